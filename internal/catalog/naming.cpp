#include "naming.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>

namespace beatstore::catalog {

std::string ToLowerAscii(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return out;
}

std::string ExtensionOf(const std::string& file_name) {
  return std::filesystem::path(file_name).extension().string();
}

bool IsAudioFileName(const std::string& file_name) {
  const auto extension = ToLowerAscii(ExtensionOf(file_name));
  return std::find(kAudioExtensions.begin(), kAudioExtensions.end(), extension) != kAudioExtensions.end();
}

std::string DeriveTitle(const std::string& file_name) {
  return std::filesystem::path(file_name).stem().string();
}

std::string DeriveFileType(const std::string& file_name) {
  auto extension = ExtensionOf(file_name);
  if (!extension.empty() && extension.front() == '.') {
    extension.erase(0, 1);
  }
  return ToLowerAscii(extension);
}

std::string DeriveSlug(std::string_view title) {
  auto slug = ToLowerAscii(title);
  std::replace(slug.begin(), slug.end(), ' ', '-');
  std::replace(slug.begin(), slug.end(), '_', '-');
  return slug;
}

bool IsValidUtf8(std::string_view text) {
  std::size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }

    std::size_t   length = 0;
    unsigned char min    = 0x80;
    unsigned char max    = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
      if (lead == 0xE0) min = 0xA0; // overlong
      if (lead == 0xED) max = 0x9F; // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
      if (lead == 0xF0) min = 0x90; // overlong
      if (lead == 0xF4) max = 0x8F; // above U+10FFFF
    } else {
      return false;
    }

    if (i + length > text.size()) {
      return false;
    }
    const auto second = static_cast<unsigned char>(text[i + 1]);
    if (second < min || second > max) {
      return false;
    }
    for (std::size_t k = 2; k < length; ++k) {
      const auto next = static_cast<unsigned char>(text[i + k]);
      if (next < 0x80 || next > 0xBF) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

} // namespace beatstore::catalog
