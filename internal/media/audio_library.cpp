#include "audio_library.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <vector>

#include "internal/catalog/naming.hpp"
#include "internal/util/errors.hpp"

namespace beatstore::media {

namespace {

// Lexical containment on canonical paths; "/beats2" is not inside "/beats".
// The root itself counts as inside; it is rejected later as "not a file".
bool IsWithin(const std::filesystem::path& root, const std::filesystem::path& target) {
  const auto relative = target.lexically_relative(root);
  if (relative.empty()) {
    return false;
  }
  return *relative.begin() != "..";
}

} // namespace

AudioLibrary::AudioLibrary(std::filesystem::path root) : root_(std::move(root)) {
}

AudioFile AudioLibrary::Resolve(const std::string& file_name) const {
  if (file_name.empty() || file_name.find('\0') != std::string::npos) {
    throw util::NotFound("audio file not found");
  }

  std::error_code ec;
  const auto absolute_root = std::filesystem::absolute(root_, ec);
  std::filesystem::path canonical_root;
  if (!ec) {
    canonical_root = std::filesystem::weakly_canonical(absolute_root, ec);
  }
  if (ec) {
    throw util::NotFound("audio folder unavailable");
  }

  const auto canonical_target = std::filesystem::weakly_canonical(canonical_root / file_name, ec);
  if (ec || !IsWithin(canonical_root, canonical_target)) {
    throw util::AccessDenied("path escapes the audio folder");
  }

  if (!std::filesystem::is_regular_file(canonical_target, ec)) {
    throw util::NotFound("audio file not found");
  }

  const auto size = std::filesystem::file_size(canonical_target, ec);
  if (ec) {
    throw util::NotFound("audio file not readable");
  }

  AudioFile file;
  file.path         = canonical_target;
  file.size         = size;
  file.content_type = ContentTypeFor(file_name);
  return file;
}

std::uint64_t AudioLibrary::Stream(const AudioFile& file, const ChunkSink& sink) const {
  std::ifstream in(file.path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("unable to open audio file: " + file.path.string());
  }

  std::vector<char> buffer(kStreamChunkBytes);
  std::uint64_t     delivered = 0;

  while (in) {
    in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    const auto count = static_cast<std::size_t>(in.gcount());
    if (count == 0) break;

    if (!sink(buffer.data(), count)) {
      break;
    }
    delivered += count;
  }

  if (in.bad()) {
    throw std::runtime_error("read failed on audio file: " + file.path.string());
  }
  return delivered;
}

std::string AudioLibrary::ContentTypeFor(const std::string& file_name) {
  const auto type = catalog::DeriveFileType(file_name);
  if (type == "mp3") return "audio/mpeg";
  if (type == "wav") return "audio/wav";
  if (type == "m4a") return "audio/mp4";
  if (type == "flac") return "audio/flac";
  if (type == "ogg") return "audio/ogg";
  return "audio/mpeg";
}

} // namespace beatstore::media
