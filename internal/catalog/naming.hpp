#pragma once

#include <array>
#include <string>
#include <string_view>

namespace beatstore::catalog {

// Recognized audio extensions, lower-case with the dot.
inline constexpr std::array<std::string_view, 5> kAudioExtensions = {".mp3", ".wav", ".m4a", ".flac", ".ogg"};

std::string ToLowerAscii(std::string_view text);

// Extension as std::filesystem::path sees it ("" for dotfiles like ".mp3").
std::string ExtensionOf(const std::string& file_name);

// Case-insensitive match of the extension only.
bool IsAudioFileName(const std::string& file_name);

// File name without its extension.
std::string DeriveTitle(const std::string& file_name);

// Lower-cased extension without the dot.
std::string DeriveFileType(const std::string& file_name);

// Lower-cased title; every space and every underscore becomes a hyphen.
std::string DeriveSlug(std::string_view title);

// Well-formed UTF-8: no overlongs, no surrogates, nothing above U+10FFFF.
// Catalog names end up verbatim in JSON strings, which must be UTF-8.
bool IsValidUtf8(std::string_view text);

} // namespace beatstore::catalog
