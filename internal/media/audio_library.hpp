#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

namespace beatstore::media {

inline constexpr std::size_t kStreamChunkBytes = 64 * 1024;

struct AudioFile {
  std::filesystem::path path;
  std::uint64_t         size = 0;
  std::string           content_type;
};

// Receives one chunk; returning false stops the stream (peer went away).
using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

/*
  Read-only view of the audio directory.

  Every name is resolved against the root and must stay inside it after
  symlinks and ".." are collapsed; anything else is util::AccessDenied.
*/
class AudioLibrary {
 public:
  explicit AudioLibrary(std::filesystem::path root);

  // Throws util::AccessDenied outside the root, util::NotFound when absent or
  // not a regular file. Messages never include the requested name.
  AudioFile Resolve(const std::string& file_name) const;

  // Streams the file in kStreamChunkBytes pieces. Returns bytes delivered.
  std::uint64_t Stream(const AudioFile& file, const ChunkSink& sink) const;

  static std::string ContentTypeFor(const std::string& file_name);

 private:
  std::filesystem::path root_;
};

} // namespace beatstore::media
