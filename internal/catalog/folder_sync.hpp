#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace beatstore::db { class Repository; }

namespace beatstore::catalog {

struct SyncFailure {
  std::string file_name;
  std::string error_message;
};

struct SyncReport {
  bool        directory_available = false;
  std::size_t considered          = 0; // audio files seen in the directory
  std::size_t inserted            = 0;
  std::size_t skipped             = 0; // already catalogued
  std::vector<SyncFailure> failures;
};

/*
  Reconciles the catalog with the audio files in one directory.

  - non-recursive; regular files with a recognized audio extension only
  - inserts beats for unseen file names, never updates or deletes rows
  - names that are not valid UTF-8 are reported as failures
  - each insert commits on its own; a failing file is reported and the
    scan moves on to the next one
  - a missing or unreadable directory leaves the store untouched
*/
class FolderSynchronizer {
 public:
  FolderSynchronizer(std::shared_ptr<db::Repository> repository, std::filesystem::path audio_root);

  SyncReport Sync();

 private:
  // Sorted for a deterministic insertion order.
  std::vector<std::string> ListAudioFiles(std::error_code& ec) const;
  void CatalogFile(const std::string& file_name, SyncReport& report);

  std::shared_ptr<db::Repository> repository_;
  std::filesystem::path           audio_root_;
};

} // namespace beatstore::catalog
