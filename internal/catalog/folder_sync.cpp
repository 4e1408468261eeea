#include "folder_sync.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "internal/catalog/naming.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"

namespace beatstore::catalog {

using beatstore::observability::IntField;
using beatstore::observability::StringField;

FolderSynchronizer::FolderSynchronizer(std::shared_ptr<db::Repository> repository, std::filesystem::path audio_root)
    : repository_(std::move(repository)), audio_root_(std::move(audio_root)) {
  if (!repository_) {
    throw std::invalid_argument("folder synchronizer requires a repository");
  }
}

std::vector<std::string> FolderSynchronizer::ListAudioFiles(std::error_code& ec) const {
  std::vector<std::string> files;

  std::filesystem::directory_iterator it(audio_root_, ec);
  if (ec) return files;

  const std::filesystem::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) return files;

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;

    auto file_name = it->path().filename().string();
    if (IsAudioFileName(file_name)) {
      files.push_back(std::move(file_name));
    }
  }
  if (ec) return files;

  std::sort(files.begin(), files.end());
  return files;
}

SyncReport FolderSynchronizer::Sync() {
  SyncReport report;

  std::error_code ec;
  if (!std::filesystem::is_directory(audio_root_, ec)) {
    BEATSTORE_LOG_WARN("Beats folder not found", {StringField("path", audio_root_.string())});
    return report;
  }

  const auto files = ListAudioFiles(ec);
  if (ec) {
    BEATSTORE_LOG_WARN("Beats folder unreadable",
                       {StringField("path", audio_root_.string()), StringField("error", ec.message())});
    return report;
  }

  report.directory_available = true;
  report.considered          = files.size();

  for (const auto& file_name : files) {
    try {
      CatalogFile(file_name, report);
    } catch (const std::exception& e) {
      report.failures.push_back({file_name, e.what()});
      BEATSTORE_LOG_ERROR("Failed to catalog beat", {StringField("file_name", file_name), StringField("error", e.what())});
    }
  }

  const auto level = (report.inserted > 0 || !report.failures.empty()) ? spdlog::level::info : spdlog::level::debug;
  observability::Log(level, "Synced beats from folder",
                     {IntField("considered", static_cast<int64_t>(report.considered)),
                      IntField("inserted", static_cast<int64_t>(report.inserted)),
                      IntField("skipped", static_cast<int64_t>(report.skipped)),
                      IntField("failed", static_cast<int64_t>(report.failures.size()))});
  return report;
}

void FolderSynchronizer::CatalogFile(const std::string& file_name, SyncReport& report) {
  if (!IsValidUtf8(file_name)) {
    report.failures.push_back({file_name, "file name is not valid UTF-8"});
    BEATSTORE_LOG_WARN("Skipped beat", {StringField("file_name", file_name),
                                        StringField("error", "file name is not valid UTF-8")});
    return;
  }

  auto tx = repository_->Begin();

  if (repository_->FindBeatByFileName(*tx, file_name)) {
    tx->Commit();
    ++report.skipped;
    BEATSTORE_LOG_DEBUG("Beat already catalogued", {StringField("file_name", file_name)});
    return;
  }

  db::model::BeatRecord record;
  record.title     = DeriveTitle(file_name);
  record.slug      = DeriveSlug(record.title);
  record.file_name = file_name;
  record.file_type = DeriveFileType(file_name);

  auto result = repository_->InsertBeat(*tx, record);
  if (!result) {
    tx->Rollback();
    report.failures.push_back({file_name, result.Describe()});
    BEATSTORE_LOG_WARN("Skipped beat", {StringField("file_name", file_name), StringField("slug", record.slug),
                                        StringField("error", result.Describe())});
    return;
  }

  tx->Commit();
  ++report.inserted;
  BEATSTORE_LOG_INFO("Catalogued beat", {StringField("file_name", file_name), IntField("id", record.id)});
}

} // namespace beatstore::catalog
