#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <system_error>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"

namespace beatstore::factory {

using beatstore::observability::StringField;

namespace {

void EnsureAudioRoot(const std::filesystem::path& audio_root) {
  std::error_code ec;
  std::filesystem::create_directories(audio_root, ec);
  if (ec) {
    BEATSTORE_LOG_WARN("Unable to create beats folder",
                       {StringField("path", audio_root.string()), StringField("error", ec.message())});
  }
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const beatstore::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    BEATSTORE_LOG_WARN("Using in-memory catalog store; nothing survives a restart");
    return std::make_shared<db::memory::MemoryRepository>();
  }

  db::sqlite::SqliteOptions options;
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (!sqlite.path().empty()) options.path = sqlite.path();
    if (sqlite.has_wal_mode()) options.wal_mode = sqlite.wal_mode();
    if (sqlite.busy_timeout_ms() != 0) options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
  }

  auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(options));
  repository->Initialize();
  return repository;
}

/*
    Build full application dependency graph
*/
Application Build(const beatstore::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Audio folder
  // ------------------------------------------------------------------
  const std::filesystem::path audio_root = config.catalog().audio_root();
  if (config.catalog().create_audio_root()) {
    EnsureAudioRoot(audio_root);
  }

  app.synchronizer  = std::make_shared<catalog::FolderSynchronizer>(app.repository, audio_root);
  app.audio_library = std::make_shared<media::AudioLibrary>(audio_root);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository   = app.repository;
  ctx.synchronizer = app.synchronizer;
  ctx.sync_on_list = config.catalog().sync_on_list();

  app.catalog_service = std::make_shared<service::CatalogService>(ctx);

  // ------------------------------------------------------------------
  // HTTP routes
  // ------------------------------------------------------------------
  app.router = std::make_shared<http::Router>(app.catalog_service, app.audio_library, config.server().static_root());

  return app;
}

} // namespace beatstore::factory
