#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using beatstore::observability::BoolField;
using beatstore::observability::IntField;
using beatstore::observability::StringField;
using beatstore::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  if (argc == 1) {
    // defaults and environment only
  } else if (argc == 2 && std::string(argv[1]) != "--config") {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: beatstore-server [--config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = beatstore::config::ConfigLoader::Load(config_path);

    beatstore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = beatstore::factory::Build(config);

    if (config.database().has_sqlite()) {
      BEATSTORE_LOG_INFO("Catalog database in use; deleting it loses all inquiry history",
                         {StringField("path", config.database().sqlite().path())});
    }

    if (config.catalog().sync_on_startup()) {
      const auto report = app.catalog_service->Sync();
      if (!report.directory_available) {
        BEATSTORE_LOG_WARN("Startup sync skipped", {StringField("audio_root", config.catalog().audio_root())});
      }
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), static_cast<std::uint16_t>(config.server().port()),
                  config.server().worker_threads(), std::chrono::milliseconds(config.server().read_timeout_ms()),
                  app.router, app.audio_library);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    BEATSTORE_LOG_INFO("Beat store started", {StringField("bind_address", config.server().bind_address()),
                                              IntField("port", server.Port()),
                                              StringField("audio_root", config.catalog().audio_root()),
                                              BoolField("sync_on_list", config.catalog().sync_on_list())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    BEATSTORE_LOG_INFO("Shutting down beat store");

    server.Stop();
    beatstore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    BEATSTORE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    beatstore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
