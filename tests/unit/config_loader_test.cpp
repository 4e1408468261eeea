#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using beatstore::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "beatstore_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void ClearEnvironment() {
  unsetenv("PORT");
  unsetenv("BEATS_FOLDER");
  unsetenv("BEATSTORE_DB_PATH");
  unsetenv("BEATSTORE_LOG_LEVEL");
  unsetenv("BEATSTORE_LOG_PATTERN");
}

void TestFullFileIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1"
  port: 9090
  worker_threads: 2
  static_root: "/srv/site"
  read_timeout_ms: 2500
catalog:
  audio_root: "/srv/beats"
  sync_on_list: false
  sync_on_startup: true
  create_audio_root: false
database:
  sqlite:
    path: "/var/lib/beatstore/beats.db"
    wal_mode: false
    busy_timeout_ms: 250
logging:
  level: "debug"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1");
  assert(config.server().port() == 9090);
  assert(config.server().worker_threads() == 2);
  assert(config.server().static_root() == "/srv/site");
  assert(config.server().read_timeout_ms() == 2500);
  assert(config.catalog().audio_root() == "/srv/beats");
  assert(config.catalog().has_sync_on_list() && !config.catalog().sync_on_list());
  assert(!config.catalog().create_audio_root());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/beatstore/beats.db");
  assert(!config.database().sqlite().wal_mode());
  assert(config.database().sqlite().busy_timeout_ms() == 250);
  assert(config.logging().level() == "debug");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(catalog:
  audio_root: "C:\\beats\\\"quoted\"\\dir"
database:
  sqlite:
    path: "8000"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.catalog().audio_root() == "C:\\beats\\\"quoted\"\\dir");
  // quoted numbers stay strings
  assert(config.database().sqlite().path() == "8000");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(catalog:
  audio_root: "line1\nline2☃"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.catalog().audio_root() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  port: 8000
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestDefaultsWithoutFile() {
  ClearEnvironment();

  auto config = ConfigLoader::Load(std::nullopt);
  assert(config.server().bind_address() == "0.0.0.0");
  assert(config.server().port() == 8000);
  assert(config.server().worker_threads() == 4);
  assert(config.server().static_root() == ".");
  assert(config.server().read_timeout_ms() == 10000);
  assert(config.catalog().audio_root() == "./beats");
  assert(config.catalog().sync_on_list());
  assert(config.catalog().sync_on_startup());
  assert(config.catalog().create_audio_root());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "./beats.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "info");
}

void TestEmptyFileFallsBackToDefaults() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("empty", "");

  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.server().port() == 8000);
  assert(config.database().sqlite().path() == "./beats.db");
}

void TestMemoryBackendIsKept() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("memory",
                                   R"(database:
  memory: {}
)");

  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());
}

void TestEnvironmentOverridesFile() {
  ClearEnvironment();
  const auto yaml_path = WriteYaml("env_override",
                                   R"(server:
  port: 9090
catalog:
  audio_root: "/from/file"
database:
  memory: {}
)");

  setenv("PORT", "7001", 1);
  setenv("BEATS_FOLDER", "/from/env", 1);
  setenv("BEATSTORE_DB_PATH", "/tmp/env.db", 1);
  setenv("BEATSTORE_LOG_LEVEL", "warn", 1);

  auto config = ConfigLoader::Load(yaml_path.string());
  assert(config.server().port() == 7001);
  assert(config.catalog().audio_root() == "/from/env");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/tmp/env.db");
  assert(config.logging().level() == "warn");

  ClearEnvironment();
}

void TestInvalidPortIsRejected() {
  ClearEnvironment();
  setenv("PORT", "80x", 1);

  bool threw = false;
  try {
    (void)ConfigLoader::Load(std::nullopt);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  ClearEnvironment();
  assert(threw);

  const auto yaml_path = WriteYaml("port_range",
                                   R"(server:
  port: 70000
)");
  threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullFileIsLoaded();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();
  TestDefaultsWithoutFile();
  TestEmptyFileFallsBackToDefaults();
  TestMemoryBackendIsKept();
  TestEnvironmentOverridesFile();
  TestInvalidPortIsRejected();

  std::cout << "beatstore_unit_config_loader: pass\n";
  return 0;
}
