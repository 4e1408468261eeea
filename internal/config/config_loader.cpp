#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace beatstore::config {

using beatstore::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("8000", "true")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static uint32_t ParsePort(const std::string& text) {
  char*               endptr = nullptr;
  const unsigned long port   = std::strtoul(text.c_str(), &endptr, 10);
  if (text.empty() || !endptr || *endptr != '\0' || port == 0 || port > 65535) {
    throw std::runtime_error("Invalid port: " + text);
  }
  return static_cast<uint32_t>(port);
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  if (config.server().port() > 65535) {
    throw std::runtime_error("Invalid configuration: server.port out of range");
  }

  return config;
}

RuntimeConfig ConfigLoader::Load(const std::optional<std::string>& path) {
  RuntimeConfig config;
  if (path) {
    config = LoadFromYaml(*path);
  }
  ApplyDefaults(config);
  ApplyEnvironment(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address(kDefaultBindAddress);
  if (server->port() == 0) server->set_port(kDefaultPort);
  if (server->worker_threads() == 0) server->set_worker_threads(kDefaultWorkers);
  if (server->static_root().empty()) server->set_static_root(kDefaultStaticRoot);
  if (server->read_timeout_ms() == 0) server->set_read_timeout_ms(kDefaultReadTimeoutMs);

  auto* catalog = config.mutable_catalog();
  if (catalog->audio_root().empty()) catalog->set_audio_root(kDefaultAudioRoot);
  if (!catalog->has_sync_on_list()) catalog->set_sync_on_list(true);
  if (!catalog->has_sync_on_startup()) catalog->set_sync_on_startup(true);
  if (!catalog->has_create_audio_root()) catalog->set_create_audio_root(true);

  auto* database = config.mutable_database();
  if (database->backend_case() == beatstore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    database->mutable_sqlite();
  }
  if (database->has_sqlite()) {
    auto* sqlite = database->mutable_sqlite();
    if (sqlite->path().empty()) sqlite->set_path(kDefaultSqlitePath);
    if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
  }

  auto* logging = config.mutable_logging();
  if (logging->level().empty()) logging->set_level("info");
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (const char* port = std::getenv("PORT")) {
    config.mutable_server()->set_port(ParsePort(port));
  }
  if (const char* folder = std::getenv("BEATS_FOLDER")) {
    config.mutable_catalog()->set_audio_root(folder);
  }
  if (const char* db_path = std::getenv("BEATSTORE_DB_PATH")) {
    auto* sqlite = config.mutable_database()->mutable_sqlite();
    sqlite->set_path(db_path);
    if (!sqlite->has_wal_mode()) sqlite->set_wal_mode(true);
    if (sqlite->busy_timeout_ms() == 0) sqlite->set_busy_timeout_ms(5000);
  }
  if (const char* level = std::getenv("BEATSTORE_LOG_LEVEL")) {
    config.mutable_logging()->set_level(level);
  }
  if (const char* pattern = std::getenv("BEATSTORE_LOG_PATTERN")) {
    config.mutable_logging()->set_pattern(pattern);
  }
}

} // namespace beatstore::config
