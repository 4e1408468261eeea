#pragma once

#include <optional>
#include <string>

#include "config/config.pb.h"

namespace beatstore::config {

inline constexpr const char* kDefaultBindAddress = "0.0.0.0";
inline constexpr uint32_t    kDefaultPort        = 8000;
inline constexpr uint32_t    kDefaultWorkers     = 4;
inline constexpr const char* kDefaultStaticRoot  = ".";
inline constexpr uint32_t    kDefaultReadTimeoutMs = 10000;
inline constexpr const char* kDefaultAudioRoot   = "./beats";
inline constexpr const char* kDefaultSqlitePath  = "./beats.db";

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Defaults fill whatever the file leaves empty, then environment
  overrides are applied on top:

    PORT                  server.port
    BEATS_FOLDER          catalog.audio_root
    BEATSTORE_DB_PATH     database.sqlite.path
    BEATSTORE_LOG_LEVEL   logging.level
    BEATSTORE_LOG_PATTERN logging.pattern
*/
class ConfigLoader {
 public:
  static beatstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Defaults + environment; the file is optional.
  static beatstore::runtime::config::RuntimeConfig Load(const std::optional<std::string>& path);

  static void ApplyDefaults(beatstore::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironment(beatstore::runtime::config::RuntimeConfig& config);
};

} // namespace beatstore::config
