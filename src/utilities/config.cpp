#include "utilities/config.h"
#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace gutex {

namespace {

template <typename T>
void readKey(const YAML::Node &node, const char *key, T &out) {
  if (node && node[key])
    out = node[key].as<T>();
}

void readMillis(const YAML::Node &node, const char *key,
                std::chrono::milliseconds &out) {
  if (node && node[key])
    out = std::chrono::milliseconds(node[key].as<long long>());
}

void applyYaml(const YAML::Node &root, Config &config) {
  readKey(root, "cache_dir", config.cacheDir);
  readKey(root, "log_file", config.logFile);
  if (root["log_level"])
    config.logLevel =
        logLevelFromString(root["log_level"].as<std::string>(), config.logLevel);

  const YAML::Node mirrors = root["mirrors"];
  readKey(mirrors, "list_url", config.racer.mirrorListUrl);
  readKey(mirrors, "default_url", config.racer.defaultMirrorUrl);
  readKey(mirrors, "resource_path", config.racer.resourcePath);
  readKey(mirrors, "race_count", config.racer.raceCount);
  readKey(mirrors, "backup_count", config.racer.backupCount);
  readMillis(mirrors, "request_timeout_ms", config.racer.requestTimeout);
  readMillis(mirrors, "list_timeout_ms", config.racer.listTimeout);
  readMillis(mirrors, "backup_stagger_ms", config.racer.backupStagger);

  const YAML::Node cache = root["cache"];
  readKey(cache, "block_size", config.cache.blockSize);
  readKey(cache, "max_coalesce_gap", config.cache.maxCoalesceGap);
  if (cache && cache["validation_interval_s"])
    config.cache.validationInterval =
        std::chrono::seconds(cache["validation_interval_s"].as<long long>());

  const YAML::Node navigator = root["navigator"];
  readKey(navigator, "chunk_size", config.navigator.chunkSize);
  readKey(navigator, "prefetch", config.navigator.prefetch);

  const YAML::Node fetcher = root["fetcher"];
  readKey(fetcher, "retries", config.fetcher.retries);
  readMillis(fetcher, "retry_backoff_ms", config.fetcher.retryBackoff);
}

} // namespace

Config loadConfig(const std::string &path) {
  Config config;
  std::string file = path;
  bool explicitPath = !file.empty();
  if (file.empty()) {
    if (const char *env = std::getenv("GUTEX_CONFIG")) {
      file = env;
      explicitPath = true;
    } else {
      file = "gutex.yaml";
    }
  }

  std::error_code ec;
  if (std::filesystem::exists(file, ec)) {
    try {
      applyYaml(YAML::LoadFile(file), config);
      Logger::getInstance().log(LogLevel::DEBUG, "Loaded config from " + file);
    } catch (const YAML::Exception &e) {
      config = Config{};
      Logger::getInstance().log(LogLevel::WARN, "Ignoring malformed config " +
                                                    file + ": " + e.what());
    }
  } else if (explicitPath) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Config file " + file + " not found, using defaults");
  }

  if (const char *env = std::getenv("GUTEX_CACHE_DIR"))
    config.cacheDir = env;
  if (const char *env = std::getenv("GUTEX_LOG_LEVEL"))
    config.logLevel = logLevelFromString(env, config.logLevel);
  if (const char *env = std::getenv("GUTEX_RACE_COUNT")) {
    try {
      config.racer.raceCount = std::stoul(env);
    } catch (const std::exception &) {
      Logger::getInstance().log(LogLevel::WARN,
                                std::string("Ignoring invalid GUTEX_RACE_COUNT: ") + env);
    }
  }
  return config;
}

void applyCacheRoot(const Config &config) {
  if (!config.cacheDir.empty())
    setCacheRoot(config.cacheDir);
}

std::string logFilePath(const Config &config) {
  if (!config.logFile.empty())
    return config.logFile;
  return logsDir() + "/gutex.log";
}

} // namespace gutex
