#pragma once
#ifndef GUTEX_CONFIG_H
#define GUTEX_CONFIG_H

#include "cache/sparse_cache.h"
#include "fetcher/cached_fetcher.h"
#include "mirror/origin_racer.h"
#include "navigator/navigator.h"
#include "utilities/logger.h"

#include <string>

namespace gutex {

/**
 * @brief Runtime settings for every component.
 *
 * Defaults match the component option structs.
 */
struct Config {
  /// Cache root; empty keeps getCacheRoot().
  std::string cacheDir;
  /// Log file; empty means <logsDir()>/gutex.log.
  std::string logFile;
  LogLevel logLevel = LogLevel::INFO;

  OriginRacerOptions racer;
  SparseCacheOptions cache;
  NavigatorOptions navigator;
  CachedFetcherOptions fetcher;
};

/**
 * @brief Load YAML settings, then apply environment overrides.
 *
 * @param path YAML file. Empty means $GUTEX_CONFIG, else "gutex.yaml".
 * A missing or malformed file leaves defaults in place.
 * Environment: GUTEX_CACHE_DIR, GUTEX_LOG_LEVEL, GUTEX_RACE_COUNT.
 */
Config loadConfig(const std::string &path = "");

/** Point the cache root at config.cacheDir when set. */
void applyCacheRoot(const Config &config);

/** Resolved log file path for @p config. */
std::string logFilePath(const Config &config);

} // namespace gutex

#endif // GUTEX_CONFIG_H
