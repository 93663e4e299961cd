#pragma once
#ifndef GUTEX_SPARSE_CACHE_H
#define GUTEX_SPARSE_CACHE_H

#include "cache/bitmap.h"
#include "cache/cache_meta.h"
#include "cache/upstream_fetcher.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gutex {

struct SparseCacheOptions {
  /// Empty means sparseCacheDir() at construction time.
  std::string cacheDir;
  std::int64_t blockSize = 4096;
  std::int64_t maxCoalesceGap = 8192;
  std::chrono::seconds validationInterval{std::chrono::hours(24)};
};

struct ResourceStats {
  std::int64_t fileSize{0};
  std::int64_t cachedBytes{0};
  double coveragePercent{0.0};
  std::int64_t blocksCached{0};
  std::int64_t totalBlocks{0};
  std::int64_t lastValidatedTs{0};
  std::int64_t lastAccessedTs{0};
  bool isStale{false};
  std::optional<std::string> etag;

  Json::Value toJson() const;
};

/// Where the bytes of one getRange call came from.
struct RangeSource {
  std::int64_t fromCache{0};
  std::int64_t fromNetwork{0};
};

struct SparseCacheStats {
  std::uint64_t cacheHits{0};
  std::uint64_t cacheMisses{0};
  std::uint64_t bytesFromCache{0};
  std::uint64_t bytesFromNetwork{0};
  double hitRate{0.0};
  std::uint64_t validationChecks{0};
  std::uint64_t validationRefreshes{0};

  Json::Value toJson() const;
};

/**
 * @brief Disk-backed byte-range cache over an UpstreamFetcher.
 *
 * Each resource is kept as a pre-sized data file, a block bitmap and a
 * JSON metadata file in the cache directory. Only blocks whose bit is set
 * are ever served from disk.
 *
 * Calls for different resources run independently. Calls for the same
 * resource serialize their bookkeeping but not their upstream fetches, so
 * two overlapping readers may fetch the same missing bytes twice.
 */
class SparseCache {
public:
  explicit SparseCache(std::shared_ptr<UpstreamFetcher> upstream,
                       SparseCacheOptions options = {});

  /**
   * @brief Resource length in bytes, from metadata or a first HEAD.
   * @throw std::invalid_argument for an unsafe resource id.
   */
  std::int64_t getFileSize(const std::string &resourceId);

  /**
   * @brief Bytes [start, end] (inclusive), clamped to the resource.
   *
   * Missing blocks are fetched from upstream and stored first. A range
   * wholly past the end of the resource yields an empty string. Upstream
   * errors propagate; disk errors never do.
   * @param source Optional breakdown of disk versus network bytes.
   */
  std::string getRange(const std::string &resourceId, std::int64_t start,
                       std::int64_t end, RangeSource *source = nullptr);

  /** Delete data, bitmap and metadata for @p resourceId. */
  void invalidate(const std::string &resourceId);

  /**
   * @brief HEAD now, ignoring the validation interval.
   * @return true when the cache is still valid; false when it was
   * invalidated or nothing is cached.
   */
  bool forceValidation(const std::string &resourceId);

  /** Keep the @p keepCount most recently accessed resources. */
  std::vector<std::string> pruneByLRU(std::size_t keepCount);

  std::vector<std::string> listCachedResources() const;

  /** Invalidate everything and reset counters. */
  void clearAll();

  std::optional<ResourceStats> getResourceStats(const std::string &resourceId);
  SparseCacheStats getStats() const;

  void setUpstream(std::shared_ptr<UpstreamFetcher> upstream);

  const SparseCacheOptions &options() const { return options_; }

private:
  struct ResourceState {
    std::mutex mutex;
    std::optional<CacheMeta> meta;
    Bitmap bitmap;
    /// Bumped by every invalidation so in-flight fetches can notice.
    std::uint64_t generation{0};
  };

  /// Metadata plus whether the resource could be set up on disk.
  struct Prepared {
    CacheMeta meta;
    bool onDisk{false};
  };

  std::shared_ptr<ResourceState> stateFor(const std::string &resourceId);
  std::shared_ptr<UpstreamFetcher> upstream() const;

  Prepared prepareLocked(const std::string &resourceId, ResourceState &state);
  bool loadLocked(const std::string &resourceId, ResourceState &state);
  bool validateLocked(const std::string &resourceId, ResourceState &state);
  void invalidateLocked(const std::string &resourceId, ResourceState &state);
  void persistMetaLocked(const std::string &resourceId, ResourceState &state);

  std::string fetchDirect(const std::string &resourceId, std::int64_t start,
                          std::int64_t end, RangeSource *source);

  std::string dataPath(const std::string &resourceId) const;
  std::string bitmapPath(const std::string &resourceId) const;
  std::string metaPath(const std::string &resourceId) const;

  SparseCacheOptions options_;

  mutable std::mutex upstreamMutex_;
  std::shared_ptr<UpstreamFetcher> upstream_;

  std::mutex statesMutex_;
  std::unordered_map<std::string, std::shared_ptr<ResourceState>> states_;

  std::atomic<std::uint64_t> cacheHits_{0};
  std::atomic<std::uint64_t> cacheMisses_{0};
  std::atomic<std::uint64_t> bytesFromCache_{0};
  std::atomic<std::uint64_t> bytesFromNetwork_{0};
  std::atomic<std::uint64_t> validationChecks_{0};
  std::atomic<std::uint64_t> validationRefreshes_{0};
};

/**
 * @brief Reject ids that are not safe as file names.
 * @throw std::invalid_argument unless @p resourceId matches [A-Za-z0-9._-]+
 *        and is not "." or "..".
 */
void validateResourceId(const std::string &resourceId);

} // namespace gutex

#endif // GUTEX_SPARSE_CACHE_H
