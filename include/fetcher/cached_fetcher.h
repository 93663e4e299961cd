#pragma once
#ifndef GUTEX_CACHED_FETCHER_H
#define GUTEX_CACHED_FETCHER_H

#include "cache/sparse_cache.h"
#include "fetcher/range_fetcher.h"

#include <atomic>
#include <chrono>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace gutex {

struct CachedFetcherOptions {
  int retries = 3;
  /// Sleep before retry n is retryBackoff * n.
  std::chrono::milliseconds retryBackoff{500};
};

struct FetcherStats {
  std::uint64_t requests{0};
  std::uint64_t bytesDownloaded{0};
  std::optional<std::int64_t> totalBytes;
  std::string efficiency; ///< "12.34%" or "N/A"
  std::string source;

  Json::Value toJson() const;
};

struct FetcherCacheStats {
  std::uint64_t cacheHits{0};
  std::uint64_t cacheMisses{0};
  double hitRate{0.0};
  std::optional<ResourceStats> resourceStats;

  Json::Value toJson() const;
};

/**
 * @brief RangeFetcher for one resource backed by a shared SparseCache.
 *
 * Whole calls are retried on failure; the counters are for display only.
 */
class CachedFetcher : public RangeFetcher {
public:
  CachedFetcher(std::string resourceId, std::shared_ptr<SparseCache> cache,
                CachedFetcherOptions options = {});

  std::int64_t getFileSize() override;
  std::string fetchRange(std::int64_t start, std::int64_t end) override;
  const std::string &resourceId() const override { return resourceId_; }

  FetcherStats getStats() const;
  FetcherCacheStats getCacheStats() const;

  void invalidateCache();
  bool validateCache();

private:
  const std::string resourceId_;
  std::shared_ptr<SparseCache> cache_;
  const CachedFetcherOptions options_;

  mutable std::mutex sizeMutex_;
  std::optional<std::int64_t> totalBytes_;

  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> bytesDownloaded_{0};
  std::atomic<std::uint64_t> cacheHits_{0};
  std::atomic<std::uint64_t> cacheMisses_{0};
};

} // namespace gutex

#endif // GUTEX_CACHED_FETCHER_H
