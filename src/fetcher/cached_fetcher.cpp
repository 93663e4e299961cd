#include "fetcher/cached_fetcher.h"
#include "utilities/logger.h"

#include <cstdio>
#include <stdexcept>
#include <thread>

namespace gutex {

Json::Value FetcherStats::toJson() const {
  Json::Value v;
  v["requests"] = static_cast<Json::UInt64>(requests);
  v["bytesDownloaded"] = static_cast<Json::UInt64>(bytesDownloaded);
  v["totalBytes"] = totalBytes ? Json::Value(static_cast<Json::Int64>(*totalBytes))
                               : Json::Value(Json::nullValue);
  v["efficiency"] = efficiency;
  v["source"] = source;
  return v;
}

Json::Value FetcherCacheStats::toJson() const {
  Json::Value v;
  v["cacheHits"] = static_cast<Json::UInt64>(cacheHits);
  v["cacheMisses"] = static_cast<Json::UInt64>(cacheMisses);
  v["hitRate"] = hitRate;
  v["resourceStats"] =
      resourceStats ? resourceStats->toJson() : Json::Value(Json::nullValue);
  return v;
}

CachedFetcher::CachedFetcher(std::string resourceId,
                             std::shared_ptr<SparseCache> cache,
                             CachedFetcherOptions options)
    : resourceId_(std::move(resourceId)), cache_(std::move(cache)),
      options_(options) {
  if (!cache_)
    throw std::invalid_argument("CachedFetcher requires a SparseCache");
  if (options_.retries < 1)
    throw std::invalid_argument("CachedFetcher needs at least one attempt");
  validateResourceId(resourceId_);
}

std::int64_t CachedFetcher::getFileSize() {
  std::lock_guard<std::mutex> lock(sizeMutex_);
  if (!totalBytes_) {
    totalBytes_ = cache_->getFileSize(resourceId_);
    Logger::getInstance().log(LogLevel::DEBUG, "Size of " + resourceId_ + ": " +
                                                   std::to_string(*totalBytes_));
  }
  return *totalBytes_;
}

std::string CachedFetcher::fetchRange(std::int64_t start, std::int64_t end) {
  const auto request = ++requests_;
  Logger::getInstance().log(LogLevel::TRACE,
                            "Request #" + std::to_string(request) + " for " +
                                resourceId_ + ": bytes " + std::to_string(start) +
                                "-" + std::to_string(end));

  for (int attempt = 1;; ++attempt) {
    try {
      RangeSource source;
      std::string data = cache_->getRange(resourceId_, start, end, &source);
      if (source.fromCache > 0)
        cacheHits_++;
      if (source.fromNetwork > 0) {
        cacheMisses_++;
        bytesDownloaded_ += static_cast<std::uint64_t>(source.fromNetwork);
      }
      return data;
    } catch (const std::invalid_argument &) {
      throw;
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                "Attempt " + std::to_string(attempt) + " for " +
                                    resourceId_ + " failed: " + e.what());
      if (attempt >= options_.retries)
        throw;
      std::this_thread::sleep_for(options_.retryBackoff * attempt);
    }
  }
}

FetcherStats CachedFetcher::getStats() const {
  FetcherStats stats;
  stats.requests = requests_;
  stats.bytesDownloaded = bytesDownloaded_;
  {
    std::lock_guard<std::mutex> lock(sizeMutex_);
    stats.totalBytes = totalBytes_;
  }
  if (stats.totalBytes && *stats.totalBytes > 0) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f%%",
                  static_cast<double>(stats.bytesDownloaded) / *stats.totalBytes * 100.0);
    stats.efficiency = buf;
  } else {
    stats.efficiency = "N/A";
  }
  stats.source = "sparse-cache";
  return stats;
}

FetcherCacheStats CachedFetcher::getCacheStats() const {
  FetcherCacheStats stats;
  stats.cacheHits = cacheHits_;
  stats.cacheMisses = cacheMisses_;
  const auto total = stats.cacheHits + stats.cacheMisses;
  stats.hitRate = total > 0 ? static_cast<double>(stats.cacheHits) / total : 0.0;
  stats.resourceStats = cache_->getResourceStats(resourceId_);
  return stats;
}

void CachedFetcher::invalidateCache() {
  cache_->invalidate(resourceId_);
  std::lock_guard<std::mutex> lock(sizeMutex_);
  totalBytes_.reset();
}

bool CachedFetcher::validateCache() { return cache_->forceValidation(resourceId_); }

} // namespace gutex
