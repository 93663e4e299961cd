#include "cache/sparse_cache.h"
#include "cache/sparse_file.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace gutex {

namespace {

const std::string kMetaSuffix = ".meta.json";

std::string bitmapBytes(const Bitmap &bitmap) {
  return std::string(bitmap.begin(), bitmap.end());
}

void countBytes(const char *source, std::int64_t bytes) {
  MetricsRegistry::instance().incrementCounter(
      "gutex_cache_bytes_total", static_cast<double>(bytes), {{"source", source}});
}

} // namespace

void validateResourceId(const std::string &resourceId) {
  bool ok = !resourceId.empty() && resourceId != "." && resourceId != "..";
  for (char c : resourceId) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' ||
          c == '-')) {
      ok = false;
      break;
    }
  }
  if (!ok)
    throw std::invalid_argument("Invalid resource id '" + resourceId + "'");
}

Json::Value ResourceStats::toJson() const {
  Json::Value v;
  v["fileSize"] = static_cast<Json::Int64>(fileSize);
  v["cachedBytes"] = static_cast<Json::Int64>(cachedBytes);
  v["coveragePercent"] = coveragePercent;
  v["blocksCached"] = static_cast<Json::Int64>(blocksCached);
  v["totalBlocks"] = static_cast<Json::Int64>(totalBlocks);
  v["lastValidatedTs"] = static_cast<Json::Int64>(lastValidatedTs);
  v["lastAccessedTs"] = static_cast<Json::Int64>(lastAccessedTs);
  v["isStale"] = isStale;
  v["etag"] = etag ? Json::Value(*etag) : Json::Value(Json::nullValue);
  return v;
}

Json::Value SparseCacheStats::toJson() const {
  Json::Value v;
  v["cacheHits"] = static_cast<Json::UInt64>(cacheHits);
  v["cacheMisses"] = static_cast<Json::UInt64>(cacheMisses);
  v["bytesFromCache"] = static_cast<Json::UInt64>(bytesFromCache);
  v["bytesFromNetwork"] = static_cast<Json::UInt64>(bytesFromNetwork);
  v["hitRate"] = hitRate;
  v["validationChecks"] = static_cast<Json::UInt64>(validationChecks);
  v["validationRefreshes"] = static_cast<Json::UInt64>(validationRefreshes);
  return v;
}

SparseCache::SparseCache(std::shared_ptr<UpstreamFetcher> upstream,
                         SparseCacheOptions options)
    : options_(std::move(options)), upstream_(std::move(upstream)) {
  if (!upstream_)
    throw std::invalid_argument("SparseCache requires an upstream fetcher");
  if (options_.blockSize <= 0)
    throw std::invalid_argument("Block size must be positive");
  if (options_.maxCoalesceGap < 0)
    throw std::invalid_argument("Coalesce gap must not be negative");
  if (options_.cacheDir.empty())
    options_.cacheDir = sparseCacheDir();
}

std::string SparseCache::dataPath(const std::string &resourceId) const {
  return (fs::path(options_.cacheDir) / (resourceId + ".txt")).string();
}

std::string SparseCache::bitmapPath(const std::string &resourceId) const {
  return (fs::path(options_.cacheDir) / (resourceId + ".bitmap")).string();
}

std::string SparseCache::metaPath(const std::string &resourceId) const {
  return (fs::path(options_.cacheDir) / (resourceId + kMetaSuffix)).string();
}

std::shared_ptr<SparseCache::ResourceState>
SparseCache::stateFor(const std::string &resourceId) {
  std::lock_guard<std::mutex> lock(statesMutex_);
  auto &slot = states_[resourceId];
  if (!slot)
    slot = std::make_shared<ResourceState>();
  return slot;
}

std::shared_ptr<UpstreamFetcher> SparseCache::upstream() const {
  std::lock_guard<std::mutex> lock(upstreamMutex_);
  return upstream_;
}

void SparseCache::setUpstream(std::shared_ptr<UpstreamFetcher> upstream) {
  if (!upstream)
    throw std::invalid_argument("SparseCache requires an upstream fetcher");
  std::lock_guard<std::mutex> lock(upstreamMutex_);
  upstream_ = std::move(upstream);
}

void SparseCache::persistMetaLocked(const std::string &resourceId,
                                    ResourceState &state) {
  if (!state.meta)
    return;
  try {
    writeFileAtomic(metaPath(resourceId), state.meta->toJson());
  } catch (const CacheIoError &e) {
    Logger::getInstance().log(LogLevel::WARN, "Failed to save metadata for " +
                                                  resourceId + ": " + e.what());
  }
}

bool SparseCache::loadLocked(const std::string &resourceId, ResourceState &state) {
  if (state.meta)
    return true;
  std::error_code ec;
  if (!fs::exists(metaPath(resourceId), ec))
    return false;

  try {
    CacheMeta meta = CacheMeta::fromJson(readWholeFile(metaPath(resourceId)));
    if (meta.blockSize != options_.blockSize) {
      Logger::getInstance().log(LogLevel::INFO,
                                "Block size of cached " + resourceId +
                                    " differs from configuration, discarding");
      invalidateLocked(resourceId, state);
      return false;
    }

    const std::size_t expected = bitmapSize(meta.fileSize, meta.blockSize);
    Bitmap bitmap;
    auto dataSize = fs::file_size(dataPath(resourceId), ec);
    if (ec || static_cast<std::int64_t>(dataSize) != meta.fileSize) {
      Logger::getInstance().log(LogLevel::WARN, "Data file for " + resourceId +
                                                    " missing or resized, recreating");
      preallocateFile(dataPath(resourceId), meta.fileSize);
      bitmap.assign(expected, 0);
      writeFileAtomic(bitmapPath(resourceId), bitmapBytes(bitmap));
    } else {
      std::string raw;
      if (fs::exists(bitmapPath(resourceId), ec))
        raw = readWholeFile(bitmapPath(resourceId));
      if (raw.size() == expected) {
        bitmap.assign(raw.begin(), raw.end());
      } else {
        Logger::getInstance().log(LogLevel::WARN, "Bitmap for " + resourceId +
                                                      " has wrong size, recreating");
        bitmap.assign(expected, 0);
        writeFileAtomic(bitmapPath(resourceId), bitmapBytes(bitmap));
      }
    }

    meta.resourceId = resourceId;
    meta.totalBlocks = totalBlocks(meta.fileSize, meta.blockSize);
    meta.blocksCached = countCachedBlocks(bitmap, meta.totalBlocks);
    state.meta = meta;
    state.bitmap = std::move(bitmap);
    return true;
  } catch (const CacheIoError &e) {
    Logger::getInstance().log(LogLevel::WARN, "Discarding unreadable cache for " +
                                                  resourceId + ": " + e.what());
    invalidateLocked(resourceId, state);
    return false;
  }
}

bool SparseCache::validateLocked(const std::string &resourceId,
                                 ResourceState &state) {
  validationChecks_++;
  UpstreamHead head;
  try {
    head = upstream()->head(resourceId);
  } catch (const std::exception &e) {
    // Keep serving what we have while the network is unhappy.
    Logger::getInstance().log(LogLevel::WARN, "Validation of " + resourceId +
                                                  " failed, keeping cache: " +
                                                  e.what());
    return true;
  }

  CacheMeta &meta = *state.meta;
  std::string reason;
  if (head.size != meta.fileSize)
    reason = "size " + std::to_string(meta.fileSize) + " -> " +
             std::to_string(head.size);
  else if (head.etag && meta.etag && *head.etag != *meta.etag)
    reason = "etag changed";
  else if (head.lastModified && meta.lastModified &&
           *head.lastModified != *meta.lastModified)
    reason = "last-modified changed";

  if (!reason.empty()) {
    validationRefreshes_++;
    Logger::getInstance().log(LogLevel::INFO,
                              "Cached " + resourceId + " is stale (" + reason + ")");
    return false;
  }

  meta.lastValidatedTs = nowMillis();
  if (head.etag)
    meta.etag = head.etag;
  if (head.lastModified)
    meta.lastModified = head.lastModified;
  persistMetaLocked(resourceId, state);
  return true;
}

void SparseCache::invalidateLocked(const std::string &resourceId,
                                   ResourceState &state) {
  for (const auto &path :
       {dataPath(resourceId), bitmapPath(resourceId), metaPath(resourceId)}) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
      Logger::getInstance().log(LogLevel::WARN,
                                "Failed to delete " + path + ": " + ec.message());
  }
  state.meta.reset();
  state.bitmap.clear();
  state.generation++;
  MetricsRegistry::instance().incrementCounter("gutex_cache_invalidations_total");
}

SparseCache::Prepared SparseCache::prepareLocked(const std::string &resourceId,
                                                 ResourceState &state) {
  if (loadLocked(resourceId, state)) {
    const std::int64_t intervalMs =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            options_.validationInterval)
            .count();
    if (nowMillis() - state.meta->lastValidatedTs > intervalMs &&
        !validateLocked(resourceId, state)) {
      Logger::getInstance().log(LogLevel::INFO,
                                "Invalidating cache for " + resourceId);
      invalidateLocked(resourceId, state);
    }
    if (state.meta)
      return {*state.meta, true};
  }

  UpstreamHead head = upstream()->head(resourceId);
  if (head.size < 0)
    throw GutexError("Upstream reported negative size for " + resourceId);

  const std::int64_t now = nowMillis();
  CacheMeta meta;
  meta.resourceId = resourceId;
  meta.fileSize = head.size;
  meta.etag = head.etag;
  meta.lastModified = head.lastModified;
  meta.blockSize = options_.blockSize;
  meta.lastValidatedTs = now;
  meta.lastAccessedTs = now;
  meta.createdTs = now;
  meta.totalBlocks = totalBlocks(head.size, options_.blockSize);

  try {
    std::error_code ec;
    fs::create_directories(options_.cacheDir, ec);
    if (ec)
      throw CacheIoError("Cannot create " + options_.cacheDir + ": " + ec.message());
    preallocateFile(dataPath(resourceId), head.size);
    Bitmap bitmap(bitmapSize(head.size, options_.blockSize), 0);
    writeFileAtomic(bitmapPath(resourceId), bitmapBytes(bitmap));
    writeFileAtomic(metaPath(resourceId), meta.toJson());
    state.meta = meta;
    state.bitmap = std::move(bitmap);
    return {meta, true};
  } catch (const CacheIoError &e) {
    Logger::getInstance().log(LogLevel::WARN, "Cannot cache " + resourceId +
                                                  " on disk, reading through: " +
                                                  e.what());
    invalidateLocked(resourceId, state);
    return {meta, false};
  }
}

std::int64_t SparseCache::getFileSize(const std::string &resourceId) {
  validateResourceId(resourceId);
  auto state = stateFor(resourceId);
  std::lock_guard<std::mutex> lock(state->mutex);
  return prepareLocked(resourceId, *state).meta.fileSize;
}

std::string SparseCache::fetchDirect(const std::string &resourceId,
                                     std::int64_t start, std::int64_t end,
                                     RangeSource *source) {
  cacheMisses_++;
  std::string bytes = upstream()->getRange(resourceId, start, end);
  bytesFromNetwork_ += bytes.size();
  if (source)
    source->fromNetwork += static_cast<std::int64_t>(bytes.size());
  countBytes("network", static_cast<std::int64_t>(bytes.size()));
  return bytes;
}

std::string SparseCache::getRange(const std::string &resourceId,
                                  std::int64_t start, std::int64_t end,
                                  RangeSource *source) {
  validateResourceId(resourceId);
  if (end < start)
    throw std::invalid_argument("Range end " + std::to_string(end) +
                                " before start " + std::to_string(start));

  auto state = stateFor(resourceId);
  std::unique_lock<std::mutex> lock(state->mutex);
  const Prepared prepared = prepareLocked(resourceId, *state);
  const std::int64_t fileSize = prepared.meta.fileSize;
  const std::int64_t first = std::max<std::int64_t>(start, 0);
  const std::int64_t last = std::min(end, fileSize - 1);
  if (first > last)
    return "";
  if (!prepared.onDisk) {
    lock.unlock();
    return fetchDirect(resourceId, first, last, source);
  }

  state->meta->lastAccessedTs = nowMillis();
  const std::uint64_t generation = state->generation;
  const auto missing = coalesceRanges(
      findUncachedBlockRanges(state->bitmap, first, last, options_.blockSize,
                              options_.maxCoalesceGap));
  lock.unlock();

  // Upstream fetches run without the resource lock.
  std::vector<std::pair<ByteRange, std::string>> fetched;
  if (!missing.empty()) {
    auto origin = upstream();
    for (ByteRange range : missing) {
      range.end = std::min(range.end, fileSize - 1);
      std::string bytes = origin->getRange(resourceId, range.start, range.end);
      if (static_cast<std::int64_t>(bytes.size()) != range.length())
        throw GutexError("Upstream returned " + std::to_string(bytes.size()) +
                         " bytes for " + resourceId + " range " +
                         std::to_string(range.start) + "-" +
                         std::to_string(range.end));
      bytesFromNetwork_ += bytes.size();
      countBytes("network", range.length());
      fetched.emplace_back(range, std::move(bytes));
    }
  }

  lock.lock();
  if (state->generation != generation || !state->meta) {
    lock.unlock();
    Logger::getInstance().log(LogLevel::DEBUG, "Cache for " + resourceId +
                                                   " changed during fetch, reading through");
    return fetchDirect(resourceId, first, last, source);
  }

  if (!fetched.empty()) {
    try {
      SparseDataFile file(dataPath(resourceId));
      for (const auto &[range, bytes] : fetched) {
        file.write(range.start, bytes);
        state->bitmap = markBlockRangeCached(
            state->bitmap, byteToBlock(range.start, options_.blockSize),
            byteToBlock(range.end, options_.blockSize));
      }
    } catch (const CacheIoError &e) {
      Logger::getInstance().log(LogLevel::WARN, "Failed to store bytes for " +
                                                    resourceId + ": " + e.what());
    }
    state->meta->blocksCached =
        countCachedBlocks(state->bitmap, state->meta->totalBlocks);
    try {
      writeFileAtomic(bitmapPath(resourceId), bitmapBytes(state->bitmap));
    } catch (const CacheIoError &e) {
      Logger::getInstance().log(LogLevel::WARN, "Failed to save bitmap for " +
                                                    resourceId + ": " + e.what());
    }
  }
  persistMetaLocked(resourceId, *state);

  std::string data;
  try {
    SparseDataFile file(dataPath(resourceId));
    data = file.read(first, last - first + 1);
  } catch (const CacheIoError &e) {
    lock.unlock();
    Logger::getInstance().log(LogLevel::WARN, "Disk read for " + resourceId +
                                                  " failed, refetching: " + e.what());
    return fetchDirect(resourceId, first, last, source);
  }
  lock.unlock();

  // Fetched bytes win over the disk copy in case a write above failed.
  std::int64_t fromNetwork = 0;
  for (const auto &[range, bytes] : fetched) {
    const std::int64_t from = std::max(range.start, first);
    const std::int64_t to = std::min(range.end, last);
    if (from > to)
      continue;
    data.replace(static_cast<std::size_t>(from - first),
                 static_cast<std::size_t>(to - from + 1), bytes,
                 static_cast<std::size_t>(from - range.start),
                 static_cast<std::size_t>(to - from + 1));
    fromNetwork += to - from + 1;
  }
  const std::int64_t fromDisk = (last - first + 1) - fromNetwork;
  if (fromDisk > 0) {
    cacheHits_++;
    bytesFromCache_ += static_cast<std::uint64_t>(fromDisk);
    countBytes("disk", fromDisk);
  }
  if (!fetched.empty())
    cacheMisses_++;
  if (source) {
    source->fromCache += fromDisk;
    source->fromNetwork += fromNetwork;
  }
  return data;
}

void SparseCache::invalidate(const std::string &resourceId) {
  validateResourceId(resourceId);
  auto state = stateFor(resourceId);
  std::lock_guard<std::mutex> lock(state->mutex);
  Logger::getInstance().log(LogLevel::INFO, "Invalidating cache for " + resourceId);
  invalidateLocked(resourceId, *state);
}

bool SparseCache::forceValidation(const std::string &resourceId) {
  validateResourceId(resourceId);
  auto state = stateFor(resourceId);
  std::lock_guard<std::mutex> lock(state->mutex);
  if (!loadLocked(resourceId, *state))
    return false;
  if (validateLocked(resourceId, *state))
    return true;
  Logger::getInstance().log(LogLevel::INFO, "Invalidating cache for " + resourceId);
  invalidateLocked(resourceId, *state);
  return false;
}

std::vector<std::string> SparseCache::listCachedResources() const {
  std::vector<std::string> ids;
  std::error_code ec;
  fs::directory_iterator it(options_.cacheDir, ec);
  if (ec)
    return ids;
  for (const auto &entry : it) {
    const std::string name = entry.path().filename().string();
    if (name.size() > kMetaSuffix.size() &&
        name.compare(name.size() - kMetaSuffix.size(), kMetaSuffix.size(),
                     kMetaSuffix) == 0)
      ids.push_back(name.substr(0, name.size() - kMetaSuffix.size()));
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<std::string> SparseCache::pruneByLRU(std::size_t keepCount) {
  std::vector<std::pair<std::int64_t, std::string>> ranked;
  for (const auto &id : listCachedResources()) {
    auto state = stateFor(id);
    std::lock_guard<std::mutex> lock(state->mutex);
    ranked.emplace_back(loadLocked(id, *state) ? state->meta->lastAccessedTs : 0,
                        id);
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto &a, const auto &b) { return a.first > b.first; });

  std::vector<std::string> removed;
  for (std::size_t i = keepCount; i < ranked.size(); ++i) {
    invalidate(ranked[i].second);
    removed.push_back(ranked[i].second);
  }
  if (!removed.empty())
    Logger::getInstance().log(LogLevel::INFO, "Pruned " +
                                                  std::to_string(removed.size()) +
                                                  " cached resources");
  return removed;
}

void SparseCache::clearAll() {
  for (const auto &id : listCachedResources())
    invalidate(id);
  cacheHits_ = 0;
  cacheMisses_ = 0;
  bytesFromCache_ = 0;
  bytesFromNetwork_ = 0;
  validationChecks_ = 0;
  validationRefreshes_ = 0;
}

std::optional<ResourceStats>
SparseCache::getResourceStats(const std::string &resourceId) {
  validateResourceId(resourceId);
  auto state = stateFor(resourceId);
  std::lock_guard<std::mutex> lock(state->mutex);
  if (!loadLocked(resourceId, *state))
    return std::nullopt;

  const CacheMeta &meta = *state->meta;
  ResourceStats stats;
  stats.fileSize = meta.fileSize;
  stats.totalBlocks = meta.totalBlocks;
  stats.blocksCached = countCachedBlocks(state->bitmap, meta.totalBlocks);
  stats.cachedBytes = std::min(stats.blocksCached * meta.blockSize, meta.fileSize);
  stats.coveragePercent =
      meta.totalBlocks > 0
          ? static_cast<double>(stats.blocksCached) / meta.totalBlocks * 100.0
          : 0.0;
  stats.lastValidatedTs = meta.lastValidatedTs;
  stats.lastAccessedTs = meta.lastAccessedTs;
  stats.isStale = nowMillis() - meta.lastValidatedTs >
                  std::chrono::duration_cast<std::chrono::milliseconds>(
                      options_.validationInterval)
                      .count();
  stats.etag = meta.etag;
  return stats;
}

SparseCacheStats SparseCache::getStats() const {
  SparseCacheStats stats;
  stats.cacheHits = cacheHits_;
  stats.cacheMisses = cacheMisses_;
  stats.bytesFromCache = bytesFromCache_;
  stats.bytesFromNetwork = bytesFromNetwork_;
  const auto total = stats.cacheHits + stats.cacheMisses;
  stats.hitRate = total > 0 ? static_cast<double>(stats.cacheHits) / total : 0.0;
  stats.validationChecks = validationChecks_;
  stats.validationRefreshes = validationRefreshes_;
  return stats;
}

} // namespace gutex
