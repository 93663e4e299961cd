#pragma once
#ifndef GUTEX_CACHE_META_H
#define GUTEX_CACHE_META_H

#include <cstdint>
#include <optional>
#include <string>

namespace gutex {

/**
 * @brief Persisted description of one cached resource (`<id>.meta.json`).
 *
 * Timestamps are Unix milliseconds.
 */
struct CacheMeta {
  std::string resourceId;
  std::int64_t fileSize{0};
  std::optional<std::string> etag;
  std::optional<std::string> lastModified;
  std::int64_t blockSize{4096};
  std::int64_t lastValidatedTs{0};
  std::int64_t lastAccessedTs{0};
  std::int64_t createdTs{0};
  std::int64_t blocksCached{0};
  std::int64_t totalBlocks{0};

  std::string toJson() const;

  /** @throw CacheIoError when @p text is not a valid meta document. */
  static CacheMeta fromJson(const std::string &text);
};

/** Current wall clock as Unix milliseconds. */
std::int64_t nowMillis();

} // namespace gutex

#endif // GUTEX_CACHE_META_H
