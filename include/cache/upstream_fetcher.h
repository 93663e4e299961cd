#pragma once
#ifndef GUTEX_UPSTREAM_FETCHER_H
#define GUTEX_UPSTREAM_FETCHER_H

#include <cstdint>
#include <optional>
#include <string>

namespace gutex {

struct UpstreamHead {
  std::int64_t size{0};
  std::optional<std::string> etag;
  std::optional<std::string> lastModified;
};

/**
 * @brief Source of truth behind the SparseCache.
 */
class UpstreamFetcher {
public:
  virtual ~UpstreamFetcher() = default;

  virtual UpstreamHead head(const std::string &resourceId) = 0;

  /** Bytes [startByte, endByte], both inclusive. */
  virtual std::string getRange(const std::string &resourceId,
                               std::int64_t startByte, std::int64_t endByte) = 0;
};

} // namespace gutex

#endif // GUTEX_UPSTREAM_FETCHER_H
