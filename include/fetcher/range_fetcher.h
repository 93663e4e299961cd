#pragma once
#ifndef GUTEX_RANGE_FETCHER_H
#define GUTEX_RANGE_FETCHER_H

#include <cstdint>
#include <string>

namespace gutex {

/**
 * @brief Byte access to one resource, as consumed by the Navigator.
 */
class RangeFetcher {
public:
  virtual ~RangeFetcher() = default;

  virtual std::int64_t getFileSize() = 0;

  /** Bytes [start, end], both inclusive, clamped to the resource. */
  virtual std::string fetchRange(std::int64_t start, std::int64_t end) = 0;

  /** Identifier used in chunk cache keys. */
  virtual const std::string &resourceId() const = 0;
};

} // namespace gutex

#endif // GUTEX_RANGE_FETCHER_H
