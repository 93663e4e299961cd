#pragma once
#ifndef GUTEX_ERRORS_H
#define GUTEX_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gutex {

/**
 * @brief Base class for every error raised by the gutex core.
 */
class GutexError : public std::runtime_error {
public:
  explicit GutexError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief An origin answered with a status code the caller cannot use.
 */
class HttpError : public GutexError {
public:
  HttpError(int statusCode, const std::string &url)
      : GutexError("HTTP " + std::to_string(statusCode) + " from " + url),
        statusCode_(statusCode) {}

  int statusCode() const { return statusCode_; }

private:
  int statusCode_;
};

/**
 * @brief A network operation did not finish before its deadline.
 *
 * Treated exactly like any other failed request for health scoring.
 */
class TimeoutError : public GutexError {
public:
  using GutexError::GutexError;
};

/**
 * @brief Every candidate mirror failed for a resource.
 */
class MirrorsExhaustedError : public GutexError {
public:
  MirrorsExhaustedError(std::size_t mirrorsTried, const std::string &resourceId)
      : GutexError("All " + std::to_string(mirrorsTried) +
                   " mirrors failed for resource " + resourceId),
        mirrorsTried_(mirrorsTried) {}

  std::size_t mirrorsTried() const { return mirrorsTried_; }

private:
  std::size_t mirrorsTried_;
};

/**
 * @brief Disk I/O failure inside the sparse cache.
 *
 * Never escapes SparseCache::getRange; the read path converts it into a
 * cache miss.
 */
class CacheIoError : public GutexError {
public:
  using GutexError::GutexError;
};

} // namespace gutex

#endif // GUTEX_ERRORS_H
