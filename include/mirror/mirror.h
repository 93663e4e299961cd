#pragma once
#ifndef GUTEX_MIRROR_H
#define GUTEX_MIRROR_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gutex {

using WallClock = std::chrono::system_clock;

/**
 * @brief One origin server able to serve every resource.
 *
 * Parsed once from the mirror list and never modified. Two mirrors are the
 * same mirror when their baseUrl matches.
 */
struct Mirror {
  std::string baseUrl; ///< Scheme and host, no trailing slash
  std::string provider;
  std::string location;
  std::string note;
  std::string continent;

  bool operator==(const Mirror &other) const { return baseUrl == other.baseUrl; }
  bool operator!=(const Mirror &other) const { return !(*this == other); }
};

/**
 * @brief Rolling health figures for one mirror.
 */
struct MirrorStats {
  std::uint64_t successes{0};
  std::uint64_t failures{0};
  /// EWMA of response times in milliseconds, unset until the first sample.
  std::optional<double> avgResponseTimeMs;
  std::optional<WallClock::time_point> lastSuccess;
  std::optional<WallClock::time_point> lastFailure;
};

/** The primary site, used when no mirror list can be obtained. */
Mirror defaultMirror();

} // namespace gutex

#endif // GUTEX_MIRROR_H
