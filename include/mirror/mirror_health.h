#pragma once
#ifndef GUTEX_MIRROR_HEALTH_H
#define GUTEX_MIRROR_HEALTH_H

#include "mirror/keyed_store.h"
#include "mirror/mirror.h"

#include <chrono>
#include <unordered_map>
#include <vector>

/**
 * @file mirror_health.h
 * @brief Thread-safe response-time and failure tracker for mirrors.
 */

namespace gutex {

/**
 * @brief Per-mirror outcome table used to rank race candidates.
 */
class MirrorHealthTable {
public:
  explicit MirrorHealthTable(
      std::chrono::seconds recentFailureWindow = std::chrono::minutes(5),
      double ewmaAlpha = 0.1);

  /**
   * @brief Record one request outcome against @p baseUrl.
   *
   * Successes feed the response-time EWMA; the first sample initialises it.
   */
  void recordOutcome(const std::string &baseUrl, bool success,
                     double elapsedMs, WallClock::time_point at = WallClock::now());

  std::optional<MirrorStats> stats(const std::string &baseUrl) const;

  /** True when @p baseUrl failed within the recent-failure window. */
  bool recentlyFailed(const std::string &baseUrl,
                      WallClock::time_point now = WallClock::now()) const;

  /**
   * @brief Rank @p mirrors for a race.
   *
   * Mirrors with stats and no recent failure come first, fastest EWMA
   * first; then mirrors without stats; recently failed mirrors last. Ties
   * keep the input order.
   */
  std::vector<Mirror> order(const std::vector<Mirror> &mirrors,
                            WallClock::time_point now = WallClock::now()) const;

  /** Snapshot of all stats for diagnostics. */
  std::unordered_map<std::string, MirrorStats> snapshot() const;

  void clear();

private:
  KeyedStore<MirrorStats> stats_;
  const std::chrono::seconds recentFailureWindow_;
  const double ewmaAlpha_;
};

} // namespace gutex

#endif // GUTEX_MIRROR_HEALTH_H
