#include "mirror/mirror_health.h"

#include <algorithm>

namespace gutex {

MirrorHealthTable::MirrorHealthTable(std::chrono::seconds recentFailureWindow,
                                     double ewmaAlpha)
    : recentFailureWindow_(recentFailureWindow), ewmaAlpha_(ewmaAlpha) {}

void MirrorHealthTable::recordOutcome(const std::string &baseUrl, bool success,
                                      double elapsedMs,
                                      WallClock::time_point at) {
  stats_.update(baseUrl, [&](MirrorStats &s) {
    if (success) {
      s.successes++;
      s.lastSuccess = at;
      if (s.avgResponseTimeMs)
        s.avgResponseTimeMs =
            ewmaAlpha_ * elapsedMs + (1.0 - ewmaAlpha_) * *s.avgResponseTimeMs;
      else
        s.avgResponseTimeMs = elapsedMs;
    } else {
      s.failures++;
      s.lastFailure = at;
    }
  });
}

std::optional<MirrorStats>
MirrorHealthTable::stats(const std::string &baseUrl) const {
  return stats_.get(baseUrl);
}

static bool failedWithin(const MirrorStats &s, WallClock::time_point now,
                         std::chrono::seconds window) {
  return s.lastFailure && now - *s.lastFailure < window;
}

bool MirrorHealthTable::recentlyFailed(const std::string &baseUrl,
                                       WallClock::time_point now) const {
  auto s = stats_.get(baseUrl);
  return s && failedWithin(*s, now, recentFailureWindow_);
}

std::vector<Mirror> MirrorHealthTable::order(const std::vector<Mirror> &mirrors,
                                             WallClock::time_point now) const {
  // 0 = healthy with a response-time sample, 1 = unknown, 2 = recently failed
  struct Ranked {
    Mirror mirror;
    int tier;
    double avgMs;
  };
  std::vector<Ranked> ranked;
  ranked.reserve(mirrors.size());
  for (const auto &m : mirrors) {
    auto s = stats_.get(m.baseUrl);
    if (s && failedWithin(*s, now, recentFailureWindow_))
      ranked.push_back({m, 2, 0.0});
    else if (s && s->avgResponseTimeMs)
      ranked.push_back({m, 0, *s->avgResponseTimeMs});
    else
      ranked.push_back({m, 1, 0.0});
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Ranked &a, const Ranked &b) {
                     if (a.tier != b.tier)
                       return a.tier < b.tier;
                     return a.tier == 0 && a.avgMs < b.avgMs;
                   });
  std::vector<Mirror> out;
  out.reserve(ranked.size());
  for (auto &r : ranked)
    out.push_back(std::move(r.mirror));
  return out;
}

std::unordered_map<std::string, MirrorStats> MirrorHealthTable::snapshot() const {
  return stats_.snapshot();
}

void MirrorHealthTable::clear() { stats_.clear(); }

} // namespace gutex
