#pragma once
#ifndef GUTEX_ORIGIN_RACER_H
#define GUTEX_ORIGIN_RACER_H

#include "mirror/keyed_store.h"
#include "mirror/mirror.h"
#include "mirror/mirror_health.h"
#include "mirror/mirror_transport.h"

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gutex {

struct OriginRacerOptions {
  std::string mirrorListUrl = "https://www.gutenberg.org/MIRRORS.ALL";
  /// Origin appended to every list; empty keeps defaultMirror().
  std::string defaultMirrorUrl;
  /// Local copy of the last downloaded list; empty means mirrorListPath().
  std::string localMirrorListPath;
  std::string resourcePath = "/cache/epub/{id}/pg{id}.txt";
  std::chrono::milliseconds requestTimeout{3000};
  std::chrono::milliseconds listTimeout{5000};
  std::size_t raceCount = 3;
  std::size_t backupCount = 2;
  std::chrono::milliseconds backupStagger{500};
  std::chrono::seconds recentFailureWindow{std::chrono::minutes(5)};
  std::size_t workerThreads = 8;
};

struct HeadResult {
  std::string url;
  std::int64_t contentLength{0};
  std::optional<std::string> etag;
  std::optional<std::string> lastModified;
  Mirror mirror;
};

struct GetResult {
  std::string body;
  std::string url;
  int statusCode{0};
  Mirror mirror;
};

struct GetOptions {
  /// Inclusive byte range sent as a Range header.
  std::optional<std::pair<std::int64_t, std::int64_t>> range;
};

struct MirrorStatusEntry {
  Mirror mirror;
  std::optional<MirrorStats> stats;
};

struct OriginRacerStatus {
  bool initialized{false};
  std::size_t mirrorCount{0};
  std::size_t stickyResources{0};
  std::vector<MirrorStatusEntry> mirrors; ///< In current health order

  Json::Value toJson() const;
};

/**
 * @brief Fetches resources from whichever mirror answers first.
 *
 * Keeps a ranked mirror list, races the best candidates, remembers the
 * mirror that last served each resource (sticky) and records every
 * outcome for health ranking. Requests run on an owned worker pool;
 * losing requests are not cancelled and the destructor waits for them.
 */
class OriginRacer {
public:
  explicit OriginRacer(std::shared_ptr<MirrorTransport> transport,
                       OriginRacerOptions options = {});
  ~OriginRacer();

  OriginRacer(const OriginRacer &) = delete;
  OriginRacer &operator=(const OriginRacer &) = delete;

  /**
   * @brief Load the mirror list: download, else local copy, else default.
   *
   * Never throws for list problems. Later calls return immediately.
   */
  void initialize();
  bool isInitialized() const { return initialized_.load(); }

  /**
   * @brief HEAD a resource: sticky mirror first, then a race.
   * @throw MirrorsExhaustedError when every mirror failed.
   */
  HeadResult headWithFallback(const std::string &resourceId);

  /**
   * @brief GET a resource: sticky mirror plus staggered backups, then a race.
   * @throw MirrorsExhaustedError when every mirror failed.
   */
  GetResult getWithFallback(const std::string &resourceId,
                            const GetOptions &options = {});

  /** Record an outcome for health ranking. */
  void recordOutcome(const std::string &baseUrl, bool success, double elapsedMs);

  std::vector<Mirror> mirrors() const;
  /** Mirrors in race order for the current health figures. */
  std::vector<Mirror> orderedMirrors() const;

  std::optional<Mirror> stickyMirror(const std::string &resourceId) const;
  void clearSticky(const std::string &resourceId);

  std::string resourceUrl(const Mirror &mirror,
                          const std::string &resourceId) const;

  OriginRacerStatus getStatus() const;
  const MirrorHealthTable &health() const { return health_; }

private:
  template <typename T>
  using Attempt = std::function<T(const Mirror &, const std::string &url)>;

  template <typename T>
  T timedAttempt(const Mirror &mirror, const std::string &resourceId,
                 const Attempt<T> &attempt);
  template <typename T>
  T raceTopN(const std::string &resourceId, const Attempt<T> &attempt);

  HeadResult headAttempt(const Mirror &mirror, const std::string &url);
  GetResult getAttempt(const Mirror &mirror, const std::string &url,
                       const GetOptions &options);
  void setSticky(const std::string &resourceId, const Mirror &mirror);
  void ensureInitialized();

  std::shared_ptr<MirrorTransport> transport_;
  const OriginRacerOptions options_;
  MirrorHealthTable health_;
  KeyedStore<Mirror> sticky_;

  mutable std::shared_mutex mirrorsMutex_;
  std::vector<Mirror> mirrors_;
  std::mutex initMutex_;
  std::atomic<bool> initialized_{false};

  boost::asio::thread_pool pool_;
};

} // namespace gutex

#endif // GUTEX_ORIGIN_RACER_H
