#include "mirror/origin_racer.h"
#include "mirror/mirror_list.h"
#include "utilities/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace gutex {

namespace {

/**
 * @brief Shared state of one fan-out: the first success is kept, later
 * results are discarded, and waiters wake when a winner exists or every
 * participant has finished.
 */
template <typename T> class RaceGroup {
public:
  explicit RaceGroup(std::size_t participants) : pending_(participants) {}

  void succeed(T result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!winner_)
      winner_ = std::move(result);
    --pending_;
    cv_.notify_all();
  }

  void fail(const std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    errors_.push_back(error);
    --pending_;
    cv_.notify_all();
  }

  /** A participant that decided not to run. */
  void withdraw() {
    std::lock_guard<std::mutex> lock(mutex_);
    --pending_;
    cv_.notify_all();
  }

  /**
   * @brief Gate for staggered participants: wait up to @p stagger, waking
   * early once any participant has failed.
   * @return false when a winner already exists and the caller should not run.
   */
  bool waitToStart(std::chrono::milliseconds stagger) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, stagger,
                 [this] { return winner_.has_value() || !errors_.empty(); });
    return !winner_.has_value();
  }

  std::optional<T> awaitWinner() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return winner_.has_value() || pending_ == 0; });
    return winner_;
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::size_t pending_;
  std::optional<T> winner_;
  std::vector<std::string> errors_;
};

template <typename T, typename F> void settle(RaceGroup<T> &group, F &&fn) {
  try {
    group.succeed(fn());
  } catch (const std::exception &e) {
    group.fail(e.what());
  }
}

double millisSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - start)
      .count();
}

std::string readFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    return "";
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

std::int64_t toEpochMillis(WallClock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace

OriginRacer::OriginRacer(std::shared_ptr<MirrorTransport> transport,
                         OriginRacerOptions options)
    : transport_(std::move(transport)), options_(std::move(options)),
      health_(options_.recentFailureWindow),
      pool_(std::max<std::size_t>(1, options_.workerThreads)) {
  if (!transport_)
    throw std::invalid_argument("OriginRacer requires a transport");
}

OriginRacer::~OriginRacer() { pool_.join(); }

void OriginRacer::initialize() {
  std::lock_guard<std::mutex> lock(initMutex_);
  if (initialized_)
    return;

  const std::string localPath = options_.localMirrorListPath.empty()
                                    ? mirrorListPath()
                                    : options_.localMirrorListPath;
  std::string content;
  std::string source = "built-in default";
  try {
    auto response = transport_->send(HTTP::HttpMethod::GET,
                                     options_.mirrorListUrl, {},
                                     options_.listTimeout);
    if (response.statusCodeNumber != 200)
      throw HttpError(response.statusCodeNumber, options_.mirrorListUrl);
    content = std::move(response.body);
    source = "download";

    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(localPath).parent_path(), ec);
    std::ofstream out(localPath, std::ios::binary | std::ios::trunc);
    if (out.is_open() && out.write(content.data(), content.size())) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                "Saved mirror list copy to " + localPath);
    } else {
      Logger::getInstance().log(LogLevel::WARN,
                                "Could not save mirror list copy to " + localPath);
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Mirror list download failed: " + std::string(e.what()));
    content = readFile(localPath);
    if (!content.empty())
      source = "local copy " + localPath;
  }

  auto parsed = parseMirrorList(content);
  Mirror fallback = defaultMirror();
  if (!options_.defaultMirrorUrl.empty())
    fallback.baseUrl = options_.defaultMirrorUrl;
  if (std::find(parsed.begin(), parsed.end(), fallback) == parsed.end())
    parsed.push_back(fallback);

  Logger::getInstance().log(LogLevel::INFO,
                            "Loaded " + std::to_string(parsed.size()) +
                                " mirrors from " + source);
  {
    std::unique_lock<std::shared_mutex> guard(mirrorsMutex_);
    mirrors_ = std::move(parsed);
  }
  initialized_ = true;
}

void OriginRacer::ensureInitialized() {
  if (!initialized_)
    initialize();
}

std::vector<Mirror> OriginRacer::mirrors() const {
  std::shared_lock<std::shared_mutex> guard(mirrorsMutex_);
  return mirrors_;
}

std::vector<Mirror> OriginRacer::orderedMirrors() const {
  return health_.order(mirrors());
}

void OriginRacer::recordOutcome(const std::string &baseUrl, bool success,
                                double elapsedMs) {
  health_.recordOutcome(baseUrl, success, elapsedMs);
  MetricsRegistry::instance().incrementCounter(
      "gutex_mirror_requests_total", 1.0,
      {{"mirror", baseUrl}, {"outcome", success ? "success" : "failure"}});
}

std::optional<Mirror>
OriginRacer::stickyMirror(const std::string &resourceId) const {
  return sticky_.get(resourceId);
}

void OriginRacer::setSticky(const std::string &resourceId, const Mirror &mirror) {
  sticky_.set(resourceId, mirror);
  MetricsRegistry::instance().setGauge("gutex_sticky_resources",
                                       static_cast<double>(sticky_.size()));
}

void OriginRacer::clearSticky(const std::string &resourceId) {
  if (sticky_.erase(resourceId))
    MetricsRegistry::instance().setGauge("gutex_sticky_resources",
                                         static_cast<double>(sticky_.size()));
}

std::string OriginRacer::resourceUrl(const Mirror &mirror,
                                     const std::string &resourceId) const {
  return buildResourceUrl(mirror.baseUrl, options_.resourcePath, resourceId);
}

template <typename T>
T OriginRacer::timedAttempt(const Mirror &mirror, const std::string &resourceId,
                            const Attempt<T> &attempt) {
  const std::string url = resourceUrl(mirror, resourceId);
  const auto start = std::chrono::steady_clock::now();
  try {
    T result = attempt(mirror, url);
    recordOutcome(mirror.baseUrl, true, millisSince(start));
    return result;
  } catch (const std::exception &e) {
    recordOutcome(mirror.baseUrl, false, millisSince(start));
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Mirror " + mirror.baseUrl + " failed for " +
                                  resourceId + ": " + e.what());
    throw;
  }
}

template <typename T>
T OriginRacer::raceTopN(const std::string &resourceId,
                        const Attempt<T> &attempt) {
  const auto ordered = orderedMirrors();
  const std::size_t raced = std::min(options_.raceCount, ordered.size());

  if (raced > 0) {
    auto group = std::make_shared<RaceGroup<T>>(raced);
    for (std::size_t i = 0; i < raced; ++i) {
      boost::asio::post(pool_, [this, group, mirror = ordered[i], resourceId,
                                attempt] {
        settle(*group, [&] { return timedAttempt(mirror, resourceId, attempt); });
      });
    }
    if (auto winner = group->awaitWinner()) {
      Logger::getInstance().log(LogLevel::DEBUG, "Race for " + resourceId +
                                                     " won by " +
                                                     winner->mirror.baseUrl);
      setSticky(resourceId, winner->mirror);
      return std::move(*winner);
    }
  }

  for (std::size_t i = raced; i < ordered.size(); ++i) {
    try {
      T result = timedAttempt(ordered[i], resourceId, attempt);
      setSticky(resourceId, ordered[i]);
      return result;
    } catch (const std::exception &) {
      // Already recorded and logged by timedAttempt; try the next mirror.
    }
  }
  throw MirrorsExhaustedError(ordered.size(), resourceId);
}

HeadResult OriginRacer::headAttempt(const Mirror &mirror, const std::string &url) {
  auto response = transport_->send(HTTP::HttpMethod::HEAD, url, {},
                                   options_.requestTimeout);
  if (response.statusCodeNumber != 200)
    throw HttpError(response.statusCodeNumber, url);
  auto length = HTTP::FindHeader(response.headers, "Content-Length");
  if (!length)
    throw GutexError("No Content-Length in HEAD response from " + url);

  HeadResult result;
  try {
    result.contentLength = std::stoll(*length);
  } catch (const std::exception &) {
    throw GutexError("Malformed Content-Length '" + *length + "' from " + url);
  }
  result.url = url;
  result.etag = HTTP::FindHeader(response.headers, "ETag");
  result.lastModified = HTTP::FindHeader(response.headers, "Last-Modified");
  result.mirror = mirror;
  return result;
}

GetResult OriginRacer::getAttempt(const Mirror &mirror, const std::string &url,
                                  const GetOptions &options) {
  HTTP::HeaderMap headers;
  if (options.range)
    headers["Range"] =
        HTTP::FormatRangeHeader(options.range->first, options.range->second);
  auto response = transport_->send(HTTP::HttpMethod::GET, url, headers,
                                   options_.requestTimeout);
  if (response.statusCodeNumber != 200 && response.statusCodeNumber != 206)
    throw HttpError(response.statusCodeNumber, url);
  return GetResult{std::move(response.body), url, response.statusCodeNumber,
                   mirror};
}

HeadResult OriginRacer::headWithFallback(const std::string &resourceId) {
  ensureInitialized();
  Attempt<HeadResult> attempt = [this](const Mirror &m, const std::string &url) {
    return headAttempt(m, url);
  };

  if (auto sticky = sticky_.get(resourceId)) {
    try {
      return timedAttempt(*sticky, resourceId, attempt);
    } catch (const std::exception &e) {
      Logger::getInstance().log(LogLevel::INFO,
                                "Sticky mirror " + sticky->baseUrl +
                                    " failed HEAD for " + resourceId +
                                    ", clearing: " + e.what());
      clearSticky(resourceId);
    }
  }
  return raceTopN(resourceId, attempt);
}

GetResult OriginRacer::getWithFallback(const std::string &resourceId,
                                       const GetOptions &options) {
  ensureInitialized();
  // Captured by value: losing attempts may outlive this call.
  Attempt<GetResult> attempt = [this, options](const Mirror &m,
                                               const std::string &url) {
    return getAttempt(m, url, options);
  };

  auto sticky = sticky_.get(resourceId);
  if (!sticky)
    return raceTopN(resourceId, attempt);

  std::vector<Mirror> backups;
  for (const auto &m : orderedMirrors()) {
    if (backups.size() >= options_.backupCount)
      break;
    if (m != *sticky)
      backups.push_back(m);
  }

  auto group = std::make_shared<RaceGroup<GetResult>>(1 + backups.size());
  boost::asio::post(pool_, [this, group, mirror = *sticky, resourceId, attempt] {
    settle(*group, [&] { return timedAttempt(mirror, resourceId, attempt); });
  });
  const auto stagger = options_.backupStagger;
  for (const auto &backup : backups) {
    boost::asio::post(pool_, [this, group, mirror = backup, resourceId, attempt,
                              stagger] {
      if (!group->waitToStart(stagger)) {
        group->withdraw();
        return;
      }
      settle(*group, [&] { return timedAttempt(mirror, resourceId, attempt); });
    });
  }

  if (auto winner = group->awaitWinner()) {
    if (winner->mirror != *sticky) {
      Logger::getInstance().log(LogLevel::INFO,
                                "Backup mirror " + winner->mirror.baseUrl +
                                    " replaces sticky " + sticky->baseUrl +
                                    " for " + resourceId);
      setSticky(resourceId, winner->mirror);
    }
    return std::move(*winner);
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Sticky mirror " + sticky->baseUrl +
                                " and backups failed for " + resourceId +
                                ", clearing sticky and racing");
  clearSticky(resourceId);
  return raceTopN(resourceId, attempt);
}

OriginRacerStatus OriginRacer::getStatus() const {
  OriginRacerStatus status;
  status.initialized = initialized_;
  for (const auto &m : orderedMirrors())
    status.mirrors.push_back({m, health_.stats(m.baseUrl)});
  status.mirrorCount = status.mirrors.size();
  status.stickyResources = sticky_.size();
  return status;
}

Json::Value OriginRacerStatus::toJson() const {
  Json::Value root;
  root["initialized"] = initialized;
  root["mirrorCount"] = static_cast<Json::UInt64>(mirrorCount);
  root["stickyResources"] = static_cast<Json::UInt64>(stickyResources);
  root["mirrors"] = Json::Value(Json::arrayValue);
  for (const auto &entry : mirrors) {
    Json::Value m;
    m["provider"] = entry.mirror.provider;
    m["location"] = entry.mirror.location;
    m["baseUrl"] = entry.mirror.baseUrl;
    if (entry.stats) {
      Json::Value s;
      s["successes"] = static_cast<Json::UInt64>(entry.stats->successes);
      s["failures"] = static_cast<Json::UInt64>(entry.stats->failures);
      s["avgResponseTimeMs"] = entry.stats->avgResponseTimeMs
                                   ? Json::Value(*entry.stats->avgResponseTimeMs)
                                   : Json::Value(Json::nullValue);
      s["lastSuccess"] =
          entry.stats->lastSuccess
              ? Json::Value(static_cast<Json::Int64>(toEpochMillis(*entry.stats->lastSuccess)))
              : Json::Value(Json::nullValue);
      s["lastFailure"] =
          entry.stats->lastFailure
              ? Json::Value(static_cast<Json::Int64>(toEpochMillis(*entry.stats->lastFailure)))
              : Json::Value(Json::nullValue);
      m["stats"] = s;
    } else {
      m["stats"] = Json::Value(Json::nullValue);
    }
    root["mirrors"].append(m);
  }
  return root;
}

} // namespace gutex
