#pragma once
#ifndef GUTEX_NAVIGATOR_H
#define GUTEX_NAVIGATOR_H

#include "fetcher/range_fetcher.h"
#include "navigator/chunk_lru.h"
#include "navigator/position.h"

#include <atomic>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace gutex {

struct NavigatorOptions {
  std::size_t chunkSize = 200;
  bool prefetch = true;
  std::size_t lruCapacity = 10;
  std::size_t historyLimit = 50;
  std::chrono::milliseconds prefetchLeadDelay{10};
  std::chrono::milliseconds prefetchTrailDelay{100};
  std::size_t prefetchThreads = 2;
};

/** Boundaries spanning a whole resource of @p size bytes. */
Boundaries wholeResource(std::int64_t size);

/**
 * @brief Word-chunk navigation over a byte-addressed resource.
 *
 * Chunks are located by byte offset only. Moving forward and then back
 * returns byte-identical chunks because every move records where it came
 * from. Adjacent chunks are prefetched in the background into a small LRU.
 *
 * Public calls are expected from one reader at a time; prefetch tasks run
 * concurrently with them.
 */
class Navigator {
public:
  /**
   * @throw std::invalid_argument for inverted boundaries or a zero chunk size.
   */
  Navigator(std::shared_ptr<RangeFetcher> fetcher, Boundaries boundaries,
            NavigatorOptions options = {});
  ~Navigator();

  Navigator(const Navigator &) = delete;
  Navigator &operator=(const Navigator &) = delete;

  /**
   * @brief Jump to @p percent (clamped to [0, 100]) of the clean span.
   *
   * Clears both history stacks.
   * @throw std::invalid_argument when @p percent is not finite.
   */
  Position goToPercent(double percent);

  /** Next chunk; returns @p current unchanged at the document end. */
  Position moveForward(const Position &current);

  /**
   * @brief Previous chunk; returns @p current unchanged when no earlier
   * chunk can be located reliably.
   */
  Position moveBackward(const Position &current);

  /**
   * @brief Change the chunk size, re-materializing at current.byteStart.
   *
   * Clears history and the chunk cache.
   * @throw std::invalid_argument when @p chunkSize is zero.
   */
  Position setChunkSize(std::size_t chunkSize, const Position &current);

  std::size_t chunkSize() const;
  /** Calibrated bytes per word; calibrates on first call. */
  double averageBytesPerWord();
  std::size_t backDepth() const;
  std::size_t forwardDepth() const;
  std::size_t cachedChunks() const;
  const Boundaries &boundaries() const { return boundaries_; }

private:
  enum class Direction { Forward, Backward };

  struct HistoryEntry {
    /// byteStart of the position the entry applies to.
    std::int64_t anchor{0};
    /// Where the move from anchor leads.
    std::int64_t target{0};
    std::int64_t wordIndex{0};
  };

  /// Where the next move in one direction would land.
  struct Step {
    std::int64_t anchor{0};
    std::int64_t wordIndex{0};
    bool fromHistory{false};
    bool estimated{false};
    /// anchor is the last byte of the chunk rather than its first.
    bool endsAtAnchor{false};
  };

  double calibrate();
  Position materialize(std::int64_t anchor, std::int64_t wordIndexHint,
                       std::size_t chunkSize, bool isPrefetch,
                       bool endsAtAnchor = false);
  Position extract(std::int64_t anchor, std::int64_t wordIndexHint,
                   std::size_t chunkSize, double avg);
  /// The last chunkSize words ending exactly at @p lastByte.
  Position extractEndingAt(std::int64_t lastByte, std::int64_t wordIndexHint,
                           std::size_t chunkSize, double avg);
  void finishPosition(Position &position, std::size_t chunkSize,
                      bool shortChunkIsEnd) const;
  std::string chunkKey(std::int64_t anchor, std::size_t chunkSize, double avg,
                       bool endsAtAnchor = false) const;
  std::int64_t initialSpan(std::size_t chunkSize, double avg) const;

  std::optional<Step> nextStep(const Position &current) const;
  std::optional<Step> previousStep(const Position &current) const;
  bool acceptEstimate(const Position &current, const Position &candidate,
                      const Step &step, double avg) const;

  void pushHistory(std::deque<HistoryEntry> &stack, HistoryEntry entry);
  void clearHistory();
  void schedulePrefetch(const Position &position, Direction direction);
  void prefetchAdjacent(Position position, Direction direction,
                        std::chrono::milliseconds delay,
                        std::uint64_t generation);

  std::shared_ptr<RangeFetcher> fetcher_;
  const Boundaries boundaries_;
  const NavigatorOptions options_;

  std::mutex calibrationMutex_;
  std::optional<double> avgBytesPerWord_;

  mutable std::mutex mutex_;
  std::size_t chunkSize_;
  std::deque<HistoryEntry> back_;
  std::deque<HistoryEntry> forward_;
  LruCache<std::string, Position> chunks_;
  /// Bumped when cached chunks become stale so late prefetches are dropped.
  std::uint64_t generation_{0};

  std::mutex stopMutex_;
  std::condition_variable stopCv_;
  std::atomic<bool> stopping_{false};
  boost::asio::thread_pool prefetchPool_;
};

} // namespace gutex

#endif // GUTEX_NAVIGATOR_H
