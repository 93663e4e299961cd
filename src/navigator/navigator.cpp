#include "navigator/navigator.h"
#include "navigator/word_scanner.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <cmath>
#include <stdexcept>

namespace gutex {

namespace {

/// Longest UTF-8 continuation run that can sit at either end of a window.
constexpr std::int64_t kUtf8Margin = 3;
constexpr double kOverfetchFactor = 2.5;
constexpr double kDefaultBytesPerWord = 6.0;
constexpr std::int64_t kMaxCalibrationSample = 2000;
constexpr std::int64_t kNearEndBytes = 100;

void appendWords(Position &position, const std::string &window,
                 std::int64_t windowStart, const std::vector<WordSpan> &words,
                 std::size_t first, std::size_t count) {
  for (std::size_t i = first; i < first + count; ++i) {
    const WordSpan &w = words[i];
    std::string word =
        window.substr(static_cast<std::size_t>(w.start - windowStart),
                      static_cast<std::size_t>(w.end - w.start + 1));
    if (i > first)
      position.formattedText += w.paragraphBefore ? "\n\n" : " ";
    position.formattedText += word;
    position.words.push_back(std::move(word));
  }
  position.actualCount = count;
}

} // namespace

Boundaries wholeResource(std::int64_t size) {
  Boundaries b;
  b.startByte = 0;
  b.endByte = size > 0 ? size - 1 : 0;
  b.cleanLength = std::max<std::int64_t>(size, 0);
  return b;
}

Navigator::Navigator(std::shared_ptr<RangeFetcher> fetcher,
                     Boundaries boundaries, NavigatorOptions options)
    : fetcher_(std::move(fetcher)), boundaries_(boundaries),
      options_(options), chunkSize_(options.chunkSize),
      chunks_(options.lruCapacity),
      prefetchPool_(std::max<std::size_t>(options.prefetchThreads, 1)) {
  if (!fetcher_)
    throw std::invalid_argument("Navigator requires a fetcher");
  if (boundaries_.startByte < 0 || boundaries_.endByte < boundaries_.startByte)
    throw std::invalid_argument("Invalid navigation boundaries [" +
                                std::to_string(boundaries_.startByte) + ", " +
                                std::to_string(boundaries_.endByte) + "]");
  if (chunkSize_ == 0)
    throw std::invalid_argument("Chunk size must be positive");
}

Navigator::~Navigator() {
  {
    std::lock_guard<std::mutex> lock(stopMutex_);
    stopping_ = true;
  }
  stopCv_.notify_all();
  prefetchPool_.join();
}

double Navigator::calibrate() {
  std::lock_guard<std::mutex> lock(calibrationMutex_);
  if (avgBytesPerWord_)
    return *avgBytesPerWord_;

  const std::int64_t sampleLength = std::min<std::int64_t>(
      kMaxCalibrationSample,
      static_cast<std::int64_t>(std::floor(boundaries_.cleanLength * 0.02)));
  std::int64_t totalBytes = 0;
  std::size_t totalWords = 0;
  if (sampleLength > 0) {
    for (double fraction : {0.10, 0.60}) {
      const std::int64_t start =
          boundaries_.startByte +
          static_cast<std::int64_t>(std::floor(boundaries_.cleanLength * fraction));
      if (start > boundaries_.endByte)
        continue;
      const std::int64_t end =
          std::min(boundaries_.endByte, start + sampleLength - 1);
      std::string sample = fetcher_->fetchRange(start, end);
      totalBytes += static_cast<std::int64_t>(sample.size());
      totalWords += countWords(sample);
    }
  }

  double avg = kDefaultBytesPerWord;
  if (totalWords > 0)
    avg = std::max(1.0, static_cast<double>(totalBytes) /
                            static_cast<double>(totalWords));
  avgBytesPerWord_ = avg;
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Calibrated " + fetcher_->resourceId() + " at " +
                                std::to_string(avg) + " bytes per word");
  return avg;
}

double Navigator::averageBytesPerWord() { return calibrate(); }

std::int64_t Navigator::initialSpan(std::size_t chunkSize, double avg) const {
  auto span = static_cast<std::int64_t>(
      std::ceil(static_cast<double>(chunkSize) * avg * kOverfetchFactor));
  return std::max<std::int64_t>(span, 1);
}

std::string Navigator::chunkKey(std::int64_t anchor, std::size_t chunkSize,
                                double avg, bool endsAtAnchor) const {
  if (endsAtAnchor)
    return fetcher_->resourceId() + ":..:" + std::to_string(anchor) + ":" +
           std::to_string(chunkSize);
  const std::int64_t requestEnd = std::min(
      boundaries_.endByte, anchor + initialSpan(chunkSize, avg) - 1 + kUtf8Margin);
  return fetcher_->resourceId() + ":" + std::to_string(anchor) + ":" +
         std::to_string(requestEnd);
}

Position Navigator::materialize(std::int64_t anchor, std::int64_t wordIndexHint,
                                std::size_t chunkSize, bool isPrefetch,
                                bool endsAtAnchor) {
  const double avg = calibrate();
  const std::string key = chunkKey(anchor, chunkSize, avg, endsAtAnchor);
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = generation_;
    auto cached = chunks_.get(key);
    if (cached) {
      MetricsRegistry::instance().incrementCounter("gutex_navigator_chunks_total",
                                                   1.0, {{"source", "lru"}});
      cached->wordIndex = wordIndexHint;
      return *cached;
    }
  }

  Position position =
      endsAtAnchor ? extractEndingAt(anchor, wordIndexHint, chunkSize, avg)
                   : extract(anchor, wordIndexHint, chunkSize, avg);
  MetricsRegistry::instance().incrementCounter(
      "gutex_navigator_chunks_total", 1.0,
      {{"source", isPrefetch ? "prefetch" : "fetch"}});

  std::lock_guard<std::mutex> lock(mutex_);
  if (generation == generation_)
    chunks_.put(key, position);
  return position;
}

Position Navigator::extract(std::int64_t anchor, std::int64_t wordIndexHint,
                            std::size_t chunkSize, double avg) {
  std::int64_t span = initialSpan(chunkSize, avg);
  std::string window;
  std::int64_t windowStart = 0;
  std::vector<WordSpan> words;

  for (;;) {
    const std::int64_t requestStart =
        std::max(boundaries_.startByte, anchor - kUtf8Margin);
    const std::int64_t requestEnd =
        std::min(boundaries_.endByte, anchor + span - 1 + kUtf8Margin);
    std::string buffer = fetcher_->fetchRange(requestStart, requestEnd);
    const bool atEnd =
        requestEnd >= boundaries_.endByte ||
        static_cast<std::int64_t>(buffer.size()) < requestEnd - requestStart + 1;

    auto safe = utf8SafeSpan(buffer);
    window = buffer.substr(safe.first, safe.second - safe.first);
    windowStart = requestStart + static_cast<std::int64_t>(safe.first);
    words = scanWords(window, windowStart, anchor, boundaries_.startByte, atEnd,
                      chunkSize + 1);
    if (words.size() > chunkSize || atEnd)
      break;
    span *= 2;
  }

  Position position;
  position.wordIndex = wordIndexHint;
  const std::size_t count = std::min(words.size(), chunkSize);
  if (count == 0) {
    position.byteStart = std::clamp(anchor, boundaries_.startByte, boundaries_.endByte);
    position.byteEnd = boundaries_.endByte;
    position.isNearEnd = true;
  } else {
    appendWords(position, window, windowStart, words, 0, count);
    position.byteStart = words.front().start;
    if (words.size() > chunkSize) {
      position.nextByteStart = words[chunkSize].start;
      position.byteEnd = *position.nextByteStart - 1;
    } else {
      position.byteEnd = words[count - 1].end;
    }
  }

  finishPosition(position, chunkSize, true);
  return position;
}

Position Navigator::extractEndingAt(std::int64_t lastByte,
                                    std::int64_t wordIndexHint,
                                    std::size_t chunkSize, double avg) {
  std::int64_t span = initialSpan(chunkSize, avg);
  std::string window;
  std::int64_t windowStart = 0;
  std::vector<WordSpan> words;

  // lastByte + 1 starts a word, so a word touching the window end is whole.
  for (;;) {
    const std::int64_t requestStart =
        std::max(boundaries_.startByte, lastByte - span + 1 - kUtf8Margin);
    std::string buffer = fetcher_->fetchRange(requestStart, lastByte);
    const bool atStart = requestStart <= boundaries_.startByte;

    auto safe = utf8SafeSpan(buffer);
    window = buffer.substr(safe.first, safe.second - safe.first);
    windowStart = requestStart + static_cast<std::int64_t>(safe.first);
    words = scanWords(window, windowStart, windowStart, boundaries_.startByte,
                      true, window.size());
    if (words.size() >= chunkSize || atStart)
      break;
    span *= 2;
  }

  Position position;
  position.wordIndex = wordIndexHint;
  if (words.empty()) {
    position.byteStart = lastByte + 1;
    position.byteEnd = lastByte;
    return position;
  }
  const std::size_t count = std::min(words.size(), chunkSize);
  const std::size_t first = words.size() - count;
  appendWords(position, window, windowStart, words, first, count);
  position.byteStart = words[first].start;
  position.byteEnd = lastByte;
  if (lastByte < boundaries_.endByte)
    position.nextByteStart = lastByte + 1;
  finishPosition(position, chunkSize, false);
  return position;
}

void Navigator::finishPosition(Position &position, std::size_t chunkSize,
                               bool shortChunkIsEnd) const {
  if (position.byteStart > boundaries_.startByte)
    position.previousByteEnd = position.byteStart - 1;
  if (boundaries_.cleanLength > 0) {
    double percent = static_cast<double>(position.byteStart - boundaries_.startByte) /
                     static_cast<double>(boundaries_.cleanLength) * 100.0;
    position.percent = std::min(100.0, std::round(percent * 10.0) / 10.0);
  }
  position.isNearEnd = position.isNearEnd || !position.nextByteStart ||
                       position.byteEnd >= boundaries_.endByte - kNearEndBytes ||
                       (shortChunkIsEnd && position.actualCount < chunkSize);
}

std::optional<Navigator::Step>
Navigator::nextStep(const Position &current) const {
  if (!forward_.empty() && forward_.back().anchor == current.byteStart)
    return Step{forward_.back().target, forward_.back().wordIndex, true, false};
  if (current.nextByteStart)
    return Step{*current.nextByteStart,
                current.wordIndex + static_cast<std::int64_t>(current.actualCount),
                false, false};
  return std::nullopt;
}

std::optional<Navigator::Step>
Navigator::previousStep(const Position &current) const {
  if (!back_.empty() && back_.back().anchor == current.byteStart)
    return Step{back_.back().target, back_.back().wordIndex, true, false};
  if (current.byteStart <= boundaries_.startByte || current.words.empty())
    return std::nullopt;
  const std::int64_t wordIndex = std::max<std::int64_t>(
      0, current.wordIndex - static_cast<std::int64_t>(chunkSize_));
  return Step{current.byteStart - 1, wordIndex, false, true, true};
}

bool Navigator::acceptEstimate(const Position &current,
                               const Position &candidate, const Step &step,
                               double avg) const {
  if (candidate.words.empty() || candidate.byteStart >= current.byteStart ||
      candidate.byteEnd != step.anchor)
    return false;
  // Fewer words than asked: the chunk runs back to the first word.
  if (candidate.actualCount < chunkSize_)
    return true;
  const double expected = static_cast<double>(chunkSize_) * avg;
  return static_cast<double>(current.byteStart - candidate.byteStart) >=
         expected / 2.0;
}

void Navigator::pushHistory(std::deque<HistoryEntry> &stack,
                            HistoryEntry entry) {
  stack.push_back(entry);
  while (stack.size() > options_.historyLimit)
    stack.pop_front();
}

void Navigator::clearHistory() {
  back_.clear();
  forward_.clear();
}

Position Navigator::goToPercent(double percent) {
  if (!std::isfinite(percent))
    throw std::invalid_argument("Percent must be a finite number");
  percent = std::clamp(percent, 0.0, 100.0);
  const double avg = calibrate();
  const std::size_t chunk = chunkSize();

  const auto offset = static_cast<std::int64_t>(
      std::floor(static_cast<double>(boundaries_.cleanLength) * percent / 100.0));
  const std::int64_t target =
      std::min(boundaries_.endByte, boundaries_.startByte + offset);
  Position position = materialize(
      target, std::llround(static_cast<double>(target - boundaries_.startByte) / avg),
      chunk, false);

  if (position.words.empty() && target > boundaries_.startByte) {
    // Landed in trailing whitespace or the last word; show the final chunk.
    const std::int64_t fallback = std::max<std::int64_t>(
        boundaries_.startByte,
        boundaries_.endByte - std::llround(static_cast<double>(chunk) * avg));
    position = materialize(
        fallback,
        std::llround(static_cast<double>(fallback - boundaries_.startByte) / avg),
        chunk, false);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    clearHistory();
  }
  schedulePrefetch(position, Direction::Forward);
  return position;
}

Position Navigator::moveForward(const Position &current) {
  std::optional<Step> step;
  std::size_t chunk = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    step = nextStep(current);
    chunk = chunkSize_;
  }
  if (!step)
    return current;

  Position next = materialize(step->anchor, step->wordIndex, chunk, false);
  if (next.words.empty())
    return current;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (step->fromHistory && !forward_.empty() &&
        forward_.back().anchor == current.byteStart)
      forward_.pop_back();
    else
      forward_.clear();
    pushHistory(back_, {next.byteStart, current.byteStart, current.wordIndex});
  }
  schedulePrefetch(next, Direction::Forward);
  return next;
}

Position Navigator::moveBackward(const Position &current) {
  const double avg = calibrate();
  std::optional<Step> step;
  std::size_t chunk = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    step = previousStep(current);
    chunk = chunkSize_;
  }
  if (!step)
    return current;

  Position previous = materialize(step->anchor, step->wordIndex, chunk, false,
                                  step->endsAtAnchor);
  if (step->estimated && !acceptEstimate(current, previous, *step, avg)) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "No earlier chunk before byte " +
                                  std::to_string(current.byteStart) + " of " +
                                  fetcher_->resourceId());
    return current;
  }
  if (previous.words.empty())
    return current;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (step->fromHistory && !back_.empty() &&
        back_.back().anchor == current.byteStart)
      back_.pop_back();
    pushHistory(forward_,
                {previous.byteStart, current.byteStart, current.wordIndex});
  }
  schedulePrefetch(previous, Direction::Backward);
  return previous;
}

Position Navigator::setChunkSize(std::size_t chunkSize, const Position &current) {
  if (chunkSize == 0)
    throw std::invalid_argument("Chunk size must be positive");
  Position position =
      materialize(current.byteStart, current.wordIndex, chunkSize, false);
  const double avg = calibrate();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    chunkSize_ = chunkSize;
    clearHistory();
    chunks_.clear();
    ++generation_;
    chunks_.put(chunkKey(current.byteStart, chunkSize, avg), position);
  }
  Logger::getInstance().log(LogLevel::DEBUG,
                            "Chunk size for " + fetcher_->resourceId() +
                                " set to " + std::to_string(chunkSize));
  schedulePrefetch(position, Direction::Forward);
  return position;
}

std::size_t Navigator::chunkSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunkSize_;
}

std::size_t Navigator::backDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return back_.size();
}

std::size_t Navigator::forwardDepth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return forward_.size();
}

std::size_t Navigator::cachedChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

void Navigator::schedulePrefetch(const Position &position, Direction direction) {
  if (!options_.prefetch || stopping_ || position.words.empty())
    return;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    generation = generation_;
  }
  const Direction opposite =
      direction == Direction::Forward ? Direction::Backward : Direction::Forward;
  boost::asio::post(prefetchPool_, [this, position, direction, generation] {
    prefetchAdjacent(position, direction, options_.prefetchLeadDelay, generation);
  });
  boost::asio::post(prefetchPool_, [this, position, opposite, generation] {
    prefetchAdjacent(position, opposite, options_.prefetchTrailDelay, generation);
  });
}

void Navigator::prefetchAdjacent(Position position, Direction direction,
                                 std::chrono::milliseconds delay,
                                 std::uint64_t generation) {
  {
    std::unique_lock<std::mutex> lock(stopMutex_);
    if (stopCv_.wait_for(lock, delay, [this] { return stopping_.load(); }))
      return;
  }

  try {
    const double avg = calibrate();
    std::optional<Step> step;
    std::size_t chunk = 0;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (generation != generation_)
        return;
      chunk = chunkSize_;
      step = direction == Direction::Forward ? nextStep(position)
                                             : previousStep(position);
      if (!step ||
          chunks_.contains(chunkKey(step->anchor, chunk, avg, step->endsAtAnchor)))
        return;
    }
    materialize(step->anchor, step->wordIndex, chunk, true, step->endsAtAnchor);
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Prefetch near byte " +
                                  std::to_string(position.byteStart) + " of " +
                                  fetcher_->resourceId() + " failed: " + e.what());
  }
}

} // namespace gutex
