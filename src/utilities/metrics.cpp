#include "utilities/metrics.h"

#include <algorithm>
#include <sstream>
#include <vector>

namespace gutex {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const std::map<std::string, std::string> &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

// Splits "name{labels}" back into its parts.
static std::pair<std::string, std::string> splitKey(const std::string &key) {
  auto nameEnd = key.find('{');
  if (nameEnd == std::string::npos)
    return {key, ""};
  return {key.substr(0, nameEnd), key.substr(nameEnd)};
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(
    const std::string &name, double value,
    const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const std::map<std::string, std::string> &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

std::string MetricsRegistry::labelsToString(
    const std::map<std::string, std::string> &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::vector<std::string> lines;
  for (const auto &kv : gauges_) {
    std::ostringstream line;
    line << kv.first << ' ' << kv.second;
    lines.push_back(line.str());
  }
  for (const auto &kv : counters_) {
    std::ostringstream line;
    line << kv.first << ' ' << kv.second;
    lines.push_back(line.str());
  }
  for (const auto &kv : histograms_) {
    auto [name, labels] = splitKey(kv.first);
    std::ostringstream sum;
    sum << name << "_sum" << labels << ' ' << kv.second.sum;
    lines.push_back(sum.str());
    std::ostringstream count;
    count << name << "_count" << labels << ' ' << kv.second.count;
    lines.push_back(count.str());
  }
  std::sort(lines.begin(), lines.end());

  std::ostringstream oss;
  for (const auto &line : lines)
    oss << line << '\n';
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace gutex
