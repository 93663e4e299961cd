#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace gutex {

/**
 * @brief Simple metrics registry that exports Prometheus text format.
 *
 * Write-only from the point of view of the fetch path: nothing in the
 * racer or the cache reads these values back.
 */
class MetricsRegistry {
public:
  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const std::map<std::string, std::string> &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const std::map<std::string, std::string> &labels = {});

  /** Record observation for a histogram. */
  void observe(const std::string &name, double value,
               const std::map<std::string, std::string> &labels = {});

  /** Serialize all metrics in Prometheus text format, sorted by series. */
  std::string toPrometheus() const;

  /** Clear all stored metrics. */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string
  labelsToString(const std::map<std::string, std::string> &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};

} // namespace gutex
