#ifndef LEDGER_METRICS_HPP_
#define LEDGER_METRICS_HPP_

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {
namespace observability {

/**
 * Metrics collection for the ledger engine.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector();
  ~MetricsCollector() = default;

  // Help text shown in the export; optional.
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  size_t histogramCount(const std::string& name) const;

  // Observes the elapsed time of a scope, in seconds
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  // Reset all metrics and their help text
  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const std::string& fallback) const;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, Histogram> histograms_;
  std::unordered_map<std::string, std::string> help_;

  // Default histogram buckets (in seconds); settlement is sub-millisecond
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_METRICS_HPP_
