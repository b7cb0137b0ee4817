#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace kspec {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
class MetricRegistry {
public:
  static MetricRegistry& instance();

  MetricRegistry() = default;

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  void increment(const std::string& name, double v = 1.0);
  void setGauge(const std::string& name, double v);

  // 0 when the metric has never been touched.
  double counter(const std::string& name) const;
  double gauge(const std::string& name) const;

  // Snapshots (cheap copies) for debug/admin endpoints.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  // Log every counter and gauge at info level.
  void logSnapshot() const;

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;
};

} // namespace util
} // namespace kspec

#define KSPEC_METRIC_INC(name, d) ::kspec::util::MetricRegistry::instance().increment((name), (d))
#define KSPEC_METRIC_HIT(name)    ::kspec::util::MetricRegistry::instance().increment((name), 1.0)
#define KSPEC_METRIC_SET(name, v) ::kspec::util::MetricRegistry::instance().setGauge((name), (v))
