#include "kspec/util/Metrics.hpp"
#include "kspec/util/Logger.hpp"

#include <map>
#include <sstream>

namespace kspec {
namespace util {

MetricRegistry& MetricRegistry::instance() {
  static MetricRegistry inst;
  return inst;
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

double MetricRegistry::gauge(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gauges_.find(name);
  return it == gauges_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::logSnapshot() const {
  // Sorted for stable output.
  std::map<std::string, double> all;
  {
    std::lock_guard<std::mutex> lk(mu_);
    all.insert(counters_.begin(), counters_.end());
    all.insert(gauges_.begin(), gauges_.end());
  }
  std::vector<Field> fields;
  fields.reserve(all.size());
  for (auto& kv : all) {
    std::ostringstream v;
    v << kv.second;
    fields.push_back({kv.first, v.str()});
  }
  logger().log(LogLevel::Info, "metrics", fields);
}

} // namespace util
} // namespace kspec
