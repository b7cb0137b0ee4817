#include "kspec/rt/ShutdownCoordinator.hpp"
#include "kspec/util/Logger.hpp"

#include <algorithm>
#include <exception>

namespace kspec::rt {

using util::LogLevel;
using util::logger;

bool ShutdownCoordinator::registerStep(std::string name, int order, std::function<void()> fn) {
  std::lock_guard<std::mutex> lk(mx_);
  if (stopping()) {
    logger().log(LogLevel::Warn, "shutdown step registered too late", {{"step", name}});
    return false;
  }
  const bool taken = std::any_of(steps_.begin(), steps_.end(),
                                 [&name](const Step& s) { return s.name == name; });
  if (taken) {
    logger().log(LogLevel::Warn, "duplicate shutdown step", {{"step", name}});
    return false;
  }
  steps_.push_back(Step{std::move(name), order, std::move(fn)});
  return true;
}

std::vector<ShutdownCoordinator::Step> ShutdownCoordinator::ordered() const {
  std::vector<Step> out;
  {
    std::lock_guard<std::mutex> lk(mx_);
    out = steps_;
  }
  // Equal orders keep registration order.
  std::stable_sort(out.begin(), out.end(),
                   [](const Step& a, const Step& b) { return a.order < b.order; });
  return out;
}

std::vector<std::string> ShutdownCoordinator::plan() const {
  std::vector<std::string> names;
  for (const auto& s : ordered()) names.push_back(s.name);
  return names;
}

std::vector<ShutdownCoordinator::StepResult> ShutdownCoordinator::stop() {
  std::vector<Step> run;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (stopping_.exchange(true, std::memory_order_acq_rel)) return {};
  }
  run = ordered();

  logger().log(LogLevel::Info, "shutdown begin", {{"steps", std::to_string(run.size())}});

  std::vector<StepResult> results;
  results.reserve(run.size());
  for (const auto& s : run) {
    StepResult r;
    r.name = s.name;
    r.order = s.order;
    const auto t0 = std::chrono::steady_clock::now();
    try {
      if (s.fn) s.fn();
    } catch (const std::exception& ex) {
      r.ok = false;
      r.error = ex.what();
    }
    r.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - t0);

    if (r.ok) {
      logger().log(LogLevel::Debug, "shutdown step",
                   {{"step", r.name}, {"us", std::to_string(r.elapsed.count())}});
    } else {
      logger().log(LogLevel::Error, "shutdown step failed", {{"step", r.name}, {"error", r.error}});
    }
    results.push_back(std::move(r));
  }
  return results;
}

} // namespace kspec::rt
