#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace kspec::rt {

// Named daemon teardown steps, run once in ascending `order` when the first
// stop() arrives (signal, fatal error or natural exit). A step that throws is
// reported and the remaining steps still run.
class ShutdownCoordinator {
public:
  struct StepResult {
    std::string name;
    int order = 0;
    bool ok = true;
    std::string error;
    std::chrono::microseconds elapsed{0};
  };

  // False when the name is taken or shutdown already began.
  bool registerStep(std::string name, int order, std::function<void()> fn);

  // First call runs every step and returns their outcomes; later calls
  // return an empty list.
  std::vector<StepResult> stop();

  bool stopping() const { return stopping_.load(std::memory_order_acquire); }

  // Registered step names in execution order.
  std::vector<std::string> plan() const;

private:
  struct Step {
    std::string name;
    int order;
    std::function<void()> fn;
  };

  std::vector<Step> ordered() const;

  mutable std::mutex mx_;
  std::vector<Step> steps_;
  std::atomic<bool> stopping_{false};
};

} // namespace kspec::rt
