#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>

namespace kspec::server {

class ConnectionRegistry;

// Probes every registered connection on a fixed interval and evicts the ones
// that stopped answering. Talks to the registry only through its public API.
class HeartbeatManager {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::chrono::seconds kPingInterval{30};
  static constexpr std::chrono::seconds kPongTimeout{90};

  explicit HeartbeatManager(boost::asio::io_context& ioc,
                            Clock::duration pingInterval = kPingInterval,
                            Clock::duration pongTimeout  = kPongTimeout);
  ~HeartbeatManager();

  HeartbeatManager(const HeartbeatManager&)            = delete;
  HeartbeatManager& operator=(const HeartbeatManager&) = delete;

  void start(ConnectionRegistry& registry);
  void stop() noexcept;   // idempotent
  bool running() const { return running_.load(std::memory_order_acquire); }

  void recordPong(const std::string& sessionId);

  // One probe cycle: ping everything, then evict connections whose last pong
  // is older than the timeout (close code 1001). Returns the number evicted.
  std::size_t tick(Clock::time_point now);

  Clock::duration pingInterval() const { return pingInterval_; }
  Clock::duration pongTimeout() const { return pongTimeout_; }

private:
  void arm();

private:
  boost::asio::steady_timer timer_;
  std::mutex timerMx_;
  ConnectionRegistry* registry_{nullptr};
  std::atomic<bool> running_{false};
  Clock::duration pingInterval_;
  Clock::duration pongTimeout_;
};

} // namespace kspec::server
