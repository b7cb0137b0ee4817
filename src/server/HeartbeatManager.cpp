#include "kspec/server/HeartbeatManager.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Metrics.hpp"
#include "kspec/ws/Protocol.hpp"

#include <boost/asio/error.hpp>

namespace kspec::server {

using util::LogLevel;
using util::logger;

HeartbeatManager::HeartbeatManager(boost::asio::io_context& ioc,
                                   Clock::duration pingInterval,
                                   Clock::duration pongTimeout)
  : timer_(ioc)
  , pingInterval_(pingInterval)
  , pongTimeout_(pongTimeout)
{}

HeartbeatManager::~HeartbeatManager() {
  stop();
}

void HeartbeatManager::start(ConnectionRegistry& registry) {
  registry_ = &registry;
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return; // already running
  }
  logger().log(LogLevel::Info, "heartbeat started",
               {{"interval_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(pingInterval_).count())},
                {"timeout_ms", std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(pongTimeout_).count())}});
  arm();
}

void HeartbeatManager::stop() noexcept {
  if (!running_.exchange(false, std::memory_order_acq_rel)) return;
  std::lock_guard<std::mutex> lk(timerMx_);
  timer_.cancel();
}

void HeartbeatManager::arm() {
  std::lock_guard<std::mutex> lk(timerMx_);
  if (!running_.load(std::memory_order_acquire)) return;
  timer_.expires_after(pingInterval_);
  timer_.async_wait([this](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;
    if (!running_.load(std::memory_order_acquire)) return;
    tick(Clock::now());
    arm();
  });
}

void HeartbeatManager::recordPong(const std::string& sessionId) {
  if (!registry_) return;
  registry_->recordPong(sessionId, Clock::now());
}

std::size_t HeartbeatManager::tick(Clock::time_point now) {
  if (!registry_) return 0;

  const auto pinged = registry_->pingAll(now);
  logger().log(LogLevel::Debug, "heartbeat ping", {{"connections", std::to_string(pinged.size())}});

  std::size_t evicted = 0;
  for (const auto& id : registry_->staleConnections(now, pongTimeout_)) {
    logger().log(LogLevel::Warn, "heartbeat timeout, closing", {{"session", id}});
    if (registry_->closeConnection(id, ws::kCloseGoingAway, "Ping timeout")) {
      ++evicted;
      KSPEC_METRIC_HIT("kspec.heartbeat.evicted");
    }
  }
  return evicted;
}

} // namespace kspec::server
