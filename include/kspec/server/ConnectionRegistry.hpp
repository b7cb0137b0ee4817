#pragma once

#include "kspec/Result.hpp"
#include "kspec/server/IConnection.hpp"

#include <rapidjson/document.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace kspec::server {

// Owns every live connection, its topic subscriptions and its outbound
// sequence counter. All operations are thread-safe.
//
// Locking: mx_ guards the map only; each entry carries its own mutex for
// topics, sequence and heartbeat timestamps. Sends happen under the entry lock
// (they are non-blocking enqueues) but never under mx_.
class ConnectionRegistry {
public:
  using Clock = std::chrono::steady_clock;

  static constexpr std::size_t kDefaultBackpressureBytes = 1024 * 1024;

  explicit ConnectionRegistry(std::size_t backpressureBytes = kDefaultBackpressureBytes);

  ConnectionRegistry(const ConnectionRegistry&)            = delete;
  ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

  // Register with an empty topic set and out_seq = 0. Fails on a duplicate id.
  Result<void> addConnection(std::shared_ptr<IConnection> conn,
                             std::optional<std::string> project = std::nullopt,
                             Clock::time_point now = Clock::now());

  // No-op if absent.
  void removeConnection(const std::string& sessionId);

  // False if the session is unknown.
  bool subscribe(const std::string& sessionId, const std::vector<std::string>& topics);
  bool unsubscribe(const std::string& sessionId, const std::vector<std::string>& topics);

  // Fan one logical event out to every subscriber of `topic` (optionally only
  // those bound to `project`). Connections at or above the backpressure
  // threshold are skipped and keep their sequence. Returns deliveries.
  std::size_t broadcast(const std::string& topic,
                        const std::string& event,
                        const rapidjson::Value& data,
                        const std::optional<std::string>& project = std::nullopt);

  // Same, with the payload already serialized to JSON text. The text is
  // re-serialized compactly; text that does not parse is rejected (returns 0,
  // no sequence consumed). Empty text is sent as null.
  std::size_t broadcastRaw(const std::string& topic,
                           const std::string& event,
                           std::string dataJson,
                           const std::optional<std::string>& project = std::nullopt);

  std::size_t connectionCount() const;

  // --- heartbeat support ---
  // Ping every connection and stamp last_ping_sent_at. Returns pinged ids.
  std::vector<std::string> pingAll(Clock::time_point now);
  bool recordPong(const std::string& sessionId, Clock::time_point now);
  // Ids whose last pong is older than `timeout`.
  std::vector<std::string> staleConnections(Clock::time_point now, Clock::duration timeout) const;

  // Remove the connection and close its transport. False if unknown.
  bool closeConnection(const std::string& sessionId, std::uint16_t code, const std::string& reason);
  // Remove and close everything. Returns the number closed.
  std::size_t closeAll(std::uint16_t code, const std::string& reason);

  // --- introspection ---
  std::optional<std::set<std::string>> topicsOf(const std::string& sessionId) const;
  std::optional<std::uint64_t> outSeqOf(const std::string& sessionId) const;
  std::optional<Clock::time_point> lastPingSentAt(const std::string& sessionId) const;
  std::vector<std::string> sessionIds() const;

  std::size_t backpressureBytes() const { return backpressureBytes_; }

private:
  struct Entry {
    std::shared_ptr<IConnection> conn;
    std::optional<std::string> project;

    mutable std::mutex mx;
    std::set<std::string> topics;
    std::uint64_t outSeq = 0;
    std::optional<Clock::time_point> lastPingSentAt;
    Clock::time_point lastPongReceivedAt;
    bool closed = false;
  };

  std::size_t deliver(const std::string& topic,
                      const std::string& event,
                      std::string dataJson,
                      const std::optional<std::string>& project);

  std::shared_ptr<Entry> find(const std::string& sessionId) const;
  std::vector<std::shared_ptr<Entry>> snapshot() const;
  std::shared_ptr<Entry> detach(const std::string& sessionId);
  // Called with mx_ held so the gauge follows the map's order of changes.
  void publishCount(std::size_t n) const;

private:
  mutable std::mutex mx_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
  std::size_t backpressureBytes_;
};

} // namespace kspec::server
