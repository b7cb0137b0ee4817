#pragma once

#include "kspec/ws/Protocol.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace kspec::client {

enum class ConnectionStatus { Disconnected, Connecting, Connected, Reconnecting, GivenUp };

// What a dashboard shows. Derived from status and elapsed time.
enum class Connectivity { Connected, Reconnecting, Disconnected, ConnectionLost };

const char* toString(ConnectionStatus s);
const char* toString(Connectivity c);

struct ReconnectPolicy {
  int maxAttempts = 10;
  std::chrono::seconds maxBackoff{30};
  std::chrono::seconds connectionLostAfter{10};
  // An open socket with no frames or control frames for this long is
  // reported as Reconnecting.
  std::chrono::seconds contactTimeout{90};
};

// min(2^attempt, maxBackoff) seconds.
std::chrono::milliseconds backoffDelay(int attempt, const ReconnectPolicy& policy = {});

struct ClientAction {
  enum class Kind {
    OpenSocket,
    CloseSocket,
    SendText,
    ScheduleReconnect,
    CancelReconnect,
    ScheduleConnectionLostCheck,
    CancelConnectionLostCheck,
    Deliver,
    StatusChanged
  };

  Kind kind = Kind::StatusChanged;
  std::string text;                          // SendText body, CloseSocket reason
  std::uint16_t code = 0;                    // CloseSocket
  std::chrono::milliseconds delay{0};        // Schedule*
  std::optional<ws::BroadcastEvent> event;   // Deliver
  ConnectionStatus status = ConnectionStatus::Disconnected;   // StatusChanged
  Connectivity connectivity = Connectivity::Disconnected;     // StatusChanged
};

using ClientActions = std::vector<ClientAction>;

struct ConnectionStats {
  std::uint64_t connectCount   = 0;
  std::uint64_t reconnectCount = 0;
  std::optional<std::chrono::steady_clock::time_point> lastConnectedAt;
  std::optional<std::chrono::steady_clock::time_point> lastDisconnectedAt;
};

// Socket-free core of the client reconnection protocol. Every input returns
// the side effects the driver must perform, in order. Not thread-safe; the
// driver serializes calls.
class ReconnectStateMachine {
public:
  using Clock = std::chrono::steady_clock;

  explicit ReconnectStateMachine(ReconnectPolicy policy = {});

  // --- application inputs ---
  ClientActions connect(Clock::time_point now = Clock::now());
  ClientActions disconnect(Clock::time_point now = Clock::now());
  // Leave GivenUp (or Disconnected) and start over with zero attempts.
  ClientActions reset(Clock::time_point now = Clock::now());
  ClientActions subscribe(const std::vector<std::string>& topics);
  ClientActions unsubscribe(const std::vector<std::string>& topics);

  // --- socket and timer inputs ---
  ClientActions onOpen(Clock::time_point now = Clock::now());
  ClientActions onFrame(std::string_view text, Clock::time_point now = Clock::now());
  ClientActions onClose(Clock::time_point now = Clock::now());
  ClientActions onReconnectTimer(Clock::time_point now = Clock::now());
  ClientActions onConnectionLostTimer(Clock::time_point now = Clock::now());
  void noteContact(Clock::time_point now = Clock::now());

  ConnectionStatus status() const { return status_; }
  Connectivity connectivity(Clock::time_point now = Clock::now()) const;
  std::int64_t lastSeqProcessed() const { return lastSeq_; }
  int reconnectAttempts() const { return attempts_; }
  const std::set<std::string>& subscribedTopics() const { return topics_; }
  const std::optional<std::string>& sessionId() const { return sessionId_; }
  const ConnectionStats& stats() const { return stats_; }
  const ReconnectPolicy& policy() const { return policy_; }
  std::size_t pendingAcks() const { return pending_.size(); }

private:
  void setStatus(ClientActions& out, ConnectionStatus s, Clock::time_point now);
  void scheduleRetry(ClientActions& out, Clock::time_point now);
  void sendCommand(ClientActions& out, ws::Action action, const std::vector<std::string>& topics);

private:
  ReconnectPolicy policy_;
  ConnectionStatus status_{ConnectionStatus::Disconnected};

  std::int64_t lastSeq_{-1};
  int attempts_{0};
  bool retrying_{false};       // current Connecting is a reconnect attempt
  bool ready_{false};          // ConnectedEvent seen on the current socket
  std::set<std::string> topics_;
  std::optional<std::string> sessionId_;

  std::optional<Clock::time_point> lastContact_;
  std::optional<Clock::time_point> disconnectedAt_;   // start of the current outage

  // request_id -> action, for logging failed acks
  std::map<std::string, std::string> pending_;

  ConnectionStats stats_;
};

} // namespace kspec::client
