#include "kspec/client/ReconnectStateMachine.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Ulid.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace kspec::client {

using util::LogLevel;
using util::logger;

const char* toString(ConnectionStatus s) {
  switch (s) {
    case ConnectionStatus::Disconnected: return "disconnected";
    case ConnectionStatus::Connecting:   return "connecting";
    case ConnectionStatus::Connected:    return "connected";
    case ConnectionStatus::Reconnecting: return "reconnecting";
    case ConnectionStatus::GivenUp:      return "given_up";
  }
  return "disconnected";
}

const char* toString(Connectivity c) {
  switch (c) {
    case Connectivity::Connected:      return "Connected";
    case Connectivity::Reconnecting:   return "Reconnecting";
    case Connectivity::Disconnected:   return "Disconnected";
    case Connectivity::ConnectionLost: return "Connection Lost";
  }
  return "Disconnected";
}

std::chrono::milliseconds backoffDelay(int attempt, const ReconnectPolicy& policy) {
  using namespace std::chrono;
  const milliseconds cap = duration_cast<milliseconds>(policy.maxBackoff);
  if (attempt < 0) attempt = 0;
  // 2^31 s is far past any sane cap.
  if (attempt >= 31) return cap;
  const milliseconds d = seconds(std::int64_t{1} << attempt);
  return std::min(d, cap);
}

namespace {

ClientAction make(ClientAction::Kind k) {
  ClientAction a;
  a.kind = k;
  return a;
}

} // namespace

ReconnectStateMachine::ReconnectStateMachine(ReconnectPolicy policy)
  : policy_(policy)
{}

// ---------------------------------------------------------------------------
// Application inputs
// ---------------------------------------------------------------------------

ClientActions ReconnectStateMachine::connect(Clock::time_point now) {
  ClientActions out;
  switch (status_) {
    case ConnectionStatus::Connecting:
    case ConnectionStatus::Connected:
    case ConnectionStatus::GivenUp:
      return out;
    case ConnectionStatus::Reconnecting:
      // Skip the rest of the backoff wait.
      out.push_back(make(ClientAction::Kind::CancelReconnect));
      retrying_ = true;
      break;
    case ConnectionStatus::Disconnected:
      retrying_ = false;
      break;
  }
  setStatus(out, ConnectionStatus::Connecting, now);
  out.push_back(make(ClientAction::Kind::OpenSocket));
  return out;
}

ClientActions ReconnectStateMachine::disconnect(Clock::time_point now) {
  ClientActions out;
  if (status_ == ConnectionStatus::Disconnected) return out;

  const ConnectionStatus prev = status_;
  out.push_back(make(ClientAction::Kind::CancelReconnect));
  out.push_back(make(ClientAction::Kind::CancelConnectionLostCheck));
  if (prev == ConnectionStatus::Connected || prev == ConnectionStatus::Connecting) {
    ClientAction close = make(ClientAction::Kind::CloseSocket);
    close.code = ws::kCloseNormal;
    close.text = "Client disconnect";
    out.push_back(std::move(close));
  }
  if (prev == ConnectionStatus::Connected) stats_.lastDisconnectedAt = now;

  ready_ = false;
  retrying_ = false;
  attempts_ = 0;
  pending_.clear();
  lastContact_.reset();
  // A deliberate disconnect is not an outage.
  disconnectedAt_.reset();
  setStatus(out, ConnectionStatus::Disconnected, now);
  return out;
}

ClientActions ReconnectStateMachine::reset(Clock::time_point now) {
  if (status_ != ConnectionStatus::GivenUp && status_ != ConnectionStatus::Disconnected) return {};

  logger().log(LogLevel::Info, "reconnect reset", {{"attempts", std::to_string(attempts_)}});
  attempts_ = 0;
  status_ = ConnectionStatus::Disconnected;
  return connect(now);
}

ClientActions ReconnectStateMachine::subscribe(const std::vector<std::string>& topics) {
  ClientActions out;
  std::vector<std::string> added;
  for (const auto& t : topics) {
    if (topics_.insert(t).second) added.push_back(t);
  }
  // Otherwise the next ConnectedEvent sends the whole set.
  if (ready_ && !added.empty()) sendCommand(out, ws::Action::Subscribe, added);
  return out;
}

ClientActions ReconnectStateMachine::unsubscribe(const std::vector<std::string>& topics) {
  ClientActions out;
  std::vector<std::string> removed;
  for (const auto& t : topics) {
    if (topics_.erase(t) > 0) removed.push_back(t);
  }
  if (ready_ && !removed.empty()) sendCommand(out, ws::Action::Unsubscribe, removed);
  return out;
}

// ---------------------------------------------------------------------------
// Socket and timer inputs
// ---------------------------------------------------------------------------

ClientActions ReconnectStateMachine::onOpen(Clock::time_point now) {
  ClientActions out;
  if (status_ != ConnectionStatus::Connecting) return out;

  attempts_ = 0;
  retrying_ = false;
  lastSeq_ = -1;
  ready_ = false;
  sessionId_.reset();
  pending_.clear();
  lastContact_ = now;
  disconnectedAt_.reset();
  ++stats_.connectCount;
  stats_.lastConnectedAt = now;

  out.push_back(make(ClientAction::Kind::CancelConnectionLostCheck));
  setStatus(out, ConnectionStatus::Connected, now);
  return out;
}

ClientActions ReconnectStateMachine::onFrame(std::string_view text, Clock::time_point now) {
  ClientActions out;
  if (status_ != ConnectionStatus::Connected) return out;
  noteContact(now);

  auto frame = ws::decodeServerFrame(text);
  if (!frame) {
    logger().log(LogLevel::Debug, "ignored server frame", {{"error", frame.error().describe()}});
    return out;
  }

  std::visit([&](auto& f) {
    using T = std::decay_t<decltype(f)>;
    if constexpr (std::is_same_v<T, ws::ConnectedEvent>) {
      sessionId_ = f.sessionId;
      lastSeq_ = -1;
      ready_ = true;
      if (!topics_.empty()) {
        std::vector<std::string> all(topics_.begin(), topics_.end());
        sendCommand(out, ws::Action::Subscribe, all);
      }
    } else if constexpr (std::is_same_v<T, ws::CommandAck>) {
      std::string action = "unknown";
      if (f.requestId) {
        auto it = pending_.find(*f.requestId);
        if (it != pending_.end()) {
          action = it->second;
          pending_.erase(it);
        }
      }
      if (!f.success) {
        logger().log(LogLevel::Warn, "command rejected",
                     {{"action", action},
                      {"request_id", f.requestId.value_or("")},
                      {"error", f.error}});
      }
    } else {
      const auto seq = static_cast<std::int64_t>(f.seq);
      if (seq <= lastSeq_) {
        logger().log(LogLevel::Trace, "duplicate event discarded",
                     {{"seq", std::to_string(seq)}, {"topic", f.topic}});
        return;
      }
      lastSeq_ = seq;
      ClientAction d = make(ClientAction::Kind::Deliver);
      d.event = std::move(f);
      out.push_back(std::move(d));
    }
  }, *frame);
  return out;
}

ClientActions ReconnectStateMachine::onClose(Clock::time_point now) {
  ClientActions out;
  const ConnectionStatus prev = status_;
  if (prev != ConnectionStatus::Connected && prev != ConnectionStatus::Connecting) return out;

  ready_ = false;
  pending_.clear();
  lastContact_.reset();
  if (!disconnectedAt_) disconnectedAt_ = now;
  if (prev == ConnectionStatus::Connected) {
    stats_.lastDisconnectedAt = now;
    logger().log(LogLevel::Info, "connection dropped",
                 {{"session", sessionId_.value_or("")}, {"last_seq", std::to_string(lastSeq_)}});
  }

  if (prev == ConnectionStatus::Connecting && retrying_) {
    ++attempts_;
    if (attempts_ >= policy_.maxAttempts) {
      logger().log(LogLevel::Warn, "giving up reconnecting", {{"attempts", std::to_string(attempts_)}});
      retrying_ = false;
      setStatus(out, ConnectionStatus::GivenUp, now);
      return out;
    }
  }

  scheduleRetry(out, now);
  return out;
}

ClientActions ReconnectStateMachine::onReconnectTimer(Clock::time_point now) {
  ClientActions out;
  if (status_ != ConnectionStatus::Reconnecting) return out;
  retrying_ = true;
  setStatus(out, ConnectionStatus::Connecting, now);
  out.push_back(make(ClientAction::Kind::OpenSocket));
  return out;
}

ClientActions ReconnectStateMachine::onConnectionLostTimer(Clock::time_point now) {
  ClientActions out;
  if (!disconnectedAt_ || status_ == ConnectionStatus::Connected) return out;

  const auto elapsed = now - *disconnectedAt_;
  if (elapsed >= policy_.connectionLostAfter) {
    ClientAction s = make(ClientAction::Kind::StatusChanged);
    s.status = status_;
    s.connectivity = connectivity(now);
    out.push_back(std::move(s));
    return out;
  }
  // Fired early; wait out the remainder.
  ClientAction again = make(ClientAction::Kind::ScheduleConnectionLostCheck);
  again.delay = std::chrono::duration_cast<std::chrono::milliseconds>(policy_.connectionLostAfter - elapsed);
  out.push_back(std::move(again));
  return out;
}

void ReconnectStateMachine::noteContact(Clock::time_point now) {
  if (status_ == ConnectionStatus::Connected) lastContact_ = now;
}

Connectivity ReconnectStateMachine::connectivity(Clock::time_point now) const {
  if (status_ == ConnectionStatus::Connected) {
    if (lastContact_ && now - *lastContact_ > policy_.contactTimeout) return Connectivity::Reconnecting;
    return Connectivity::Connected;
  }
  if (disconnectedAt_ && now - *disconnectedAt_ >= policy_.connectionLostAfter) {
    return Connectivity::ConnectionLost;
  }
  if (status_ == ConnectionStatus::Reconnecting) return Connectivity::Reconnecting;
  if (status_ == ConnectionStatus::Connecting && disconnectedAt_) return Connectivity::Reconnecting;
  return Connectivity::Disconnected;
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void ReconnectStateMachine::setStatus(ClientActions& out, ConnectionStatus s, Clock::time_point now) {
  status_ = s;
  ClientAction a = make(ClientAction::Kind::StatusChanged);
  a.status = s;
  a.connectivity = connectivity(now);
  out.push_back(std::move(a));
}

void ReconnectStateMachine::scheduleRetry(ClientActions& out, Clock::time_point now) {
  const auto delay = backoffDelay(attempts_, policy_);
  ++stats_.reconnectCount;
  logger().log(LogLevel::Info, "reconnect scheduled",
               {{"attempt", std::to_string(attempts_ + 1)},
                {"delay_ms", std::to_string(delay.count())}});

  setStatus(out, ConnectionStatus::Reconnecting, now);

  ClientAction timer = make(ClientAction::Kind::ScheduleReconnect);
  timer.delay = delay;
  out.push_back(std::move(timer));

  const auto elapsed = now - *disconnectedAt_;
  if (elapsed < policy_.connectionLostAfter) {
    ClientAction lost = make(ClientAction::Kind::ScheduleConnectionLostCheck);
    lost.delay = std::chrono::duration_cast<std::chrono::milliseconds>(policy_.connectionLostAfter - elapsed);
    out.push_back(std::move(lost));
  }
}

void ReconnectStateMachine::sendCommand(ClientActions& out, ws::Action action,
                                        const std::vector<std::string>& topics) {
  const std::string rid = util::ulid();
  pending_[rid] = ws::toString(action);
  ClientAction send = make(ClientAction::Kind::SendText);
  send.text = ws::encodeCommand(action, rid, topics);
  out.push_back(std::move(send));
}

} // namespace kspec::client
