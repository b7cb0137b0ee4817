#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Metrics.hpp"
#include "kspec/util/Time.hpp"
#include "kspec/util/Ulid.hpp"
#include "kspec/ws/Protocol.hpp"

namespace kspec::server {

using util::LogLevel;
using util::logger;

ConnectionRegistry::ConnectionRegistry(std::size_t backpressureBytes)
  : backpressureBytes_(backpressureBytes == 0 ? kDefaultBackpressureBytes : backpressureBytes)
{}

Result<void> ConnectionRegistry::addConnection(std::shared_ptr<IConnection> conn,
                                               std::optional<std::string> project,
                                               Clock::time_point now) {
  if (!conn) return Error{"null connection", "addConnection"};
  const std::string id = conn->sessionId();
  if (id.empty()) return Error{"empty session id", "addConnection"};

  auto e = std::make_shared<Entry>();
  e->conn = std::move(conn);
  e->project = std::move(project);
  e->lastPongReceivedAt = now;

  {
    std::lock_guard<std::mutex> lk(mx_);
    if (entries_.count(id)) {
      return Error{"session already registered", id};
    }
    entries_.emplace(id, std::move(e));
    publishCount(entries_.size());
  }
  return {};
}

void ConnectionRegistry::removeConnection(const std::string& sessionId) {
  (void)detach(sessionId);
}

std::shared_ptr<ConnectionRegistry::Entry> ConnectionRegistry::detach(const std::string& sessionId) {
  std::shared_ptr<Entry> e;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = entries_.find(sessionId);
    if (it == entries_.end()) return nullptr;
    e = std::move(it->second);
    entries_.erase(it);
    publishCount(entries_.size());
  }
  {
    // A broadcast that snapshotted this entry earlier sees `closed` and skips it.
    std::lock_guard<std::mutex> lk(e->mx);
    e->closed = true;
  }
  return e;
}

bool ConnectionRegistry::subscribe(const std::string& sessionId, const std::vector<std::string>& topics) {
  auto e = find(sessionId);
  if (!e) return false;
  std::lock_guard<std::mutex> lk(e->mx);
  if (e->closed) return false;
  for (const auto& t : topics) e->topics.insert(t);
  return true;
}

bool ConnectionRegistry::unsubscribe(const std::string& sessionId, const std::vector<std::string>& topics) {
  auto e = find(sessionId);
  if (!e) return false;
  std::lock_guard<std::mutex> lk(e->mx);
  if (e->closed) return false;
  for (const auto& t : topics) e->topics.erase(t);
  return true;
}

std::size_t ConnectionRegistry::broadcast(const std::string& topic,
                                          const std::string& event,
                                          const rapidjson::Value& data,
                                          const std::optional<std::string>& project) {
  return deliver(topic, event, ws::toJson(data), project);
}

std::size_t ConnectionRegistry::broadcastRaw(const std::string& topic,
                                             const std::string& event,
                                             std::string dataJson,
                                             const std::optional<std::string>& project) {
  if (dataJson.empty()) return deliver(topic, event, std::string(), project);

  // Frames go out as compact single-line JSON, whatever the caller handed in.
  rapidjson::Document doc;
  doc.Parse(dataJson.data(), dataJson.size());
  if (doc.HasParseError()) {
    KSPEC_METRIC_INC("kspec.broadcast.rejected", 1.0);
    logger().log(LogLevel::Warn, "broadcast rejected: payload is not JSON",
                 {{"topic", topic},
                  {"event", event},
                  {"offset", std::to_string(doc.GetErrorOffset())}});
    return 0;
  }
  return deliver(topic, event, ws::toJson(doc), project);
}

std::size_t ConnectionRegistry::deliver(const std::string& topic,
                                        const std::string& event,
                                        std::string dataJson,
                                        const std::optional<std::string>& project) {
  // One identity and timestamp per logical event, shared by every recipient.
  ws::BroadcastEvent ev;
  ev.msgId     = util::ulid();
  ev.timestamp = util::nowIso();
  ev.topic     = topic;
  ev.event     = event;
  ev.data      = std::move(dataJson);

  std::size_t delivered = 0;
  std::size_t dropped = 0;

  for (const auto& e : snapshot()) {
    if (project && e->project != project) continue;

    std::lock_guard<std::mutex> lk(e->mx);
    if (e->closed || e->topics.count(topic) == 0) continue;

    const std::size_t buffered = e->conn->bufferedAmount();
    if (buffered >= backpressureBytes_) {
      ++dropped;
      logger().log(LogLevel::Warn, "broadcast skipped: backpressure",
                   {{"session", e->conn->sessionId()},
                    {"topic", topic},
                    {"bytes", std::to_string(buffered)}});
      continue;
    }

    ev.seq = e->outSeq;
    e->conn->sendText(ws::encodeBroadcast(ev));
    ++e->outSeq;
    ++delivered;
  }

  if (delivered) KSPEC_METRIC_INC("kspec.broadcast.delivered", static_cast<double>(delivered));
  if (dropped)   KSPEC_METRIC_INC("kspec.broadcast.dropped", static_cast<double>(dropped));

  if (logger().enabled(LogLevel::Trace)) {
    logger().log(LogLevel::Trace, "broadcast",
                 {{"topic", topic}, {"event", event}, {"msg_id", ev.msgId},
                  {"delivered", std::to_string(delivered)}});
  }
  return delivered;
}

std::size_t ConnectionRegistry::connectionCount() const {
  std::lock_guard<std::mutex> lk(mx_);
  return entries_.size();
}

std::vector<std::string> ConnectionRegistry::pingAll(Clock::time_point now) {
  std::vector<std::string> pinged;
  for (const auto& e : snapshot()) {
    {
      std::lock_guard<std::mutex> lk(e->mx);
      if (e->closed) continue;
      e->lastPingSentAt = now;
    }
    e->conn->ping();
    pinged.push_back(e->conn->sessionId());
  }
  return pinged;
}

bool ConnectionRegistry::recordPong(const std::string& sessionId, Clock::time_point now) {
  auto e = find(sessionId);
  if (!e) return false;
  std::lock_guard<std::mutex> lk(e->mx);
  if (e->closed) return false;
  e->lastPongReceivedAt = now;
  return true;
}

std::vector<std::string> ConnectionRegistry::staleConnections(Clock::time_point now,
                                                              Clock::duration timeout) const {
  std::vector<std::string> stale;
  for (const auto& e : snapshot()) {
    std::lock_guard<std::mutex> lk(e->mx);
    if (e->closed) continue;
    if (now - e->lastPongReceivedAt > timeout) stale.push_back(e->conn->sessionId());
  }
  return stale;
}

bool ConnectionRegistry::closeConnection(const std::string& sessionId,
                                         std::uint16_t code,
                                         const std::string& reason) {
  auto e = detach(sessionId);
  if (!e) return false;
  e->conn->close(code, reason);
  return true;
}

std::size_t ConnectionRegistry::closeAll(std::uint16_t code, const std::string& reason) {
  std::unordered_map<std::string, std::shared_ptr<Entry>> tmp;
  {
    std::lock_guard<std::mutex> lk(mx_);
    tmp.swap(entries_);
    publishCount(entries_.size());
  }
  for (auto& kv : tmp) {
    std::lock_guard<std::mutex> lk(kv.second->mx);
    kv.second->closed = true;
  }
  for (auto& kv : tmp) kv.second->conn->close(code, reason);
  return tmp.size();
}

std::optional<std::set<std::string>> ConnectionRegistry::topicsOf(const std::string& sessionId) const {
  auto e = find(sessionId);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lk(e->mx);
  return e->topics;
}

std::optional<std::uint64_t> ConnectionRegistry::outSeqOf(const std::string& sessionId) const {
  auto e = find(sessionId);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lk(e->mx);
  return e->outSeq;
}

std::optional<ConnectionRegistry::Clock::time_point>
ConnectionRegistry::lastPingSentAt(const std::string& sessionId) const {
  auto e = find(sessionId);
  if (!e) return std::nullopt;
  std::lock_guard<std::mutex> lk(e->mx);
  return e->lastPingSentAt;
}

std::vector<std::string> ConnectionRegistry::sessionIds() const {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& kv : entries_) ids.push_back(kv.first);
  return ids;
}

std::shared_ptr<ConnectionRegistry::Entry> ConnectionRegistry::find(const std::string& sessionId) const {
  std::lock_guard<std::mutex> lk(mx_);
  auto it = entries_.find(sessionId);
  return it == entries_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ConnectionRegistry::Entry>> ConnectionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lk(mx_);
  std::vector<std::shared_ptr<Entry>> out;
  out.reserve(entries_.size());
  for (const auto& kv : entries_) out.push_back(kv.second);
  return out;
}

void ConnectionRegistry::publishCount(std::size_t n) const {
  KSPEC_METRIC_SET("kspec.connections", static_cast<double>(n));
}

} // namespace kspec::server
