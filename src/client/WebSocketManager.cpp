#include "kspec/client/WebSocketManager.hpp"
#include "kspec/util/Logger.hpp"

#include <boost/asio/post.hpp>

#include <exception>

namespace kspec::client {

using util::LogLevel;
using util::logger;
using Kind = ClientAction::Kind;

std::shared_ptr<WebSocketManager>
WebSocketManager::create(boost::asio::io_context& ioc, std::string host, std::string port,
                         std::string target, ReconnectPolicy policy) {
  return std::make_shared<WebSocketManager>(ioc, std::move(host), std::move(port),
                                            std::move(target), policy);
}

WebSocketManager::WebSocketManager(boost::asio::io_context& ioc, std::string host, std::string port,
                                   std::string target, ReconnectPolicy policy)
  : ioc_(ioc)
  , strand_(boost::asio::make_strand(ioc))
  , host_(std::move(host))
  , port_(std::move(port))
  , target_(std::move(target))
  , sm_(policy)
  , reconnectTimer_(strand_)
  , lostTimer_(strand_)
{}

template <typename Fn>
void WebSocketManager::post(Fn&& fn) {
  boost::asio::post(strand_,
    [w = weak_from_this(), fn = std::forward<Fn>(fn)]() mutable {
      if (auto self = w.lock()) fn(*self);
    });
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

void WebSocketManager::connect() {
  post([](WebSocketManager& m) { m.apply(m.sm_.connect()); });
}

void WebSocketManager::disconnect() {
  post([](WebSocketManager& m) { m.apply(m.sm_.disconnect()); });
}

void WebSocketManager::reset() {
  post([](WebSocketManager& m) { m.apply(m.sm_.reset()); });
}

void WebSocketManager::subscribe(std::vector<std::string> topics) {
  post([topics = std::move(topics)](WebSocketManager& m) { m.apply(m.sm_.subscribe(topics)); });
}

void WebSocketManager::unsubscribe(std::vector<std::string> topics) {
  post([topics = std::move(topics)](WebSocketManager& m) { m.apply(m.sm_.unsubscribe(topics)); });
}

WebSocketManager::HandlerId WebSocketManager::on(const std::string& topic, EventHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  const HandlerId id = nextId_++;
  handlers_.emplace(id, std::make_pair(topic, std::move(handler)));
  return id;
}

void WebSocketManager::off(HandlerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  handlers_.erase(id);
}

WebSocketManager::HandlerId WebSocketManager::onStatusChange(StatusHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  const HandlerId id = nextId_++;
  statusHandlers_.emplace(id, std::move(handler));
  return id;
}

void WebSocketManager::offStatusChange(HandlerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  statusHandlers_.erase(id);
}

ConnectionStats WebSocketManager::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

std::vector<std::string> WebSocketManager::subscriptions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return topics_;
}

// ---------------------------------------------------------------------------
// Action execution (strand)
// ---------------------------------------------------------------------------

void WebSocketManager::apply(ClientActions actions) {
  for (auto& a : actions) {
    switch (a.kind) {
      case Kind::OpenSocket:
        openSocket();
        break;

      case Kind::CloseSocket:
        // Late callbacks from this socket are ignored from here on.
        ++generation_;
        if (conn_) {
          conn_->close(a.code, a.text);
          conn_.reset();
        }
        break;

      case Kind::SendText:
        if (conn_) conn_->send(std::move(a.text));
        break;

      case Kind::ScheduleReconnect:
        reconnectTimer_.expires_after(a.delay);
        reconnectTimer_.async_wait([w = weak_from_this()](const boost::system::error_code& ec) {
          if (ec) return;
          if (auto self = w.lock()) self->apply(self->sm_.onReconnectTimer());
        });
        break;

      case Kind::CancelReconnect:
        reconnectTimer_.cancel();
        break;

      case Kind::ScheduleConnectionLostCheck:
        lostTimer_.expires_after(a.delay);
        lostTimer_.async_wait([w = weak_from_this()](const boost::system::error_code& ec) {
          if (ec) return;
          if (auto self = w.lock()) self->apply(self->sm_.onConnectionLostTimer());
        });
        break;

      case Kind::CancelConnectionLostCheck:
        lostTimer_.cancel();
        break;

      case Kind::Deliver:
        if (a.event) deliver(*a.event);
        break;

      case Kind::StatusChanged:
        status_.store(a.status, std::memory_order_release);
        connectivity_.store(a.connectivity, std::memory_order_release);
        notifyStatus(a.status, a.connectivity);
        break;
    }
  }
  publish();
}

void WebSocketManager::openSocket() {
  const std::uint64_t gen = ++generation_;
  auto conn = ClientConnection::create(ioc_, host_, port_, target_);
  conn->setIdleTimeout(sm_.policy().contactTimeout);

  auto w = weak_from_this();
  // Each callback hops back onto the manager strand and drops itself if a
  // newer socket has replaced this one.
  auto guard = [w, gen](auto fn) {
    return [w, gen, fn](auto&&... args) {
      if (auto self = w.lock()) {
        boost::asio::post(self->strand_, [w, gen, fn, args...]() {
          auto s = w.lock();
          if (!s || s->generation_ != gen) return;
          fn(*s, args...);
        });
      }
    };
  };

  conn->setOnOpen(guard([](WebSocketManager& m) {
    logger().log(LogLevel::Info, "connected", {{"host", m.host_}, {"port", m.port_}});
    m.apply(m.sm_.onOpen());
  }));
  conn->setOnMessage(guard([](WebSocketManager& m, const std::string& text) {
    m.apply(m.sm_.onFrame(text));
  }));
  conn->setOnContact(guard([](WebSocketManager& m) {
    m.sm_.noteContact();
  }));
  conn->setOnClose(guard([](WebSocketManager& m) {
    m.conn_.reset();
    m.apply(m.sm_.onClose());
  }));
  conn->setOnError([host = host_, port = port_](const ClientConnection::ErrorCode& ec, std::string_view where) {
    logger().log(LogLevel::Debug, "client connection error",
                 {{"where", std::string(where)}, {"error", ec.message()},
                  {"host", host}, {"port", port}});
  });

  conn_ = conn;
  conn->connect();
}

void WebSocketManager::deliver(const ws::BroadcastEvent& ev) {
  std::vector<EventHandler> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : handlers_) {
      if (kv.second.first == ev.topic) targets.push_back(kv.second.second);
    }
  }
  for (auto& h : targets) {
    try {
      h(ev);
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "event handler threw",
                   {{"topic", ev.topic}, {"event", ev.event}, {"error", ex.what()}});
    }
  }
}

void WebSocketManager::notifyStatus(ConnectionStatus s, Connectivity c) {
  std::vector<StatusHandler> targets;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& kv : statusHandlers_) targets.push_back(kv.second);
  }
  for (auto& h : targets) {
    try {
      h(s, c);
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "status handler threw",
                   {{"status", toString(s)}, {"error", ex.what()}});
    }
  }
}

void WebSocketManager::publish() {
  lastSeq_.store(sm_.lastSeqProcessed(), std::memory_order_release);
  std::lock_guard<std::mutex> lk(mu_);
  stats_ = sm_.stats();
  topics_.assign(sm_.subscribedTopics().begin(), sm_.subscribedTopics().end());
}

} // namespace kspec::client
