#include "kspec/server/WebSocketServer.hpp"
#include "kspec/server/ClientSession.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/HeartbeatManager.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/ws/Protocol.hpp"

#include <boost/asio/strand.hpp>

#include <vector>

namespace kspec::server {

namespace beast = boost::beast;

using util::LogLevel;
using util::logger;

WebSocketServer::WebSocketServer(boost::asio::io_context& ioc,
                                 ConnectionRegistry& registry,
                                 CommandHandler& commands,
                                 HeartbeatManager& heartbeat,
                                 tcp::endpoint endpoint,
                                 std::string wsPath)
  : ioc_(ioc)
  , acceptor_(ioc)
  , endpoint_(std::move(endpoint))
  , registry_(registry)
  , commands_(commands)
  , heartbeat_(heartbeat)
  , wsPath_(std::move(wsPath))
  , startedAt_(std::chrono::steady_clock::now())
{}

Result<void> WebSocketServer::run() {
  beast::error_code ec;

  acceptor_.open(endpoint_.protocol(), ec);
  if (ec) return Error{ec.message(), "open"};

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) return Error{ec.message(), "set_option"};

  acceptor_.bind(endpoint_, ec);
  if (ec) return Error{ec.message(), "bind " + endpoint_.address().to_string() + ":" + std::to_string(endpoint_.port())};

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) return Error{ec.message(), "listen"};

  startedAt_ = std::chrono::steady_clock::now();
  accepting_.store(true, std::memory_order_release);
  logger().log(LogLevel::Info, "listening",
               {{"address", endpoint_.address().to_string()},
                {"port", std::to_string(port())},
                {"ws", wsPath_}});
  doAccept();
  return {};
}

unsigned short WebSocketServer::port() const {
  beast::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? endpoint_.port() : ep.port();
}

void WebSocketServer::doAccept() {
  if (!accepting_.load(std::memory_order_acquire)) return;
  acceptor_.async_accept(
      boost::asio::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_acquire)) return;
  if (ec) {
    logger().log(LogLevel::Warn, "accept failed", {{"error", ec.message()}});
  } else {
    auto session = std::make_shared<ClientSession>(std::move(socket), *this);
    registerSession(session);
    session->run();
  }
  doAccept();
}

void WebSocketServer::registerSession(const std::shared_ptr<ClientSession>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[s.get()] = s;
}

void WebSocketServer::unregisterSession(ClientSession* s) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(s);
}

std::size_t WebSocketServer::sessionCount() const {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  return sessions_.size();
}

double WebSocketServer::uptimeSeconds() const {
  using namespace std::chrono;
  return duration_cast<duration<double>>(steady_clock::now() - startedAt_).count();
}

void WebSocketServer::stopAccept() noexcept {
  accepting_.store(false, std::memory_order_release);
  beast::error_code ec;
  // Both are idempotent; on an already-closed acceptor they are no-ops.
  acceptor_.cancel(ec);
  acceptor_.close(ec);
}

void WebSocketServer::closeAll() noexcept {
  const std::size_t n = registry_.closeAll(ws::kCloseNormal, "Server shutting down");

  // Sessions that never finished the upgrade are not in the registry.
  std::vector<std::shared_ptr<ClientSession>> pending;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    pending.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) pending.emplace_back(std::move(sp));
    }
  }
  for (auto& s : pending) {
    if (s->state() == ClientSession::State::Opening) s->close(ws::kCloseNormal, "Server shutting down");
  }

  logger().log(LogLevel::Info, "closed all connections",
               {{"connections", std::to_string(n)}, {"pending", std::to_string(pending.size())}});
}

void WebSocketServer::shutdown() noexcept {
  stopAccept();
  closeAll();
  heartbeat_.stop();
}

} // namespace kspec::server
