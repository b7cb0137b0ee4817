#pragma once

#include "kspec/Result.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace kspec::server {

class ClientSession;
class CommandHandler;
class ConnectionRegistry;
class HeartbeatManager;

// Accept loop for the daemon's HTTP/WebSocket port. Sessions register
// themselves here for their whole life so shutdown can reach the ones that
// have not finished the upgrade yet.
class WebSocketServer {
public:
  using tcp = boost::asio::ip::tcp;

  static constexpr const char* kVersion = "0.1.0";

  WebSocketServer(boost::asio::io_context& ioc,
                  ConnectionRegistry& registry,
                  CommandHandler& commands,
                  HeartbeatManager& heartbeat,
                  tcp::endpoint endpoint,
                  std::string wsPath = "/ws");

  WebSocketServer(const WebSocketServer&)            = delete;
  WebSocketServer& operator=(const WebSocketServer&) = delete;

  // Open, bind and listen, then start accepting.
  Result<void> run();

  // Port actually bound (useful with port 0).
  unsigned short port() const;

  void stopAccept() noexcept;
  // Close every connection with 1000 "Server shutting down".
  void closeAll() noexcept;
  // stopAccept + closeAll + heartbeat stop, in that order.
  void shutdown() noexcept;

  void registerSession(const std::shared_ptr<ClientSession>& s);
  void unregisterSession(ClientSession* s) noexcept;
  std::size_t sessionCount() const;

  ConnectionRegistry& registry() { return registry_; }
  CommandHandler& commands() { return commands_; }
  HeartbeatManager& heartbeat() { return heartbeat_; }
  const std::string& wsPath() const { return wsPath_; }
  double uptimeSeconds() const;

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, tcp::socket socket);

private:
  boost::asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  tcp::endpoint endpoint_;

  ConnectionRegistry& registry_;
  CommandHandler& commands_;
  HeartbeatManager& heartbeat_;
  std::string wsPath_;
  std::chrono::steady_clock::time_point startedAt_;

  std::atomic<bool> accepting_{false};

  mutable std::mutex sessions_mu_;
  std::unordered_map<ClientSession*, std::weak_ptr<ClientSession>> sessions_;
};

} // namespace kspec::server
