#pragma once

#include "kspec/client/ClientConnection.hpp"
#include "kspec/client/ReconnectStateMachine.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace kspec::client {

// Drives a ReconnectStateMachine over real sockets and timers. All state
// transitions run on one strand; the public methods may be called from any
// thread.
class WebSocketManager : public std::enable_shared_from_this<WebSocketManager> {
public:
  using EventHandler  = std::function<void(const ws::BroadcastEvent&)>;
  using StatusHandler = std::function<void(ConnectionStatus, Connectivity)>;
  using HandlerId     = std::uint64_t;

  static std::shared_ptr<WebSocketManager>
  create(boost::asio::io_context& ioc, std::string host, std::string port,
         std::string target = "/ws", ReconnectPolicy policy = {});

  WebSocketManager(boost::asio::io_context& ioc, std::string host, std::string port,
                   std::string target, ReconnectPolicy policy);

  WebSocketManager(const WebSocketManager&)            = delete;
  WebSocketManager& operator=(const WebSocketManager&) = delete;

  void connect();
  void disconnect();
  void reset();
  void subscribe(std::vector<std::string> topics);
  void unsubscribe(std::vector<std::string> topics);

  HandlerId on(const std::string& topic, EventHandler handler);
  void off(HandlerId id);
  HandlerId onStatusChange(StatusHandler handler);
  void offStatusChange(HandlerId id);

  // Snapshots; updated after every transition.
  ConnectionStatus status() const { return status_.load(std::memory_order_acquire); }
  Connectivity connectivity() const { return connectivity_.load(std::memory_order_acquire); }
  ConnectionStats stats() const;
  std::vector<std::string> subscriptions() const;
  std::int64_t lastSeqProcessed() const { return lastSeq_.load(std::memory_order_acquire); }

private:
  template <typename Fn>
  void post(Fn&& fn);

  void apply(ClientActions actions);
  void openSocket();
  void deliver(const ws::BroadcastEvent& ev);
  void notifyStatus(ConnectionStatus s, Connectivity c);
  void publish();

private:
  boost::asio::io_context& ioc_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::string host_;
  std::string port_;
  std::string target_;

  // Strand only.
  ReconnectStateMachine sm_;
  std::shared_ptr<ClientConnection> conn_;
  std::uint64_t generation_{0};
  boost::asio::steady_timer reconnectTimer_;
  boost::asio::steady_timer lostTimer_;

  std::atomic<ConnectionStatus> status_{ConnectionStatus::Disconnected};
  std::atomic<Connectivity> connectivity_{Connectivity::Disconnected};
  std::atomic<std::int64_t> lastSeq_{-1};

  mutable std::mutex mu_;
  HandlerId nextId_{1};
  std::map<HandlerId, std::pair<std::string, EventHandler>> handlers_;
  std::map<HandlerId, StatusHandler> statusHandlers_;
  ConnectionStats stats_;
  std::vector<std::string> topics_;
};

} // namespace kspec::client
