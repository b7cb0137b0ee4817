#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace kspec::client {

// One WebSocket connection attempt to the daemon: resolve, connect,
// handshake, then a read loop and a queued writer. Not reusable; the
// reconnect logic creates a fresh instance per attempt.
//
// onClose fires exactly once per instance, whether the attempt failed before
// the handshake completed or an open connection ended.
class ClientConnection : public std::enable_shared_from_this<ClientConnection> {
public:
  using IoContext = boost::asio::io_context;
  using Tcp       = boost::asio::ip::tcp;
  using WsStream  = boost::beast::websocket::stream<boost::beast::tcp_stream>;
  using ErrorCode = boost::beast::error_code;

  using OnOpen    = std::function<void()>;
  using OnClose   = std::function<void()>;
  using OnMessage = std::function<void(const std::string&)>;
  using OnError   = std::function<void(const ErrorCode&, std::string_view where)>;
  using OnContact = std::function<void()>;

  ClientConnection(IoContext& ioc,
                   std::string host,
                   std::string service,
                   std::string target);

  static std::shared_ptr<ClientConnection>
  create(IoContext& ioc, std::string host, std::string service, std::string target) {
    return std::make_shared<ClientConnection>(ioc, std::move(host), std::move(service),
                                              std::move(target));
  }

  void connect();
  // Graceful close when open; aborts the attempt otherwise.
  void close(std::uint16_t code, std::string reason);
  bool isOpen() const;

  // Thread-safe; queued until the handshake completes.
  void send(std::string text);

  // Close the connection when nothing arrives for this long (zero disables).
  void setIdleTimeout(std::chrono::seconds t) { idleTimeout_ = t; }

  void setOnOpen(OnOpen cb)       { onOpen_ = std::move(cb); }
  void setOnClose(OnClose cb)     { onClose_ = std::move(cb); }
  void setOnMessage(OnMessage cb) { onMessage_ = std::move(cb); }
  void setOnError(OnError cb)     { onError_ = std::move(cb); }
  // Server ping or pong frames.
  void setOnContact(OnContact cb) { onContact_ = std::move(cb); }

private:
  void onResolve(ErrorCode ec, Tcp::resolver::results_type results);
  void onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type ep);
  void onHandshake(ErrorCode ec);

  void doRead();
  void onRead(ErrorCode ec, std::size_t bytes);

  void doWrite();
  void onWrite(ErrorCode ec, std::size_t bytes);

  void fail(ErrorCode ec, std::string_view where);
  void finish();

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  Tcp::resolver resolver_;
  WsStream ws_;
  std::string host_;
  std::string service_;
  std::string target_;
  boost::beast::flat_buffer buffer_;
  std::chrono::seconds idleTimeout_{0};

  std::deque<std::string> outbox_;
  bool writing_{false};
  bool open_{false};
  bool closing_{false};
  bool finished_{false};

  OnOpen onOpen_;
  OnClose onClose_;
  OnMessage onMessage_;
  OnError onError_;
  OnContact onContact_;
};

} // namespace kspec::client
