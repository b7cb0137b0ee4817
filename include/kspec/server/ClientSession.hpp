#pragma once
#include "kspec/server/IConnection.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>

namespace kspec::server {

class WebSocketServer;

// One accepted socket. Starts as a plain HTTP exchange (health endpoint,
// localhost guard) and, on an upgrade to the configured path, becomes a
// registered WebSocket connection.
//
// Lifecycle: Opening -> Open -> Closing -> Closed. All socket work runs on
// the session's strand; IConnection calls may come from any thread.
class ClientSession : public IConnection,
                      public std::enable_shared_from_this<ClientSession> {
public:
  using tcp = boost::asio::ip::tcp;
  using Ws  = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  enum class State { Opening, Open, Closing, Closed };

  ClientSession(tcp::socket socket, WebSocketServer& server);

  // Read the HTTP request and route it.
  void run();

  // IConnection
  const std::string& sessionId() const override { return sessionId_; }
  void sendText(std::string text) override;
  std::size_t bufferedAmount() const override { return queued_.load(std::memory_order_acquire); }
  void ping() override;
  void close(std::uint16_t code, std::string reason) override;

  State state() const { return state_.load(std::memory_order_acquire); }
  const std::optional<std::string>& project() const { return project_; }

private:
  void doHttpRead();
  void onHttpRead(boost::beast::error_code ec, std::size_t bytes);
  void respond(boost::beast::http::status status, std::string body);

  void acceptWebSocket();
  void onAccept(boost::beast::error_code ec);

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);

  void doWrite();
  void onWrite(boost::beast::error_code ec, std::size_t bytes);

  void onClosed(boost::beast::error_code ec, const char* where);

private:
  WebSocketServer& server_;
  Ws ws_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;

  const std::string sessionId_;
  std::optional<std::string> project_;
  std::atomic<State> state_{State::Opening};

  // Outbound write serialization (broadcasts arrive from arbitrary threads).
  std::deque<std::string> outbox_;
  bool writing_{false};
  bool pinging_{false};
  std::atomic<std::size_t> queued_{0};
};

} // namespace kspec::server
