#include "kspec/server/ClientSession.hpp"
#include "kspec/server/CommandHandler.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/HeartbeatManager.hpp"
#include "kspec/server/HttpGuard.hpp"
#include "kspec/server/WebSocketServer.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Ulid.hpp"
#include "kspec/ws/Protocol.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <chrono>
#include <iterator>

namespace kspec::server {

namespace websocket = boost::beast::websocket;
namespace beast     = boost::beast;
namespace http      = boost::beast::http;

using util::LogLevel;
using util::logger;

namespace {

std::string toStd(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

} // namespace

ClientSession::ClientSession(tcp::socket socket, WebSocketServer& server)
  : server_(server)
  , ws_(std::move(socket))
  , sessionId_(util::ulid())
{}

void ClientSession::run() {
  // Hop onto the session strand before touching the stream.
  boost::asio::dispatch(ws_.get_executor(),
    [self = shared_from_this()]() { self->doHttpRead(); });
}

// ---------------------------------------------------------------------------
// HTTP phase
// ---------------------------------------------------------------------------

void ClientSession::doHttpRead() {
  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
  http::async_read(ws_.next_layer(), buffer_, req_,
    [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
      self->onHttpRead(ec, bytes);
    });
}

void ClientSession::onHttpRead(beast::error_code ec, std::size_t) {
  if (ec) {
    onClosed(ec, "http-read");
    return;
  }

  const std::string host = toStd(req_[http::field::host]);
  if (!isLocalhostHost(host)) {
    logger().log(LogLevel::Warn, "rejected non-localhost request", {{"host", host}});
    respond(http::status::forbidden,
            ws::encodeHttpError("Forbidden", "This server only accepts connections from localhost"));
    return;
  }

  const std::string target = toStd(req_.target());
  const std::string path = targetPath(target);

  if (websocket::is_upgrade(req_)) {
    if (path != server_.wsPath()) {
      respond(http::status::not_found, ws::encodeHttpError("Not Found", "No WebSocket endpoint at " + path));
      return;
    }
    project_ = queryParam(target, "project");
    acceptWebSocket();
    return;
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    respond(http::status::ok,
            ws::encodeHealth(server_.uptimeSeconds(), server_.registry().connectionCount(),
                             WebSocketServer::kVersion));
    return;
  }

  respond(http::status::not_found, ws::encodeHttpError("Not Found", "Unknown route " + path));
}

void ClientSession::respond(http::status status, std::string body) {
  auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
  res->set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " kspecd");
  res->set(http::field::content_type, "application/json");
  res->keep_alive(false);
  res->body() = std::move(body);
  res->prepare_payload();

  http::async_write(ws_.next_layer(), *res,
    [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
      beast::error_code sec;
      beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, sec);
      if (sec) {
        logger().log(LogLevel::Debug, "http shutdown", {{"error", sec.message()}});
      }
      self->onClosed(ec, "http-write");
    });
}

// ---------------------------------------------------------------------------
// WebSocket phase
// ---------------------------------------------------------------------------

void ClientSession::acceptWebSocket() {
  // The websocket stream has its own timeouts; liveness is the heartbeat's job.
  beast::get_lowest_layer(ws_).expires_never();

  auto opt = websocket::stream_base::timeout::suggested(beast::role_type::server);
  opt.idle_timeout = websocket::stream_base::none();
  opt.keep_alive_pings = false;
  ws_.set_option(opt);

  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " kspecd");
      }));

  ws_.control_callback(
      [this](websocket::frame_type kind, beast::string_view) {
        if (kind == websocket::frame_type::pong) {
          server_.heartbeat().recordPong(sessionId_);
        }
      });

  ws_.async_accept(req_,
    [self = shared_from_this()](beast::error_code ec) {
      self->onAccept(ec);
    });
}

void ClientSession::onAccept(beast::error_code ec) {
  if (ec) {
    logger().log(LogLevel::Warn, "websocket accept failed", {{"error", ec.message()}});
    onClosed(ec, "accept");
    return;
  }

  state_.store(State::Open, std::memory_order_release);

  auto added = server_.registry().addConnection(shared_from_this(), project_);
  if (!added) {
    logger().log(LogLevel::Error, "could not register connection",
                 {{"session", sessionId_}, {"error", added.error().describe()}});
    close(static_cast<std::uint16_t>(websocket::close_code::internal_error), "Registration failed");
    return;
  }

  std::vector<util::Field> fields{{"session", sessionId_},
                                  {"connections", std::to_string(server_.registry().connectionCount())}};
  if (project_) fields.push_back({"project", *project_});
  logger().log(LogLevel::Info, "connection opened", fields);

  // Must be the first frame the client sees.
  sendText(ws::encodeConnected(ws::ConnectedEvent{sessionId_}));
  doRead();
}

void ClientSession::doRead() {
  ws_.async_read(buffer_,
    [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
      self->onRead(ec, bytes);
    });
}

void ClientSession::onRead(beast::error_code ec, std::size_t) {
  if (ec) {
    onClosed(ec, "read");
    return;
  }

  const std::string text = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());

  server_.commands().handleMessage(*this, text);

  doRead();
}

// ---------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------

void ClientSession::sendText(std::string text) {
  if (state() != State::Open) return;

  queued_.fetch_add(text.size(), std::memory_order_acq_rel);
  boost::asio::post(ws_.get_executor(),
    [self = shared_from_this(), msg = std::move(text)]() mutable {
      if (self->state() != State::Open) {
        self->queued_.fetch_sub(msg.size(), std::memory_order_acq_rel);
        return;
      }
      self->outbox_.emplace_back(std::move(msg));
      if (!self->writing_) {
        self->writing_ = true;
        self->doWrite();
      }
    });
}

void ClientSession::doWrite() {
  if (outbox_.empty()) {
    writing_ = false;
    return;
  }
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(outbox_.front()),
    [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
      self->onWrite(ec, bytes);
    });
}

void ClientSession::onWrite(beast::error_code ec, std::size_t) {
  if (!outbox_.empty()) {
    queued_.fetch_sub(outbox_.front().size(), std::memory_order_acq_rel);
    outbox_.pop_front();
  }
  if (ec) {
    onClosed(ec, "write");
    return;
  }
  doWrite();
}

void ClientSession::ping() {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this()]() {
    if (self->state() != State::Open || self->pinging_) return;
    self->pinging_ = true;
    self->ws_.async_ping(websocket::ping_data{},
      [self](beast::error_code ec) {
        self->pinging_ = false;
        if (ec && ec != boost::asio::error::operation_aborted) {
          logger().log(LogLevel::Debug, "ping failed",
                       {{"session", self->sessionId_}, {"error", ec.message()}});
        }
      });
  });
}

void ClientSession::close(std::uint16_t code, std::string reason) {
  boost::asio::post(ws_.get_executor(),
    [self = shared_from_this(), code, reason = std::move(reason)]() {
      State expected = State::Open;
      if (self->state_.compare_exchange_strong(expected, State::Closing, std::memory_order_acq_rel)) {
        const std::size_t n = std::min<std::size_t>(reason.size(), 120);
        websocket::close_reason cr(static_cast<websocket::close_code>(code),
                                   beast::string_view(reason.data(), n));
        self->ws_.async_close(cr, [self, code](beast::error_code ec) {
          logger().log(LogLevel::Debug, "close handshake done",
                       {{"session", self->sessionId_}, {"code", std::to_string(code)},
                        {"error", ec ? ec.message() : std::string("none")}});
          self->onClosed(ec, "close");
        });
        return;
      }
      if (expected == State::Opening) {
        // Still in the HTTP phase: drop the socket; the pending read fails
        // and finishes the session.
        beast::get_lowest_layer(self->ws_).close();
      }
    });
}

void ClientSession::onClosed(beast::error_code ec, const char* where) {
  const State prev = state_.exchange(State::Closed, std::memory_order_acq_rel);
  if (prev == State::Closed) return;

  const bool clean = !ec || ec == websocket::error::closed;
  const bool upgraded = prev == State::Open || prev == State::Closing;

  // Transport failure: abort the other pending operation first.
  if (upgraded && !clean) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
  }

  // An in-flight async_write still points at the front buffer; onWrite pops it.
  if (writing_ && !outbox_.empty()) {
    outbox_.erase(std::next(outbox_.begin()), outbox_.end());
    queued_.store(outbox_.front().size(), std::memory_order_release);
  } else {
    outbox_.clear();
    queued_.store(0, std::memory_order_release);
  }

  if (upgraded) {
    server_.registry().removeConnection(sessionId_);

    std::vector<util::Field> fields{{"session", sessionId_}, {"where", where}};
    if (!clean) fields.push_back({"error", ec.message()});
    if (ec == websocket::error::closed) {
      fields.push_back({"code", std::to_string(static_cast<unsigned>(ws_.reason().code))});
    }
    fields.push_back({"connections", std::to_string(server_.registry().connectionCount())});
    logger().log(clean ? LogLevel::Info : LogLevel::Warn, "connection closed", fields);
  } else if (ec && ec != http::error::end_of_stream) {
    logger().log(LogLevel::Debug, "http session ended", {{"where", where}, {"error", ec.message()}});
  }

  server_.unregisterSession(this);
}

} // namespace kspec::server
