#include "kspec/client/ClientConnection.hpp"
#include "kspec/util/Logger.hpp"

#include <boost/beast/version.hpp>

#include <algorithm>
#include <iterator>

namespace kspec::client {

namespace websocket = boost::beast::websocket;

using namespace std::chrono_literals;
using util::LogLevel;
using util::logger;

ClientConnection::ClientConnection(IoContext& ioc,
                                   std::string host,
                                   std::string service,
                                   std::string target)
  : strand_(boost::asio::make_strand(ioc))
  , resolver_(strand_)
  , ws_(strand_)
  , host_(std::move(host))
  , service_(std::move(service))
  , target_(std::move(target))
{
}

bool ClientConnection::isOpen() const {
  return ws_.is_open();
}

void ClientConnection::connect() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->resolver_.async_resolve(self->host_, self->service_,
      boost::asio::bind_executor(
        self->strand_,
        [self](ErrorCode ec, Tcp::resolver::results_type results) {
          self->onResolve(ec, std::move(results));
        }));
  });
}

void ClientConnection::onResolve(ErrorCode ec, Tcp::resolver::results_type results) {
  if (ec) return fail(ec, "resolve");
  if (closing_) return finish();

  boost::beast::get_lowest_layer(ws_).expires_after(30s);
  boost::beast::get_lowest_layer(ws_).async_connect(
    results,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec2, Tcp::resolver::results_type::endpoint_type ep) {
        self->onConnect(ec2, ep);
      }));
}

void ClientConnection::onConnect(ErrorCode ec, Tcp::resolver::results_type::endpoint_type) {
  if (ec) return fail(ec, "connect");
  if (closing_) return finish();

  // The websocket stream has its own timeouts.
  boost::beast::get_lowest_layer(ws_).expires_never();

  auto opt = websocket::stream_base::timeout::suggested(boost::beast::role_type::client);
  if (idleTimeout_.count() > 0) opt.idle_timeout = idleTimeout_;
  ws_.set_option(opt);

  ws_.set_option(websocket::stream_base::decorator(
    [](websocket::request_type& req) {
      req.set(boost::beast::http::field::user_agent,
              std::string(BOOST_BEAST_VERSION_STRING) + " kspec-client");
    }));

  ws_.control_callback(
    [this](websocket::frame_type kind, boost::beast::string_view) {
      if (kind != websocket::frame_type::close && onContact_) onContact_();
    });

  ws_.text(true);

  // Host header must carry the port for the daemon's localhost check.
  ws_.async_handshake(host_ + ":" + service_, target_,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec2) {
        self->onHandshake(ec2);
      }));
}

void ClientConnection::onHandshake(ErrorCode ec) {
  if (ec) return fail(ec, "handshake");

  open_ = true;
  if (onOpen_) onOpen_();

  doRead();

  if (!outbox_.empty() && !writing_) {
    writing_ = true;
    doWrite();
  }
}

void ClientConnection::doRead() {
  ws_.async_read(
    buffer_,
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec, std::size_t bytes) {
        self->onRead(ec, bytes);
      }));
}

void ClientConnection::onRead(ErrorCode ec, std::size_t) {
  if (ec) {
    if (ec == websocket::error::closed) {
      logger().log(LogLevel::Debug, "server closed connection",
                   {{"code", std::to_string(static_cast<unsigned>(ws_.reason().code))},
                    {"reason", std::string(ws_.reason().reason.c_str())}});
      return finish();
    }
    return fail(ec, "read");
  }

  auto text = boost::beast::buffers_to_string(buffer_.cdata());
  buffer_.consume(buffer_.size());
  if (onMessage_) onMessage_(text);

  doRead();
}

void ClientConnection::send(std::string text) {
  boost::asio::post(
    strand_,
    [self = shared_from_this(), msg = std::move(text)]() mutable {
      if (self->finished_ || self->closing_) return;
      self->outbox_.emplace_back(std::move(msg));
      if (self->open_ && !self->writing_) {
        self->writing_ = true;
        self->doWrite();
      }
    });
}

void ClientConnection::doWrite() {
  if (outbox_.empty() || closing_) {
    writing_ = false;
    return;
  }

  ws_.async_write(
    boost::asio::buffer(outbox_.front()),
    boost::asio::bind_executor(
      strand_,
      [self = shared_from_this()](ErrorCode ec, std::size_t bytes) {
        self->onWrite(ec, bytes);
      }));
}

void ClientConnection::onWrite(ErrorCode ec, std::size_t) {
  if (!outbox_.empty()) outbox_.pop_front();
  if (ec) {
    // The read loop sees the same failure and finishes the connection.
    writing_ = false;
    if (onError_ && !finished_) onError_(ec, "write");
    return;
  }
  if (finished_) {
    writing_ = false;
    return;
  }
  doWrite();
}

void ClientConnection::close(std::uint16_t code, std::string reason) {
  boost::asio::post(
    strand_,
    [self = shared_from_this(), code, reason = std::move(reason)]() {
      if (self->closing_ || self->finished_) return;
      self->closing_ = true;

      if (!self->open_) {
        // Still connecting: abort whatever is pending.
        self->resolver_.cancel();
        ErrorCode ignored;
        boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
        return;
      }

      const std::size_t n = std::min<std::size_t>(reason.size(), 120);
      websocket::close_reason cr(static_cast<websocket::close_code>(code),
                                 boost::beast::string_view(reason.data(), n));
      self->ws_.async_close(cr,
        boost::asio::bind_executor(
          self->strand_,
          [self](ErrorCode ec) {
            if (ec) self->fail(ec, "close");
            else self->finish();
          }));
    });
}

void ClientConnection::fail(ErrorCode ec, std::string_view where) {
  if (ec == boost::asio::error::operation_aborted && closing_) {
    return finish();
  }
  if (onError_) onError_(ec, where);
  else logger().log(LogLevel::Warn, "client connection error",
                    {{"where", std::string(where)}, {"error", ec.message()}});
  finish();
}

void ClientConnection::finish() {
  if (finished_) return;
  finished_ = true;
  open_ = false;

  ErrorCode ignored;
  boost::beast::get_lowest_layer(ws_).socket().close(ignored);

  // An in-flight async_write still points at the front buffer; onWrite pops it.
  if (writing_ && !outbox_.empty()) {
    outbox_.erase(std::next(outbox_.begin()), outbox_.end());
  } else {
    outbox_.clear();
  }
  if (onClose_) onClose_();
}

} // namespace kspec::client
