#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace kspec::server {

// Transport seen by the registry, heartbeat and command handler.
// Implementations must make every call non-blocking and safe from any thread.
class IConnection {
public:
  virtual ~IConnection() = default;

  virtual const std::string& sessionId() const = 0;

  // Queue one text frame.
  virtual void sendText(std::string text) = 0;

  // Bytes queued for this connection but not yet written to the socket.
  virtual std::size_t bufferedAmount() const = 0;

  // Transport-level ping frame.
  virtual void ping() = 0;

  // Start a close handshake; idempotent.
  virtual void close(std::uint16_t code, std::string reason) = 0;
};

} // namespace kspec::server
