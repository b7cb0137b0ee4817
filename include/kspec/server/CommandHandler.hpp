#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kspec::server {

class ConnectionRegistry;
class IConnection;

// Error strings carried in failed acknowledgements.
constexpr const char* kErrInvalidPayload = "validation_error: invalid payload";
constexpr const char* kErrInvalidAction  = "missing or invalid action field";
constexpr const char* kErrInvalidTopics  = "validation_error: missing or invalid topics array";
constexpr const char* kErrNotFound       = "not_found: session not found";

// Parses inbound command frames, applies them to the registry and answers
// each with exactly one CommandAck. Never throws, never closes the connection.
class CommandHandler {
public:
  explicit CommandHandler(ConnectionRegistry& registry) : registry_(registry) {}

  void handleMessage(IConnection& conn, std::string_view raw);

private:
  void sendAck(IConnection& conn,
               const std::optional<std::string>& requestId,
               bool success,
               const std::string& error = {});

private:
  ConnectionRegistry& registry_;
};

} // namespace kspec::server
