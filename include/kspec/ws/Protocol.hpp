#pragma once

#include "kspec/Result.hpp"

#include <rapidjson/document.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kspec::ws {

// Close codes used by the daemon.
constexpr std::uint16_t kCloseNormal    = 1000;
constexpr std::uint16_t kCloseGoingAway = 1001;

// Well-known topics.
constexpr const char* kTopicFileUpdates  = "files:updates";
constexpr const char* kTopicFileErrors   = "files:errors";
constexpr const char* kTopicTaskUpdates  = "tasks:updates";
constexpr const char* kTopicInboxUpdates = "inbox:updates";

enum class Action { Subscribe, Unsubscribe, Ping };

const char* toString(Action a);
std::optional<Action> parseAction(std::string_view s);

// client -> server
struct WebSocketCommand {
  std::string action;                                  // raw, validated by the handler
  std::optional<std::string> requestId;
  std::optional<std::vector<std::string>> topics;      // nullopt if absent or not a string array
};

// server -> client, reply to a command
struct CommandAck {
  std::optional<std::string> requestId;
  bool success = false;
  std::string error;                                   // only meaningful when !success
};

// server -> client, first frame of every connection
struct ConnectedEvent {
  std::string sessionId;
};

// server -> client, topic broadcast
struct BroadcastEvent {
  std::string msgId;
  std::uint64_t seq = 0;
  std::string timestamp;
  std::string topic;
  std::string event;
  std::string data;                                    // raw JSON text; "null" if empty
};

using ServerFrame = std::variant<ConnectedEvent, CommandAck, BroadcastEvent>;

// Envelope-level decode. Fails only when the text is not a JSON object.
Result<WebSocketCommand> decodeCommand(std::string_view text);
std::string encodeCommand(Action action,
                          const std::optional<std::string>& requestId,
                          const std::vector<std::string>& topics = {});

std::string encodeAck(const CommandAck& ack);
std::string encodeConnected(const ConnectedEvent& ev);
std::string encodeBroadcast(const BroadcastEvent& ev);

// Classify and decode any server frame.
Result<ServerFrame> decodeServerFrame(std::string_view text);

// Serialize an arbitrary JSON value (used for broadcast payloads).
std::string toJson(const rapidjson::Value& v);

// Body of GET /api/health.
std::string encodeHealth(double uptimeSec, std::size_t connections, const std::string& version);

// {"error":..,"message":..} body for rejected HTTP requests.
std::string encodeHttpError(const std::string& error, const std::string& message);

} // namespace kspec::ws
