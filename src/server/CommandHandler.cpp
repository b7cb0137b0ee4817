#include "kspec/server/CommandHandler.hpp"
#include "kspec/server/ConnectionRegistry.hpp"
#include "kspec/server/IConnection.hpp"
#include "kspec/util/Logger.hpp"
#include "kspec/util/Metrics.hpp"
#include "kspec/ws/Protocol.hpp"

#include <exception>

namespace kspec::server {

using util::LogLevel;
using util::logger;

void CommandHandler::handleMessage(IConnection& conn, std::string_view raw) {
  auto decoded = ws::decodeCommand(raw);
  if (!decoded) {
    logger().log(LogLevel::Debug, "command rejected",
                 {{"session", conn.sessionId()}, {"reason", decoded.error().describe()}});
    sendAck(conn, std::nullopt, false, kErrInvalidPayload);
    return;
  }
  const ws::WebSocketCommand& cmd = *decoded;

  const auto action = ws::parseAction(cmd.action);
  if (!action) {
    sendAck(conn, cmd.requestId, false, kErrInvalidAction);
    return;
  }

  try {
    switch (*action) {
      case ws::Action::Subscribe:
      case ws::Action::Unsubscribe: {
        if (!cmd.topics || cmd.topics->empty()) {
          sendAck(conn, cmd.requestId, false, kErrInvalidTopics);
          return;
        }
        const bool subscribe = (*action == ws::Action::Subscribe);
        const bool ok = subscribe ? registry_.subscribe(conn.sessionId(), *cmd.topics)
                                  : registry_.unsubscribe(conn.sessionId(), *cmd.topics);
        if (!ok) {
          sendAck(conn, cmd.requestId, false, kErrNotFound);
          return;
        }
        std::string joined;
        for (const auto& t : *cmd.topics) {
          if (!joined.empty()) joined += ',';
          joined += t;
        }
        logger().log(LogLevel::Info, subscribe ? "subscribed" : "unsubscribed",
                     {{"session", conn.sessionId()}, {"topics", joined}});
        sendAck(conn, cmd.requestId, true);
        return;
      }
      case ws::Action::Ping:
        sendAck(conn, cmd.requestId, true);
        return;
    }
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "command failed",
                 {{"session", conn.sessionId()}, {"action", cmd.action}, {"error", ex.what()}});
    sendAck(conn, cmd.requestId, false, std::string("error: ") + ex.what());
  }
}

void CommandHandler::sendAck(IConnection& conn,
                             const std::optional<std::string>& requestId,
                             bool success,
                             const std::string& error) {
  if (!success) KSPEC_METRIC_HIT("kspec.command.failed");
  ws::CommandAck ack;
  ack.requestId = requestId;
  ack.success = success;
  ack.error = error;
  conn.sendText(ws::encodeAck(ack));
}

} // namespace kspec::server
