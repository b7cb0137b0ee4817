#include "kspec/ws/Protocol.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace kspec::ws {

using rapidjson::SizeType;

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(JsonWriter& w, const std::string& s) {
  w.String(s.data(), static_cast<SizeType>(s.size()));
}

void writeKey(JsonWriter& w, const char* k) {
  w.Key(k);
}

std::optional<std::string> stringMember(const rapidjson::Value& obj, const char* name) {
  auto it = obj.FindMember(name);
  if (it == obj.MemberEnd() || !it->value.IsString()) return std::nullopt;
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

Result<rapidjson::Document> parseObject(std::string_view text) {
  rapidjson::Document doc;
  doc.Parse(text.data(), text.size());
  if (doc.HasParseError()) {
    return Error{std::string("invalid JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                 "offset " + std::to_string(doc.GetErrorOffset())};
  }
  if (!doc.IsObject()) {
    return Error{"expected a JSON object", "$"};
  }
  return std::move(doc);
}

} // namespace

const char* toString(Action a) {
  switch (a) {
    case Action::Subscribe:   return "subscribe";
    case Action::Unsubscribe: return "unsubscribe";
    case Action::Ping:        return "ping";
  }
  return "ping";
}

std::optional<Action> parseAction(std::string_view s) {
  if (s == "subscribe")   return Action::Subscribe;
  if (s == "unsubscribe") return Action::Unsubscribe;
  if (s == "ping")        return Action::Ping;
  return std::nullopt;
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

Result<WebSocketCommand> decodeCommand(std::string_view text) {
  auto parsed = parseObject(text);
  if (!parsed) return parsed.error();
  const auto& doc = *parsed;

  WebSocketCommand cmd;
  if (auto a = stringMember(doc, "action")) cmd.action = std::move(*a);
  cmd.requestId = stringMember(doc, "request_id");

  auto p = doc.FindMember("payload");
  if (p != doc.MemberEnd() && p->value.IsObject()) {
    auto t = p->value.FindMember("topics");
    if (t != p->value.MemberEnd() && t->value.IsArray()) {
      std::vector<std::string> topics;
      bool allStrings = true;
      for (const auto& v : t->value.GetArray()) {
        if (!v.IsString()) { allStrings = false; break; }
        topics.emplace_back(v.GetString(), v.GetStringLength());
      }
      if (allStrings) cmd.topics = std::move(topics);
    }
  }
  return cmd;
}

std::string encodeCommand(Action action,
                          const std::optional<std::string>& requestId,
                          const std::vector<std::string>& topics) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "action");
  w.String(toString(action));
  if (requestId) {
    writeKey(w, "request_id");
    writeString(w, *requestId);
  }
  if (action != Action::Ping) {
    writeKey(w, "payload");
    w.StartObject();
    writeKey(w, "topics");
    w.StartArray();
    for (const auto& t : topics) writeString(w, t);
    w.EndArray();
    w.EndObject();
  }
  w.EndObject();
  return sb.GetString();
}

// ---------------------------------------------------------------------------
// Server frames
// ---------------------------------------------------------------------------

std::string encodeAck(const CommandAck& ack) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "ack");
  w.Bool(true);
  if (ack.requestId) {
    writeKey(w, "request_id");
    writeString(w, *ack.requestId);
  }
  writeKey(w, "success");
  w.Bool(ack.success);
  if (!ack.success) {
    writeKey(w, "error");
    writeString(w, ack.error);
  }
  w.EndObject();
  return sb.GetString();
}

std::string encodeConnected(const ConnectedEvent& ev) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "event");
  w.String("connected");
  writeKey(w, "session_id");
  writeString(w, ev.sessionId);
  w.EndObject();
  return sb.GetString();
}

std::string encodeBroadcast(const BroadcastEvent& ev) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "msg_id");
  writeString(w, ev.msgId);
  writeKey(w, "seq");
  w.Uint64(ev.seq);
  writeKey(w, "timestamp");
  writeString(w, ev.timestamp);
  writeKey(w, "topic");
  writeString(w, ev.topic);
  writeKey(w, "event");
  writeString(w, ev.event);
  writeKey(w, "data");
  if (ev.data.empty()) {
    w.Null();
  } else {
    // Payload was serialized once by the broadcaster; splice it in verbatim.
    w.RawValue(ev.data.data(), ev.data.size(), rapidjson::kObjectType);
  }
  w.EndObject();
  return sb.GetString();
}

Result<ServerFrame> decodeServerFrame(std::string_view text) {
  auto parsed = parseObject(text);
  if (!parsed) return parsed.error();
  const auto& doc = *parsed;

  if (doc.HasMember("ack")) {
    CommandAck ack;
    ack.requestId = stringMember(doc, "request_id");
    auto s = doc.FindMember("success");
    if (s == doc.MemberEnd() || !s->value.IsBool()) {
      return Error{"ack without boolean success", "success"};
    }
    ack.success = s->value.GetBool();
    if (auto e = stringMember(doc, "error")) ack.error = std::move(*e);
    return ServerFrame{std::move(ack)};
  }

  if (doc.HasMember("msg_id") && doc.HasMember("seq")) {
    BroadcastEvent ev;
    const auto& seq = doc["seq"];
    if (!seq.IsUint64()) return Error{"seq must be a non-negative integer", "seq"};
    ev.seq = seq.GetUint64();
    ev.msgId = stringMember(doc, "msg_id").value_or("");
    ev.timestamp = stringMember(doc, "timestamp").value_or("");
    auto topic = stringMember(doc, "topic");
    if (!topic) return Error{"broadcast without topic", "topic"};
    ev.topic = std::move(*topic);
    ev.event = stringMember(doc, "event").value_or("");
    auto d = doc.FindMember("data");
    ev.data = (d == doc.MemberEnd()) ? std::string("null") : toJson(d->value);
    return ServerFrame{std::move(ev)};
  }

  auto event = stringMember(doc, "event");
  if (event && *event == "connected") {
    ConnectedEvent ev;
    if (auto sid = stringMember(doc, "session_id")) {
      ev.sessionId = std::move(*sid);
    } else {
      // Older daemons nest the id under "data".
      auto d = doc.FindMember("data");
      if (d != doc.MemberEnd() && d->value.IsObject()) {
        ev.sessionId = stringMember(d->value, "session_id").value_or("");
      }
    }
    return ServerFrame{std::move(ev)};
  }

  return Error{"unrecognized server frame", "$"};
}

std::string toJson(const rapidjson::Value& v) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  v.Accept(w);
  return sb.GetString();
}

std::string encodeHealth(double uptimeSec, std::size_t connections, const std::string& version) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "status");
  w.String("ok");
  writeKey(w, "uptime");
  w.Double(uptimeSec);
  writeKey(w, "connections");
  w.Uint64(static_cast<std::uint64_t>(connections));
  writeKey(w, "version");
  writeString(w, version);
  w.EndObject();
  return sb.GetString();
}

std::string encodeHttpError(const std::string& error, const std::string& message) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  writeKey(w, "error");
  writeString(w, error);
  writeKey(w, "message");
  writeString(w, message);
  w.EndObject();
  return sb.GetString();
}

} // namespace kspec::ws
