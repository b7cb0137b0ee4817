#include "kspec/util/Config.hpp"
#include "kspec/util/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace kspec {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::parseBool(const std::string& s) {
  std::string x = s;
  for (auto& c : x) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return x == "1" || x == "true" || x == "yes" || x == "on";
}

bool Config::parsePort(const std::string& s, unsigned short& out) {
  char* end = nullptr;
  const unsigned long v = std::strtoul(s.c_str(), &end, 10);
  if (s.empty() || end == s.c_str() || *end != '\0' || v == 0 || v > 65535) return false;
  out = static_cast<unsigned short>(v);
  return true;
}

bool Config::set(const std::string& key, const std::string& val) {
  if      (key == "host")                   host = val;
  else if (key == "port") {
    if (!parsePort(val, port)) {
      logger().log(LogLevel::Warn, "config: port out of range, keeping previous",
                   {{"value", val}, {"port", std::to_string(port)}});
    }
  }
  else if (key == "wsPath")                 wsPath = val;
  else if (key == "pingIntervalSec")        pingIntervalSec = std::max(1, std::atoi(val.c_str()));
  else if (key == "pongTimeoutSec")         pongTimeoutSec = std::max(1, std::atoi(val.c_str()));
  else if (key == "backpressureBytes")      backpressureBytes = static_cast<std::size_t>(std::strtoull(val.c_str(), nullptr, 10));
  else if (key == "logLevel")               logLevel = val;
  else if (key == "logJson")                logJson = parseBool(val);
  else if (key == "logFile")                logFile = val;
  else if (key == "reconnectMaxAttempts")   reconnectMaxAttempts = std::max(1, std::atoi(val.c_str()));
  else if (key == "reconnectMaxBackoffSec") reconnectMaxBackoffSec = std::max(1, std::atoi(val.c_str()));
  else if (key == "connectionLostSec")      connectionLostSec = std::max(1, std::atoi(val.c_str()));
  else if (key == "watchDir")               watchDir = val;
  else if (key == "watchPollMs")            watchPollMs = std::max(10, std::atoi(val.c_str()));
  else if (key == "watchDebounceMs")        watchDebounceMs = std::max(0, std::atoi(val.c_str()));
  else return false;
  return true;
}

bool Config::loadFromFile(const std::string& path) {
  // Simple INI-ish parser: key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so new knobs don't break older builds.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  char tmp[1024];
  while (std::fgets(tmp, sizeof(tmp), f)) {
    line.assign(tmp);

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;

    if (!set(key, val)) {
      logger().log(LogLevel::Debug, "config: unknown key ignored", {{"key", key}});
    }
  }

  std::fclose(f);
  sanitize();
  return true;
}

void Config::sanitize() {
  // A timeout shorter than one ping interval would evict healthy peers.
  if (pongTimeoutSec < pingIntervalSec) pongTimeoutSec = pingIntervalSec * 3;
  if (port == 0) port = 3456;
  if (wsPath.empty() || wsPath[0] != '/') wsPath = "/" + wsPath;
  if (backpressureBytes == 0) backpressureBytes = 1024 * 1024;
}

void Config::applyLogging() const {
  auto& L = logger();
  L.setLevel(parseLevel(logLevel));
  L.setFormatJson(logJson);
  if (!L.setFile(logFile)) {
    L.log(LogLevel::Warn, "config: cannot open log file, logging to stdout", {{"path", logFile}});
  }
}

} // namespace util
} // namespace kspec
