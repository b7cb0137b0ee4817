#include "kspec/util/Logger.hpp"
#include "kspec/util/Time.hpp"

#include <cctype>
#include <map>

namespace kspec::util {

namespace {

thread_local std::map<std::string, std::string> t_context;

void appendJsonString(std::string& out, const std::string& s) {
  out.push_back('"');
  for (char c : s) {
    switch (c) {
      case '"':  out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n";  break;
      case '\r': out += "\\r";  break;
      case '\t': out += "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

void appendJsonPair(std::string& out, const std::string& k, const std::string& v) {
  out.push_back(',');
  appendJsonString(out, k);
  out.push_back(':');
  appendJsonString(out, v);
}

} // namespace

const char* levelName(LogLevel l) {
  switch (l) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
  }
  return "INFO";
}

LogLevel parseLevel(const std::string& s) {
  std::string x;
  x.reserve(s.size());
  for (char c : s) x.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (x == "trace") return LogLevel::Trace;
  if (x == "debug") return LogLevel::Debug;
  if (x == "warn" || x == "warning") return LogLevel::Warn;
  if (x == "error") return LogLevel::Error;
  return LogLevel::Info;
}

Logger& logger() {
  static Logger instance;
  return instance;
}

Logger::~Logger() {
  std::lock_guard<std::mutex> lk(mx_);
  closeFileLocked();
}

void Logger::closeFileLocked() {
  if (out_) std::fclose(out_);
  out_ = nullptr;
}

void Logger::setFormatJson(bool json) {
  json_.store(json, std::memory_order_relaxed);
}

bool Logger::setFile(const std::string& path) {
  std::lock_guard<std::mutex> lk(mx_);
  closeFileLocked();
  path_ = path;
  if (path_.empty()) return true;
  out_ = std::fopen(path_.c_str(), "a");
  if (!out_) {
    path_.clear();
    return false;
  }
  return true;
}

bool Logger::reopen() {
  std::lock_guard<std::mutex> lk(mx_);
  if (path_.empty()) return true;
  closeFileLocked();
  out_ = std::fopen(path_.c_str(), "a");
  return out_ != nullptr;
}

std::string Logger::format(LogLevel lvl, const std::string& msg,
                           const std::vector<Field>& fields) const {
  const std::string ts = nowIso();
  std::string line;
  line.reserve(64 + msg.size() + fields.size() * 24);

  if (json_.load(std::memory_order_relaxed)) {
    line += "{\"ts\":\"";
    line += ts;
    line += "\",\"lvl\":\"";
    line += levelName(lvl);
    line += "\",\"msg\":";
    appendJsonString(line, msg);
    for (const auto& kv : t_context) appendJsonPair(line, kv.first, kv.second);
    for (const auto& f : fields) appendJsonPair(line, f.k, f.v);
    line += "}\n";
    return line;
  }

  char head[64];
  std::snprintf(head, sizeof(head), "[%s] %-5s ", ts.c_str(), levelName(lvl));
  line += head;
  line += msg;
  for (const auto& kv : t_context) line += ' ' + kv.first + '=' + kv.second;
  for (const auto& f : fields) line += ' ' + f.k + '=' + f.v;
  line.push_back('\n');
  return line;
}

void Logger::log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) {
  if (!enabled(lvl)) return;
  const std::string line = format(lvl, msg, fields);

  std::lock_guard<std::mutex> lk(mx_);
  std::FILE* f = out_ ? out_ : stdout;
  std::fwrite(line.data(), 1, line.size(), f);
  std::fflush(f);
}

Logger::Scoped::Scoped(const std::vector<Field>& add) {
  for (const auto& f : add) {
    if (t_context.find(f.k) == t_context.end()) added_.push_back(f.k);
    t_context[f.k] = f.v;
  }
}

Logger::Scoped::~Scoped() {
  for (const auto& k : added_) t_context.erase(k);
}

} // namespace kspec::util
