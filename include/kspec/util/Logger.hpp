#pragma once

#include <atomic>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

namespace kspec::util {

enum class LogLevel : int { Trace, Debug, Info, Warn, Error };

LogLevel parseLevel(const std::string& s);   // unknown -> Info
const char* levelName(LogLevel l);

// One structured key/value pair attached to a record.
struct Field {
  std::string k;
  std::string v;
};

// Line-oriented daemon log: "[ts] LEVEL msg k=v ..." or one JSON object per
// line. Writes go to stdout or to a file opened in append mode; reopen()
// lets an external rotator move the file away.
class Logger {
public:
  Logger() = default;
  ~Logger();

  Logger(const Logger&)            = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel lvl) { level_.store(static_cast<int>(lvl), std::memory_order_relaxed); }
  LogLevel level() const { return static_cast<LogLevel>(level_.load(std::memory_order_relaxed)); }
  bool enabled(LogLevel lvl) const {
    return static_cast<int>(lvl) >= level_.load(std::memory_order_relaxed);
  }

  void setFormatJson(bool json);

  // Empty path means stdout. Returns false (and stays on stdout) when the
  // file cannot be opened.
  bool setFile(const std::string& path);
  // Close and reopen the current file. No-op on stdout.
  bool reopen();
  const std::string& filePath() const { return path_; }

  void log(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields = {});

  // Fields appended to every record the current thread writes while alive.
  class Scoped {
  public:
    explicit Scoped(const std::vector<Field>& add);
    ~Scoped();

    Scoped(const Scoped&)            = delete;
    Scoped& operator=(const Scoped&) = delete;

  private:
    std::vector<std::string> added_;
  };

private:
  std::string format(LogLevel lvl, const std::string& msg, const std::vector<Field>& fields) const;
  void closeFileLocked();

private:
  std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
  std::atomic<bool> json_{false};

  std::mutex mx_;                   // guards out_ and path_
  std::FILE* out_ = nullptr;        // nullptr -> stdout
  std::string path_;
};

Logger& logger();

} // namespace kspec::util
