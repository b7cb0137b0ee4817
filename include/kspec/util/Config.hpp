#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace kspec {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply a single key/value pair. Returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  // --- Daemon ---
  std::string    host = "127.0.0.1";
  unsigned short port = 3456;
  std::string    wsPath = "/ws";

  // Heartbeat
  int pingIntervalSec = 30;
  int pongTimeoutSec  = 90;

  // Per-connection outbound bytes at which broadcasts are dropped.
  std::size_t backpressureBytes = 1024 * 1024;

  // --- File watcher ---
  std::string watchDir = ".kspec";   // empty -> disabled
  int watchPollMs      = 250;
  int watchDebounceMs  = 500;

  // --- Logging ---
  std::string logLevel = "info";
  bool        logJson  = false;
  std::string logFile;           // empty -> stdout

  // --- Client reconnection ---
  int reconnectMaxAttempts   = 10;
  int reconnectMaxBackoffSec = 30;
  int connectionLostSec      = 10;

  // Apply log settings to the process-wide logger.
  void applyLogging() const;

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  static bool parseBool(const std::string& s);
  static bool parsePort(const std::string& s, unsigned short& out);
  void sanitize();
};

} // namespace util
} // namespace kspec
