#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace kspec {
namespace util {

// ISO-8601 UTC with millisecond precision, e.g. "2024-05-01T12:00:00.123Z".
std::string isoTimestamp(std::chrono::system_clock::time_point tp);

inline std::string nowIso() {
  return isoTimestamp(std::chrono::system_clock::now());
}

inline std::uint64_t unixMillis(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(duration_cast<milliseconds>(tp.time_since_epoch()).count());
}

} // namespace util
} // namespace kspec
