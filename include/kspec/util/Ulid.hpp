#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace kspec {
namespace util {

// Time-sortable 26-character identifiers (Crockford base32): 48 bits of
// milliseconds since the epoch followed by 80 random bits. Identifiers produced
// by one generator within the same millisecond are strictly increasing.
class UlidGenerator {
public:
  UlidGenerator();
  explicit UlidGenerator(std::uint64_t seed);

  std::string next();
  std::string next(std::uint64_t unixMs);

private:
  std::mutex mx_;
  std::mt19937_64 rng_;
  std::uint64_t lastMs_ = 0;
  std::uint16_t randHi_ = 0;   // top 16 of the 80 random bits
  std::uint64_t randLo_ = 0;   // low 64 of the 80 random bits
};

// Process-wide generator.
std::string ulid();

// Millisecond timestamp encoded in a ULID, or nullopt if malformed.
std::optional<std::uint64_t> ulidTime(const std::string& id);

} // namespace util
} // namespace kspec
