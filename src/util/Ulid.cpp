#include "kspec/util/Ulid.hpp"
#include "kspec/util/Time.hpp"

#include <chrono>

namespace kspec {
namespace util {

namespace {

constexpr char kAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
constexpr std::uint64_t kMaxTime = (std::uint64_t{1} << 48) - 1;

int decodeChar(char c) {
  if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
  for (int i = 0; i < 32; ++i) {
    if (kAlphabet[i] == c) return i;
  }
  return -1;
}

} // namespace

UlidGenerator::UlidGenerator() : rng_(std::random_device{}()) {}

UlidGenerator::UlidGenerator(std::uint64_t seed) : rng_(seed) {}

std::string UlidGenerator::next() {
  return next(unixMillis(std::chrono::system_clock::now()));
}

std::string UlidGenerator::next(std::uint64_t unixMs) {
  std::uint64_t ms;
  std::uint16_t hi;
  std::uint64_t lo;
  {
    std::lock_guard<std::mutex> lk(mx_);
    if (unixMs > kMaxTime) unixMs = kMaxTime;
    if (unixMs <= lastMs_ && lastMs_ != 0) {
      // Same (or regressed) millisecond: bump the random part instead.
      ++randLo_;
      if (randLo_ == 0) ++randHi_;
      unixMs = lastMs_;
    } else {
      lastMs_ = unixMs;
      randLo_ = rng_();
      randHi_ = static_cast<std::uint16_t>(rng_() & 0xFFFF);
    }
    ms = unixMs;
    hi = randHi_;
    lo = randLo_;
  }

  std::string out(26, '0');
  for (int i = 9; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kAlphabet[ms & 31];
    ms >>= 5;
  }
  for (int i = 25; i >= 10; --i) {
    out[static_cast<std::size_t>(i)] = kAlphabet[lo & 31];
    lo = (lo >> 5) | (static_cast<std::uint64_t>(hi & 31) << 59);
    hi = static_cast<std::uint16_t>(hi >> 5);
  }
  return out;
}

std::string ulid() {
  static UlidGenerator gen;
  return gen.next();
}

std::optional<std::uint64_t> ulidTime(const std::string& id) {
  if (id.size() != 26) return std::nullopt;
  std::uint64_t ms = 0;
  for (std::size_t i = 0; i < 10; ++i) {
    int v = decodeChar(id[i]);
    if (v < 0) return std::nullopt;
    ms = (ms << 5) | static_cast<std::uint64_t>(v);
  }
  for (std::size_t i = 10; i < 26; ++i) {
    if (decodeChar(id[i]) < 0) return std::nullopt;
  }
  if (ms > kMaxTime) return std::nullopt;
  return ms;
}

} // namespace util
} // namespace kspec
