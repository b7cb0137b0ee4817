#include "kspec/server/HttpGuard.hpp"

#include <cctype>

namespace kspec::server {

namespace {

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::string percentDecode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2 < s.size()) {
      int hi = hexValue(s[i + 1]);
      int lo = hexValue(s[i + 2]);
      if (hi < 0 || lo < 0) {
        out.push_back(s[i]);
        continue;
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

} // namespace

bool isLocalhostHost(std::string_view host) {
  if (host.empty()) return false;

  std::string_view name;
  if (host.front() == '[') {
    // IPv6 with brackets: [::1]:3456 -> ::1
    auto close = host.find(']');
    if (close == std::string_view::npos) return false;
    name = host.substr(1, close - 1);
  } else if (host.find(':') != host.rfind(':')) {
    // Bare IPv6 literal without port.
    name = host;
  } else {
    name = host.substr(0, host.find(':'));
  }

  std::string lower;
  lower.reserve(name.size());
  for (char c : name) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

  return lower == "localhost" || lower == "127.0.0.1" || lower == "::1";
}

std::string targetPath(std::string_view target) {
  auto q = target.find('?');
  return std::string(target.substr(0, q));
}

std::optional<std::string> queryParam(std::string_view target, std::string_view key) {
  auto q = target.find('?');
  if (q == std::string_view::npos) return std::nullopt;
  std::string_view query = target.substr(q + 1);

  while (!query.empty()) {
    auto amp = query.find('&');
    std::string_view pair = query.substr(0, amp);
    auto eq = pair.find('=');
    std::string_view k = pair.substr(0, eq);
    if (percentDecode(k) == key) {
      if (eq == std::string_view::npos) return std::string();
      return percentDecode(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) break;
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

} // namespace kspec::server
