#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace kspec::server {

// True when a Host header names the loopback interface
// ("localhost", "127.0.0.1", "::1", with or without port / IPv6 brackets).
bool isLocalhostHost(std::string_view host);

// "/ws?project=/tmp/a" -> "/ws"
std::string targetPath(std::string_view target);

// Percent-decoded value of `key` in the query string, if present.
std::optional<std::string> queryParam(std::string_view target, std::string_view key);

} // namespace kspec::server
