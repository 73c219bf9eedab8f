#pragma once

#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace upecho::endpoint {

struct HostPort {
  std::string host;
  unsigned short port = 0;
};

inline std::optional<unsigned short> ParsePort(std::string_view s) {
  unsigned int v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc{} || ptr != s.data() + s.size() || v > 0xFFFF) {
    return std::nullopt;
  }
  return static_cast<unsigned short>(v);
}

// Parses "host:port" or "[v6addr]:port". The port is mandatory.
inline std::optional<HostPort> ParseHostPort(std::string_view s) {
  std::string_view host;
  std::string_view port;
  if (!s.empty() && s.front() == '[') {
    auto close = s.find(']');
    if (close == std::string_view::npos || close + 1 >= s.size() ||
        s[close + 1] != ':') {
      return std::nullopt;
    }
    host = s.substr(1, close - 1);
    port = s.substr(close + 2);
  } else {
    auto colon = s.rfind(':');
    if (colon == std::string_view::npos) {
      return std::nullopt;
    }
    host = s.substr(0, colon);
    port = s.substr(colon + 1);
  }
  if (host.empty()) {
    return std::nullopt;
  }
  auto p = ParsePort(port);
  if (!p) {
    return std::nullopt;
  }
  return HostPort{.host = std::string(host), .port = *p};
}

} // namespace upecho::endpoint
