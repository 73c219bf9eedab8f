#pragma once

#include "upecho/core/protocol.hpp"
#include "upecho/net/endpoint.hpp"
#include <charconv>
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

namespace upecho {

enum class RunMode { async, sync };

struct ServerOptions {
  std::string bind_address = "0.0.0.0";
  unsigned short port = protocol::kDefaultPort;
  RunMode mode = RunMode::async;
  int workers = 0; // 0 = hardware concurrency
  std::size_t max_connections = 64; // 0 = unlimited
  std::string log_file;             // empty = stderr
  bool help = false;
};

struct ClientOptions {
  std::string host = "127.0.0.1";
  unsigned short port = protocol::kDefaultPort;
  RunMode mode = RunMode::async;
  bool help = false;
};

inline constexpr std::string_view kServerUsage =
    "usage: upecho_server [-p|--port N] [-b|--bind ADDR] [-m|--mode "
    "async|sync]\n"
    "                     [-w|--workers N] [-c|--max-connections N] "
    "[-l|--log-file PATH]\n";

inline constexpr std::string_view kClientUsage =
    "usage: upecho_client [-H|--host HOST] [-p|--port N] [--connect "
    "HOST:PORT]\n"
    "                     [-m|--mode async|sync]\n";

namespace detail {

template <typename T> bool ParseNumber(std::string_view s, T &out) {
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc{} && ptr == s.data() + s.size();
}

inline bool ParseMode(std::string_view s, RunMode &out) {
  if (s == "async") {
    out = RunMode::async;
    return true;
  }
  if (s == "sync") {
    out = RunMode::sync;
    return true;
  }
  return false;
}

} // namespace detail

inline std::expected<ServerOptions, std::string> ParseServerArgs(int argc,
                                                                 char **argv) {
  ServerOptions opt;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    const bool has_value = i + 1 < argc;
    if (a == "-h" || a == "--help") {
      opt.help = true;
    } else if ((a == "-p" || a == "--port") && has_value) {
      auto p = endpoint::ParsePort(argv[++i]);
      if (!p) {
        return std::unexpected("invalid port: " + std::string(argv[i]));
      }
      opt.port = *p;
    } else if ((a == "-b" || a == "--bind") && has_value) {
      opt.bind_address = argv[++i];
    } else if ((a == "-m" || a == "--mode") && has_value) {
      if (!detail::ParseMode(argv[++i], opt.mode)) {
        return std::unexpected("invalid mode: " + std::string(argv[i]));
      }
    } else if ((a == "-w" || a == "--workers") && has_value) {
      if (!detail::ParseNumber(argv[++i], opt.workers) || opt.workers < 0) {
        return std::unexpected("invalid worker count: " +
                               std::string(argv[i]));
      }
    } else if ((a == "-c" || a == "--max-connections") && has_value) {
      if (!detail::ParseNumber(argv[++i], opt.max_connections)) {
        return std::unexpected("invalid connection limit: " +
                               std::string(argv[i]));
      }
    } else if ((a == "-l" || a == "--log-file") && has_value) {
      opt.log_file = argv[++i];
    } else {
      return std::unexpected("unknown argument: " + std::string(a));
    }
  }
  return opt;
}

inline std::expected<ClientOptions, std::string> ParseClientArgs(int argc,
                                                                 char **argv) {
  ClientOptions opt;
  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];
    const bool has_value = i + 1 < argc;
    if (a == "-h" || a == "--help") {
      opt.help = true;
    } else if ((a == "-H" || a == "--host") && has_value) {
      opt.host = argv[++i];
    } else if ((a == "-p" || a == "--port") && has_value) {
      auto p = endpoint::ParsePort(argv[++i]);
      if (!p) {
        return std::unexpected("invalid port: " + std::string(argv[i]));
      }
      opt.port = *p;
    } else if (a == "--connect" && has_value) {
      auto hp = endpoint::ParseHostPort(argv[++i]);
      if (!hp) {
        return std::unexpected("expected HOST:PORT, got: " +
                               std::string(argv[i]));
      }
      opt.host = hp->host;
      opt.port = hp->port;
    } else if ((a == "-m" || a == "--mode") && has_value) {
      if (!detail::ParseMode(argv[++i], opt.mode)) {
        return std::unexpected("invalid mode: " + std::string(argv[i]));
      }
    } else {
      return std::unexpected("unknown argument: " + std::string(a));
    }
  }
  return opt;
}

} // namespace upecho
