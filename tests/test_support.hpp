#pragma once

#include "upecho/core/iserver.hpp"
#include "upecho/core/options.hpp"
#include "upecho/core/runner.hpp"
#include "upecho/core/status.hpp"
#include "upecho/io/file_writer.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/wire/codec.hpp"
#include <array>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <fcntl.h>
#include <functional>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>

namespace upecho::test {

namespace net = boost::asio;
using tcp = net::ip::tcp;

inline constexpr int kTimeoutMs = 5000;

struct Pipe {
  int read_fd = -1;
  int write_fd = -1;

  Pipe() {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == 0) {
      read_fd = fds[0];
      write_fd = fds[1];
    }
  }
  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }

  void Write(std::string_view s) const {
    ASSERT_TRUE(io::WriteAll(write_fd, s.data(), s.size()));
  }
  void CloseRead() {
    if (read_fd != -1) {
      ::close(read_fd);
      read_fd = -1;
    }
  }
  void CloseWrite() {
    if (write_fd != -1) {
      ::close(write_fd);
      write_fd = -1;
    }
  }
};

// Reads from fd until the accumulated text contains needle or the timeout
// expires. Returns everything read.
inline std::string ReadUntil(int fd, std::string_view needle,
                             int timeout_ms = kTimeoutMs) {
  std::string got;
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  std::array<char, 1024> buf;
  while (got.find(needle) == std::string::npos) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          deadline - std::chrono::steady_clock::now())
                          .count();
    if (left <= 0) {
      break;
    }
    auto readable = tcpops::PollReadable(fd, static_cast<int>(left));
    if (!readable || !*readable) {
      continue;
    }
    ssize_t n = ::read(fd, buf.data(), buf.size());
    if (n <= 0) {
      break;
    }
    got.append(buf.data(), static_cast<std::size_t>(n));
  }
  return got;
}

inline bool WaitFor(const std::function<bool()> &pred,
                    int timeout_ms = kTimeoutMs) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return pred();
}

// A status logger that writes nowhere.
class QuietLog {
public:
  QuietLog() : fd_(::open("/dev/null", O_WRONLY | O_CLOEXEC)), log_(fd_) {
    log_.Start();
  }
  ~QuietLog() {
    log_.Join();
    if (fd_ != -1) {
      ::close(fd_);
    }
  }
  logging::StatusLogger &Get() { return log_; }

private:
  int fd_;
  logging::StatusLogger log_;
};

// Blocking framed peer for driving a server. Receive() gives up after
// kTimeoutMs instead of hanging the test.
class RawClient {
public:
  explicit RawClient(unsigned short port) : socket_(ioc_) {
    error_code ec;
    socket_.connect({net::ip::address_v4::loopback(), port}, ec);
    EXPECT_FALSE(ec) << ec.message();
  }

  Status Send(std::string_view text) {
    return wire::WriteFrame(socket_, text);
  }

  void SendRaw(std::string_view bytes) {
    error_code ec;
    net::write(socket_, net::buffer(bytes.data(), bytes.size()), ec);
    EXPECT_FALSE(ec) << ec.message();
  }

  Result<std::string> Receive(int timeout_ms = kTimeoutMs) {
    auto readable = tcpops::PollReadable(socket_.native_handle(), timeout_ms);
    if (!readable) {
      return std::unexpected(readable.error());
    }
    if (!*readable) {
      return std::unexpected(make_error_code(net::error::timed_out));
    }
    return wire::Decode(socket_);
  }

  void Close() {
    error_code ec;
    socket_.close(ec);
  }

private:
  net::io_context ioc_;
  tcp::socket socket_;
};

// Server bound to an ephemeral loopback port, Run() on a background thread.
class ServerHarness {
public:
  explicit ServerHarness(RunMode mode, std::size_t max_connections = 64) {
    ServerOptions opt;
    opt.bind_address = "127.0.0.1";
    opt.port = 0;
    opt.mode = mode;
    opt.workers = 2;
    opt.max_connections = max_connections;
    server_ = MakeServer(opt, log_.Get());
    auto st = server_->Bind();
    EXPECT_TRUE(st.has_value());
    runner_ = std::jthread([this] { server_->Run(); });
  }

  ~ServerHarness() { StopAndJoin(); }

  void StopAndJoin() {
    server_->Stop();
    if (runner_.joinable()) {
      runner_.join();
    }
  }

  IServer &Server() { return *server_; }
  unsigned short Port() const { return server_->LocalPort(); }

private:
  QuietLog log_;
  std::unique_ptr<IServer> server_;
  std::jthread runner_;
};

inline std::string RunModeName(const testing::TestParamInfo<RunMode> &info) {
  return info.param == RunMode::sync ? "Sync" : "Async";
}

} // namespace upecho::test
