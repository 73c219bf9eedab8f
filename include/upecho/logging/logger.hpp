#pragma once

#include "upecho/core/status.hpp"
#include "upecho/io/file_writer.hpp"
#include "upecho/logging/status_event.hpp"
#include "upecho/util/branch.hpp"
#include "upecho/util/time.hpp"
#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <sys/uio.h>
#include <thread>
#include <unistd.h>

namespace upecho::logging {

// LoggerBase
// Threading model:
// - Owns one background std::jthread worker (started via Start)
// - Derived class implements RunLoop() and controls draining strategy
// - Join() stops the worker and waits for clean shutdown
template <typename Derived> class LoggerBase {
public:
  LoggerBase() = default;
  ~LoggerBase() { Join(); }

  void Start() {
    if (running_.exchange(true)) {
      return;
    }
    worker_ = std::jthread([this] { static_cast<Derived *>(this)->RunLoop(); });
  }

  void Join() {
    running_.store(false, std::memory_order_relaxed);
    if (worker_.joinable()) {
      worker_.join();
    }
  }

protected:
  std::jthread worker_;
  std::atomic<bool> running_{false};
};

// StatusLogger: the status channel for accept/close/error notices.
// Threading model:
// - Any thread may call Log(); events go through one MPSC lock-free queue and
//   are never blocked on (a full queue drops the event and counts it)
// - The worker drains in batches and writes whole lines with writev
// - Events logged before Start() are kept and written once the worker runs
class StatusLogger : public LoggerBase<StatusLogger> {
public:
  explicit StatusLogger(int fd = STDERR_FILENO)
      : queue_(std::make_unique<StatusQueue>()), fd_(fd) {}

  StatusLogger(const StatusLogger &) = delete;
  StatusLogger &operator=(const StatusLogger &) = delete;

  ~StatusLogger() {
    Join();
    if (owns_fd_ && fd_ != -1) {
      ::close(fd_);
    }
  }

  // Redirects output to an append-only file. Must be called before Start().
  Status OpenFile(const std::string &path) {
    int fd =
        ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
      return std::unexpected(
          error_code(errno, boost::system::system_category()));
    }
    if (owns_fd_ && fd_ != -1) {
      ::close(fd_);
    }
    fd_ = fd;
    owns_fd_ = true;
    return {};
  }

  void Log(Level level, std::string_view text) {
    StatusEvent ev;
    ev.epoch_ms = timeutil::EpochMillisUtc();
    ev.level = level;
    std::size_t n = std::min(text.size(), kStatusTextCapacity);
    // never cut a UTF-8 sequence: back off to the start of the last one
    while (n > 0 && n < text.size() &&
           (static_cast<unsigned char>(text[n]) & 0xC0) == 0x80) {
      --n;
    }
    std::memcpy(ev.text, text.data(), n);
    ev.len = static_cast<std::uint16_t>(n);
    if (UPECHO_UNLIKELY(!queue_->push(ev))) {
      dropped_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  template <typename... Args> void Info(const Args &...args) {
    Log(Level::info, Concat(args...));
  }
  template <typename... Args> void Warn(const Args &...args) {
    Log(Level::warn, Concat(args...));
  }
  template <typename... Args> void Error(const Args &...args) {
    Log(Level::error, Concat(args...));
  }

  std::uint64_t Dropped() const {
    return dropped_.load(std::memory_order_relaxed);
  }

  void RunLoop() {
    for (;;) {
      if (UPECHO_UNLIKELY(!this->running_.load(std::memory_order_relaxed))) {
        break;
      }
      if (DrainQueue() == 0) {
        std::this_thread::sleep_for(kIdleSleep);
      }
    }
    DrainQueue();
  }

private:
  static constexpr int kBatch = 64;
  static constexpr auto kIdleSleep = std::chrono::milliseconds(2);

  template <typename... Args> static std::string Concat(const Args &...args) {
    std::ostringstream oss;
    (oss << ... << args);
    return oss.str();
  }

  static std::string FormatLine(const StatusEvent &ev) {
    std::string line;
    line.reserve(ev.len + 24);
    line += '[';
    line += timeutil::ClockTime(ev.epoch_ms);
    line += "] ";
    line += LevelTag(ev.level);
    line += ' ';
    line.append(ev.text, ev.len);
    line += '\n';
    return line;
  }

  std::size_t DrainQueue() {
    StatusEvent ev;
    struct iovec iov[kBatch];
    std::array<std::string, kBatch> lines;
    int cnt = 0;
    std::size_t total = 0;
    // batch consume to reduce syscalls
    while (queue_->pop(ev)) {
      lines[cnt] = FormatLine(ev);
      iov[cnt] = {lines[cnt].data(), lines[cnt].size()};
      ++cnt;
      ++total;
      if (cnt == kBatch) {
        (void)io::WritevAll(fd_, iov, cnt);
        cnt = 0;
      }
    }
    if (cnt > 0) {
      (void)io::WritevAll(fd_, iov, cnt);
    }
    return total;
  }

  std::unique_ptr<StatusQueue> queue_;
  int fd_;
  bool owns_fd_ = false;
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace upecho::logging
