#pragma once

#include "upecho/net/tcp_ops.hpp"
#include <array>
#include <cerrno>
#include <optional>
#include <string>
#include <sys/stat.h>
#include <unistd.h>

namespace upecho {

inline void StripCarriageReturn(std::string &line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

// Regular files always poll readable and cannot be registered with epoll; the
// async client falls back to the sync loop for them.
inline bool IsPollableInput(int fd) {
  struct stat st{};
  if (::fstat(fd, &st) != 0) {
    return false;
  }
  return !S_ISREG(st.st_mode);
}

// LineReader: non-blocking line source over a descriptor (the console).
// TryReadLine() never blocks: it reads whatever poll() says is available and
// hands out complete lines. After end of input, a trailing line without a
// newline is still delivered before Eof() turns true.
class LineReader {
public:
  explicit LineReader(int fd) : fd_(fd) {}

  int NativeHandle() const { return fd_; }
  bool Eof() const { return eof_ && buffer_.empty(); }
  bool HasBufferedLine() const {
    return buffer_.find('\n') != std::string::npos ||
           (eof_ && !buffer_.empty());
  }

  std::optional<std::string> TryReadLine() {
    if (auto line = PopLine()) {
      return line;
    }
    if (!eof_) {
      auto readable = tcpops::PollReadable(fd_, 0);
      if (!readable || *readable) {
        Fill();
      }
    }
    return PopLine();
  }

private:
  std::optional<std::string> PopLine() {
    auto nl = buffer_.find('\n');
    if (nl != std::string::npos) {
      std::string line = buffer_.substr(0, nl);
      buffer_.erase(0, nl + 1);
      StripCarriageReturn(line);
      return line;
    }
    if (eof_ && !buffer_.empty()) {
      std::string line = std::move(buffer_);
      buffer_.clear();
      StripCarriageReturn(line);
      return line;
    }
    return std::nullopt;
  }

  void Fill() {
    std::array<char, 4096> chunk;
    for (;;) {
      ssize_t n = ::read(fd_, chunk.data(), chunk.size());
      if (n > 0) {
        buffer_.append(chunk.data(), static_cast<std::size_t>(n));
        return;
      }
      if (n < 0 && errno == EINTR) {
        continue;
      }
      if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        return;
      }
      // end of input, or an input error that ends it just the same
      eof_ = true;
      return;
    }
  }

  int fd_;
  std::string buffer_;
  bool eof_ = false;
};

} // namespace upecho
