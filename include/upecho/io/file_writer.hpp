#pragma once

#include "upecho/core/status.hpp"
#include <cerrno>
#include <cstddef>
#include <poll.h>
#include <sys/uio.h>
#include <unistd.h>

namespace upecho::io {

// Writes every iovec in full. Partial writes advance the array in place, so
// the caller's iovecs are consumed. A non-blocking descriptor that is full is
// waited on with poll() rather than spun on.
inline Status WritevAll(int fd, struct iovec *iov, int cnt) {
  while (cnt > 0) {
    ssize_t n = ::writev(fd, iov, cnt);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        pollfd pfd{.fd = fd, .events = POLLOUT, .revents = 0};
        (void)::poll(&pfd, 1, -1);
        continue;
      }
      return std::unexpected(
          error_code(errno, boost::system::system_category()));
    }
    auto left = static_cast<std::size_t>(n);
    while (cnt > 0 && left >= iov->iov_len) {
      left -= iov->iov_len;
      ++iov;
      --cnt;
    }
    if (cnt > 0) {
      iov->iov_base = static_cast<char *>(iov->iov_base) + left;
      iov->iov_len -= left;
    }
  }
  return {};
}

inline Status WriteAll(int fd, const char *data, std::size_t len) {
  struct iovec one {
    const_cast<char *>(data), len
  };
  return WritevAll(fd, &one, len == 0 ? 0 : 1);
}

} // namespace upecho::io
