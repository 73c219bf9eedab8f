#pragma once

#include "upecho/core/status.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/wire/codec.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <string>
#include <string_view>

namespace upecho {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// Connection: one open socket with blocking framed I/O.
// Threading model:
// - Owned by exactly one thread of control (a SyncSession worker or the sync
//   client loop); not safe for concurrent use
// - Once closed every operation fails with not_connected without touching the
//   socket
class Connection {
public:
  explicit Connection(tcp::socket socket)
      : socket_(std::move(socket)), peer_(tcpops::FormatEndpoint(socket_)) {}

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  ~Connection() { Close(); }

  bool IsClosed() const { return closed_; }
  const std::string &RemoteEndpoint() const { return peer_; }
  int NativeHandle() { return socket_.native_handle(); }

  // Non-blocking hint. True when bytes are buffered, or when the transport has
  // reached end-of-stream or an error: Receive() then reports it instead of
  // the session looking idle forever.
  bool HasIncomingData() {
    if (closed_) {
      return false;
    }
    error_code ec;
    if (socket_.available(ec) > 0) {
      return true;
    }
    if (ec) {
      return true;
    }
    auto readable = tcpops::PollReadable(socket_.native_handle(), 0);
    return !readable || *readable;
  }

  // Bounded wait for HasIncomingData(). Returns whether data (or a transport
  // condition) is pending when the wait ends.
  bool WaitReadable(int timeout_ms) {
    if (closed_) {
      return false;
    }
    auto readable = tcpops::PollReadable(socket_.native_handle(), timeout_ms);
    return !readable || *readable;
  }

  // Blocks until a whole frame has arrived. A frame that is only partly
  // buffered is completed by the blocking read.
  Result<std::string> Receive() {
    if (closed_) {
      return std::unexpected(make_error_code(net::error::not_connected));
    }
    return wire::Decode(socket_);
  }

  Status Send(std::string_view text) {
    if (closed_) {
      return std::unexpected(make_error_code(net::error::not_connected));
    }
    return wire::WriteFrame(socket_, text);
  }

  void Close() {
    if (closed_) {
      return;
    }
    closed_ = true;
    error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }

private:
  tcp::socket socket_;
  std::string peer_;
  bool closed_ = false;
};

} // namespace upecho
