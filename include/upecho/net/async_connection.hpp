#pragma once

#include "upecho/core/status.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/wire/codec.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/spawn.hpp>
#include <string>
#include <string_view>

namespace upecho {

namespace net = boost::asio;
using tcp = net::ip::tcp;

// AsyncConnection: one open socket with coroutine framed I/O.
// Threading model:
// - All calls are made from the executor the socket was created on (a
//   per-session strand on the server, the single client thread otherwise)
// - At most one pending receive and one pending send at a time
// - Close() cancels pending operations; they complete with operation_aborted
class AsyncConnection {
public:
  explicit AsyncConnection(tcp::socket socket)
      : socket_(std::move(socket)), peer_(tcpops::FormatEndpoint(socket_)) {}

  AsyncConnection(const AsyncConnection &) = delete;
  AsyncConnection &operator=(const AsyncConnection &) = delete;

  ~AsyncConnection() { Close(); }

  bool IsClosed() const { return closed_; }
  const std::string &RemoteEndpoint() const { return peer_; }
  tcp::socket::executor_type GetExecutor() { return socket_.get_executor(); }

  bool HasIncomingData() {
    if (closed_) {
      return false;
    }
    error_code ec;
    return socket_.available(ec) > 0 || ec;
  }

  Result<std::string> AsyncReceive(net::yield_context yield) {
    if (closed_) {
      return std::unexpected(make_error_code(net::error::not_connected));
    }
    return wire::AsyncDecode(socket_, yield);
  }

  Status AsyncSend(std::string_view text, net::yield_context yield) {
    if (closed_) {
      return std::unexpected(make_error_code(net::error::not_connected));
    }
    return wire::AsyncWriteFrame(socket_, text, yield);
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
