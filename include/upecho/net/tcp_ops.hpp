#pragma once

#include "upecho/core/status.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>
#include <cerrno>
#include <poll.h>
#include <string>

// namespace tcpops: thin expected-returning wrappers over the Asio calls used
// to set up client and server sockets.
namespace upecho::tcpops {

namespace net = boost::asio;
using tcp = net::ip::tcp;

inline Result<tcp::resolver::results_type>
Resolve(tcp::resolver &resolver, const std::string &host,
        unsigned short port) {
  error_code ec;
  auto r = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    return std::unexpected(ec);
  }
  return r;
}

inline Status Connect(tcp::socket &sock,
                      const tcp::resolver::results_type &endpoints) {
  error_code ec;
  net::connect(sock, endpoints, ec);
  return MakeStatus(ec);
}

// Open → reuse_address → bind → listen. Any step failing leaves the acceptor
// closed.
inline Status OpenAcceptor(tcp::acceptor &acceptor, const std::string &address,
                           unsigned short port) {
  error_code ec;
  auto addr = net::ip::make_address(address, ec);
  if (ec) {
    return std::unexpected(ec);
  }
  const tcp::endpoint ep{addr, port};
  acceptor.open(ep.protocol(), ec);
  if (!ec) {
    acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(ep, ec);
  }
  if (!ec) {
    acceptor.listen(net::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    error_code ignored;
    acceptor.close(ignored);
    return std::unexpected(ec);
  }
  return {};
}

inline void SetTcpNoDelay(tcp::socket &sock) {
  error_code ec;
  sock.set_option(tcp::no_delay(true), ec);
  (void)ec;
}

inline std::string FormatEndpoint(const tcp::socket &sock) {
  error_code ec;
  auto ep = sock.remote_endpoint(ec);
  if (ec) {
    return "<unknown>";
  }
  return ep.address().to_string() + ":" + std::to_string(ep.port());
}

// Waits up to timeout_ms for fd to become readable. Hang-up and error
// conditions count as readable so the following read reports them.
inline Result<bool> PollReadable(int fd, int timeout_ms) {
  pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
  int rc = ::poll(&pfd, 1, timeout_ms);
  if (rc < 0) {
    if (errno == EINTR) {
      return false;
    }
    return std::unexpected(error_code(errno, boost::system::system_category()));
  }
  return rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR | POLLNVAL));
}

} // namespace upecho::tcpops
