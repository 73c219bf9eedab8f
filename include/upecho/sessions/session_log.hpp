#pragma once

#include "upecho/core/failure.hpp"
#include "upecho/logging/logger.hpp"
#include <boost/asio/error.hpp>
#include <cstdint>

namespace upecho::sessions {

namespace net = boost::asio;

// A peer that drops the connection without sending the sentinel is expected
// traffic, not a server fault.
inline bool IsPeerGone(const error_code &ec) {
  return ec == net::error::eof || ec == net::error::connection_reset ||
         ec == net::error::broken_pipe;
}

inline void LogSessionError(logging::StatusLogger &log, std::uint64_t id,
                            const char *stage, const error_code &ec) {
  if (IsPeerGone(ec)) {
    log.Warn("[session ", id, "] peer disconnected during ", stage, ": ",
             ec.message());
    return;
  }
  log.Error("[session ", id, "] ", ToString(ClassifySessionError(ec)),
            " during ", stage, ": ", ec.message());
}

} // namespace upecho::sessions
