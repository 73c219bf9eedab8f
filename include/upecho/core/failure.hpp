#pragma once

#include "upecho/core/status.hpp"
#include "upecho/wire/error.hpp"

namespace upecho {

enum class FailureKind { bind, accept, connection, malformed_frame };

inline const char *ToString(FailureKind kind) {
  switch (kind) {
  case FailureKind::bind:
    return "bind failure";
  case FailureKind::accept:
    return "accept failure";
  case FailureKind::connection:
    return "connection error";
  case FailureKind::malformed_frame:
    return "malformed frame";
  }
  return "failure";
}

// Errors surfaced by Receive/Send on an established session.
inline FailureKind ClassifySessionError(const error_code &ec) {
  return wire::IsMalformedFrame(ec) ? FailureKind::malformed_frame
                                    : FailureKind::connection;
}

} // namespace upecho
