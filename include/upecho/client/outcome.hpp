#pragma once

#include "upecho/wire/error.hpp"
#include <boost/system/error_code.hpp>

namespace upecho {

enum class ClientOutcome {
  // user typed the sentinel (any case)
  closed_by_user,
  // console input ended; the sentinel was sent on the user's behalf
  input_closed,
  // transport failure, server disconnect or malformed frame
  connection_failed,
};

inline const char *ToString(ClientOutcome o) {
  switch (o) {
  case ClientOutcome::closed_by_user:
    return "closed_by_user";
  case ClientOutcome::input_closed:
    return "input_closed";
  case ClientOutcome::connection_failed:
    return "connection_failed";
  }
  return "?";
}

// Codec refusals of a typed line (too long, not UTF-8). Reported to the user,
// not fatal to the session.
inline bool IsRejectedInput(const boost::system::error_code &ec) {
  return ec == wire::Errc::frame_too_large || ec == wire::Errc::invalid_utf8;
}

} // namespace upecho
