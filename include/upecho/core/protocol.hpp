#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <string_view>

namespace upecho::protocol {

inline constexpr unsigned short kDefaultPort = 8099;
inline constexpr std::string_view kExitSentinel = "exit";
inline constexpr std::string_view kPrompt = "> ";

// Server side: only the exact text ends a session. "Exit" is echoed as
// "EXIT".
inline bool IsServerSentinel(std::string_view message) {
  return message == kExitSentinel;
}

// Client side: any casing of "exit" typed by the user ends the session, and
// the literal kExitSentinel is what goes on the wire.
inline bool IsClientSentinel(std::string_view line) {
  return boost::algorithm::iequals(line, kExitSentinel);
}

} // namespace upecho::protocol
