#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace upecho::wire {

enum class Errc {
  // Encoder: payload does not fit the 16-bit length prefix.
  frame_too_large = 1,
  // Decoder: stream ended inside a frame.
  truncated_frame,
  // Payload bytes are not well-formed UTF-8.
  invalid_utf8,
};

class ErrorCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "upecho.wire"; }

  std::string message(int ev) const override {
    switch (static_cast<Errc>(ev)) {
    case Errc::frame_too_large:
      return "frame exceeds 65535 bytes";
    case Errc::truncated_frame:
      return "stream closed inside a frame";
    case Errc::invalid_utf8:
      return "payload is not valid UTF-8";
    }
    return "unknown wire error";
  }
};

inline const boost::system::error_category &WireCategory() {
  static const ErrorCategory category;
  return category;
}

inline boost::system::error_code make_error_code(Errc e) {
  return {static_cast<int>(e), WireCategory()};
}

// A decode failure that leaves the stream in an unknown position. The session
// that saw it cannot continue.
inline bool IsMalformedFrame(const boost::system::error_code &ec) {
  return ec.category() == WireCategory() &&
         (ec.value() == static_cast<int>(Errc::truncated_frame) ||
          ec.value() == static_cast<int>(Errc::invalid_utf8));
}

} // namespace upecho::wire

namespace boost::system {
template <> struct is_error_code_enum<upecho::wire::Errc> : std::true_type {};
} // namespace boost::system
