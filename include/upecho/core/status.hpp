#pragma once

#include <boost/system/error_code.hpp>
#include <expected>

namespace upecho {

using error_code = boost::system::error_code;

template <typename T> using Result = std::expected<T, error_code>;
using Status = std::expected<void, error_code>;

inline Status MakeStatus(const error_code &ec) {
  if (ec) {
    return std::unexpected(ec);
  }
  return {};
}

} // namespace upecho
