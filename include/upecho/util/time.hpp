#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <string>

namespace upecho::timeutil {

inline std::int64_t EpochMillisUtc() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// HH:MM:SS in local time. Status events carry the stamp taken by the
// producer, not the time the logger drains them.
inline std::string ClockTime(std::int64_t epoch_ms) {
  const auto tt = static_cast<std::time_t>(epoch_ms / 1000);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[16];
  const std::size_t n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return std::string(buf, n);
}

} // namespace upecho::timeutil
