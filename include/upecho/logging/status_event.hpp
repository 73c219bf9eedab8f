#pragma once

#include <boost/lockfree/queue.hpp>
#include <cstddef>
#include <cstdint>

namespace upecho::logging {

enum class Level : std::uint8_t { info, warn, error };

inline const char *LevelTag(Level level) {
  switch (level) {
  case Level::info:
    return "INFO ";
  case Level::warn:
    return "WARN ";
  case Level::error:
    return "ERROR";
  }
  return "?????";
}

inline constexpr std::size_t kStatusTextCapacity = 240;

// Fixed-size record so it can travel through a lock-free queue. Longer
// messages are truncated by the producer.
struct StatusEvent {
  std::int64_t epoch_ms;
  Level level;
  std::uint16_t len;
  char text[kStatusTextCapacity];
};

inline constexpr std::size_t kStatusQueueCapacity = 1024;

// Multi-producer (every session thread), single consumer (the logger).
using StatusQueue =
    boost::lockfree::queue<StatusEvent,
                           boost::lockfree::capacity<kStatusQueueCapacity>>;

} // namespace upecho::logging
