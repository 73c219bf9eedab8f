#pragma once

#include <algorithm>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <thread>

// namespace retry: pause between failed accept attempts, so a persistent
// failure such as descriptor exhaustion does not spin the accept loop.
namespace upecho::retry {

namespace net = boost::asio;
using Delay = std::chrono::milliseconds;

class AcceptBackoff {
public:
  static constexpr Delay kInitial{200};
  static constexpr Delay kCeiling{5000};

  // Delay to apply now; the next one doubles, up to kCeiling.
  Delay Next() {
    const Delay d = next_;
    next_ = std::min(kCeiling, next_ * 2);
    return d;
  }
  void Reset() { next_ = kInitial; }

private:
  Delay next_ = kInitial;
};

inline void SleepFor(Delay d) { std::this_thread::sleep_for(d); }

// Suspends the calling coroutine only; other work on ex keeps running.
template <typename Executor>
void AsyncSleepFor(const Executor &ex, net::yield_context yield, Delay d) {
  boost::system::error_code ec;
  net::steady_timer timer(ex, d);
  timer.async_wait(yield[ec]);
}

} // namespace upecho::retry
