#pragma once

#include <algorithm>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <optional>
#include <thread>
#include <vector>

namespace upecho {

namespace net = boost::asio;

// Reactor
// Threading model:
// - Owns a single io_context shared by the accept loop and all async sessions
// - Runs io_context::run() on a fixed number of std::jthread workers; sessions
//   execute as coroutines on these threads, so the number of OS threads does
//   not grow with the number of connections
// - Join() lets outstanding work finish; Stop() abandons it
class Reactor {
public:
  Reactor() = default;
  Reactor(const Reactor &) = delete;
  Reactor &operator=(const Reactor &) = delete;

  net::io_context &GetIoContext() { return ioc_; }

  void Start(int numThreads = 1) {
    if (!work_guard_.has_value()) {
      work_guard_.emplace(ioc_.get_executor());
    }
    numThreads = std::max(1, numThreads);
    threads_.reserve(static_cast<std::size_t>(numThreads));
    for (int i = 0; i < numThreads; ++i) {
      threads_.emplace_back([this] { ioc_.run(); });
    }
  }

  // Releases the work guard and waits for the workers to run out of work.
  void Join() {
    work_guard_.reset();
    threads_.clear();
  }

  void Stop() {
    work_guard_.reset();
    ioc_.stop();
    threads_.clear();
  }

  ~Reactor() { Stop(); }

private:
  net::io_context ioc_;
  std::vector<std::jthread> threads_;
  std::optional<net::executor_work_guard<net::io_context::executor_type>>
      work_guard_;
};

} // namespace upecho
