#pragma once

#include "upecho/core/status.hpp"
#include <cstddef>

namespace upecho {

// Binding → Listening → (per accept) Spawning → Listening → … → Stopped.
// A failed bind goes straight from binding to stopped.
enum class ServerState { binding, listening, stopped };

inline const char *ToString(ServerState s) {
  switch (s) {
  case ServerState::binding:
    return "binding";
  case ServerState::listening:
    return "listening";
  case ServerState::stopped:
    return "stopped";
  }
  return "?";
}

// IServer: accept loop, independent of the session execution model.
// Bind() and Run() are called from one thread; Stop() may be called from any
// thread (signal handler thread, tests) at any time after construction.
class IServer {
public:
  virtual ~IServer() = default;
  virtual Status Bind() = 0;
  // Blocks until the server is stopped and every session has finished.
  virtual void Run() = 0;
  virtual void Stop() = 0;
  virtual ServerState State() const = 0;
  virtual unsigned short LocalPort() const = 0;
  virtual std::size_t ActiveConnections() const = 0;
};

} // namespace upecho
