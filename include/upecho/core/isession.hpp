#pragma once

#include <cstdint>

namespace upecho {

// ISession: one connection handler, whatever its execution model (dedicated
// thread or coroutine on the reactor). Servers keep sessions through this
// interface to stop them on shutdown without knowing the concrete type.
class ISession {
public:
  virtual ~ISession() = default;
  virtual void Start() = 0;
  // Asks the handler to close its connection. Returns immediately.
  virtual void Stop() = 0;
  virtual bool Finished() const = 0;
  virtual std::uint64_t Id() const = 0;
};

} // namespace upecho
