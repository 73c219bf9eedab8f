#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace upecho {

// AdmissionControl: connection-count limit applied at accept.
// A Ticket holds one slot for the lifetime of a session; destroying it frees
// the slot. A limit of 0 admits everything (the count is still tracked).
class AdmissionControl {
public:
  class Ticket {
  public:
    Ticket(Ticket &&other) noexcept : owner_(other.owner_) {
      other.owner_ = nullptr;
    }
    Ticket &operator=(Ticket &&) = delete;
    Ticket(const Ticket &) = delete;

    ~Ticket() {
      if (owner_ != nullptr) {
        owner_->active_.fetch_sub(1, std::memory_order_acq_rel);
      }
    }

  private:
    friend class AdmissionControl;
    explicit Ticket(AdmissionControl *owner) : owner_(owner) {}
    AdmissionControl *owner_;
  };

  explicit AdmissionControl(std::size_t limit) : limit_(limit) {}

  std::optional<Ticket> TryAdmit() {
    std::size_t cur = active_.load(std::memory_order_acquire);
    for (;;) {
      if (limit_ != 0 && cur >= limit_) {
        return std::nullopt;
      }
      if (active_.compare_exchange_weak(cur, cur + 1,
                                        std::memory_order_acq_rel)) {
        return Ticket(this);
      }
    }
  }

  std::size_t Active() const {
    return active_.load(std::memory_order_acquire);
  }
  std::size_t Limit() const { return limit_; }

private:
  std::size_t limit_;
  std::atomic<std::size_t> active_{0};
};

} // namespace upecho
