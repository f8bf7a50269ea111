#pragma once

#include <atomic>

namespace broadcast {

// Single-slot limiter: at most one holder at a time.
class InFlightGate {
public:
  bool try_acquire() {
    bool expected = false;
    return busy_.compare_exchange_strong(expected, true,
                                         std::memory_order_acq_rel);
  }
  void release() { busy_.store(false, std::memory_order_release); }
  bool busy() const { return busy_.load(std::memory_order_acquire); }

private:
  std::atomic<bool> busy_{false};
};

// Releases the gate when destroyed, whichever way the send ends.
class GateLease {
public:
  explicit GateLease(InFlightGate &gate) : gate_(gate) {}
  ~GateLease() { gate_.release(); }

  GateLease(const GateLease &) = delete;
  GateLease &operator=(const GateLease &) = delete;

private:
  InFlightGate &gate_;
};

} // namespace broadcast
