#pragma once

#include <atomic>

namespace dsa::core {

/// Single-flight flag: "is this job's callback running right now".
///
/// Acquisition never blocks. The polling loop must not wait on a slow task,
/// so a caller that loses the race is expected to skip its run, not queue
/// it.
class ExecutionGuard {
public:
  ExecutionGuard() = default;
  ExecutionGuard(const ExecutionGuard &) = delete;
  ExecutionGuard &operator=(const ExecutionGuard &) = delete;

  /// Unlocked -> Locked. False when already locked.
  [[nodiscard]] bool try_acquire() noexcept {
    bool expected = false;
    return locked_.compare_exchange_strong(expected, true,
                                           std::memory_order_acq_rel,
                                           std::memory_order_relaxed);
  }

  void release() noexcept { locked_.store(false, std::memory_order_release); }

  [[nodiscard]] bool is_locked() const noexcept {
    return locked_.load(std::memory_order_acquire);
  }

  /// Scoped try-acquire; releases on destruction if it acquired, including
  /// during stack unwinding.
  class Lease {
  public:
    explicit Lease(ExecutionGuard &guard) noexcept
        : guard_(guard), owns_(guard.try_acquire()) {}
    ~Lease() {
      if (owns_) {
        guard_.release();
      }
    }

    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    [[nodiscard]] bool owns() const noexcept { return owns_; }

  private:
    ExecutionGuard &guard_;
    bool owns_;
  };

private:
  std::atomic<bool> locked_{false};
};

} // namespace dsa::core
