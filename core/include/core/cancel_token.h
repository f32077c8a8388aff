#pragma once

#include <atomic>
#include <memory>

namespace dsa::core {

/// Thread-safe cancellation token.
///
/// Single-writer (whoever calls request_cancel()) / multi-reader (name
/// fetches and the HTTP transfer loop poll is_canceled()). The flag is an
/// atomic<bool> with acquire/release ordering.
class CancelToken {
public:
  CancelToken() = default;

  CancelToken(const CancelToken &) = delete;
  CancelToken &operator=(const CancelToken &) = delete;

  /// Request cancellation. Thread-safe, idempotent.
  /// Returns true only for the call that flipped the flag.
  bool request_cancel() noexcept;

  /// Check if cancellation has been requested.
  [[nodiscard]] bool is_canceled() const noexcept;

  /// Create a shared CancelToken.
  static std::shared_ptr<CancelToken> create();

private:
  std::atomic<bool> canceled_{false};
};

} // namespace dsa::core
