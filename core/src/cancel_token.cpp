#include "core/cancel_token.h"

namespace dsa::core {

bool CancelToken::request_cancel() noexcept {
  bool expected = false;
  return canceled_.compare_exchange_strong(expected, true,
                                           std::memory_order_release,
                                           std::memory_order_relaxed);
}

bool CancelToken::is_canceled() const noexcept {
  return canceled_.load(std::memory_order_acquire);
}

std::shared_ptr<CancelToken> CancelToken::create() {
  return std::make_shared<CancelToken>();
}

} // namespace dsa::core
