#pragma once

#include <atomic>

namespace redial::detail {

/// One-shot "stop requested" flag.
///
/// - request_cancel() is idempotent and callable from any thread
/// - is_cancelled() is a lock-free multi-reader check
///
/// There is no reset(): a controller is not reusable after it terminates.
class cancel_source {
 public:
  cancel_source() = default;
  cancel_source(cancel_source const&) = delete;
  auto operator=(cancel_source const&) -> cancel_source& = delete;
  cancel_source(cancel_source&&) = delete;
  auto operator=(cancel_source&&) -> cancel_source& = delete;

  /// Request cancellation. Returns true for the call that actually flipped the flag.
  auto request_cancel() noexcept -> bool {
    return !cancelled_.exchange(true, std::memory_order_acq_rel);
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

}  // namespace redial::detail
