#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>

namespace redial::detail {

/// One-shot, thread-blocking completion signal ("the loop has exited").
///
/// Signal semantics:
/// - notify() latches the event; later notify() calls are no-ops
/// - wait() blocks until the event is latched, then returns immediately forever after
/// - any number of threads may wait()
///
/// Race condition prevention:
/// The latch write and the waiter's predicate check are both done under mutex_, so a notify()
/// that lands between a waiter's check and its sleep cannot be lost.
class done_event {
 public:
  done_event() = default;
  ~done_event() = default;

  done_event(done_event const&) = delete;
  auto operator=(done_event const&) -> done_event& = delete;

  done_event(done_event&&) = delete;
  auto operator=(done_event&&) -> done_event& = delete;

  void notify() {
    {
      std::lock_guard lk{mutex_};
      if (done_.load(std::memory_order_relaxed)) {
        return;
      }
      done_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  void wait() {
    std::unique_lock lk{mutex_};
    cv_.wait(lk, [this] { return done_.load(std::memory_order_relaxed); });
  }

  [[nodiscard]] bool is_ready() const noexcept { return done_.load(std::memory_order_acquire); }

 private:
  std::mutex mutex_{};
  std::condition_variable cv_{};
  std::atomic<bool> done_{false};
};

}  // namespace redial::detail
