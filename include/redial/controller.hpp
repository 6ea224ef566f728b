#pragma once

#include <redial/config.hpp>
#include <redial/connection.hpp>
#include <redial/detail/cancel_source.hpp>
#include <redial/detail/done_event.hpp>
#include <redial/error.hpp>
#include <redial/error_info.hpp>
#include <redial/expected.hpp>
#include <redial/lifecycle_state.hpp>
#include <redial/logger.hpp>

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <utility>

namespace redial {

namespace detail {

inline auto make_exception_error(errc code, std::exception_ptr ep, std::string_view context)
  -> error_info;

}  // namespace detail

/// Snapshot of the controller's counters.
struct controller_stats {
  /// Successful establish() calls over the controller's lifetime.
  std::uint64_t generation{0};
  /// Current run of consecutive establish() failures.
  int connect_attempts{0};
  /// Current run of consecutive await_drop() failures.
  int connection_errors{0};
};

/// Reconnection controller around a single connection.
///
/// High-level model:
/// - start() runs the reconnection loop on the caller's thread and blocks until the loop ends.
/// - close() is called from ANOTHER thread: it requests a stop, terminates the connection (which
///   unblocks an in-flight await_drop()/establish()), and waits until start() has returned.
///
/// Loop (one iteration):
///   1. stop requested?           -> CLOSED, start() returns a value
///   2. establish()               -> CONNECTED (reset attempts) | error hook, FAILING, attempts++
///   3. attempts == max (max > 0) -> FAILED, start() returns the last establish() error
///   4. establish() failed        -> RECONNECTING, next iteration
///   5. await_drop()              -> DISCONNECTED (reset errors) | error hook, FAILING, errors++
///   6. errors == max (max > 0)   -> FAILED, start() returns the last await_drop() error
///   7. stop not requested        -> RECONNECTING, next iteration
///
/// An error-hook veto takes precedence over the thresholds: after FAILING, FAILED is emitted and
/// start() returns the veto error at once.
///
/// Ordering guarantee (CRITICAL):
/// - close() never returns before start() has fully unwound, so no connection operation is
///   invoked by the controller after close() returns.
/// - The stop request is only checked at the top of the loop; a blocked await_drop() is
///   interrupted by terminate(), never by the stop flag itself.
///
/// Lifetime:
/// - One start() per controller. A second call fails with errc::already_started.
/// - The destructor does not join; the owner must have joined the thread running start()
///   (checked by REDIAL_ASSERT in debug builds).
class controller {
 public:
  controller(std::unique_ptr<connection> conn, config cfg);

  /// Construct from configuration mutators applied in order to a default config.
  template <config_option... Options>
  explicit controller(std::unique_ptr<connection> conn, Options&&... options)
      : controller(std::move(conn), make_config(std::forward<Options>(options)...)) {}

  ~controller() noexcept;

  controller(controller const&) = delete;
  auto operator=(controller const&) -> controller& = delete;
  controller(controller&&) = delete;
  auto operator=(controller&&) -> controller& = delete;

  /// Run the reconnection loop. Blocks.
  ///
  /// Returns:
  /// - a value on a clean, externally requested close
  /// - the last establish()/await_drop() error once a threshold is exhausted
  /// - the veto error returned by the error hook
  /// - errc::invalid_config / errc::already_started without running the loop
  auto start() -> expected<void, error_info>;

  /// Request a stop, terminate the connection and wait for start() to return.
  ///
  /// Returns whatever terminate() produced, regardless of how start() concluded.
  /// Safe to call repeatedly; every call invokes terminate().
  auto close() -> expected<void, error_info>;

  /// Last emitted lifecycle state (CONNECTING before start()).
  [[nodiscard]] auto state() const noexcept -> lifecycle_state {
    return state_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto close_requested() const noexcept -> bool { return stop_.is_cancelled(); }

  /// Most recent establish()/await_drop() failure, if any.
  [[nodiscard]] auto last_error() const -> std::optional<error_info>;

  [[nodiscard]] auto stats() const noexcept -> controller_stats;

  [[nodiscard]] auto get_config() const noexcept -> config const& { return cfg_; }

 private:
  auto run_loop() -> expected<void, error_info>;

  /// Invoke a connection operation, converting exceptions into errc::internal_error.
  template <typename Op>
  auto invoke(std::string_view name, Op op) -> expected<void, error_info>;

  /// Record a failure and consult the error hook. Returns the veto, if any.
  auto on_failure(error_info const& err) -> std::optional<error_info>;

  auto emit(lifecycle_state next) -> void;

  auto fail(error_info err, std::string_view reason) -> expected<void, error_info>;

 private:
  std::unique_ptr<connection> conn_;
  config const cfg_;

  // "stop requested" (written by close(), read by start())
  detail::cancel_source stop_{};
  // "loop has exited" (written by start(), waited by close())
  detail::done_event exited_{};
  std::atomic<bool> started_{false};

  std::atomic<lifecycle_state> state_{lifecycle_state::connecting};

  // Counters are only written by the thread running start(); atomics make stats() safe.
  std::atomic<std::uint64_t> generation_{0};
  std::atomic<int> connect_attempts_{0};
  std::atomic<int> connection_errors_{0};

  mutable std::mutex last_error_mutex_{};
  std::optional<error_info> last_error_{};
};

}  // namespace redial

#include <redial/impl/controller.ipp>
