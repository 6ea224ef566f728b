#pragma once

#include <redial/error_info.hpp>
#include <redial/lifecycle_state.hpp>

#include <optional>

namespace redial {

/// Optional notification hooks invoked by the controller.
///
/// Each hook receives its own user_data pointer.
///
/// Threading / performance contract:
/// - Callbacks run synchronously on the thread executing controller::start().
/// - They should not block; a blocked hook stalls the reconnection loop.
///
/// on_state:
/// - Invoked on every emitted lifecycle state.
/// - An exception escaping it is logged and otherwise ignored.
///
/// on_error:
/// - Invoked for every establish() / await_drop() failure, before FAILING is emitted.
/// - Returning a value vetoes further retries: start() returns that error immediately,
///   regardless of the configured thresholds.
/// - Returning std::nullopt lets the threshold accounting decide.
/// - An exception escaping it is treated as a veto with errc::hook_failed.
struct lifecycle_hooks {
  using on_state_fn = void (*)(void*, lifecycle_state);
  using on_error_fn = std::optional<error_info> (*)(void*, error_info const&);

  void* state_user_data{};
  on_state_fn on_state{};

  void* error_user_data{};
  on_error_fn on_error{};

  [[nodiscard]] constexpr bool has_state_hook() const noexcept { return on_state != nullptr; }
  [[nodiscard]] constexpr bool has_error_hook() const noexcept { return on_error != nullptr; }
};

}  // namespace redial
