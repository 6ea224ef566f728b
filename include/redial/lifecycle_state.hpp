#pragma once

#include <redial/assert.hpp>

#include <cstdint>
#include <ostream>

namespace redial {

/// Lifecycle states emitted by the controller.
///
/// Transitions (terminal states: CLOSED, FAILED):
///
///   CONNECTING   -> CONNECTED | FAILING | CLOSED
///   CONNECTED    -> DISCONNECTED | FAILING
///   FAILING      -> FAILED | RECONNECTING | CLOSED
///   DISCONNECTED -> RECONNECTING | CLOSED
///   RECONNECTING -> CONNECTED | FAILING | CLOSED
///
/// - CONNECTING is emitted once, before the first attempt.
/// - CONNECTED / DISCONNECTED report a successful establish() / a clean await_drop().
/// - FAILING reports every establish() or await_drop() failure.
/// - FAILED always follows FAILING: threshold exhaustion or an error-hook veto.
/// - RECONNECTING precedes every new attempt, except when a stop was requested while waiting.
/// - CLOSED is emitted only when a requested stop is observed at the top of the loop.
///
/// States are purely observational; they never drive control flow.
enum class lifecycle_state : std::uint8_t {
  connecting,
  reconnecting,
  connected,
  disconnected,
  failing,
  failed,
  closed,
};

[[nodiscard]] constexpr auto is_terminal(lifecycle_state s) noexcept -> bool {
  return s == lifecycle_state::closed || s == lifecycle_state::failed;
}

/// Display name of a state. An out-of-range value is a programming error.
[[nodiscard]] constexpr auto to_string(lifecycle_state s) noexcept -> char const* {
  switch (s) {
    case lifecycle_state::connecting:
      return "connecting";
    case lifecycle_state::reconnecting:
      return "reconnecting";
    case lifecycle_state::connected:
      return "connected";
    case lifecycle_state::disconnected:
      return "disconnected";
    case lifecycle_state::failing:
      return "failing";
    case lifecycle_state::failed:
      return "failed";
    case lifecycle_state::closed:
      return "closed";
  }
  REDIAL_UNREACHABLE();
}

inline auto operator<<(std::ostream& os, lifecycle_state s) -> std::ostream& {
  return os << to_string(s);
}

}  // namespace redial
