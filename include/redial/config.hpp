#pragma once

#include <redial/error.hpp>
#include <redial/error_info.hpp>
#include <redial/expected.hpp>
#include <redial/hooks.hpp>

#include <concepts>
#include <string>
#include <utility>

namespace redial {

/// Reconnection policy.
///
/// Thresholds count CONSECUTIVE failures of the same phase:
/// - A successful establish() resets the connect-attempt counter.
/// - A clean await_drop() resets the connection-error counter.
///
/// Retries are immediate; pacing (if any) is up to the connection implementation.
struct config {
  /// Consecutive establish() failures tolerated before FAILED. 0 = unlimited.
  int max_connect_attempts = 0;

  /// Consecutive await_drop() failures tolerated before FAILED. 0 = unlimited.
  int max_connection_errors = 0;

  /// State / error notification hooks. Empty hooks are no-ops.
  lifecycle_hooks hooks{};
};

/// A configuration mutator, applied to a default-constructed config.
template <typename F>
concept config_option = std::invocable<F&, config&>;

/// Fold mutators into a config, in order (later ones override earlier ones).
template <config_option... Options>
[[nodiscard]] auto make_config(Options&&... options) -> config {
  config cfg{};
  (std::forward<Options>(options)(cfg), ...);
  return cfg;
}

[[nodiscard]] inline auto max_connect_attempts(int n) {
  return [n](config& cfg) { cfg.max_connect_attempts = n; };
}

[[nodiscard]] inline auto max_connection_errors(int n) {
  return [n](config& cfg) { cfg.max_connection_errors = n; };
}

[[nodiscard]] inline auto on_state(lifecycle_hooks::on_state_fn fn, void* user_data = nullptr) {
  return [fn, user_data](config& cfg) {
    cfg.hooks.on_state = fn;
    cfg.hooks.state_user_data = user_data;
  };
}

[[nodiscard]] inline auto on_error(lifecycle_hooks::on_error_fn fn, void* user_data = nullptr) {
  return [fn, user_data](config& cfg) {
    cfg.hooks.on_error = fn;
    cfg.hooks.error_user_data = user_data;
  };
}

[[nodiscard]] inline auto validate(config const& cfg) -> expected<void, error_info> {
  if (cfg.max_connect_attempts < 0) {
    return unexpected(error_info{errc::invalid_config,
                                 "max_connect_attempts=" + std::to_string(cfg.max_connect_attempts)});
  }
  if (cfg.max_connection_errors < 0) {
    return unexpected(error_info{errc::invalid_config, "max_connection_errors=" +
                                                         std::to_string(cfg.max_connection_errors)});
  }
  return {};
}

}  // namespace redial
