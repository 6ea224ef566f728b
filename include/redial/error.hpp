#pragma once

#include <system_error>
#include <type_traits>

namespace redial {

/// Error codes produced by the controller itself, plus canonical codes for connection
/// implementations that have no richer error domain of their own.
enum class errc {
  /// start() was invoked on a controller that has already been started.
  already_started = 1,

  /// A reconnection threshold in the configuration is negative.
  invalid_config,

  /// establish() could not bring the connection up.
  connect_failed,

  /// await_drop() observed the connection failing (as opposed to a clean drop).
  connection_lost,

  /// terminate() could not tear the connection down.
  terminate_failed,

  /// The error hook threw; treated as a veto.
  hook_failed,

  /// An operation of the wrapped connection threw an exception.
  internal_error,
};

inline auto make_error_code(errc e) -> std::error_code;

inline auto error_category() noexcept -> std::error_category const&;

}  // namespace redial

namespace std {

template <>
struct is_error_code_enum<redial::errc> : std::true_type {};

}  // namespace std

#include <redial/impl/error.ipp>
