#pragma once

#include <redial/error_info.hpp>
#include <redial/expected.hpp>

namespace redial {

/// The capability wrapped by a controller.
///
/// Contract:
/// - establish(): bring the connection up. May be retried any number of times.
/// - await_drop(): block until the connection is lost. A value means a clean drop; an error means
///   the connection failed. MUST return promptly once terminate() has been called concurrently.
/// - terminate(): tear the connection down and unblock an in-flight await_drop() (or establish()).
///
/// Concurrency:
/// - The controller is the only caller of establish() / await_drop(), always from the thread
///   running controller::start().
/// - terminate() is called from the thread running controller::close(), possibly while
///   establish() or await_drop() is in progress. Implementations MUST tolerate that overlap.
///
/// Exceptions thrown by any operation are converted to errc::internal_error by the controller.
class connection {
 public:
  virtual ~connection() = default;

  virtual auto establish() -> expected<void, error_info> = 0;

  virtual auto await_drop() -> expected<void, error_info> = 0;

  virtual auto terminate() -> expected<void, error_info> = 0;
};

}  // namespace redial
