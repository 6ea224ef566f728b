#pragma once

#include <redial/assert.hpp>
#include <redial/connection.hpp>

#include <functional>
#include <utility>

namespace redial {

/// A connection assembled from three callables, for callers that already have the operations
/// at hand and do not want to subclass connection.
///
/// The callables inherit the connection contract: await_drop must return once terminate has run,
/// and terminate must be safe to call while the other two are in progress.
class function_connection final : public connection {
 public:
  using operation = std::function<expected<void, error_info>()>;

  function_connection(operation establish, operation await_drop, operation terminate)
      : establish_(std::move(establish)),
        await_drop_(std::move(await_drop)),
        terminate_(std::move(terminate)) {
    REDIAL_ENSURE(static_cast<bool>(establish_), "establish operation is empty");
    REDIAL_ENSURE(static_cast<bool>(await_drop_), "await_drop operation is empty");
    REDIAL_ENSURE(static_cast<bool>(terminate_), "terminate operation is empty");
  }

  auto establish() -> expected<void, error_info> override { return establish_(); }

  auto await_drop() -> expected<void, error_info> override { return await_drop_(); }

  auto terminate() -> expected<void, error_info> override { return terminate_(); }

 private:
  operation establish_;
  operation await_drop_;
  operation terminate_;
};

}  // namespace redial
