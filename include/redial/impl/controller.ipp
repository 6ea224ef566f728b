#pragma once

#include <redial/assert.hpp>
#include <redial/controller.hpp>

#include <exception>
#include <string>
#include <utility>

namespace redial {

namespace detail {

inline auto make_exception_error(errc code, std::exception_ptr ep, std::string_view context)
  -> error_info {
  std::string detail;
  if (!context.empty()) {
    detail.append(context.data(), context.size());
    detail.append(": ");
  }

  if (ep == nullptr) {
    detail.append("unknown exception");
    return {code, std::move(detail)};
  }

  try {
    std::rethrow_exception(ep);
  } catch (std::exception const& e) {
    detail.append(e.what());
  } catch (...) {
    detail.append("unknown exception");
  }

  return {code, std::move(detail)};
}

}  // namespace detail

inline controller::controller(std::unique_ptr<connection> conn, config cfg)
    : conn_(std::move(conn)), cfg_(std::move(cfg)) {
  REDIAL_ENSURE(conn_ != nullptr, "controller requires a connection");
}

inline controller::~controller() noexcept {
  // The owner joins the thread running start() before destroying the controller.
  REDIAL_ASSERT(!started_.load(std::memory_order_acquire) || exited_.is_ready(),
                "controller destroyed while start() is running");
}

inline auto controller::start() -> expected<void, error_info> {
  if (started_.exchange(true, std::memory_order_acq_rel)) {
    REDIAL_LOG_WARNING("controller.start.rejected reason=already_started");
    return unexpected(error_info{errc::already_started});
  }

  // close() waits on exited_, so it must be latched on every way out of start().
  struct exit_notifier {
    detail::done_event& ev;
    ~exit_notifier() { ev.notify(); }
  } notifier{exited_};

  if (auto valid = validate(cfg_); !valid) {
    REDIAL_LOG_ERROR("controller.start.invalid_config err={}", valid.error().to_string());
    return valid;
  }

  REDIAL_LOG_INFO("controller.start max_connect_attempts={} max_connection_errors={}",
                  cfg_.max_connect_attempts, cfg_.max_connection_errors);
  auto res = run_loop();
  REDIAL_LOG_INFO("controller.stop state={} generation={} ok={}", to_string(state()),
                  generation_.load(std::memory_order_relaxed), res.has_value());
  return res;
}

inline auto controller::run_loop() -> expected<void, error_info> {
  emit(lifecycle_state::connecting);

  while (true) {
    if (stop_.is_cancelled()) {
      emit(lifecycle_state::closed);
      return {};
    }

    auto established = invoke("establish", [this] { return conn_->establish(); });
    if (established) {
      generation_.fetch_add(1, std::memory_order_relaxed);
      connect_attempts_.store(0, std::memory_order_relaxed);
      REDIAL_LOG_INFO("controller.connected generation={}",
                      generation_.load(std::memory_order_relaxed));
      emit(lifecycle_state::connected);
    } else {
      auto veto = on_failure(established.error());
      emit(lifecycle_state::failing);
      auto const attempts = connect_attempts_.fetch_add(1, std::memory_order_relaxed) + 1;
      REDIAL_LOG_WARNING("controller.establish.failed attempt={} max={} err={}", attempts,
                         cfg_.max_connect_attempts, established.error().to_string());

      if (veto) {
        return fail(std::move(*veto), "veto");
      }

      if (cfg_.max_connect_attempts > 0 && attempts == cfg_.max_connect_attempts) {
        return fail(std::move(established.error()), "max_connect_attempts");
      }

      // Never wait on a connection that did not come up.
      emit(lifecycle_state::reconnecting);
      continue;
    }

    auto dropped = invoke("await_drop", [this] { return conn_->await_drop(); });
    if (dropped) {
      connection_errors_.store(0, std::memory_order_relaxed);
      REDIAL_LOG_INFO("controller.disconnected generation={}",
                      generation_.load(std::memory_order_relaxed));
      emit(lifecycle_state::disconnected);
    } else {
      auto veto = on_failure(dropped.error());
      emit(lifecycle_state::failing);
      auto const errors = connection_errors_.fetch_add(1, std::memory_order_relaxed) + 1;
      REDIAL_LOG_WARNING("controller.await_drop.failed error_count={} max={} err={}", errors,
                         cfg_.max_connection_errors, dropped.error().to_string());

      if (veto) {
        return fail(std::move(*veto), "veto");
      }

      if (cfg_.max_connection_errors > 0 && errors == cfg_.max_connection_errors) {
        return fail(std::move(dropped.error()), "max_connection_errors");
      }
    }

    // A stop requested while waiting goes straight to CLOSED at the top of the loop.
    if (!stop_.is_cancelled()) {
      emit(lifecycle_state::reconnecting);
    }
  }
}

template <typename Op>
auto controller::invoke(std::string_view name, Op op) -> expected<void, error_info> {
  try {
    return op();
  } catch (...) {
    auto err = detail::make_exception_error(errc::internal_error, std::current_exception(), name);
    REDIAL_LOG_ERROR("controller.connection_threw op={} err={}", name, err.to_string());
    return unexpected(std::move(err));
  }
}

inline auto controller::on_failure(error_info const& err) -> std::optional<error_info> {
  {
    std::lock_guard lk{last_error_mutex_};
    last_error_ = err;
  }

  auto const& hooks = cfg_.hooks;
  if (!hooks.has_error_hook()) {
    return std::nullopt;
  }

  try {
    return hooks.on_error(hooks.error_user_data, err);
  } catch (...) {
    auto veto =
      detail::make_exception_error(errc::hook_failed, std::current_exception(), "on_error");
    REDIAL_LOG_ERROR("controller.error_hook_threw err={}", veto.to_string());
    return veto;
  }
}

inline auto controller::fail(error_info err, std::string_view reason)
  -> expected<void, error_info> {
  REDIAL_LOG_ERROR("controller.failed reason={} err={}", reason, err.to_string());
  emit(lifecycle_state::failed);
  return unexpected(std::move(err));
}

inline auto controller::emit(lifecycle_state next) -> void {
  auto const prev = state_.exchange(next, std::memory_order_acq_rel);
  REDIAL_LOG_DEBUG("controller.state_transition from={} to={}", to_string(prev),
                   to_string(next));

  auto const& hooks = cfg_.hooks;
  if (!hooks.has_state_hook()) {
    return;
  }

  try {
    hooks.on_state(hooks.state_user_data, next);
  } catch (std::exception const& e) {
    REDIAL_LOG_ERROR("controller.state_hook_threw state={} what={}", to_string(next), e.what());
  } catch (...) {
    REDIAL_LOG_ERROR("controller.state_hook_threw state={} what=unknown", to_string(next));
  }
}

inline auto controller::close() -> expected<void, error_info> {
  if (stop_.request_cancel()) {
    REDIAL_LOG_INFO("controller.close.requested state={}", to_string(state()));
  }

  auto res = invoke("terminate", [this] { return conn_->terminate(); });
  if (!res) {
    REDIAL_LOG_WARNING("controller.close.terminate_failed err={}", res.error().to_string());
  }

  exited_.wait();
  REDIAL_LOG_DEBUG("controller.close.joined state={}", to_string(state()));
  return res;
}

inline auto controller::last_error() const -> std::optional<error_info> {
  std::lock_guard lk{last_error_mutex_};
  return last_error_;
}

inline auto controller::stats() const noexcept -> controller_stats {
  return controller_stats{
    .generation = generation_.load(std::memory_order_relaxed),
    .connect_attempts = connect_attempts_.load(std::memory_order_relaxed),
    .connection_errors = connection_errors_.load(std::memory_order_relaxed),
  };
}

}  // namespace redial
