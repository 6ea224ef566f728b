#pragma once

#include <redial/connection.hpp>
#include <redial/error.hpp>
#include <redial/error_info.hpp>
#include <redial/expected.hpp>
#include <redial/hooks.hpp>
#include <redial/lifecycle_state.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace redial::test_support {

/// Connection double driven by per-operation scripts.
///
/// - Each establish()/await_drop() call pops the next scripted outcome; once a script is
///   exhausted the operation falls back to its default (establish: ok, await_drop: block).
/// - A blocking outcome waits until terminate() has been called at least once. terminate() is
///   sticky, so every later blocking outcome returns immediately.
/// - A blocked establish() returns errc::connect_failed; a blocked await_drop() returns a clean
///   drop.
class scripted_connection final : public connection {
 public:
  struct outcome {
    enum class kind {
      ok,
      fail,
      block,
      raise,
    };

    kind op{kind::ok};
    error_info err{};
    std::string what{};

    [[nodiscard]] static auto ok() -> outcome { return outcome{}; }

    [[nodiscard]] static auto fail(error_info e) -> outcome {
      outcome o{};
      o.op = kind::fail;
      o.err = std::move(e);
      return o;
    }

    [[nodiscard]] static auto block() -> outcome {
      outcome o{};
      o.op = kind::block;
      return o;
    }

    [[nodiscard]] static auto raise(std::string what) -> outcome {
      outcome o{};
      o.op = kind::raise;
      o.what = std::move(what);
      return o;
    }
  };

  using script = std::vector<outcome>;

  scripted_connection() = default;

  scripted_connection(script establish_script, script await_drop_script)
      : establish_script_(establish_script.begin(), establish_script.end()),
        await_drop_script_(await_drop_script.begin(), await_drop_script.end()) {}

  auto establish() -> expected<void, error_info> override {
    auto next = pop(establish_script_, establish_calls_, outcome::ok());
    if (next.op == outcome::kind::block) {
      wait_terminated();
      return unexpected(error_info{errc::connect_failed, "terminated while connecting"});
    }
    return resolve(next);
  }

  auto await_drop() -> expected<void, error_info> override {
    auto next = pop(await_drop_script_, await_drop_calls_, outcome::block());
    if (next.op == outcome::kind::block) {
      wait_terminated();
      return {};
    }
    return resolve(next);
  }

  auto terminate() -> expected<void, error_info> override {
    std::optional<error_info> result;
    {
      std::lock_guard lk{mu_};
      terminate_calls_ += 1;
      terminated_ = true;
      result = terminate_error_;
    }
    cv_.notify_all();
    if (result) {
      return unexpected(*result);
    }
    return {};
  }

  void set_terminate_error(error_info err) {
    std::lock_guard lk{mu_};
    terminate_error_ = std::move(err);
  }

  /// Wait until establish() has been entered at least `n` times.
  [[nodiscard]] auto wait_for_establish_calls(
    std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> bool {
    std::unique_lock lk{mu_};
    return cv_.wait_for(lk, timeout, [&] { return establish_calls_ >= n; });
  }

  /// Wait until await_drop() has been entered at least `n` times.
  [[nodiscard]] auto wait_for_await_drop_calls(
    std::size_t n, std::chrono::milliseconds timeout = std::chrono::seconds{5}) -> bool {
    std::unique_lock lk{mu_};
    return cv_.wait_for(lk, timeout, [&] { return await_drop_calls_ >= n; });
  }

  [[nodiscard]] auto establish_calls() const -> std::size_t {
    std::lock_guard lk{mu_};
    return establish_calls_;
  }

  [[nodiscard]] auto await_drop_calls() const -> std::size_t {
    std::lock_guard lk{mu_};
    return await_drop_calls_;
  }

  [[nodiscard]] auto terminate_calls() const -> std::size_t {
    std::lock_guard lk{mu_};
    return terminate_calls_;
  }

 private:
  auto pop(std::deque<outcome>& q, std::size_t& calls, outcome fallback) -> outcome {
    outcome next = std::move(fallback);
    {
      std::lock_guard lk{mu_};
      calls += 1;
      if (!q.empty()) {
        next = std::move(q.front());
        q.pop_front();
      }
    }
    cv_.notify_all();
    return next;
  }

  void wait_terminated() {
    std::unique_lock lk{mu_};
    cv_.wait(lk, [this] { return terminated_; });
  }

  static auto resolve(outcome const& o) -> expected<void, error_info> {
    switch (o.op) {
      case outcome::kind::ok:
        return {};
      case outcome::kind::fail:
        return unexpected(o.err);
      case outcome::kind::raise:
        throw std::runtime_error(o.what);
      case outcome::kind::block:
        break;
    }
    throw std::logic_error("scripted_connection: unresolved outcome");
  }

  mutable std::mutex mu_{};
  std::condition_variable cv_{};
  std::deque<outcome> establish_script_{};
  std::deque<outcome> await_drop_script_{};
  std::size_t establish_calls_{0};
  std::size_t await_drop_calls_{0};
  std::size_t terminate_calls_{0};
  bool terminated_{false};
  std::optional<error_info> terminate_error_{};
};

/// Records every emitted lifecycle state (thread-safe).
struct state_recorder {
  mutable std::mutex mu;
  std::vector<lifecycle_state> states;

  static auto on_state(void* user_data, lifecycle_state s) -> void {
    auto* self = static_cast<state_recorder*>(user_data);
    std::lock_guard lock(self->mu);
    self->states.push_back(s);
  }

  [[nodiscard]] auto snapshot() const -> std::vector<lifecycle_state> {
    std::lock_guard lock(mu);
    return states;
  }
};

/// Counts error-hook calls and vetoes on the `veto_on_call`-th one (1-based, 0 = never).
struct error_recorder {
  std::size_t veto_on_call{0};
  error_info veto{errc::connection_lost, "vetoed"};
  std::size_t calls{0};
  std::vector<error_info> seen{};

  static auto on_error(void* user_data, error_info const& err) -> std::optional<error_info> {
    auto* self = static_cast<error_recorder*>(user_data);
    self->calls += 1;
    self->seen.push_back(err);
    if (self->veto_on_call != 0 && self->calls == self->veto_on_call) {
      return self->veto;
    }
    return std::nullopt;
  }
};

/// A state recorder and an error recorder, each wired as its own hook's user_data.
struct recording_hooks {
  state_recorder states{};
  error_recorder errors{};

  [[nodiscard]] auto hooks() -> lifecycle_hooks {
    return lifecycle_hooks{
      .state_user_data = &states,
      .on_state = &state_recorder::on_state,
      .error_user_data = &errors,
      .on_error = &error_recorder::on_error,
    };
  }
};

}  // namespace redial::test_support
