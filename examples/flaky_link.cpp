#include <redial/redial.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <thread>

using namespace std::chrono_literals;

// A simulated link: connects with some probability, stays up for a random while, then drops
// either cleanly or with an error. It paces its own retries by sleeping in establish().
class flaky_link final : public redial::connection {
 public:
  explicit flaky_link(unsigned seed) : rng_(seed) {}

  auto establish() -> redial::expected<void, redial::error_info> override {
    std::this_thread::sleep_for(100ms);
    std::lock_guard lk{mu_};
    if (terminated_) {
      return redial::unexpected(redial::error_info{redial::errc::connect_failed, "terminated"});
    }
    if (std::bernoulli_distribution{0.4}(rng_)) {
      return redial::unexpected(redial::error_info{redial::errc::connect_failed, "no carrier"});
    }
    return {};
  }

  auto await_drop() -> redial::expected<void, redial::error_info> override {
    std::unique_lock lk{mu_};
    auto uptime = std::chrono::milliseconds{std::uniform_int_distribution<int>{50, 400}(rng_)};
    if (cv_.wait_for(lk, uptime, [this] { return terminated_; })) {
      return {};
    }
    if (std::bernoulli_distribution{0.5}(rng_)) {
      return redial::unexpected(redial::error_info{redial::errc::connection_lost, "line noise"});
    }
    return {};
  }

  auto terminate() -> redial::expected<void, redial::error_info> override {
    {
      std::lock_guard lk{mu_};
      terminated_ = true;
    }
    cv_.notify_all();
    return {};
  }

 private:
  std::mutex mu_{};
  std::condition_variable cv_{};
  std::mt19937 rng_;
  bool terminated_{false};
};

struct link_monitor {
  std::size_t transitions{0};
  std::size_t errors{0};

  static auto on_state(void* user_data, redial::lifecycle_state s) -> void {
    auto* self = static_cast<link_monitor*>(user_data);
    self->transitions += 1;
    std::cout << "[state] " << s << "\n";
  }

  static auto on_error(void* user_data, redial::error_info const& err)
    -> std::optional<redial::error_info> {
    auto* self = static_cast<link_monitor*>(user_data);
    self->errors += 1;
    std::cout << "[error] " << err.to_string() << "\n";
    // Give up on the tenth failure regardless of the thresholds.
    if (self->errors >= 10) {
      return redial::error_info{redial::errc::connection_lost, "too many failures overall"};
    }
    return std::nullopt;
  }
};

int main() {
  redial::set_log_level(redial::log_level::info);

  link_monitor monitor{};
  redial::controller c{std::make_unique<flaky_link>(std::random_device{}()),
                       redial::max_connect_attempts(5), redial::max_connection_errors(3),
                       redial::on_state(&link_monitor::on_state, &monitor),
                       redial::on_error(&link_monitor::on_error, &monitor)};

  std::optional<redial::expected<void, redial::error_info>> result;
  std::thread runner([&] { result.emplace(c.start()); });

  std::this_thread::sleep_for(3s);
  if (auto closed = c.close(); !closed) {
    std::cerr << "close: " << closed.error().to_string() << "\n";
  }
  runner.join();

  auto stats = c.stats();
  std::cout << "final state=" << c.state() << " generation=" << stats.generation
            << " transitions=" << monitor.transitions << " errors=" << monitor.errors << "\n";
  if (result && !*result) {
    std::cout << "stopped with: " << result->error().to_string() << "\n";
    return 1;
  }
  return 0;
}
