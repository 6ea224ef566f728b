#pragma once

#include <redial/assert.hpp>
#include <redial/error.hpp>

#include <string>

namespace redial {
namespace detail {

struct error_category_impl : std::error_category {
  auto name() const noexcept -> char const* override { return "redial"; }

  auto message(int ev) const -> std::string override {
    // clang-format off
    switch (static_cast<errc>(ev)) {
      case errc::already_started:  return "Controller already started.";
      case errc::invalid_config:   return "Invalid reconnection configuration.";
      case errc::connect_failed:   return "Connect failed.";
      case errc::connection_lost:  return "Connection lost.";
      case errc::terminate_failed: return "Terminate failed.";
      case errc::hook_failed:      return "Error hook threw an exception.";
      case errc::internal_error:   return "Internal error.";
    }
    // clang-format on
    REDIAL_UNREACHABLE();
  }
};

}  // namespace detail

inline auto error_category() noexcept -> std::error_category const& {
  static detail::error_category_impl instance;
  return instance;
}

inline auto make_error_code(errc e) -> std::error_code {
  return std::error_code{static_cast<int>(e), error_category()};
}

}  // namespace redial
