#pragma once

#include <redial/error.hpp>

#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace redial {

/// Error value passed through the reconnection loop.
///
/// - `code`: stable error_code (domain + value), compared by callers and error hooks
/// - `detail`: optional human-oriented context
/// - `cause_ec`: optional underlying error_code (no nesting)
struct error_info {
  std::error_code code{};
  std::string detail{};
  std::error_code cause_ec{};

  error_info() = default;

  explicit error_info(std::error_code c) : code(c) {}

  error_info(std::error_code c, std::string d) : code(c), detail(std::move(d)) {}

  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  explicit error_info(Errc e) : code(make_error_code(e)) {}

  template <typename Errc>
    requires std::is_error_code_enum_v<Errc>
  error_info(Errc e, std::string d) : code(make_error_code(e)), detail(std::move(d)) {}

  auto append_detail(std::string_view s) -> error_info& {
    if (s.empty()) {
      return *this;
    }
    if (!detail.empty()) {
      detail += " ";
    }
    detail.append(s.data(), s.size());
    return *this;
  }

  auto set_cause(std::error_code ec) -> error_info& {
    cause_ec = ec;
    return *this;
  }

  [[nodiscard]] auto is(errc e) const noexcept -> bool { return code == make_error_code(e); }

  [[nodiscard]] auto to_string() const -> std::string {
    std::string out;

    if (code) {
      out += code.category().name();
      out += ": ";
      out += code.message();
    } else {
      out += "unknown error";
    }

    if (!detail.empty()) {
      out += " (";
      out += detail;
      out += ")";
      return out;
    }

    if (cause_ec) {
      out += " (cause=";
      out += cause_ec.category().name();
      out += ": ";
      out += cause_ec.message();
      out += ")";
    }

    return out;
  }

  friend auto operator==(error_info const& a, error_info const& b) -> bool {
    return a.code == b.code && a.detail == b.detail && a.cause_ec == b.cause_ec;
  }
};

}  // namespace redial
