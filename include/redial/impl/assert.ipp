#pragma once

#include <redial/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace redial::detail {

namespace assert_impl {

[[noreturn]] inline void fail(char const* kind, char const* expr, char const* msg,
                              char const* file, int line, char const* func) noexcept {
  if (msg) {
    std::fprintf(stderr,
                 "[redial] %s failure\n"
                 "  expression: %s\n"
                 "  message   : %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", msg, file, line, func);
  } else {
    std::fprintf(stderr,
                 "[redial] %s failure\n"
                 "  expression: %s\n"
                 "  location  : %s:%d\n"
                 "  function  : %s\n",
                 kind, expr ? expr : "(none)", file, line, func);
  }
  std::fflush(stderr);
  std::abort();
}

}  // namespace assert_impl

inline void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  assert_impl::fail("ASSERT", expr, nullptr, file, line, func);
}

inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  assert_impl::fail("ASSERT", expr, msg, file, line, func);
}

inline void ensure_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  assert_impl::fail("ENSURE", expr, nullptr, file, line, func);
}

inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  assert_impl::fail("ENSURE", expr, msg, file, line, func);
}

inline void unreachable_fail(char const* file, int line, char const* func) noexcept {
  assert_impl::fail("UNREACHABLE", nullptr, nullptr, file, line, func);
}

}  // namespace redial::detail
