#pragma once

#include <cstdlib>

#if defined(__GNUC__) || defined(__clang__)
#define REDIAL_LIKELY(x) __builtin_expect(!!(x), 1)
#define REDIAL_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define REDIAL_LIKELY(x) (x)
#define REDIAL_UNLIKELY(x) (x)
#endif

namespace redial::detail {

[[noreturn]] inline void assert_fail(char const* expr, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void unreachable_fail(char const* file, int line, char const* func) noexcept;

}  // namespace redial::detail

// -------------------- ASSERT --------------------
// Debug-only invariant check. Compiled out under NDEBUG.
#if !defined(NDEBUG)

#define REDIAL_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define REDIAL_ASSERT_1(expr)    \
  (REDIAL_LIKELY(expr) ? (void)0 \
                       : ::redial::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define REDIAL_ASSERT_2(expr, msg) \
  (REDIAL_LIKELY(expr)             \
     ? (void)0                     \
     : ::redial::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define REDIAL_ASSERT(...) \
  REDIAL_ASSERT_SELECTOR(__VA_ARGS__, REDIAL_ASSERT_2, REDIAL_ASSERT_1)(__VA_ARGS__)

#else
#define REDIAL_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------
// Always-on precondition check.

#define REDIAL_ENSURE_SELECTOR(_1, _2, NAME, ...) NAME

#define REDIAL_ENSURE_1(expr)    \
  (REDIAL_LIKELY(expr) ? (void)0 \
                       : ::redial::detail::ensure_fail(#expr, __FILE__, __LINE__, __func__))

#define REDIAL_ENSURE_2(expr, msg) \
  (REDIAL_LIKELY(expr)             \
     ? (void)0                     \
     : ::redial::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define REDIAL_ENSURE(...) \
  REDIAL_ENSURE_SELECTOR(__VA_ARGS__, REDIAL_ENSURE_2, REDIAL_ENSURE_1)(__VA_ARGS__)

// -------------------- UNREACHABLE --------------------

#define REDIAL_UNREACHABLE() ::redial::detail::unreachable_fail(__FILE__, __LINE__, __func__)

#include <redial/impl/assert.ipp>
