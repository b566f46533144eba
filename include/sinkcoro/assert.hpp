#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define SINKCORO_LIKELY(x) __builtin_expect(!!(x), 1)
#define SINKCORO_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define SINKCORO_LIKELY(x) (x)
#define SINKCORO_UNLIKELY(x) (x)
#endif

namespace sinkcoro::detail {

[[noreturn]] inline void assert_fail(char const* expr, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void assert_fail(char const* expr, char const* msg, char const* file,
                                     int line, char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* file, int line,
                                     char const* func) noexcept;

[[noreturn]] inline void ensure_fail(char const* expr, char const* msg, char const* file,
                                     int line, char const* func) noexcept;

[[noreturn]] inline void unreachable_fail(char const* file, int line, char const* func) noexcept;

}  // namespace sinkcoro::detail

// -------------------- ASSERT --------------------
// Debug-only internal invariant checks.
#if !defined(NDEBUG)

#define SINKCORO_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define SINKCORO_ASSERT_1(expr)                        \
  (SINKCORO_LIKELY(expr) ? (void)0                     \
                         : ::sinkcoro::detail::assert_fail(#expr, __FILE__, __LINE__, __func__))

#define SINKCORO_ASSERT_2(expr, msg)                                                   \
  (SINKCORO_LIKELY(expr) ? (void)0                                                     \
                         : ::sinkcoro::detail::assert_fail(#expr, msg, __FILE__, __LINE__, \
                                                           __func__))

#define SINKCORO_ASSERT(...) \
  SINKCORO_ASSERT_SELECTOR(__VA_ARGS__, SINKCORO_ASSERT_2, SINKCORO_ASSERT_1)(__VA_ARGS__)

#else
#define SINKCORO_ASSERT(...) ((void)0)
#endif

// -------------------- ENSURE --------------------
// Always-on contract checks (broken writer contracts, misuse that would corrupt state).

#define SINKCORO_ENSURE_SELECTOR(_1, _2, NAME, ...) NAME

#define SINKCORO_ENSURE_1(expr)                        \
  (SINKCORO_LIKELY(expr) ? (void)0                     \
                         : ::sinkcoro::detail::ensure_fail(#expr, __FILE__, __LINE__, __func__))

#define SINKCORO_ENSURE_2(expr, msg)                                                   \
  (SINKCORO_LIKELY(expr) ? (void)0                                                     \
                         : ::sinkcoro::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, \
                                                           __func__))

#define SINKCORO_ENSURE(...) \
  SINKCORO_ENSURE_SELECTOR(__VA_ARGS__, SINKCORO_ENSURE_2, SINKCORO_ENSURE_1)(__VA_ARGS__)

// -------------------- UNREACHABLE --------------------

#define SINKCORO_UNREACHABLE() ::sinkcoro::detail::unreachable_fail(__FILE__, __LINE__, __func__)

#include <sinkcoro/impl/assert.ipp>
