#pragma once

#include <sinkcoro/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace sinkcoro::detail {

[[noreturn]] inline void report_and_abort(char const* kind, char const* expr, char const* msg,
                                          char const* file, int line, char const* func) noexcept {
  std::fprintf(stderr, "[sinkcoro] %s failure\n", kind);
  if (expr) {
    std::fprintf(stderr, "  expression: %s\n", expr);
  }
  if (msg) {
    std::fprintf(stderr, "  message   : %s\n", msg);
  }
  std::fprintf(stderr,
               "  location  : %s:%d\n"
               "  function  : %s\n",
               file, line, func);
  std::fflush(stderr);
  std::abort();
}

inline void assert_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  report_and_abort("ASSERT", expr, nullptr, file, line, func);
}

inline void assert_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  report_and_abort("ASSERT", expr, msg, file, line, func);
}

inline void ensure_fail(char const* expr, char const* file, int line, char const* func) noexcept {
  report_and_abort("ENSURE", expr, nullptr, file, line, func);
}

inline void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  report_and_abort("ENSURE", expr, msg, file, line, func);
}

inline void unreachable_fail(char const* file, int line, char const* func) noexcept {
  report_and_abort("UNREACHABLE", nullptr, nullptr, file, line, func);
}

}  // namespace sinkcoro::detail
