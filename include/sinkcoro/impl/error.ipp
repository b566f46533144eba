#pragma once

#include <sinkcoro/error.hpp>

#include <string>

namespace sinkcoro {

namespace detail {

class error_category_impl : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "sinkcoro"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      // Flow control
      case error::would_block:
        return "operation would block";
      case error::busy:
        return "sink busy";
      case error::not_ready:
        return "sink not ready";

      // Terminal states
      case error::sink_closed:
        return "sink closed";
      case error::sink_failed:
        return "sink failed";
      default:
        return "unknown error";
    }
  }
};

inline auto error_category() -> std::error_category const& {
  static error_category_impl instance;
  return instance;
}

}  // namespace detail

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), detail::error_category()};
}

}  // namespace sinkcoro
