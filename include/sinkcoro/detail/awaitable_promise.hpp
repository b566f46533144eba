#pragma once

#include <sinkcoro/assert.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace sinkcoro {
template <typename T>
class awaitable;
}  // namespace sinkcoro

namespace sinkcoro::detail {

struct awaitable_promise_base {
  std::coroutine_handle<> continuation_{};
  std::exception_ptr exception_{};

  awaitable_promise_base() noexcept = default;

  std::suspend_always initial_suspend() noexcept { return {}; }

  auto final_suspend() noexcept {
    struct final_awaiter {
      awaitable_promise_base* self;

      bool await_ready() noexcept { return false; }

      // Resume the awaiting coroutine inline (symmetric transfer). A top-level coroutine
      // (started by co_spawn) has no continuation and simply stays suspended until its
      // owner destroys it.
      auto await_suspend(std::coroutine_handle<>) noexcept -> std::coroutine_handle<> {
        auto cont = std::exchange(self->continuation_, std::coroutine_handle<>{});
        if (!cont) {
          return std::noop_coroutine();
        }
        return cont;
      }

      void await_resume() noexcept {}
    };

    return final_awaiter{this};
  }

  void set_continuation(std::coroutine_handle<> h) noexcept { continuation_ = h; }

  void unhandled_exception() noexcept { exception_ = std::current_exception(); }

  void rethrow_if_exception() {
    if (exception_) {
      std::rethrow_exception(std::exchange(exception_, nullptr));
    }
  }
};

template <typename T>
struct awaitable_promise final : awaitable_promise_base {
  std::optional<T> value_{};

  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<T>;

  template <typename U>
    requires std::convertible_to<U, T>
  void return_value(U&& v) {
    value_.emplace(std::forward<U>(v));
  }

  auto take_value() -> T {
    SINKCORO_ASSERT(value_.has_value(), "awaitable: result taken twice or never produced");
    auto v = std::move(*value_);
    value_.reset();
    return v;
  }
};

template <>
struct awaitable_promise<void> final : awaitable_promise_base {
  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<void>;
  void return_void() noexcept {}

  void take_value() noexcept {}
};

}  // namespace sinkcoro::detail
