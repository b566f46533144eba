#pragma once

#include <sinkcoro/assert.hpp>
#include <sinkcoro/detail/awaitable_promise.hpp>

#include <coroutine>
#include <exception>
#include <utility>

namespace sinkcoro {

/// Lazily started coroutine producing a `T`.
///
/// The body does not run until the awaitable is `co_await`ed (or started by `co_spawn`).
/// When the body finishes, the awaiting coroutine is resumed inline on the same thread.
/// There is no executor: whoever resumes a suspended leaf operation drives the whole chain.
template <typename T>
class awaitable {
 public:
  using promise_type = detail::awaitable_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  /// Owning handle wrapper for an `awaitable_promise<T>` coroutine.
  ///
  /// IMPORTANT: This type owns the coroutine frame. If it still owns a handle on destruction,
  /// it will `destroy()` the coroutine, together with every awaitable the frame holds. This is
  /// how an in-flight operation is abandoned.
  explicit awaitable(handle_type h) noexcept : coro_(h) {}
  ~awaitable() noexcept {
    if (coro_) {
      coro_.destroy();
    }
  }

  awaitable(awaitable const&) = delete;
  auto operator=(awaitable const&) -> awaitable& = delete;

  awaitable(awaitable&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
  auto operator=(awaitable&& other) noexcept -> awaitable& {
    if (this != &other) {
      if (coro_) {
        coro_.destroy();
      }
      coro_ = std::exchange(other.coro_, {});
    }
    return *this;
  }

  /// Release ownership of the coroutine handle without destroying it.
  ///
  /// SAFETY: After `release()`, the caller becomes responsible for eventually destroying the
  /// handle (or transferring ownership elsewhere).
  [[nodiscard]] auto release() noexcept -> handle_type { return std::exchange(coro_, {}); }

  bool await_ready() const noexcept { return false; }

  auto await_suspend(std::coroutine_handle<> h) noexcept -> std::coroutine_handle<> {
    SINKCORO_ENSURE(coro_ && !coro_.done(), "awaitable: awaiting an empty or finished coroutine");
    coro_.promise().set_continuation(h);
    return coro_;
  }

  auto await_resume() -> T {
    coro_.promise().rethrow_if_exception();
    return coro_.promise().take_value();
  }

 private:
  handle_type coro_;
};

}  // namespace sinkcoro

namespace sinkcoro::detail {

template <typename T>
auto awaitable_promise<T>::get_return_object() -> awaitable<T> {
  using promise_t = awaitable_promise<T>;
  return awaitable<T>{std::coroutine_handle<promise_t>::from_promise(*this)};
}

inline auto awaitable_promise<void>::get_return_object() -> awaitable<void> {
  using promise_t = awaitable_promise<void>;
  return awaitable<void>{std::coroutine_handle<promise_t>::from_promise(*this)};
}

}  // namespace sinkcoro::detail
