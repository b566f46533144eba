#pragma once

#include <sinkcoro/assert.hpp>
#include <sinkcoro/awaitable.hpp>

#include <concepts>
#include <coroutine>
#include <type_traits>
#include <utility>

namespace sinkcoro {

/// Owning handle to a coroutine started by `co_spawn`.
///
/// The coroutine runs on the calling thread until its first suspension that is not resumed
/// inline. It is then continued by whatever resumes the suspended leaf operation. Destroying
/// an unfinished `spawned` destroys the whole coroutine chain, which abandons every operation
/// it was awaiting.
template <typename T>
class spawned {
 public:
  using handle_type = typename awaitable<T>::handle_type;

  explicit spawned(awaitable<T> a) : coro_(a.release()) {
    SINKCORO_ENSURE(coro_, "co_spawn: empty awaitable");
    coro_.resume();
  }

  ~spawned() noexcept { reset(); }

  spawned(spawned const&) = delete;
  auto operator=(spawned const&) -> spawned& = delete;

  spawned(spawned&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
  auto operator=(spawned&& other) noexcept -> spawned& {
    if (this != &other) {
      reset();
      coro_ = std::exchange(other.coro_, {});
    }
    return *this;
  }

  [[nodiscard]] auto done() const noexcept -> bool { return coro_ && coro_.done(); }

  /// Take the result of a finished coroutine, rethrowing an exception that escaped its body.
  auto get() -> T {
    SINKCORO_ENSURE(done(), "spawned: get() before completion");
    coro_.promise().rethrow_if_exception();
    return coro_.promise().take_value();
  }

  /// Destroy the coroutine (finished or not).
  void reset() noexcept {
    if (coro_) {
      std::exchange(coro_, {}).destroy();
    }
  }

 private:
  handle_type coro_{};
};

namespace detail {

template <typename A>
struct awaitable_value;

template <typename T>
struct awaitable_value<awaitable<T>> {
  using type = T;
};

template <class F>
using awaitable_value_t =
  typename awaitable_value<std::remove_cvref_t<std::invoke_result_t<F&>>>::type;

template <class F>
concept awaitable_factory = std::invocable<F&> && requires { typename awaitable_value_t<F>; };

// The factory is a coroutine parameter, so it lives in this frame until the produced
// awaitable has finished. Coroutine lambdas with captures stay valid this way.
template <typename T, typename F>
auto run_factory(F f) -> awaitable<T> {
  if constexpr (std::is_void_v<T>) {
    co_await f();
  } else {
    co_return co_await f();
  }
}

}  // namespace detail

/// Start an awaitable on the calling thread.
template <typename T>
auto co_spawn(awaitable<T> a) -> spawned<T> {
  return spawned<T>{std::move(a)};
}

/// Start a callable that returns `sinkcoro::awaitable<T>` on the calling thread.
///
/// Prefer this overload for coroutine lambdas with captures: `co_spawn([&] ... {}())` would
/// leave the coroutine referring to a destroyed closure once the full-expression ends.
template <typename F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
auto co_spawn(F&& f) -> spawned<detail::awaitable_value_t<std::remove_cvref_t<F>>> {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<F>>;
  return spawned<value_type>{
    detail::run_factory<value_type>(std::remove_cvref_t<F>(std::forward<F>(f)))};
}

}  // namespace sinkcoro
