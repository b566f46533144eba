#pragma once

#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/co_spawn.hpp>

#include <coroutine>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sinkcoro::test {

/// Run the awaitable on the calling thread; return its value or rethrow its exception.
///
/// Test utility (not part of the library API). Everything the awaitable waits on must
/// complete inline; a coroutine left suspended is reported as a logic_error.
template <typename T>
auto sync_wait(awaitable<T> a) -> T {
  auto task = co_spawn(std::move(a));
  if (!task.done()) {
    throw std::logic_error("sync_wait: awaitable suspended with nothing to resume it");
  }
  return task.get();
}

template <typename F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
auto sync_wait(F&& f) -> detail::awaitable_value_t<std::remove_cvref_t<F>> {
  auto task = co_spawn(std::forward<F>(f));
  if (!task.done()) {
    throw std::logic_error("sync_wait: awaitable suspended with nothing to resume it");
  }
  return task.get();
}

/// Manually released suspension point.
///
/// `co_await g.wait()` always suspends; the test resumes the parked coroutine with `release()`.
/// Models a writer whose transport is not ready yet.
class gate {
 public:
  auto wait() noexcept {
    struct awaiter {
      gate* self;

      bool await_ready() const noexcept { return false; }
      void await_suspend(std::coroutine_handle<> h) noexcept { self->waiter_ = h; }
      void await_resume() const noexcept {}
    };
    return awaiter{this};
  }

  [[nodiscard]] auto has_waiter() const noexcept -> bool { return static_cast<bool>(waiter_); }

  /// Resume the parked coroutine (runs inline until its next suspension).
  void release() {
    if (!waiter_) {
      throw std::logic_error("gate: nothing to release");
    }
    std::exchange(waiter_, {}).resume();
  }

  /// Forget the parked coroutine after its owner destroyed it.
  void forget() noexcept { waiter_ = {}; }

 private:
  std::coroutine_handle<> waiter_{};
};

inline auto to_string(std::vector<std::byte> const& v) -> std::string {
  return std::string(reinterpret_cast<char const*>(v.data()), v.size());
}

inline auto to_bytes(std::string_view s) -> std::vector<std::byte> {
  auto const* p = reinterpret_cast<std::byte const*>(s.data());
  return std::vector<std::byte>(p, p + s.size());
}

}  // namespace sinkcoro::test
