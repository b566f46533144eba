#pragma once

#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/expected.hpp>

#include <concepts>
#include <ranges>
#include <system_error>
#include <utility>

namespace sinkcoro::io {

/// Push-side sink capabilities used by composed operations (modelled by `writer_sink`).
template <class Sink>
concept async_sink = requires(Sink& s, typename Sink::item_type item) {
  typename Sink::item_type;
  requires std::same_as<decltype(s.async_ready()), awaitable<expected<void, std::error_code>>>;
  requires std::same_as<decltype(s.start_send(std::move(item))), expected<void, std::error_code>>;
  requires std::same_as<decltype(s.async_close()), awaitable<expected<void, std::error_code>>>;
};

/// Composed operation: send every element of `items` into `sink`, then close it.
///
/// Notes:
/// - Each item waits for `async_ready()` before `start_send()`, so the last item is written by
///   the final `async_close()`.
/// - Stops at the first failure and returns it unchanged. `error::would_block` is returned as
///   well; the sink keeps its pending item and the caller decides when to drive it again.
/// - `items` is taken by value and lives in the coroutine frame. Pass a view (or move the
///   container in) to avoid a copy.
template <async_sink Sink, std::ranges::input_range Range>
  requires std::constructible_from<typename Sink::item_type, std::ranges::range_reference_t<Range>>
auto async_forward(Sink& sink, Range items) -> awaitable<expected<void, std::error_code>> {
  using item_type = typename Sink::item_type;

  for (auto&& element : items) {
    if (auto r = co_await sink.async_ready(); !r) {
      co_return r;
    }
    if (auto r = sink.start_send(item_type(std::forward<decltype(element)>(element))); !r) {
      co_return r;
    }
  }

  co_return co_await sink.async_close();
}

}  // namespace sinkcoro::io
