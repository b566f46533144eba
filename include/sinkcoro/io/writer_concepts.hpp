#pragma once

#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/expected.hpp>

#include <concepts>
#include <cstddef>
#include <span>
#include <system_error>

namespace sinkcoro::io {

/// Asynchronous byte writer wrapped by `writer_sink`.
///
/// IMPORTANT: concepts cannot enforce semantics. The following contracts are normative.
///
/// async_write_some contract:
/// - On success, returns the number of bytes accepted, `n <= buf.size()`, taken from the
///   front of `buf`.
/// - Returning `n == 0` means the writer cannot make progress right now. It is not an error;
///   the caller may try again later.
/// - The returned awaitable may suspend (transport not ready). If the awaiting coroutine is
///   destroyed while suspended, whether any bytes were consumed is the writer's business.
///
/// async_flush / async_close contract:
/// - Complete once the writer has persisted (flush) or finished (close) everything accepted
///   so far, or fail with an error. Either may suspend.
/// - After a successful close no further call is meaningful.
///
/// Error codes:
/// - Any `std::error_code`. Writers typically report `errno` values in `std::system_category()`.
template <class Writer>
concept async_writer = std::movable<Writer> &&
  requires(Writer& w, std::span<std::byte const> wbuf) {
    requires std::same_as<decltype(w.async_write_some(wbuf)),
                          awaitable<expected<std::size_t, std::error_code>>>;
    requires std::same_as<decltype(w.async_flush()), awaitable<expected<void, std::error_code>>>;
    requires std::same_as<decltype(w.async_close()), awaitable<expected<void, std::error_code>>>;
  };

}  // namespace sinkcoro::io
