#pragma once

#include <sinkcoro/assert.hpp>
#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/detail/scope_exit.hpp>
#include <sinkcoro/error.hpp>
#include <sinkcoro/expected.hpp>
#include <sinkcoro/io/writer_concepts.hpp>
#include <sinkcoro/item.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <system_error>
#include <type_traits>
#include <utility>

namespace sinkcoro {

/// Observable state of a `writer_sink`.
enum class sink_state {
  /// Nothing pending; the next item may be sent.
  idle,
  /// An item is pending and the next drive writes it immediately.
  draining,
  /// An item is pending and the sink is waiting on the writer: its write is outstanding, or it
  /// accepted no bytes last time.
  suspended,
  /// The writer reported an error. Terminal.
  failed,
  /// The writer was closed successfully. Terminal.
  closed,
};

/// Sink adapter over an asynchronous byte writer.
///
/// Items are pushed one at a time. Each accepted item is written to the writer in full, in
/// order and unmodified, before the next one is accepted. Partial writes are resumed from the
/// exact byte offset where they stopped, across suspensions and across abandoned operations.
///
/// Usage follows the sink discipline:
/// - `co_await async_ready()` until it succeeds, then `start_send(item)`;
///   or `co_await async_send(item)`, which does both for an idle sink.
/// - `co_await async_flush()` / `co_await async_close()` write whatever is pending first.
///
/// Writer errors are returned unchanged and leave the sink `failed`; the pending item is
/// dropped, never retried. `error::would_block` means the writer accepted no bytes: the item
/// stays pending and the caller drives the sink again (usually through `async_ready`) once the
/// writer can make progress.
///
/// Concurrency: single caller. Starting an operation while another one is suspended returns
/// `error::busy`. The sink must not be moved or destroyed while an operation is in flight;
/// destroying the operation's awaitable first is how an operation is abandoned.
template <io::async_writer Writer, byte_item Item>
class writer_sink {
 public:
  using writer_type = Writer;
  using item_type = Item;
  using result_type = expected<void, std::error_code>;

  explicit writer_sink(Writer w) noexcept(std::is_nothrow_move_constructible_v<Writer>)
      : writer_(std::move(w)) {}

  writer_sink(writer_sink const&) = delete;
  auto operator=(writer_sink const&) -> writer_sink& = delete;

  writer_sink(writer_sink&& other) noexcept(std::is_nothrow_move_constructible_v<Writer> &&
                                            std::is_nothrow_move_constructible_v<Item>)
      : writer_(std::move(other.writer_)),
        pending_(std::move(other.pending_)),
        state_(other.state_) {
    SINKCORO_ENSURE(!other.busy_, "writer_sink: moved while an operation is in flight");
    other.pending_.reset();
    other.state_ = sink_state::idle;
  }

  auto operator=(writer_sink&&) -> writer_sink& = delete;

  ~writer_sink() {
    SINKCORO_ENSURE(!busy_, "writer_sink: destroyed while an operation is in flight");
  }

  [[nodiscard]] auto state() const noexcept -> sink_state { return state_; }

  /// True if an item can be accepted right now without driving the writer.
  [[nodiscard]] auto is_ready() const noexcept -> bool {
    return state_ == sink_state::idle && !busy_;
  }

  /// Bytes of the pending item that have not reached the writer yet.
  [[nodiscard]] auto pending_bytes() const noexcept -> std::size_t {
    if (!pending_) {
      return 0;
    }
    return item_bytes(pending_->item).size() - pending_->offset;
  }

  [[nodiscard]] auto get_writer() const noexcept -> Writer const& { return writer_; }

  /// Tear the sink down and hand the writer back. Pending bytes, if any, are dropped.
  [[nodiscard]] auto release_writer() && -> Writer {
    SINKCORO_ENSURE(!busy_, "writer_sink: released while an operation is in flight");
    pending_.reset();
    return std::move(writer_);
  }

  /// Drive the pending item (if any) into the writer until the sink can accept the next one.
  ///
  /// With nothing pending this completes immediately and does not touch the writer.
  auto async_ready() -> awaitable<result_type> {
    if (auto r = check_usable(); !r) {
      co_return r;
    }
    if (!pending_) {
      co_return result_type{};
    }
    auto guard = enter_operation();
    co_return co_await drain_pending();
  }

  /// Accept `item` without writing anything. The sink must be ready.
  auto start_send(Item item) -> result_type {
    if (auto r = check_usable(); !r) {
      return r;
    }
    if (pending_) {
      return unexpected(error::not_ready);
    }
    pending_.emplace(std::move(item));
    state_ = sink_state::draining;
    return {};
  }

  /// Accept `item` and write it. Completes once every byte of it reached the writer.
  auto async_send(Item item) -> awaitable<result_type> {
    if (auto r = start_send(std::move(item)); !r) {
      co_return r;
    }
    auto guard = enter_operation();
    co_return co_await drain_pending();
  }

  /// Write whatever is pending, then flush the writer.
  auto async_flush() -> awaitable<result_type> {
    if (auto r = check_usable(); !r) {
      co_return r;
    }
    auto guard = enter_operation();
    if (auto r = co_await drain_pending(); !r) {
      co_return r;
    }

    auto r = co_await writer_.async_flush();
    if (!r) {
      fail();
    }
    co_return r;
  }

  /// Write whatever is pending, then close the writer.
  auto async_close() -> awaitable<result_type> {
    if (auto r = check_usable(); !r) {
      co_return r;
    }
    auto guard = enter_operation();
    if (auto r = co_await drain_pending(); !r) {
      co_return r;
    }

    auto r = co_await writer_.async_close();
    if (!r) {
      fail();
    } else {
      state_ = sink_state::closed;
    }
    co_return r;
  }

 private:
  struct pending_item {
    explicit pending_item(Item&& i) noexcept(std::is_nothrow_move_constructible_v<Item>)
        : item(std::move(i)) {}

    Item item;
    std::size_t offset{0};
  };

  auto check_usable() const -> result_type {
    if (busy_) {
      return unexpected(error::busy);
    }
    if (state_ == sink_state::closed) {
      return unexpected(error::sink_closed);
    }
    if (state_ == sink_state::failed) {
      return unexpected(error::sink_failed);
    }
    return {};
  }

  auto enter_operation() noexcept {
    busy_ = true;
    return detail::make_scope_exit([this]() noexcept { busy_ = false; });
  }

  void fail() noexcept {
    pending_.reset();
    state_ = sink_state::failed;
  }

  // Caller holds the operation guard.
  auto drain_pending() -> awaitable<result_type> {
    while (pending_) {
      auto const bytes = item_bytes(pending_->item);
      if (pending_->offset == bytes.size()) {
        break;
      }

      // Stays `suspended` if this frame is destroyed while the writer has the coroutine.
      state_ = sink_state::suspended;
      auto r = co_await writer_.async_write_some(bytes.subspan(pending_->offset));
      if (!r) {
        fail();
        co_return unexpected(std::move(r).error());
      }

      auto const n = *r;
      if (n == 0) {
        co_return unexpected(error::would_block);
      }
      SINKCORO_ENSURE(n <= bytes.size() - pending_->offset,
                      "writer_sink: writer reported more bytes than it was offered");

      pending_->offset += n;
      state_ = sink_state::draining;
    }

    pending_.reset();
    state_ = sink_state::idle;
    co_return result_type{};
  }

  Writer writer_;
  std::optional<pending_item> pending_{};
  sink_state state_{sink_state::idle};
  bool busy_{false};
};

/// Wrap `w` in a sink accepting `Item`s.
template <byte_item Item, io::async_writer Writer>
auto make_writer_sink(Writer w) -> writer_sink<Writer, Item> {
  return writer_sink<Writer, Item>{std::move(w)};
}

}  // namespace sinkcoro
