#pragma once

#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/expected.hpp>

#include <cstddef>
#include <span>
#include <system_error>

namespace sinkcoro::io {

struct fd_writer_options {
  /// `async_close()` and the destructor close the descriptor. Otherwise it is only released.
  bool close_on_close{true};
  /// `async_flush()` calls `fdatasync()`. Otherwise flushing is a no-op.
  bool sync_on_flush{false};
};

/// Writer over a POSIX file descriptor.
///
/// Every operation completes inline with a single system call; the writer never suspends.
/// On a non-blocking descriptor, `EAGAIN` / `EWOULDBLOCK` is reported as 0 bytes written
/// (no progress), which a `writer_sink` turns into `error::would_block` while keeping the
/// pending item. Other failures are reported as `errno` in `std::system_category()`.
class fd_writer {
 public:
  using options = fd_writer_options;

  fd_writer() noexcept = default;
  explicit fd_writer(int fd) noexcept;
  fd_writer(int fd, options opts) noexcept;

  ~fd_writer();

  fd_writer(fd_writer const&) = delete;
  auto operator=(fd_writer const&) -> fd_writer& = delete;

  fd_writer(fd_writer&& other) noexcept;
  auto operator=(fd_writer&& other) noexcept -> fd_writer&;

  [[nodiscard]] auto native_handle() const noexcept -> int { return fd_; }
  [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }
  [[nodiscard]] auto get_options() const noexcept -> options { return opts_; }

  auto async_write_some(std::span<std::byte const> buf)
    -> awaitable<expected<std::size_t, std::error_code>>;

  auto async_flush() -> awaitable<expected<void, std::error_code>>;

  auto async_close() -> awaitable<expected<void, std::error_code>>;

  /// Synchronous primitives behind the async operations.
  auto write_some(std::span<std::byte const> buf) noexcept
    -> expected<std::size_t, std::error_code>;
  auto flush() noexcept -> expected<void, std::error_code>;
  auto close() noexcept -> expected<void, std::error_code>;

 private:
  void reset() noexcept;

  int fd_{-1};
  options opts_{};
};

}  // namespace sinkcoro::io

#include <sinkcoro/impl/io/fd_writer.ipp>
