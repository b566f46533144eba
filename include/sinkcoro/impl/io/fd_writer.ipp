#pragma once

#include <sinkcoro/io/fd_writer.hpp>

#include <cerrno>
#include <utility>

#include <unistd.h>

namespace sinkcoro::io {

inline fd_writer::fd_writer(int fd) noexcept : fd_(fd) {}

inline fd_writer::fd_writer(int fd, options opts) noexcept : fd_(fd), opts_(opts) {}

inline fd_writer::~fd_writer() { reset(); }

inline fd_writer::fd_writer(fd_writer&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), opts_(other.opts_) {}

inline auto fd_writer::operator=(fd_writer&& other) noexcept -> fd_writer& {
  if (this != &other) {
    reset();
    fd_ = std::exchange(other.fd_, -1);
    opts_ = other.opts_;
  }
  return *this;
}

inline void fd_writer::reset() noexcept {
  auto fd = std::exchange(fd_, -1);
  if (fd >= 0 && opts_.close_on_close) {
    // Nothing useful can be done with a close() failure during teardown.
    (void)::close(fd);
  }
}

inline auto fd_writer::write_some(std::span<std::byte const> buf) noexcept
  -> expected<std::size_t, std::error_code> {
  if (fd_ < 0) {
    return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
  }
  if (buf.empty()) {
    return std::size_t{0};
  }

  for (;;) {
    auto const n = ::write(fd_, buf.data(), buf.size());
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return std::size_t{0};
    }
    return unexpected(std::error_code(errno, std::system_category()));
  }
}

inline auto fd_writer::flush() noexcept -> expected<void, std::error_code> {
  if (fd_ < 0) {
    return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
  }
  if (!opts_.sync_on_flush) {
    return {};
  }

  for (;;) {
    if (::fdatasync(fd_) == 0) {
      return {};
    }
    if (errno == EINTR) {
      continue;
    }
    // Pipes, sockets and terminals cannot be synced; there is nothing to persist.
    if (errno == EINVAL || errno == EROFS) {
      return {};
    }
    return unexpected(std::error_code(errno, std::system_category()));
  }
}

inline auto fd_writer::close() noexcept -> expected<void, std::error_code> {
  if (fd_ < 0) {
    return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
  }

  auto const fd = std::exchange(fd_, -1);
  if (!opts_.close_on_close) {
    return {};
  }
  // On Linux the descriptor is released even if close() reports EINTR.
  if (::close(fd) != 0 && errno != EINTR) {
    return unexpected(std::error_code(errno, std::system_category()));
  }
  return {};
}

inline auto fd_writer::async_write_some(std::span<std::byte const> buf)
  -> awaitable<expected<std::size_t, std::error_code>> {
  co_return write_some(buf);
}

inline auto fd_writer::async_flush() -> awaitable<expected<void, std::error_code>> {
  co_return flush();
}

inline auto fd_writer::async_close() -> awaitable<expected<void, std::error_code>> {
  co_return close();
}

}  // namespace sinkcoro::io
