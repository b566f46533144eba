#pragma once

#include <sinkcoro/awaitable.hpp>
#include <sinkcoro/expected.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <span>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace sinkcoro::io {

/// Writer that appends into an owned byte vector. Never suspends.
///
/// `max_chunk` caps how many bytes a single `async_write_some` accepts, which makes partial
/// writes easy to provoke; a cap of 0 makes every write accept nothing.
class memory_writer {
 public:
  memory_writer() noexcept = default;
  explicit memory_writer(std::size_t max_chunk) noexcept : max_chunk_(max_chunk) {}

  auto async_write_some(std::span<std::byte const> buf)
    -> awaitable<expected<std::size_t, std::error_code>> {
    if (closed_) {
      co_return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
    }
    ++write_calls_;
    auto const n = (std::min)(buf.size(), max_chunk_);
    data_.insert(data_.end(), buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n));
    co_return n;
  }

  auto async_flush() -> awaitable<expected<void, std::error_code>> {
    if (closed_) {
      co_return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
    }
    ++flush_calls_;
    co_return expected<void, std::error_code>{};
  }

  auto async_close() -> awaitable<expected<void, std::error_code>> {
    if (closed_) {
      co_return unexpected(std::make_error_code(std::errc::bad_file_descriptor));
    }
    closed_ = true;
    co_return expected<void, std::error_code>{};
  }

  [[nodiscard]] auto data() const noexcept -> std::span<std::byte const> { return data_; }

  [[nodiscard]] auto str() const -> std::string {
    return std::string(reinterpret_cast<char const*>(data_.data()), data_.size());
  }

  /// Move the written bytes out.
  [[nodiscard]] auto take() && noexcept -> std::vector<std::byte> { return std::move(data_); }

  [[nodiscard]] auto write_calls() const noexcept -> std::size_t { return write_calls_; }
  [[nodiscard]] auto flush_calls() const noexcept -> std::size_t { return flush_calls_; }
  [[nodiscard]] auto is_closed() const noexcept -> bool { return closed_; }

  void set_max_chunk(std::size_t n) noexcept { max_chunk_ = n; }

 private:
  std::vector<std::byte> data_{};
  std::size_t max_chunk_{(std::numeric_limits<std::size_t>::max)()};
  std::size_t write_calls_{0};
  std::size_t flush_calls_{0};
  bool closed_{false};
};

}  // namespace sinkcoro::io
