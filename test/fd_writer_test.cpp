#include <gtest/gtest.h>

#include <sinkcoro/error.hpp>
#include <sinkcoro/io/fd_writer.hpp>
#include <sinkcoro/io/forward.hpp>
#include <sinkcoro/writer_sink.hpp>

#include "test_util.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <ranges>
#include <span>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

static_assert(sinkcoro::io::async_writer<sinkcoro::io::fd_writer>);

namespace {

struct pipe_fds {
  int read_end{-1};
  int write_end{-1};

  pipe_fds() {
    int fds[2]{-1, -1};
    if (::pipe(fds) != 0) {
      throw std::system_error(errno, std::system_category(), "pipe");
    }
    read_end = fds[0];
    write_end = fds[1];
  }

  ~pipe_fds() {
    if (read_end >= 0) {
      (void)::close(read_end);
    }
    if (write_end >= 0) {
      (void)::close(write_end);
    }
  }

  pipe_fds(pipe_fds const&) = delete;
  auto operator=(pipe_fds const&) -> pipe_fds& = delete;

  /// Hand the write end over to a writer.
  auto take_write_end() noexcept -> int { return std::exchange(write_end, -1); }

  auto read_available() const -> std::string {
    std::string out;
    std::array<char, 4096> buf{};
    for (;;) {
      auto const n = ::read(read_end, buf.data(), buf.size());
      if (n <= 0) {
        break;
      }
      out.append(buf.data(), static_cast<std::size_t>(n));
    }
    return out;
  }
};

void set_nonblocking(int fd) {
  auto const flags = ::fcntl(fd, F_GETFL, 0);
  ASSERT_GE(flags, 0);
  ASSERT_EQ(::fcntl(fd, F_SETFL, flags | O_NONBLOCK), 0);
}

}  // namespace

TEST(fd_writer_test, default_constructed_writer_is_not_open) {
  sinkcoro::io::fd_writer w;

  EXPECT_FALSE(w.is_open());
  auto r = w.write_some(std::span<std::byte const>{});
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), std::make_error_code(std::errc::bad_file_descriptor));
}

TEST(fd_writer_test, sink_over_pipe_delivers_items_and_closes) {
  pipe_fds p;
  set_nonblocking(p.read_end);
  auto sink = sinkcoro::make_writer_sink<std::string_view>(
    sinkcoro::io::fd_writer{p.take_write_end()});

  std::vector<std::string_view> const items{"hello", " ", "pipe"};
  auto r = sinkcoro::test::sync_wait(sinkcoro::io::async_forward(sink, std::views::all(items)));

  ASSERT_TRUE(r);
  EXPECT_FALSE(sink.get_writer().is_open());
  EXPECT_EQ(p.read_available(), "hello pipe");
}

TEST(fd_writer_test, full_nonblocking_pipe_reports_would_block_then_resumes) {
  pipe_fds p;
  set_nonblocking(p.read_end);
  set_nonblocking(p.write_end);

  // Larger than any default pipe buffer.
  std::string const big(1 << 20, 'z');
  auto sink = sinkcoro::make_writer_sink<std::string>(
    sinkcoro::io::fd_writer{p.take_write_end()});

  auto r = sinkcoro::test::sync_wait(sink.async_send(big));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), sinkcoro::error::would_block);
  EXPECT_EQ(sink.state(), sinkcoro::sink_state::suspended);
  ASSERT_GT(sink.pending_bytes(), 0U);
  ASSERT_LT(sink.pending_bytes(), big.size());

  std::string received;
  while (!sink.is_ready()) {
    received += p.read_available();
    auto again = sinkcoro::test::sync_wait(sink.async_ready());
    if (!again) {
      ASSERT_EQ(again.error(), sinkcoro::error::would_block);
    }
  }
  ASSERT_TRUE(sinkcoro::test::sync_wait(sink.async_close()));
  received += p.read_available();

  EXPECT_EQ(received.size(), big.size());
  EXPECT_EQ(received, big);
}

TEST(fd_writer_test, write_to_pipe_without_reader_reports_epipe) {
  std::signal(SIGPIPE, SIG_IGN);

  pipe_fds p;
  (void)::close(std::exchange(p.read_end, -1));
  auto sink = sinkcoro::make_writer_sink<std::string>(
    sinkcoro::io::fd_writer{p.take_write_end()});

  auto r = sinkcoro::test::sync_wait(sink.async_send(std::string{"lost"}));

  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), std::error_code(EPIPE, std::system_category()));
  EXPECT_EQ(sink.state(), sinkcoro::sink_state::failed);
}

TEST(fd_writer_test, flush_with_sync_on_pipe_succeeds) {
  pipe_fds p;
  set_nonblocking(p.read_end);
  sinkcoro::io::fd_writer w{p.take_write_end(), {.close_on_close = true, .sync_on_flush = true}};

  auto bytes = sinkcoro::test::to_bytes("x");
  ASSERT_TRUE(sinkcoro::test::sync_wait(w.async_write_some(std::span<std::byte const>{bytes})));
  EXPECT_TRUE(sinkcoro::test::sync_wait(w.async_flush()));
  EXPECT_EQ(p.read_available(), "x");
}

TEST(fd_writer_test, close_without_ownership_leaves_descriptor_open) {
  pipe_fds p;
  set_nonblocking(p.read_end);
  sinkcoro::io::fd_writer w{p.write_end, {.close_on_close = false, .sync_on_flush = false}};

  ASSERT_TRUE(sinkcoro::test::sync_wait(w.async_close()));
  EXPECT_FALSE(w.is_open());

  // Still usable by its real owner.
  ASSERT_EQ(::write(p.write_end, "k", 1), 1);
  EXPECT_EQ(p.read_available(), "k");

  auto again = sinkcoro::test::sync_wait(w.async_close());
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), std::make_error_code(std::errc::bad_file_descriptor));
}

TEST(fd_writer_test, moved_from_writer_does_not_close_descriptor) {
  pipe_fds p;
  set_nonblocking(p.read_end);
  sinkcoro::io::fd_writer a{p.take_write_end()};
  auto const fd = a.native_handle();

  sinkcoro::io::fd_writer b{std::move(a)};

  EXPECT_FALSE(a.is_open());
  EXPECT_EQ(b.native_handle(), fd);
  auto bytes = sinkcoro::test::to_bytes("m");
  auto r = b.write_some(std::span<std::byte const>{bytes});
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 1U);
}
