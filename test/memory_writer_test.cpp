#include <gtest/gtest.h>

#include <sinkcoro/io/memory_writer.hpp>
#include <sinkcoro/io/writer_concepts.hpp>

#include "test_util.hpp"

#include <array>
#include <cstddef>
#include <cstring>
#include <span>
#include <system_error>

static_assert(sinkcoro::io::async_writer<sinkcoro::io::memory_writer>);

TEST(memory_writer_test, appends_up_to_max_chunk) {
  sinkcoro::io::memory_writer w{2};

  std::array<std::byte, 5> buf{};
  std::memcpy(buf.data(), "abcde", buf.size());

  auto r = sinkcoro::test::sync_wait(w.async_write_some(std::span<std::byte const>{buf}));

  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 2U);
  EXPECT_EQ(w.str(), "ab");
  EXPECT_EQ(w.write_calls(), 1U);
}

TEST(memory_writer_test, zero_chunk_accepts_nothing) {
  sinkcoro::io::memory_writer w{0};

  std::array<std::byte, 1> buf{std::byte{'x'}};
  auto r = sinkcoro::test::sync_wait(w.async_write_some(std::span<std::byte const>{buf}));

  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 0U);
  EXPECT_TRUE(w.data().empty());
}

TEST(memory_writer_test, counts_flushes_and_rejects_use_after_close) {
  sinkcoro::io::memory_writer w;

  ASSERT_TRUE(sinkcoro::test::sync_wait(w.async_flush()));
  ASSERT_TRUE(sinkcoro::test::sync_wait(w.async_close()));
  EXPECT_EQ(w.flush_calls(), 1U);
  EXPECT_TRUE(w.is_closed());

  auto const ebadf = std::make_error_code(std::errc::bad_file_descriptor);
  std::array<std::byte, 1> buf{};
  EXPECT_EQ(sinkcoro::test::sync_wait(w.async_write_some(std::span<std::byte const>{buf})).error(),
            ebadf);
  EXPECT_EQ(sinkcoro::test::sync_wait(w.async_flush()).error(), ebadf);
  EXPECT_EQ(sinkcoro::test::sync_wait(w.async_close()).error(), ebadf);
}

TEST(memory_writer_test, take_moves_bytes_out) {
  sinkcoro::io::memory_writer w;
  auto bytes = sinkcoro::test::to_bytes("payload");
  ASSERT_TRUE(sinkcoro::test::sync_wait(w.async_write_some(std::span<std::byte const>{bytes})));

  auto out = std::move(w).take();

  EXPECT_EQ(sinkcoro::test::to_string(out), "payload");
}
