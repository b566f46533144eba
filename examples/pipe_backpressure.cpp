// pipe_backpressure.cpp
//
// Purpose:
//   Show how a writer_sink reports backpressure. A large item is sent into a non-blocking
//   pipe; the pipe fills, the sink reports `error::would_block` and keeps the rest of the
//   item. The reader drains the pipe and the sink is driven again with async_ready() until
//   the item has been written completely.

#include <sinkcoro/sinkcoro.hpp>

#include <cstddef>
#include <iostream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace {

auto drain_pipe(int fd) -> std::size_t {
  char buf[4096];
  std::size_t total = 0;
  for (;;) {
    auto const n = ::read(fd, buf, sizeof(buf));
    if (n <= 0) {
      return total;
    }
    total += static_cast<std::size_t>(n);
  }
}

template <typename T>
auto run(sinkcoro::awaitable<T> a) -> T {
  auto task = sinkcoro::co_spawn(std::move(a));
  SINKCORO_ENSURE(task.done(), "fd_writer never suspends");
  return task.get();
}

}  // namespace

int main() {
  int fds[2];
  if (::pipe(fds) != 0) {
    std::cerr << "pipe_backpressure: pipe failed\n";
    return 1;
  }
  for (int fd : fds) {
    auto const flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
      std::cerr << "pipe_backpressure: fcntl failed\n";
      ::close(fds[0]);
      ::close(fds[1]);
      return 1;
    }
  }

  auto sink = sinkcoro::make_writer_sink<std::string>(sinkcoro::io::fd_writer{fds[1]});
  std::string const payload(256 * 1024, 'x');

  auto r = run(sink.async_send(payload));
  std::size_t received = 0;
  int rounds = 0;
  while (!r && r.error() == sinkcoro::error::would_block) {
    ++rounds;
    std::cout << "round " << rounds << ": " << sink.pending_bytes() << " bytes pending\n";
    received += drain_pipe(fds[0]);
    r = run(sink.async_ready());
  }
  if (!r) {
    std::cerr << "pipe_backpressure: " << r.error().message() << "\n";
    return 1;
  }

  if (auto c = run(sink.async_close()); !c) {
    std::cerr << "pipe_backpressure: close: " << c.error().message() << "\n";
    return 1;
  }
  received += drain_pipe(fds[0]);
  ::close(fds[0]);

  std::cout << "sent " << payload.size() << " bytes, received " << received << " bytes in "
            << rounds + 1 << " rounds\n";
  return received == payload.size() ? 0 : 1;
}
