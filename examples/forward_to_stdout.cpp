// forward_to_stdout.cpp
//
// Purpose:
//   Minimal runnable example: forward a sequence of strings into a writer_sink wrapping
//   standard output, then close it.
//
// Notes:
//   - fd_writer completes every operation inline, so co_spawn runs the whole pipeline
//     before returning.
//   - stdout is duplicated so closing the sink does not close the process's stdout.

#include <sinkcoro/sinkcoro.hpp>

#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

namespace {

auto demo(sinkcoro::writer_sink<sinkcoro::io::fd_writer, std::string>& sink)
  -> sinkcoro::awaitable<sinkcoro::expected<void, std::error_code>> {
  std::vector<std::string> lines{"hello", ", ", "world", "\n"};
  co_return co_await sinkcoro::io::async_forward(sink, std::move(lines));
}

}  // namespace

int main() {
  auto const fd = ::dup(STDOUT_FILENO);
  if (fd < 0) {
    std::cerr << "forward_to_stdout: dup failed\n";
    return 1;
  }

  auto sink = sinkcoro::make_writer_sink<std::string>(sinkcoro::io::fd_writer{fd});
  auto task = sinkcoro::co_spawn(demo(sink));
  if (!task.done()) {
    std::cerr << "forward_to_stdout: pipeline did not complete\n";
    return 1;
  }

  auto r = task.get();
  if (!r) {
    std::cerr << "forward_to_stdout: " << r.error().message() << "\n";
    return 1;
  }
  return 0;
}
