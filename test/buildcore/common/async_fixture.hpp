#pragma once

#include <chrono>
#include <exception>

#include <asio.hpp>
#include <catch2/catch_all.hpp>

namespace buildcore::test {

// Reusable async test runner for coroutine-based tests. Runs the io_context
// until all work (timers, detached coroutines) has drained.
template <typename F>
void RunAsyncTest(F&& test_fn) {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  bool completed = false;
  std::exception_ptr exception;

  asio::co_spawn(
      io_context,
      [fn = std::forward<F>(test_fn), &completed, &exception,
       executor]() -> asio::awaitable<void> {
        try {
          co_await fn(executor);
          completed = true;
        } catch (...) {
          exception = std::current_exception();
          completed = true;
        }
      },
      asio::detached);

  io_context.run();

  if (exception) {
    std::rethrow_exception(exception);
  }

  REQUIRE(completed);
}

inline auto Sleep(asio::any_io_executor executor, std::chrono::milliseconds delay)
    -> asio::awaitable<void> {
  asio::steady_timer timer(executor);
  timer.expires_after(delay);
  co_await timer.async_wait(asio::use_awaitable);
}

}  // namespace buildcore::test
