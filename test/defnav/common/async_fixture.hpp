#pragma once

#include <exception>

#include <asio.hpp>
#include <catch2/catch_all.hpp>

namespace defnav::test {

// Runs a coroutine test body to completion on a private io_context. The body
// receives the context's executor; exceptions are rethrown to Catch.
template <typename F>
void RunAsyncTest(F&& test_fn) {
  asio::io_context io_context;
  auto executor = io_context.get_executor();

  bool completed = false;
  std::exception_ptr exception;

  asio::co_spawn(
      io_context,
      [fn = std::forward<F>(test_fn), executor]() -> asio::awaitable<void> {
        co_await fn(executor);
      },
      [&](std::exception_ptr error) {
        exception = error;
        completed = true;
      });

  io_context.run();

  if (exception) {
    std::rethrow_exception(exception);
  }

  REQUIRE(completed);
}

}  // namespace defnav::test
