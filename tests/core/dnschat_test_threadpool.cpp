// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public License 2.0.
// See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

using dnschat::core::ThreadPool;

//
// Basic task execution
//
TEST_CASE("ThreadPool executes basic tasks", "[threadpool][basic]")
{
  ThreadPool pool(2, 16);
  std::atomic<int> counter{0};

  for (int i = 0; i < 10; ++i)
  {
    pool.enqueue([&counter]() { counter++; });
  }

  REQUIRE(dnschat::test::waitFor([&counter]() { return counter == 10; }));
  REQUIRE(pool.getThreadCount() == 2);
}

//
// A zero-sized pool still gets one worker
//
TEST_CASE("ThreadPool never starts without workers", "[threadpool][basic]")
{
  ThreadPool pool(0);
  REQUIRE(pool.getThreadCount() == 1);
  auto future = pool.enqueueWithResult([]() { return 1; });
  REQUIRE(future.get() == 1);
}

//
// Tasks with arguments and results
//
TEST_CASE("ThreadPool returns results through futures", "[threadpool][future]")
{
  ThreadPool pool(2);

  auto sum = pool.enqueueWithResult([](int a, int b) { return a + b; }, 20, 22);
  auto text = pool.enqueueWithResult([]() { return std::string("done"); });

  REQUIRE(sum.get() == 42);
  REQUIRE(text.get() == "done");
}

//
// Tasks are rejected when the queue overflows
//
TEST_CASE("ThreadPool handles queue overflow", "[threadpool][overflow]")
{
  ThreadPool pool(1, 2);
  std::atomic<bool> release{false};
  std::atomic<bool> started{false};

  pool.enqueue(
    [&]()
    {
      started = true;
      while (!release)
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    });
  REQUIRE(dnschat::test::waitFor([&started]() { return started.load(); }));

  pool.enqueue([]() {});
  pool.enqueue([]() {});
  REQUIRE_THROWS_AS(pool.enqueue([]() {}), std::runtime_error);

  release = true;
}

//
// Tasks that throw are logged when no handler is installed
//
TEST_CASE("ThreadPool handles exceptions without handler", "[threadpool][exception]")
{
  ThreadPool pool;
  std::atomic<bool> after{false};

  pool.enqueue([]() { throw std::runtime_error("oops"); });
  pool.enqueue([&after]() { after = true; });

  REQUIRE(dnschat::test::waitFor([&after]() { return after.load(); }));
}

//
// Tasks that throw reach the handler given to the constructor
//
TEST_CASE("ThreadPool handles exceptions with handler", "[threadpool][exception-handler]")
{
  std::atomic<bool> caught{false};

  ThreadPool pool(2, 16,
                  [&caught](std::exception_ptr eptr)
                  {
                    try
                    {
                      if (eptr)
                      {
                        std::rethrow_exception(eptr);
                      }
                    }
                    catch (const std::runtime_error &e)
                    {
                      if (std::string(e.what()) == "fail")
                      {
                        caught = true;
                      }
                    }
                  });

  pool.enqueue([]() { throw std::runtime_error("fail"); });

  REQUIRE(dnschat::test::waitFor([&caught]() { return caught.load(); }, std::chrono::seconds(2)));
}

//
// Futures should propagate exceptions correctly
//
TEST_CASE("ThreadPool propagates exception through future", "[threadpool][future][exception]")
{
  ThreadPool pool(2);

  auto future = pool.enqueueWithResult([]() -> int { throw std::runtime_error("bad future"); });

  REQUIRE_THROWS_AS(future.get(), std::runtime_error);
}

//
// Queued work still runs when the pool is destroyed
//
TEST_CASE("ThreadPool destruction completes pending tasks", "[threadpool][lifecycle]")
{
  std::atomic<int> completed{0};

  {
    ThreadPool pool(2, 16);
    for (int i = 0; i < 5; ++i)
    {
      pool.enqueue(
        [&completed]()
        {
          std::this_thread::sleep_for(std::chrono::milliseconds(20));
          completed++;
        });
    }
  }

  REQUIRE(completed == 5);
}

TEST_CASE("ThreadPool rejects work after shutdown", "[threadpool][lifecycle]")
{
  ThreadPool pool(2);
  pool.shutdown();
  pool.shutdown();

  REQUIRE_THROWS_WITH(pool.enqueue([]() {}), "ThreadPool is shutting down");
}

TEST_CASE("ThreadPool backpressure and monitoring", "[threadpool][backpressure]")
{
  ThreadPool pool(1, 3);
  REQUIRE(pool.getPendingTaskCount() == 0);

  std::atomic<bool> taskStarted{false};
  std::atomic<bool> allowTaskComplete{false};

  pool.enqueue(
    [&taskStarted, &allowTaskComplete]()
    {
      taskStarted = true;
      while (!allowTaskComplete)
      {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
    });
  REQUIRE(dnschat::test::waitFor([&taskStarted]() { return taskStarted.load(); }));

  pool.enqueue([]() {});
  pool.enqueue([]() {});
  REQUIRE(pool.getPendingTaskCount() == 2);

  allowTaskComplete = true;
  REQUIRE(dnschat::test::waitFor([&pool]() { return pool.getPendingTaskCount() == 0; }));
}
