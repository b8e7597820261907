// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace concurrency;

// Helper function to create a simple task that increments a counter
auto createIncrementTask(std::atomic<int>& counter) {
  return [&counter]() { counter.fetch_add(1, std::memory_order_relaxed); };
}

// Helper function to create a task that throws an exception
auto createThrowingTask(const std::string& message) {
  return [message]() { throw std::runtime_error(message); };
}

TEST_CASE("SingleThreadExecutor operations", "[SingleThreadExecutor]")
{
  SingleThreadExecutor executor;

  SECTION("Concurrency is one")
  {
    REQUIRE(executor.getConcurrency() == 1);
  }

  SECTION("Task executes inline")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Tasks run in submission order")
  {
    std::vector<int> results;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 5; ++i)
      futures.push_back(executor.submit([&results, i]() { results.push_back(i); }));

    executor.waitAll(futures);

    REQUIRE(results == std::vector<int>{0, 1, 2, 3, 4});
  }

  SECTION("Exception travels through the future")
  {
    auto future = executor.submit(createThrowingTask("inline failure"));

    try {
      future.get();
      FAIL("expected an exception");
    } catch (const std::runtime_error& e) {
      REQUIRE(std::string(e.what()) == "inline failure");
    }
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Zero threads selects hardware concurrency")
  {
    ThreadPoolExecutor executor(0);
    REQUIRE(executor.getConcurrency() == getDefaultConcurrency());
  }

  SECTION("Explicit pool size")
  {
    ThreadPoolExecutor executor(3);
    REQUIRE(executor.getConcurrency() == 3);
  }

  SECTION("All submitted tasks run")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 200; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    REQUIRE_NOTHROW(executor.waitAll(futures));
    REQUIRE(counter.load() == 200);
  }

  SECTION("Tasks execute concurrently but within the pool size")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> concurrentCount{0};
    std::atomic<int> maxConcurrent{0};
    std::vector<std::future<void>> futures;

    auto task = [&concurrentCount, &maxConcurrent]() {
      int current = concurrentCount.fetch_add(1) + 1;

      int expected = maxConcurrent.load();
      while (expected < current &&
             !maxConcurrent.compare_exchange_weak(expected, current)) {
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      concurrentCount.fetch_sub(1);
    };

    for (int i = 0; i < 8; ++i)
      futures.push_back(executor.submit(task));

    executor.waitAll(futures);

    REQUIRE(maxConcurrent.load() >= 2);
    REQUIRE(maxConcurrent.load() <= 4);
  }

  SECTION("Single worker keeps submission order")
  {
    ThreadPoolExecutor executor(1);
    std::vector<int> executionOrder;
    std::mutex orderMutex;
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 10; ++i) {
      futures.push_back(executor.submit([&executionOrder, &orderMutex, i]() {
        std::lock_guard<std::mutex> lock(orderMutex);
        executionOrder.push_back(i);
      }));
    }

    executor.waitAll(futures);

    REQUIRE(executionOrder.size() == 10);
    REQUIRE(std::is_sorted(executionOrder.begin(), executionOrder.end()));
  }

  SECTION("Destructor finishes queued tasks")
  {
    std::atomic<int> counter{0};

    {
      ThreadPoolExecutor executor(2);
      for (int i = 0; i < 10; ++i) {
        executor.submit([&counter]() {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
          counter.fetch_add(1);
        });
      }
    }

    REQUIRE(counter.load() == 10);
  }
}

TEST_CASE("waitAll drains every future before rethrowing", "[IParallelExecutor]")
{
  ThreadPoolExecutor executor(2);
  std::atomic<int> completed{0};
  std::vector<std::future<void>> futures;

  futures.push_back(executor.submit(createThrowingTask("first")));
  for (int i = 0; i < 6; ++i) {
    futures.push_back(executor.submit([&completed]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      completed.fetch_add(1);
    }));
  }

  try {
    executor.waitAll(futures);
    FAIL("expected an exception");
  } catch (const std::runtime_error& e) {
    REQUIRE(std::string(e.what()) == "first");
  }

  // Every successful task had finished when the exception escaped
  REQUIRE(completed.load() == 6);
}

TEST_CASE("makeExecutor selects the policy from the thread count", "[makeExecutor]")
{
  std::shared_ptr<IParallelExecutor> single = makeExecutor(1);
  REQUIRE(dynamic_cast<SingleThreadExecutor*>(single.get()) != nullptr);
  REQUIRE(single->getConcurrency() == 1);

  std::shared_ptr<IParallelExecutor> pool = makeExecutor(3);
  REQUIRE(dynamic_cast<ThreadPoolExecutor*>(pool.get()) != nullptr);
  REQUIRE(pool->getConcurrency() == 3);

  std::shared_ptr<IParallelExecutor> hardware = makeExecutor(0);
  REQUIRE(hardware->getConcurrency() == getDefaultConcurrency());
}
