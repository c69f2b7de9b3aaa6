#include <catch2/catch_test_macros.hpp>
#include "ParallelExecutors.h"
#include <atomic>
#include <chrono>
#include <thread>
#include <algorithm>
#include <numeric>
#include <stdexcept>

using namespace theory_validator::concurrency;

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

  SECTION("Basic task execution")
  {
    std::atomic<int> counter{0};
    auto future = executor.submit(createIncrementTask(counter));

    REQUIRE_NOTHROW(future.get());
    REQUIRE(counter.load() == 1);
  }

  SECTION("Task executes immediately")
  {
    std::atomic<bool> executed{false};
    auto future = executor.submit([&executed]() { executed.store(true); });

    REQUIRE(future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready);
    REQUIRE(executed.load());
  }

  SECTION("Exceptions are captured in the future")
  {
    auto future = executor.submit(createThrowingTask("boom"));
    REQUIRE_THROWS_AS(future.get(), std::runtime_error);
  }

  SECTION("Reports a concurrency of one")
  {
    REQUIRE(executor.concurrency() == 1);
  }
}

TEST_CASE("ThreadPoolExecutor operations", "[ThreadPoolExecutor]")
{
  SECTION("Runs every submitted task")
  {
    ThreadPoolExecutor executor(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 200; ++i)
      futures.push_back(executor.submit(createIncrementTask(counter)));

    executor.waitAll(futures);
    REQUIRE(counter.load() == 200);
  }

  SECTION("Requested size is honored")
  {
    ThreadPoolExecutor executor(3);
    REQUIRE(executor.concurrency() == 3);
  }

  SECTION("Zero picks a positive size")
  {
    ThreadPoolExecutor executor(0);
    REQUIRE(executor.concurrency() >= 1);
  }

  SECTION("waitAll drains all futures before rethrowing")
  {
    ThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    futures.push_back(executor.submit(createThrowingTask("first failure")));
    for (int i = 0; i < 20; ++i)
      futures.push_back(executor.submit([&counter]() {
	std::this_thread::sleep_for(std::chrono::milliseconds(1));
	counter.fetch_add(1);
      }));

    REQUIRE_THROWS_AS(executor.waitAll(futures), std::runtime_error);
    REQUIRE(counter.load() == 20);
  }
}
