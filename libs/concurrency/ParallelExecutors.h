#pragma once

#include "IParallelExecutor.h"
#include <queue>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the data-parallel stages of an operation.
 *
 * Two implementations of IParallelExecutor are provided:
 *  - SingleThreadExecutor: runs tasks inline on the calling thread (deterministic, no concurrency).
 *  - ThreadPoolExecutor: a pool of worker threads sized at construction time.
 *
 * Feature computation and Monte Carlo resampling write into pre-sized result
 * slots indexed by row or trial, so either executor yields identical results.
 */
namespace theory_validator
{
  namespace concurrency
  {
    /**
     * @brief Executes tasks synchronously on the calling thread.
     *
     * Useful for unit tests and for the CLI when --threads 1 is requested.
     */
    class SingleThreadExecutor : public IParallelExecutor {
    public:
      std::future<void> submit(std::function<void()> task) override {
	std::promise<void> prom;
	auto fut = prom.get_future();
	try {
	  task();
	  prom.set_value();
	} catch (...) {
	  prom.set_exception(std::current_exception());
	}
	return fut;
      }

      std::size_t concurrency() const override
      {
	return 1;
      }
    };

    /**
     * @brief Thread pool executor.
     *
     * Tasks submitted are queued and executed by a pool of worker threads.
     * A requested size of 0 picks std::thread::hardware_concurrency()
     * (falling back to 2 if that returns 0).
     */
    class ThreadPoolExecutor : public IParallelExecutor {
    public:
      ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
      ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
      ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

      explicit ThreadPoolExecutor(std::size_t requestedThreads = 0) : stop_(false)
      {
	const std::size_t hw = std::thread::hardware_concurrency();
	const std::size_t threads =
	  requestedThreads > 0 ? requestedThreads : (hw ? hw : 2);

	try {
	  for (std::size_t i = 0; i < threads; ++i) {
	    workers_.emplace_back([this] { workerLoop(); });
	  }
	}
	catch (...) {
	  {
	    std::lock_guard<std::mutex> lock(tasksMutex_);
	    stop_ = true;
	  }
	  condition_.notify_all();
	  for (auto& w : workers_) if (w.joinable()) w.join();
	  throw;
	}
      }

      ~ThreadPoolExecutor()
      {
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  stop_ = true;
	}
	condition_.notify_all();
	for (auto &worker : workers_) {
	  if (worker.joinable())
	    worker.join();
	}
      }

      std::future<void> submit(std::function<void()> task) override
      {
	auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
	auto fut = packaged->get_future();
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  if (stop_)
	    throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	  tasks_.emplace([packaged]() { (*packaged)(); });
	}
	condition_.notify_one();
	return fut;
      }

      std::size_t concurrency() const override
      {
	return workers_.size();
      }

    private:
      void workerLoop()
      {
	for (;;) {
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(tasksMutex_);
	    condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	    if (stop_ && tasks_.empty()) return;
	    task = std::move(tasks_.front());
	    tasks_.pop();
	  }
	  task();
	}
      }

    private:
      std::vector<std::thread>          workers_;
      std::queue<std::function<void()>> tasks_;
      std::mutex                        tasksMutex_;
      std::condition_variable           condition_;
      bool                              stop_;
    };
  } // namespace concurrency
} // namespace theory_validator
