// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#ifndef __PARALLEL_EXECUTORS_H
#define __PARALLEL_EXECUTORS_H 1

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>
#include "IParallelExecutor.h"

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for the IParallelExecutor interface.
 *
 *  - SingleThreadExecutor: runs every task inline on the calling thread. Use it in
 *    unit tests, when debugging, or whenever concurrency must be disabled.
 *  - ThreadPoolExecutor: a pool of worker threads created once and reused for every
 *    submitted task. Use it for the many short kernel evaluations of a backtest run.
 *
 * Both policies give identical numerical results for the latent source model because
 * every parallel loop writes its output by index.
 */
namespace concurrency
{
  /// Number of hardware threads, falling back to 2 when the platform does not report it.
  inline std::size_t getDefaultConcurrency()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? static_cast<std::size_t>(hw) : 2;
  }

  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> prom;
      auto fut = prom.get_future();

      try
	{
	  task();
	  prom.set_value();
	}
      catch (...)
	{
	  prom.set_exception(std::current_exception());
	}

      return fut;
    }

    std::size_t getConcurrency() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed-size pool of worker threads fed from a FIFO queue.
   *
   * A thread count of zero selects getDefaultConcurrency(). The destructor
   * finishes every queued task before joining the workers.
   */
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : mWorkers(),
	mTasks(),
	mTasksMutex(),
	mCondition(),
	mStop(false)
    {
      const std::size_t threads = numThreads ? numThreads : getDefaultConcurrency();

      try
	{
	  for (std::size_t i = 0; i < threads; ++i)
	    mWorkers.emplace_back([this] { workerLoop(); });
	}
      catch (...)
	{
	  shutdown();
	  throw;
	}
    }

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();

      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor::submit - executor has been stopped");

	mTasks.emplace([packaged]() { (*packaged)(); });
      }

      mCondition.notify_one();
      return fut;
    }

    std::size_t getConcurrency() const override
    {
      return mWorkers.size();
    }

  private:
    void workerLoop()
    {
      for (;;)
	{
	  std::function<void()> task;
	  {
	    std::unique_lock<std::mutex> lock(mTasksMutex);
	    mCondition.wait(lock, [this] { return mStop || !mTasks.empty(); });
	    if (mStop && mTasks.empty())
	      return;

	    task = std::move(mTasks.front());
	    mTasks.pop();
	  }
	  task();
	}
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(mTasksMutex);
	mStop = true;
      }
      mCondition.notify_all();

      for (auto& worker : mWorkers)
	{
	  if (worker.joinable())
	    worker.join();
	}
    }

  private:
    std::vector<std::thread>          mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex                        mTasksMutex;
    std::condition_variable           mCondition;
    bool                              mStop;
  };

  /**
   * @brief Build the executor for a requested thread count.
   *
   * 1 yields a SingleThreadExecutor, anything else a ThreadPoolExecutor
   * (0 meaning one worker per hardware thread).
   */
  inline std::shared_ptr<IParallelExecutor> makeExecutor(std::size_t numThreads)
  {
    if (numThreads == 1)
      return std::make_shared<SingleThreadExecutor>();

    return std::make_shared<ThreadPoolExecutor>(numThreads);
  }
}

#endif
