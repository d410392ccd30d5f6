// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include "IParallelExecutor.h"
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for running independent tests.
 *
 *  - SingleThreadExecutor: runs each task inline on the calling thread.
 *  - ThreadPoolExecutor: a fixed number of worker threads draining a queue.
 *
 * Results never depend on the executor chosen: every task owns its inputs
 * and its random stream, so the pool only changes wall clock time.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
  class SingleThreadExecutor : public IParallelExecutor
  {
  public:
    std::future<void> submit(std::function<void()> task) override
    {
      std::promise<void> done;
      auto fut = done.get_future();
      try
	{
	  task();
	  done.set_value();
	}
      catch (...)
	{
	  done.set_exception(std::current_exception());
	}
      return fut;
    }

    std::size_t concurrency() const override
    {
      return 1;
    }
  };

  /**
   * @brief Fixed-size thread pool.
   *
   * A thread count of 0 selects std::thread::hardware_concurrency(), or 2
   * when that is unknown. The destructor finishes queued tasks before
   * joining the workers.
   */
  class ThreadPoolExecutor : public IParallelExecutor
  {
  public:
    explicit ThreadPoolExecutor(std::size_t threads = 0)
      : mStop(false)
    {
      if (threads == 0)
	threads = std::thread::hardware_concurrency() ? std::thread::hardware_concurrency() : 2;

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
	std::lock_guard<std::mutex> lock(mMutex);
	if (mStop)
	  throw std::runtime_error("ThreadPoolExecutor: submit after shutdown");
	mTasks.emplace([packaged]() { (*packaged)(); });
      }
      mCondition.notify_one();
      return fut;
    }

    std::size_t concurrency() const override
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
	    std::unique_lock<std::mutex> lock(mMutex);
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
	std::lock_guard<std::mutex> lock(mMutex);
	mStop = true;
      }
      mCondition.notify_all();
      for (auto& worker : mWorkers)
	if (worker.joinable())
	  worker.join();
    }

  private:
    std::vector<std::thread> mWorkers;
    std::queue<std::function<void()>> mTasks;
    std::mutex mMutex;
    std::condition_variable mCondition;
    bool mStop;
  };

  // Inline executor for one thread, a pool otherwise
  inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t threads)
  {
    if (threads == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor>(threads);
  }
} // namespace concurrency
