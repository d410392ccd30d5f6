// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <vector>

namespace concurrency
{
  /**
   * @brief Executor interface used by the batch runner.
   *
   * Implementations decide where a task runs (inline, a pool thread). Any
   * exception thrown by a task is delivered through its future.
   */
  class IParallelExecutor
  {
  public:
    virtual ~IParallelExecutor() = default;

    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that can make progress at the same time
    virtual std::size_t concurrency() const = 0;

    // Waits for every future; the first stored exception is rethrown after
    // all tasks have finished
    virtual void waitAll(std::vector<std::future<void>>& futures)
    {
      std::exception_ptr first;
      for (auto& f : futures)
	{
	  try
	    {
	      f.get();
	    }
	  catch (...)
	    {
	      if (!first)
		first = std::current_exception();
	    }
	}

      if (first)
	std::rethrow_exception(first);
    }
  };
}
