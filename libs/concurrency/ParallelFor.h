// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <algorithm>
#include <cstddef>
#include <future>
#include <vector>
#include "IParallelExecutor.h"

namespace concurrency
{
  // Split [0, total) into one contiguous chunk per executor slot, run
  // body(i) for every index of a chunk inside one task, and wait for all
  // chunks. Exceptions from body surface after every chunk has finished.
  template <typename Body>
  void parallel_for(std::size_t total, IParallelExecutor& exec, Body body)
  {
    if (total == 0)
      return;

    const std::size_t numTasks = std::max<std::size_t>(1, exec.concurrency());
    const std::size_t chunkSize = (total + numTasks - 1) / numTasks;

    std::vector<std::future<void>> futures;
    for (std::size_t start = 0; start < total; start += chunkSize)
      {
	const std::size_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([=]() {
	      for (std::size_t i = start; i < end; ++i)
		body(i);
	    }));
      }

    exec.waitAll(futures);
  }
}
