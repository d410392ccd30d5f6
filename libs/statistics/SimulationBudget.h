// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include "ABTestConfiguration.h"

namespace mkc_abtest
{
  /**
   * @class SimulationBudget
   * @brief Limits for a posterior simulation: draw count, wall clock and an
   * optional cancellation flag owned by the caller.
   *
   * The simulation checks the budget between blocks of draws and stops at
   * the next check once it is exhausted. Zero limits mean "unlimited".
   */
  class SimulationBudget
  {
  public:
    using Clock = std::chrono::steady_clock;

    SimulationBudget()
      : mMaxDraws(0),
	mMaxWallClock(std::chrono::milliseconds::zero()),
	mCancelFlag(nullptr)
    {}

    SimulationBudget(std::size_t maxDraws,
		     std::chrono::milliseconds maxWallClock,
		     const std::atomic<bool>* cancelFlag = nullptr)
      : mMaxDraws(maxDraws),
	mMaxWallClock(maxWallClock),
	mCancelFlag(cancelFlag)
    {}

    static SimulationBudget fromConfiguration(const TestConfiguration& config,
					      const std::atomic<bool>* cancelFlag = nullptr)
    {
      return SimulationBudget(config.getMaxSimulationDraws(),
			      std::chrono::milliseconds(config.getMaxSimulationMillis()),
			      cancelFlag);
    }

    std::size_t getMaxDraws() const
    {
      return mMaxDraws;
    }

    bool hasDrawLimit() const
    {
      return mMaxDraws > 0;
    }

    std::chrono::milliseconds getMaxWallClock() const
    {
      return mMaxWallClock;
    }

    bool isCancelled() const
    {
      return mCancelFlag != nullptr && mCancelFlag->load(std::memory_order_relaxed);
    }

    // True once cancelled or once the wall clock limit has elapsed since start
    bool isExhausted(Clock::time_point start) const
    {
      if (isCancelled())
	return true;

      if (mMaxWallClock > std::chrono::milliseconds::zero())
	return (Clock::now() - start) >= mMaxWallClock;

      return false;
    }

  private:
    std::size_t mMaxDraws;
    std::chrono::milliseconds mMaxWallClock;
    const std::atomic<bool>* mCancelFlag;
  };

} // namespace mkc_abtest
