// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __BATCH_TEST_RUNNER_H
#define __BATCH_TEST_RUNNER_H 1

#include <cstdint>
#include <string>
#include <vector>
#include "ABTestConfiguration.h"
#include "ABTestRunner.h"
#include "IParallelExecutor.h"
#include "ResultAggregator.h"
#include "SummaryStatistics.h"

namespace mkc_abtest
{
  struct BatchTestCase
  {
    std::string name;
    GroupSummary control;
    GroupSummary treatment;
    TestConfiguration config;
  };

  /**
   * @class BatchTestRunner
   * @brief Runs independent named tests on an executor, then corrects and
   * aggregates them.
   *
   * Run i uses the seed hash_combine64(masterSeed, i) in place of its
   * configured one, so the report is identical whatever executor or thread
   * count is used.
   */
  class BatchTestRunner
  {
  public:
    BatchTestRunner(const EngineDefaults& defaults,
		    concurrency::IParallelExecutor& executor,
		    uint64_t masterSeed);

    /**
     * @brief Results in the order of cases.
     *
     * @throws ConfigurationError on duplicate names or an invalid case; the
     * first error raised by any run is rethrown once all runs finished.
     */
    std::vector<NamedResult> runAll(const std::vector<BatchTestCase>& cases) const;

    AggregateReport run(const std::vector<BatchTestCase>& cases,
			CorrectionMethod method,
			double targetAlpha) const;

    // Correction method and target taken from the first case's configuration
    AggregateReport run(const std::vector<BatchTestCase>& cases) const;

    static uint64_t seedForRun(uint64_t masterSeed, std::size_t index);

  private:
    ABTestRunner mRunner;
    concurrency::IParallelExecutor& mExecutor;
    uint64_t mMasterSeed;
  };

} // namespace mkc_abtest

#endif
