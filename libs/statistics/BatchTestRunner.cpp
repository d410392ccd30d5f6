// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "BatchTestRunner.h"
#include "ABTestException.h"
#include "ParallelFor.h"
#include "RngUtils.h"
#include <optional>
#include <set>

namespace mkc_abtest
{
  BatchTestRunner::BatchTestRunner(const EngineDefaults& defaults,
				   concurrency::IParallelExecutor& executor,
				   uint64_t masterSeed)
    : mRunner(defaults),
      mExecutor(executor),
      mMasterSeed(masterSeed)
  {}

  uint64_t BatchTestRunner::seedForRun(uint64_t masterSeed, std::size_t index)
  {
    return rng_utils::hash_combine64({ masterSeed, static_cast<uint64_t>(index) });
  }

  std::vector<NamedResult> BatchTestRunner::runAll(const std::vector<BatchTestCase>& cases) const
  {
    std::set<std::string> names;
    for (const auto& testCase : cases)
      {
	if (!names.insert(testCase.name).second)
	  throw ConfigurationError("BatchTestRunner: duplicate test name '" + testCase.name + "'");
	testCase.config.validate();
      }

    // One slot per run; each task writes only its own slot
    std::vector<std::optional<TestResult>> slots(cases.size());
    concurrency::parallel_for(cases.size(), mExecutor, [&](std::size_t i) {
	const BatchTestCase& testCase = cases[i];
	const TestConfiguration config = testCase.config.withRandomSeed(seedForRun(mMasterSeed, i));
	slots[i] = mRunner.run(testCase.control, testCase.treatment, config);
      });

    std::vector<NamedResult> results;
    results.reserve(cases.size());
    for (std::size_t i = 0; i < cases.size(); ++i)
      results.push_back(NamedResult{ cases[i].name, std::move(*slots[i]) });

    return results;
  }

  AggregateReport BatchTestRunner::run(const std::vector<BatchTestCase>& cases,
				       CorrectionMethod method,
				       double targetAlpha) const
  {
    ResultAggregator aggregator(method, targetAlpha);
    return aggregator.aggregate(runAll(cases));
  }

  AggregateReport BatchTestRunner::run(const std::vector<BatchTestCase>& cases) const
  {
    if (cases.empty())
      return AggregateReport();

    const TestConfiguration& first = cases.front().config;
    return run(cases, first.getCorrectionMethod(), correctionTargetAlpha(first));
  }

} // namespace mkc_abtest
