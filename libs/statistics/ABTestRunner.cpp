// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ABTestRunner.h"
#include "ABTestException.h"

namespace mkc_abtest
{
  namespace
  {
    TestResult runFrequentist(const ABTestRunner& runner, const GroupSummary& control,
			      const GroupSummary& treatment, const TestConfiguration& config,
			      const SimulationBudget&)
    {
      return runner.getFrequentistTest().run(control, treatment, config);
    }

    TestResult runBayesian(const ABTestRunner& runner, const GroupSummary& control,
			   const GroupSummary& treatment, const TestConfiguration& config,
			   const SimulationBudget& budget)
    {
      return runner.getBayesianTest().run(control, treatment, config, budget);
    }
  }

  // Indexed by TestType; each engine selects its model from the metric kind
  const TestStrategyTable& ABTestRunner::strategyTable()
  {
    static const TestStrategyTable table = {{ &runFrequentist, &runBayesian }};

    return table;
  }

  ABTestRunner::ABTestRunner(const EngineDefaults& defaults)
    : mDefaults(defaults),
      mFrequentist(defaults),
      mBayesian(defaults)
  {
    mDefaults.validate();
  }

  TestResult ABTestRunner::run(const GroupSummary& control,
			       const GroupSummary& treatment,
			       const TestConfiguration& config) const
  {
    return run(control, treatment, config, SimulationBudget::fromConfiguration(config));
  }

  TestResult ABTestRunner::run(const GroupSummary& control,
			       const GroupSummary& treatment,
			       const TestConfiguration& config,
			       const SimulationBudget& budget) const
  {
    config.validate();

    const auto row = static_cast<std::size_t>(config.getTestType());
    if (row >= kNumTestTypes)
      throw ConfigurationError("ABTestRunner: no engine for test type '" + toString(config.getTestType()) + "'");

    return strategyTable()[row](*this, control, treatment, config, budget);
  }

  double correctionTargetAlpha(const TestConfiguration& config)
  {
    if (config.getTestType() == TestType::Bayesian)
      return 1.0 - config.getStoppingThreshold();

    return config.getAlpha();
  }

} // namespace mkc_abtest
