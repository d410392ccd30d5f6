// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <array>
#include <cstddef>
#include "ABTestConfiguration.h"
#include "BayesianTest.h"
#include "FrequentistTest.h"
#include "SimulationBudget.h"
#include "SummaryStatistics.h"
#include "TestResult.h"

namespace mkc_abtest
{
  class ABTestRunner;

  // Engine entry point for one test type
  using TestStrategy = TestResult (*)(const ABTestRunner& runner,
				      const GroupSummary& control,
				      const GroupSummary& treatment,
				      const TestConfiguration& config,
				      const SimulationBudget& budget);

  constexpr std::size_t kNumTestTypes = 2;

  using TestStrategyTable = std::array<TestStrategy, kNumTestTypes>;

  /**
   * @class ABTestRunner
   * @brief Single comparison of treatment against control, dispatched
   * through a fixed table indexed by test type. The engine picks the model
   * for the metric kind.
   *
   * The configuration is validated before dispatch. A sequential
   * configuration is evaluated as one look; SequentialTest drives repeated
   * looks.
   */
  class ABTestRunner
  {
  public:
    explicit ABTestRunner(const EngineDefaults& defaults);

    /**
     * @brief Run with the simulation budget taken from the configuration.
     *
     * @throws ConfigurationError on an invalid configuration.
     * @throws InsufficientDataError when a group is too small for the test.
     */
    TestResult run(const GroupSummary& control,
		   const GroupSummary& treatment,
		   const TestConfiguration& config) const;

    TestResult run(const GroupSummary& control,
		   const GroupSummary& treatment,
		   const TestConfiguration& config,
		   const SimulationBudget& budget) const;

    const FrequentistTest& getFrequentistTest() const
    {
      return mFrequentist;
    }

    const BayesianTest& getBayesianTest() const
    {
      return mBayesian;
    }

    const EngineDefaults& getDefaults() const
    {
      return mDefaults;
    }

    static const TestStrategyTable& strategyTable();

  private:
    EngineDefaults mDefaults;
    FrequentistTest mFrequentist;
    BayesianTest mBayesian;
  };

  /**
   * @brief Target level for correcting a family of results of this
   * configuration: alpha for frequentist tests, 1 - stopping threshold for
   * Bayesian ones (their score is 1 - P(superiority)).
   */
  double correctionTargetAlpha(const TestConfiguration& config);

} // namespace mkc_abtest
