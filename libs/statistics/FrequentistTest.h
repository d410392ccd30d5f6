// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __FREQUENTIST_TEST_H
#define __FREQUENTIST_TEST_H 1

#include <cstddef>
#include <optional>
#include "ABTestConfiguration.h"
#include "SummaryStatistics.h"
#include "TestResult.h"

namespace mkc_abtest
{
  /**
   * @brief Outcome of the closed form test before it is wrapped in a TestResult.
   */
  struct FrequentistStatistic
  {
    double difference = 0.0;        ///< treatment mean - control mean
    double standardError = 0.0;     ///< SE under the null (pooled for proportions)
    double intervalStandardError = 0.0; ///< SE used for the confidence interval
    std::optional<double> statistic;
    std::optional<double> degreesOfFreedom; ///< Welch-Satterthwaite, continuous metrics only
    double pValue = 1.0;
    bool degenerate = false;        ///< zero standard error
  };

  /**
   * @class FrequentistTest
   * @brief Closed form hypothesis tests on two group summaries.
   *
   *  - Binary: two-proportion z-test with pooled SE, Wald interval (unpooled SE)
   *  - Continuous: Welch's t-test with Welch-Satterthwaite degrees of freedom
   *  - Count: normal approximation z-test on the difference of means
   *
   * Zero standard errors never produce NaN: the interval collapses to the
   * point estimate and the p-value is exactly 1 when there is no difference
   * in the direction being tested, exactly 0 otherwise.
   */
  class FrequentistTest
  {
  public:
    explicit FrequentistTest(const EngineDefaults& defaults);

    /**
     * @throws InsufficientDataError if either group has fewer than 2 observations.
     * @throws ConfigurationError on mismatched metric kinds.
     */
    TestResult run(const GroupSummary& control,
		   const GroupSummary& treatment,
		   const TestConfiguration& config) const;

    FrequentistStatistic computeStatistic(const GroupSummary& control,
					  const GroupSummary& treatment,
					  AlternativeHypothesis alternative) const;

    /**
     * @brief Power at the current sample sizes for a hypothetical absolute effect.
     *
     * For proportions the standard error is built from the control rate,
     * sqrt(p0 (1 - p0) (1/n0 + 1/n1)); other metrics use the summary variances.
     * Two-tailed power counts both rejection regions.
     */
    double power(const GroupSummary& control,
		 const GroupSummary& treatment,
		 double effect,
		 double alpha,
		 AlternativeHypothesis alternative) const;

    Curve powerCurve(const GroupSummary& control,
		     const GroupSummary& treatment,
		     double alpha,
		     AlternativeHypothesis alternative) const;

    /**
     * @brief Per-group sample size needed to detect an absolute effect with
     * the requested power, assuming equal allocation.
     */
    std::size_t requiredSampleSize(const GroupSummary& control,
				   const GroupSummary& treatment,
				   double minimumDetectableEffect,
				   double alpha,
				   double targetPower,
				   AlternativeHypothesis alternative) const;

  private:
    static double powerFromStandardError(double effect, double se, double alpha,
					 AlternativeHypothesis alternative);

  private:
    EngineDefaults mDefaults;
  };

} // namespace mkc_abtest

#endif
