// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __TEST_RESULT_H
#define __TEST_RESULT_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "ABTestTypes.h"
#include "SummaryStatistics.h"

namespace mkc_abtest
{
  /**
   * @brief A named numeric series, e.g. a power curve or an uplift density.
   *
   * Rendering is left to the consumer; the engine only produces the numbers.
   */
  struct Curve
  {
    std::string name;
    std::string xLabel;
    std::string yLabel;
    std::vector<double> x;
    std::vector<double> y;

    bool operator==(const Curve& rhs) const
    {
      return name == rhs.name && xLabel == rhs.xLabel && yLabel == rhs.yLabel &&
	x == rhs.x && y == rhs.y;
    }
  };

  // Names of the curves produced by the engines
  namespace curve_names
  {
    inline const char* const kPowerCurve = "power_curve";
    inline const char* const kUpliftDensity = "uplift_density";
    inline const char* const kUpliftCumulative = "uplift_cumulative";
    inline const char* const kUpliftTrace = "uplift_trace";
    inline const char* const kSequentialBoundary = "sequential_boundary";
  }

  /**
   * @brief Confidence interval (frequentist) or credible interval (Bayesian).
   *
   * quantity names what the bounds refer to: "difference" for an absolute
   * effect, or "uplift:<method>" for a Bayesian uplift interval.
   */
  struct IntervalEstimate
  {
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.0;
    std::string quantity;

    bool contains(double value) const
    {
      return lower <= value && value <= upper;
    }

    bool operator==(const IntervalEstimate& rhs) const
    {
      return lower == rhs.lower && upper == rhs.upper && level == rhs.level &&
	quantity == rhs.quantity;
    }
  };

  /**
   * @class TestResult
   * @brief Outcome of one control vs treatment comparison.
   *
   * Frequentist fields (statistic, degrees of freedom, p-value, power) and
   * Bayesian fields (probability of superiority, expected losses, expected
   * uplift, diagnostics) are optional; only the engine that produced the
   * result fills its own. Sequential runs produce a chain of results, one per
   * look, each with its own sample size and look index.
   */
  class TestResult
  {
  public:
    TestResult(TestType testType,
	       MetricKind metricKind,
	       const GroupSummary& control,
	       const GroupSummary& treatment);

    TestType testType;
    MetricKind metricKind;
    GroupSummary control;
    GroupSummary treatment;

    double absoluteEffect = 0.0;
    std::optional<double> relativeUplift;   ///< absent when the control mean is zero

    // Frequentist
    std::optional<double> statistic;
    std::optional<double> degreesOfFreedom;
    std::optional<double> pValue;
    std::optional<double> achievedPower;        ///< at the minimum detectable effect
    std::optional<std::size_t> requiredSampleSize; ///< per group, at the minimum detectable effect

    // Bayesian
    std::optional<double> probabilityOfSuperiority;
    std::optional<double> expectedLossTreatment; ///< E[max(control - treatment, 0)]
    std::optional<double> expectedLossControl;   ///< E[max(treatment - control, 0)]
    std::optional<double> expectedUplift;
    std::optional<double> rHat;
    std::optional<double> effectiveSampleSize;
    std::size_t posteriorDraws = 0;
    bool approximated = false;   ///< analytic normal approximation used

    std::optional<IntervalEstimate> interval;

    // Set by the correction layer
    std::optional<double> adjustedPValue;
    std::optional<double> adjustedThreshold;

    Decision decision = Decision::Inconclusive;
    std::size_t sampleSize = 0;   ///< control + treatment observations
    std::size_t lookIndex = 0;    ///< 1-based for sequential looks, 0 otherwise
    bool lowInformation = false;
    std::vector<std::string> notes;
    std::vector<Curve> curves;

    void addNote(const std::string& note)
    {
      notes.push_back(note);
    }

    void addCurve(Curve curve)
    {
      curves.push_back(std::move(curve));
    }

    // nullptr when no curve of that name is attached
    const Curve* findCurve(const std::string& name) const;

    /**
     * @brief Score used by multiple-testing correction.
     *
     * The p-value for frequentist results, 1 - P(superiority) for Bayesian
     * ones. Empty when neither is available (e.g. an inconclusive run).
     */
    std::optional<double> significanceScore() const;

    bool isSignificant() const
    {
      return decision == Decision::Significant;
    }

    bool operator==(const TestResult& rhs) const;
    bool operator!=(const TestResult& rhs) const
    {
      return !(*this == rhs);
    }
  };

} // namespace mkc_abtest

#endif
