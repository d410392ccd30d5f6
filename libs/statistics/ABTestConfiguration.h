// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include "ABTestTypes.h"

namespace mkc_abtest
{
  /**
   * @brief Process-wide defaults for the testing engine.
   *
   * Built once at startup (optionally from a JSON file) and handed to each
   * component by const reference. Nothing in the engine modifies it.
   */
  struct EngineDefaults
  {
    double alpha = 0.05;
    BucketingStrategy bucketingStrategy = BucketingStrategy::Hash;
    std::size_t bucketCount = 100;
    double credibleLevel = 0.95;
    std::size_t minimumPosteriorDraws = 2000;
    std::size_t numberOfChains = 4;
    double maxRHat = 1.05;
    double minEffectiveSampleSize = 400.0;
    double weightTolerance = 1e-9;

    // Power curve grid for conversion metrics: [0, binaryPowerGridMax) in binaryPowerGridStep
    double binaryPowerGridStep = 0.005;
    double binaryPowerGridMax = 0.2;

    // Power curve grid for continuous/count metrics: [0, span * SE) in N steps
    std::size_t continuousPowerGridSteps = 40;
    double continuousPowerGridSpanSE = 4.0;

    std::size_t densityGridPoints = 100;
    std::string controlLabel = "control";

    /**
     * @brief Check internal consistency.
     * @throws ConfigurationError naming the offending field.
     */
    void validate() const;
  };

  /**
   * @brief Immutable description of a single comparison.
   *
   * Defaults are alpha 0.05, a Beta prior built from 30 successes in 100
   * trials and 2000 posterior draws. Setters are of the form withX and
   * return a modified copy:
   *
   * @code
   * auto config = TestConfiguration().withTestType(TestType::Bayesian)
   *                                  .withMetricKind(MetricKind::Binary)
   *                                  .withStoppingThreshold(0.97);
   * config.validate();
   * @endcode
   *
   * The stopping threshold means a p-value bound for frequentist tests and a
   * probability-of-superiority bound for Bayesian tests. When it is not set
   * explicitly it defaults to 0.05 and 0.95 respectively.
   */
  class TestConfiguration
  {
  public:
    static constexpr double kDefaultFrequentistStoppingThreshold = 0.05;
    static constexpr double kDefaultBayesianStoppingThreshold = 0.95;

    TestConfiguration() = default;

    // Configuration seeded from engine defaults (alpha, credible level, draw count)
    static TestConfiguration fromDefaults(const EngineDefaults& defaults);

    TestType getTestType() const { return mTestType; }
    MetricKind getMetricKind() const { return mMetricKind; }
    bool isSequential() const { return mSequential; }
    double getStoppingThreshold() const;
    // Empty when the test type default applies
    std::optional<double> getExplicitStoppingThreshold() const { return mStoppingThreshold; }
    bool hasExplicitStoppingThreshold() const { return mStoppingThreshold.has_value(); }
    double getAlpha() const { return mAlpha; }
    double getMinimumDetectableEffect() const { return mMinimumDetectableEffect; }
    CorrectionMethod getCorrectionMethod() const { return mCorrectionMethod; }
    AlternativeHypothesis getAlternative() const { return mAlternative; }
    UpliftMethod getUpliftMethod() const { return mUpliftMethod; }
    CountVarianceModel getCountVarianceModel() const { return mCountVarianceModel; }
    double getPriorSuccesses() const { return mPriorSuccesses; }
    double getPriorTrials() const { return mPriorTrials; }
    double getLossTolerance() const { return mLossTolerance; }
    double getCredibleLevel() const { return mCredibleLevel; }
    std::size_t getPosteriorDraws() const { return mPosteriorDraws; }
    uint64_t getRandomSeed() const { return mRandomSeed; }
    std::size_t getMaxSimulationDraws() const { return mMaxSimulationDraws; }
    std::size_t getMaxSimulationMillis() const { return mMaxSimulationMillis; }
    std::size_t getMaxSampleSize() const { return mMaxSampleSize; }
    std::size_t getNumberOfLooks() const { return mNumberOfLooks; }
    double getFutilityThreshold() const { return mFutilityThreshold; }
    double getTargetPower() const { return mTargetPower; }

    TestConfiguration withTestType(TestType type) const;
    TestConfiguration withMetricKind(MetricKind kind) const;
    TestConfiguration withSequential(bool sequential) const;
    TestConfiguration withStoppingThreshold(double threshold) const;
    TestConfiguration withDefaultStoppingThreshold() const;
    TestConfiguration withAlpha(double alpha) const;
    TestConfiguration withMinimumDetectableEffect(double mde) const;
    TestConfiguration withCorrectionMethod(CorrectionMethod method) const;
    TestConfiguration withAlternative(AlternativeHypothesis alternative) const;
    TestConfiguration withUpliftMethod(UpliftMethod method) const;
    TestConfiguration withCountVarianceModel(CountVarianceModel model) const;
    TestConfiguration withPrior(double priorSuccesses, double priorTrials) const;
    TestConfiguration withLossTolerance(double tolerance) const;
    TestConfiguration withCredibleLevel(double level) const;
    TestConfiguration withPosteriorDraws(std::size_t draws) const;
    TestConfiguration withRandomSeed(uint64_t seed) const;
    TestConfiguration withSimulationBudget(std::size_t maxDraws, std::size_t maxMillis) const;
    TestConfiguration withMaxSampleSize(std::size_t maxSampleSize) const;
    TestConfiguration withNumberOfLooks(std::size_t looks) const;
    TestConfiguration withFutilityThreshold(double threshold) const;
    TestConfiguration withTargetPower(double power) const;

    /**
     * @brief Reject out-of-range or contradictory settings.
     *
     * @throws ConfigurationError with a message naming the field, e.g.
     *         "stopping_threshold 1.2 is outside (0, 0.5] for frequentist tests".
     */
    void validate() const;

    bool operator==(const TestConfiguration& rhs) const;
    bool operator!=(const TestConfiguration& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    TestType mTestType = TestType::Frequentist;
    MetricKind mMetricKind = MetricKind::Binary;
    bool mSequential = false;
    std::optional<double> mStoppingThreshold;
    double mAlpha = 0.05;
    double mMinimumDetectableEffect = 0.0;
    CorrectionMethod mCorrectionMethod = CorrectionMethod::None;
    AlternativeHypothesis mAlternative = AlternativeHypothesis::TwoTailed;
    UpliftMethod mUpliftMethod = UpliftMethod::Percent;
    CountVarianceModel mCountVarianceModel = CountVarianceModel::Poisson;
    double mPriorSuccesses = 30.0;
    double mPriorTrials = 100.0;
    double mLossTolerance = 0.01;
    double mCredibleLevel = 0.95;
    std::size_t mPosteriorDraws = 2000;
    uint64_t mRandomSeed = 20240601ull;
    std::size_t mMaxSimulationDraws = 0;     ///< 0 = unlimited
    std::size_t mMaxSimulationMillis = 0;    ///< 0 = unlimited
    std::size_t mMaxSampleSize = 0;          ///< per group; 0 = not planned
    std::size_t mNumberOfLooks = 5;
    double mFutilityThreshold = 0.1;
    double mTargetPower = 0.8;
  };

} // namespace mkc_abtest
