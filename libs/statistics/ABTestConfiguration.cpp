// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ABTestConfiguration.h"
#include "ABTestException.h"
#include <cmath>
#include <sstream>

namespace mkc_abtest
{
  namespace
  {
    std::string describe(const std::string& field, double value, const std::string& range)
    {
      std::ostringstream os;
      os << field << " " << value << " is outside " << range;
      return os.str();
    }

    bool inOpenUnitInterval(double x)
    {
      return std::isfinite(x) && x > 0.0 && x < 1.0;
    }
  }

  void EngineDefaults::validate() const
  {
    if (!inOpenUnitInterval(alpha))
      throw ConfigurationError(describe("alpha", alpha, "(0, 1)"));

    if (bucketCount == 0)
      throw ConfigurationError("bucket_count must be positive");

    if (!inOpenUnitInterval(credibleLevel))
      throw ConfigurationError(describe("credible_level", credibleLevel, "(0, 1)"));

    if (minimumPosteriorDraws == 0)
      throw ConfigurationError("minimum_posterior_draws must be positive");

    if (numberOfChains < 2)
      throw ConfigurationError("number_of_chains must be at least 2 for convergence diagnostics");

    if (!(maxRHat > 1.0))
      throw ConfigurationError(describe("max_rhat", maxRHat, "(1, inf)"));

    if (!(minEffectiveSampleSize > 0.0))
      throw ConfigurationError(describe("min_effective_sample_size", minEffectiveSampleSize, "(0, inf)"));

    if (!(weightTolerance > 0.0))
      throw ConfigurationError("weight_tolerance must be positive");

    if (!(binaryPowerGridStep > 0.0) || !(binaryPowerGridMax > binaryPowerGridStep))
      throw ConfigurationError("binary power grid requires 0 < step < max");

    if (continuousPowerGridSteps == 0 || !(continuousPowerGridSpanSE > 0.0))
      throw ConfigurationError("continuous power grid requires a positive step count and span");

    if (densityGridPoints < 2)
      throw ConfigurationError("density_grid_points must be at least 2");

    if (controlLabel.empty())
      throw ConfigurationError("control_label must not be empty");
  }

  TestConfiguration TestConfiguration::fromDefaults(const EngineDefaults& defaults)
  {
    TestConfiguration config;
    config.mAlpha = defaults.alpha;
    config.mCredibleLevel = defaults.credibleLevel;
    config.mPosteriorDraws = defaults.minimumPosteriorDraws;
    return config;
  }

  double TestConfiguration::getStoppingThreshold() const
  {
    if (mStoppingThreshold)
      return *mStoppingThreshold;

    return (mTestType == TestType::Bayesian) ? kDefaultBayesianStoppingThreshold
					     : kDefaultFrequentistStoppingThreshold;
  }

  TestConfiguration TestConfiguration::withTestType(TestType type) const
  {
    TestConfiguration copy(*this);
    copy.mTestType = type;
    return copy;
  }

  TestConfiguration TestConfiguration::withMetricKind(MetricKind kind) const
  {
    TestConfiguration copy(*this);
    copy.mMetricKind = kind;
    return copy;
  }

  TestConfiguration TestConfiguration::withSequential(bool sequential) const
  {
    TestConfiguration copy(*this);
    copy.mSequential = sequential;
    return copy;
  }

  TestConfiguration TestConfiguration::withStoppingThreshold(double threshold) const
  {
    TestConfiguration copy(*this);
    copy.mStoppingThreshold = threshold;
    return copy;
  }

  TestConfiguration TestConfiguration::withDefaultStoppingThreshold() const
  {
    TestConfiguration copy(*this);
    copy.mStoppingThreshold.reset();
    return copy;
  }

  TestConfiguration TestConfiguration::withAlpha(double alpha) const
  {
    TestConfiguration copy(*this);
    copy.mAlpha = alpha;
    return copy;
  }

  TestConfiguration TestConfiguration::withMinimumDetectableEffect(double mde) const
  {
    TestConfiguration copy(*this);
    copy.mMinimumDetectableEffect = mde;
    return copy;
  }

  TestConfiguration TestConfiguration::withCorrectionMethod(CorrectionMethod method) const
  {
    TestConfiguration copy(*this);
    copy.mCorrectionMethod = method;
    return copy;
  }

  TestConfiguration TestConfiguration::withAlternative(AlternativeHypothesis alternative) const
  {
    TestConfiguration copy(*this);
    copy.mAlternative = alternative;
    return copy;
  }

  TestConfiguration TestConfiguration::withUpliftMethod(UpliftMethod method) const
  {
    TestConfiguration copy(*this);
    copy.mUpliftMethod = method;
    return copy;
  }

  TestConfiguration TestConfiguration::withCountVarianceModel(CountVarianceModel model) const
  {
    TestConfiguration copy(*this);
    copy.mCountVarianceModel = model;
    return copy;
  }

  TestConfiguration TestConfiguration::withPrior(double priorSuccesses, double priorTrials) const
  {
    TestConfiguration copy(*this);
    copy.mPriorSuccesses = priorSuccesses;
    copy.mPriorTrials = priorTrials;
    return copy;
  }

  TestConfiguration TestConfiguration::withLossTolerance(double tolerance) const
  {
    TestConfiguration copy(*this);
    copy.mLossTolerance = tolerance;
    return copy;
  }

  TestConfiguration TestConfiguration::withCredibleLevel(double level) const
  {
    TestConfiguration copy(*this);
    copy.mCredibleLevel = level;
    return copy;
  }

  TestConfiguration TestConfiguration::withPosteriorDraws(std::size_t draws) const
  {
    TestConfiguration copy(*this);
    copy.mPosteriorDraws = draws;
    return copy;
  }

  TestConfiguration TestConfiguration::withRandomSeed(uint64_t seed) const
  {
    TestConfiguration copy(*this);
    copy.mRandomSeed = seed;
    return copy;
  }

  TestConfiguration TestConfiguration::withSimulationBudget(std::size_t maxDraws,
							    std::size_t maxMillis) const
  {
    TestConfiguration copy(*this);
    copy.mMaxSimulationDraws = maxDraws;
    copy.mMaxSimulationMillis = maxMillis;
    return copy;
  }

  TestConfiguration TestConfiguration::withMaxSampleSize(std::size_t maxSampleSize) const
  {
    TestConfiguration copy(*this);
    copy.mMaxSampleSize = maxSampleSize;
    return copy;
  }

  TestConfiguration TestConfiguration::withNumberOfLooks(std::size_t looks) const
  {
    TestConfiguration copy(*this);
    copy.mNumberOfLooks = looks;
    return copy;
  }

  TestConfiguration TestConfiguration::withFutilityThreshold(double threshold) const
  {
    TestConfiguration copy(*this);
    copy.mFutilityThreshold = threshold;
    return copy;
  }

  TestConfiguration TestConfiguration::withTargetPower(double power) const
  {
    TestConfiguration copy(*this);
    copy.mTargetPower = power;
    return copy;
  }

  void TestConfiguration::validate() const
  {
    if (!inOpenUnitInterval(mAlpha))
      throw ConfigurationError(describe("alpha", mAlpha, "(0, 1)"));

    const double threshold = getStoppingThreshold();
    if (mTestType == TestType::Frequentist)
      {
	if (!std::isfinite(threshold) || threshold <= 0.0 || threshold > 0.5)
	  throw ConfigurationError(describe("stopping_threshold", threshold,
					    "(0, 0.5] for frequentist tests"));
      }
    else
      {
	if (!std::isfinite(threshold) || threshold < 0.5 || threshold >= 1.0)
	  throw ConfigurationError(describe("stopping_threshold", threshold,
					    "[0.5, 1) for bayesian tests"));
      }

    if (!std::isfinite(mMinimumDetectableEffect) || mMinimumDetectableEffect < 0.0)
      throw ConfigurationError(describe("minimum_detectable_effect", mMinimumDetectableEffect,
					"[0, inf)"));

    if (!std::isfinite(mPriorSuccesses) || mPriorSuccesses < 0.0)
      throw ConfigurationError(describe("prior_successes", mPriorSuccesses, "[0, inf)"));

    if (!std::isfinite(mPriorTrials) || mPriorTrials < mPriorSuccesses)
      throw ConfigurationError("prior_trials must be finite and at least prior_successes");

    if (!std::isfinite(mLossTolerance) || mLossTolerance < 0.0)
      throw ConfigurationError(describe("loss_tolerance", mLossTolerance, "[0, inf)"));

    if (!inOpenUnitInterval(mCredibleLevel))
      throw ConfigurationError(describe("credible_level", mCredibleLevel, "(0, 1)"));

    if (mPosteriorDraws == 0)
      throw ConfigurationError("posterior_draws must be positive");

    if (mNumberOfLooks == 0)
      throw ConfigurationError("looks must be at least 1");

    if (!std::isfinite(mFutilityThreshold) || mFutilityThreshold < 0.0 || mFutilityThreshold >= 1.0)
      throw ConfigurationError(describe("futility_threshold", mFutilityThreshold, "[0, 1)"));

    if (!inOpenUnitInterval(mTargetPower))
      throw ConfigurationError(describe("target_power", mTargetPower, "(0, 1)"));

    if (mSequential && mTestType == TestType::Frequentist && mMaxSampleSize == 0)
      throw ConfigurationError("sequential frequentist tests require max_sample_size "
			       "to compute the information fraction");
  }

  bool TestConfiguration::operator==(const TestConfiguration& rhs) const
  {
    return mTestType == rhs.mTestType &&
      mMetricKind == rhs.mMetricKind &&
      mSequential == rhs.mSequential &&
      mStoppingThreshold == rhs.mStoppingThreshold &&
      mAlpha == rhs.mAlpha &&
      mMinimumDetectableEffect == rhs.mMinimumDetectableEffect &&
      mCorrectionMethod == rhs.mCorrectionMethod &&
      mAlternative == rhs.mAlternative &&
      mUpliftMethod == rhs.mUpliftMethod &&
      mCountVarianceModel == rhs.mCountVarianceModel &&
      mPriorSuccesses == rhs.mPriorSuccesses &&
      mPriorTrials == rhs.mPriorTrials &&
      mLossTolerance == rhs.mLossTolerance &&
      mCredibleLevel == rhs.mCredibleLevel &&
      mPosteriorDraws == rhs.mPosteriorDraws &&
      mRandomSeed == rhs.mRandomSeed &&
      mMaxSimulationDraws == rhs.mMaxSimulationDraws &&
      mMaxSimulationMillis == rhs.mMaxSimulationMillis &&
      mMaxSampleSize == rhs.mMaxSampleSize &&
      mNumberOfLooks == rhs.mNumberOfLooks &&
      mFutilityThreshold == rhs.mFutilityThreshold &&
      mTargetPower == rhs.mTargetPower;
  }

} // namespace mkc_abtest
