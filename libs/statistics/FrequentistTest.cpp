// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "FrequentistTest.h"
#include "ABTestException.h"
#include "NormalDistribution.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <boost/math/distributions/students_t.hpp>

namespace mkc_abtest
{
  namespace
  {
    // p-value when the standard error is zero: no sampling noise, so the
    // observed difference is either exactly null or conclusive.
    double degeneratePValue(double difference, AlternativeHypothesis alternative)
    {
      if (alternative == AlternativeHypothesis::TwoTailed)
	return (difference == 0.0) ? 1.0 : 0.0;

      return (difference > 0.0) ? 0.0 : 1.0;
    }

    double studentTPValue(double t, double df, AlternativeHypothesis alternative)
    {
      boost::math::students_t dist(df);
      if (alternative == AlternativeHypothesis::TwoTailed)
	return std::min(1.0, 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(t))));

      return boost::math::cdf(boost::math::complement(dist, t));
    }

    double welchDegreesOfFreedom(const GroupSummary& control, const GroupSummary& treatment)
    {
      const double n0 = static_cast<double>(control.getSampleSize());
      const double n1 = static_cast<double>(treatment.getSampleSize());
      const double a = control.getVariance() / n0;
      const double b = treatment.getVariance() / n1;
      const double denominator = (a * a) / (n0 - 1.0) + (b * b) / (n1 - 1.0);

      if (!(denominator > 0.0))
	return n0 + n1 - 2.0;

      return (a + b) * (a + b) / denominator;
    }
  }

  FrequentistTest::FrequentistTest(const EngineDefaults& defaults)
    : mDefaults(defaults)
  {}

  FrequentistStatistic FrequentistTest::computeStatistic(const GroupSummary& control,
							 const GroupSummary& treatment,
							 AlternativeHypothesis alternative) const
  {
    if (control.getMetricKind() != treatment.getMetricKind())
      throw ConfigurationError("FrequentistTest: control and treatment summaries have different metric kinds");

    SummaryStatisticsExtractor::requireSampleSize(control, TestType::Frequentist);
    SummaryStatisticsExtractor::requireSampleSize(treatment, TestType::Frequentist);

    const double n0 = static_cast<double>(control.getSampleSize());
    const double n1 = static_cast<double>(treatment.getSampleSize());

    FrequentistStatistic stat;
    stat.difference = treatment.getMean() - control.getMean();

    switch (control.getMetricKind())
      {
      case MetricKind::Binary:
	{
	  const double pooled = (control.getSum() + treatment.getSum()) / (n0 + n1);
	  stat.standardError = std::sqrt(std::max(0.0, pooled * (1.0 - pooled) * (1.0 / n0 + 1.0 / n1)));
	  stat.intervalStandardError = std::sqrt(control.getVariance() / n0 + treatment.getVariance() / n1);
	  break;
	}

      case MetricKind::Continuous:
	stat.standardError = std::sqrt(control.getVariance() / n0 + treatment.getVariance() / n1);
	stat.intervalStandardError = stat.standardError;
	stat.degreesOfFreedom = welchDegreesOfFreedom(control, treatment);
	break;

      case MetricKind::Count:
	stat.standardError = std::sqrt(control.getVariance() / n0 + treatment.getVariance() / n1);
	stat.intervalStandardError = stat.standardError;
	break;
      }

    if (!(stat.standardError > 0.0) || !std::isfinite(stat.standardError))
      {
	stat.degenerate = true;
	stat.standardError = 0.0;
	stat.pValue = degeneratePValue(stat.difference, alternative);
	if (stat.difference == 0.0)
	  stat.statistic = 0.0;

	return stat;
      }

    const double s = stat.difference / stat.standardError;
    stat.statistic = s;

    if (stat.degreesOfFreedom)
      stat.pValue = studentTPValue(s, *stat.degreesOfFreedom, alternative);
    else
      stat.pValue = NormalDistribution::pValue(s, alternative);

    return stat;
  }

  double FrequentistTest::powerFromStandardError(double effect,
						 double se,
						 double alpha,
						 AlternativeHypothesis alternative)
  {
    if (!(se > 0.0))
      {
	if (effect > 0.0)
	  return 1.0;

	return alpha;
      }

    const double shift = effect / se;
    if (alternative == AlternativeHypothesis::TwoTailed)
      {
	const double z = NormalDistribution::criticalValue(alpha, alternative);
	return NormalDistribution::standardNormalCdf(shift - z) +
	  NormalDistribution::standardNormalCdf(-shift - z);
      }

    const double z = NormalDistribution::criticalValue(alpha, alternative);
    return 1.0 - NormalDistribution::standardNormalCdf(z - shift);
  }

  double FrequentistTest::power(const GroupSummary& control,
				const GroupSummary& treatment,
				double effect,
				double alpha,
				AlternativeHypothesis alternative) const
  {
    const double n0 = static_cast<double>(control.getSampleSize());
    const double n1 = static_cast<double>(treatment.getSampleSize());
    if (n0 <= 0.0 || n1 <= 0.0)
      return 0.0;

    double se;
    if (control.getMetricKind() == MetricKind::Binary)
      {
	const double p0 = control.getMean();
	se = std::sqrt(p0 * (1.0 - p0) * (1.0 / n0 + 1.0 / n1));
      }
    else
      se = std::sqrt(control.getVariance() / n0 + treatment.getVariance() / n1);

    return powerFromStandardError(effect, se, alpha, alternative);
  }

  Curve FrequentistTest::powerCurve(const GroupSummary& control,
				    const GroupSummary& treatment,
				    double alpha,
				    AlternativeHypothesis alternative) const
  {
    Curve curve;
    curve.name = curve_names::kPowerCurve;
    curve.xLabel = "effect_size";
    curve.yLabel = "power";

    std::vector<double> grid;
    if (control.getMetricKind() == MetricKind::Binary)
      {
	const auto steps = static_cast<std::size_t>(
	  std::llround(mDefaults.binaryPowerGridMax / mDefaults.binaryPowerGridStep));
	for (std::size_t k = 0; k < steps; ++k)
	  grid.push_back(static_cast<double>(k) * mDefaults.binaryPowerGridStep);
      }
    else
      {
	const double se = std::sqrt(control.getVariance() / static_cast<double>(control.getSampleSize()) +
				    treatment.getVariance() / static_cast<double>(treatment.getSampleSize()));
	if (se > 0.0 && std::isfinite(se))
	  {
	    const double step = mDefaults.continuousPowerGridSpanSE * se /
	      static_cast<double>(mDefaults.continuousPowerGridSteps);
	    for (std::size_t k = 0; k < mDefaults.continuousPowerGridSteps; ++k)
	      grid.push_back(static_cast<double>(k) * step);
	  }
	else
	  grid.push_back(0.0);
      }

    for (double effect : grid)
      {
	curve.x.push_back(effect);
	curve.y.push_back(power(control, treatment, effect, alpha, alternative));
      }

    return curve;
  }

  std::size_t FrequentistTest::requiredSampleSize(const GroupSummary& control,
						  const GroupSummary& treatment,
						  double minimumDetectableEffect,
						  double alpha,
						  double targetPower,
						  AlternativeHypothesis alternative) const
  {
    if (!(minimumDetectableEffect > 0.0))
      throw ConfigurationError("requiredSampleSize: minimum_detectable_effect must be positive");

    double variance;
    if (control.getMetricKind() == MetricKind::Binary)
      {
	const double p0 = control.getMean();
	const double p1 = std::clamp(p0 + minimumDetectableEffect, 0.0, 1.0);
	variance = p0 * (1.0 - p0) + p1 * (1.0 - p1);
      }
    else
      variance = control.getVariance() + treatment.getVariance();

    if (!(variance > 0.0))
      return 2;

    const double zAlpha = NormalDistribution::criticalValue(alpha, alternative);
    const double zBeta = NormalDistribution::inverseNormalCdf(targetPower);
    const double n = std::ceil((zAlpha + zBeta) * (zAlpha + zBeta) * variance /
			       (minimumDetectableEffect * minimumDetectableEffect));

    return std::max<std::size_t>(2, static_cast<std::size_t>(n));
  }

  TestResult FrequentistTest::run(const GroupSummary& control,
				  const GroupSummary& treatment,
				  const TestConfiguration& config) const
  {
    if (control.getMetricKind() != config.getMetricKind() ||
	treatment.getMetricKind() != config.getMetricKind())
      throw ConfigurationError("FrequentistTest: summaries do not match the configured metric kind '" +
			       toString(config.getMetricKind()) + "'");

    const double alpha = config.getAlpha();
    const AlternativeHypothesis alternative = config.getAlternative();
    const FrequentistStatistic stat = computeStatistic(control, treatment, alternative);

    TestResult result(TestType::Frequentist, config.getMetricKind(), control, treatment);
    result.absoluteEffect = stat.difference;
    if (control.getMean() != 0.0)
      result.relativeUplift = stat.difference / control.getMean();

    result.statistic = stat.statistic;
    result.degreesOfFreedom = stat.degreesOfFreedom;
    result.pValue = stat.pValue;

    // Two-sided interval at level 1 - alpha
    double critical;
    if (stat.degreesOfFreedom)
      {
	boost::math::students_t dist(*stat.degreesOfFreedom);
	critical = boost::math::quantile(boost::math::complement(dist, alpha / 2.0));
      }
    else
      critical = NormalDistribution::criticalValue(alpha, AlternativeHypothesis::TwoTailed);

    IntervalEstimate interval;
    interval.level = 1.0 - alpha;
    interval.quantity = "difference";
    interval.lower = stat.difference - critical * stat.intervalStandardError;
    interval.upper = stat.difference + critical * stat.intervalStandardError;
    result.interval = interval;

    if (stat.degenerate)
      result.addNote("zero standard error: interval collapsed to the point estimate");

    result.addCurve(powerCurve(control, treatment, alpha, alternative));

    if (config.getMinimumDetectableEffect() > 0.0)
      {
	const double mde = config.getMinimumDetectableEffect();
	result.achievedPower = power(control, treatment, mde, alpha, alternative);
	result.requiredSampleSize = requiredSampleSize(control, treatment, mde, alpha,
						       config.getTargetPower(), alternative);
      }

    result.decision = (stat.pValue < alpha) ? Decision::Significant : Decision::NotSignificant;
    return result;
  }

} // namespace mkc_abtest
