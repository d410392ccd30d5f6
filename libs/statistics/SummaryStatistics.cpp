// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "SummaryStatistics.h"
#include "ABTestException.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/sum.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace mkc_abtest
{
  namespace acc = boost::accumulators;

  namespace
  {
    using MomentAccumulator = acc::accumulator_set<
      double,
      acc::stats<acc::tag::sum, acc::tag::mean, acc::tag::variance, acc::tag::count>>;

    // Variance implied by the metric kind given the raw moments
    double modelVariance(MetricKind kind,
			 CountVarianceModel model,
			 std::size_t n,
			 double mean,
			 double sampleVariance)
    {
      if (kind == MetricKind::Binary)
	return mean * (1.0 - mean);

      if (kind == MetricKind::Count && model == CountVarianceModel::Poisson)
	return mean;

      return (n > 1) ? sampleVariance : 0.0;
    }
  }

  GroupSummary::GroupSummary(const std::string& label,
			     MetricKind kind,
			     std::size_t sampleSize,
			     double sum,
			     double variance,
			     CountVarianceModel varianceModel)
    : mLabel(label),
      mKind(kind),
      mSampleSize(sampleSize),
      mSum(sum),
      mMean(sampleSize > 0 ? sum / static_cast<double>(sampleSize) : 0.0),
      mVariance(variance),
      mVarianceModel(varianceModel)
  {
    if (mLabel.empty())
      throw ConfigurationError("GroupSummary: label must not be empty");

    if (!std::isfinite(sum) || !std::isfinite(variance) || variance < 0.0)
      throw ConfigurationError("GroupSummary: sum and variance must be finite and variance non-negative for group '" +
			       label + "'");

    if (kind == MetricKind::Binary && (sum < 0.0 || sum > static_cast<double>(sampleSize)))
      throw ConfigurationError("GroupSummary: conversions exceed trials for group '" + label + "'");

    if (kind == MetricKind::Count && sum < 0.0)
      throw ConfigurationError("GroupSummary: negative total count for group '" + label + "'");
  }

  GroupSummary GroupSummary::fromConversions(const std::string& label,
					     std::size_t conversions,
					     std::size_t trials)
  {
    if (conversions > trials)
      {
	std::ostringstream os;
	os << "GroupSummary: " << conversions << " conversions exceed " << trials
	   << " trials for group '" << label << "'";
	throw ConfigurationError(os.str());
      }

    const double p = trials > 0 ? static_cast<double>(conversions) / static_cast<double>(trials) : 0.0;
    return GroupSummary(label, MetricKind::Binary, trials,
			static_cast<double>(conversions), p * (1.0 - p));
  }

  GroupSummary GroupSummary::fromMoments(const std::string& label,
					 MetricKind kind,
					 std::size_t sampleSize,
					 double mean,
					 double variance,
					 CountVarianceModel varianceModel)
  {
    if (!std::isfinite(mean))
      throw ConfigurationError("GroupSummary: mean must be finite for group '" + label + "'");

    const double sum = mean * static_cast<double>(sampleSize);
    if (kind == MetricKind::Binary)
      {
	const double p = mean;
	return GroupSummary(label, kind, sampleSize, sum, p * (1.0 - p));
      }

    return GroupSummary(label, kind, sampleSize, sum,
			modelVariance(kind, varianceModel, sampleSize, mean, variance),
			varianceModel);
  }

  double GroupSummary::getStdDev() const
  {
    return std::sqrt(mVariance);
  }

  double GroupSummary::getStandardError() const
  {
    if (mSampleSize == 0)
      return 0.0;

    return std::sqrt(mVariance / static_cast<double>(mSampleSize));
  }

  std::optional<std::size_t> GroupSummary::getConversions() const
  {
    if (mKind != MetricKind::Binary)
      return std::nullopt;

    return static_cast<std::size_t>(std::llround(mSum));
  }

  GroupSummary GroupSummary::combine(const GroupSummary& other) const
  {
    if (other.mLabel != mLabel)
      throw ConfigurationError("GroupSummary::combine: label mismatch ('" + mLabel + "' vs '" +
			       other.mLabel + "')");

    if (other.mKind != mKind)
      throw ConfigurationError("GroupSummary::combine: metric kind mismatch for group '" + mLabel + "'");

    if (other.mSampleSize == 0)
      return *this;
    if (mSampleSize == 0)
      return other;

    const std::size_t n = mSampleSize + other.mSampleSize;
    const double sum = mSum + other.mSum;
    const double mean = sum / static_cast<double>(n);

    if (mKind == MetricKind::Binary)
      return GroupSummary(mLabel, mKind, n, sum, mean * (1.0 - mean));

    if (mKind == MetricKind::Count && mVarianceModel == CountVarianceModel::Poisson)
      return GroupSummary(mLabel, mKind, n, sum, mean, mVarianceModel);

    // Chan et al. pairwise update of the sum of squared deviations
    const double na = static_cast<double>(mSampleSize);
    const double nb = static_cast<double>(other.mSampleSize);
    const double delta = other.mMean - mMean;
    const double m2 = mVariance * (na - 1.0) + other.mVariance * (nb - 1.0) +
      delta * delta * na * nb / static_cast<double>(n);
    const double variance = (n > 1) ? std::max(0.0, m2 / static_cast<double>(n - 1)) : 0.0;

    return GroupSummary(mLabel, mKind, n, sum, variance, mVarianceModel);
  }

  GroupSummary GroupSummary::withLabel(const std::string& label) const
  {
    return GroupSummary(label, mKind, mSampleSize, mSum, mVariance, mVarianceModel);
  }

  bool GroupSummary::operator==(const GroupSummary& rhs) const
  {
    return mLabel == rhs.mLabel &&
      mKind == rhs.mKind &&
      mSampleSize == rhs.mSampleSize &&
      mSum == rhs.mSum &&
      mVariance == rhs.mVariance &&
      mVarianceModel == rhs.mVarianceModel;
  }

  SummaryStatisticsExtractor::SummaryStatisticsExtractor(MetricKind kind,
							 CountVarianceModel varianceModel)
    : mKind(kind),
      mVarianceModel(varianceModel)
  {}

  std::size_t SummaryStatisticsExtractor::minimumSampleSize(TestType requirement)
  {
    return (requirement == TestType::Frequentist) ? 2 : 1;
  }

  void SummaryStatisticsExtractor::requireSampleSize(const GroupSummary& summary, TestType requirement)
  {
    const std::size_t minimum = minimumSampleSize(requirement);
    if (summary.getSampleSize() < minimum)
      {
	std::ostringstream os;
	os << "group '" << summary.getLabel() << "' has " << summary.getSampleSize()
	   << " observation(s); " << toString(requirement) << " tests need at least " << minimum;
	throw InsufficientDataError(os.str());
      }
  }

  void SummaryStatisticsExtractor::validateValue(double value, const std::string& subjectId) const
  {
    if (!std::isfinite(value))
      throw ConfigurationError("non-finite metric value for '" + subjectId + "'");

    switch (mKind)
      {
      case MetricKind::Binary:
	if (value != 0.0 && value != 1.0)
	  {
	    std::ostringstream os;
	    os << "binary metric value " << value << " for '" << subjectId
	       << "' must be 0 or 1";
	    throw ConfigurationError(os.str());
	  }
	break;

      case MetricKind::Count:
	if (value < 0.0 || std::floor(value) != value)
	  {
	    std::ostringstream os;
	    os << "count metric value " << value << " for '" << subjectId
	       << "' must be a non-negative integer";
	    throw ConfigurationError(os.str());
	  }
	break;

      case MetricKind::Continuous:
	break;
      }
  }

  GroupSummary SummaryStatisticsExtractor::summarizeValues(const std::string& label,
							   const std::vector<double>& values) const
  {
    MomentAccumulator moments;
    for (double v : values)
      {
	validateValue(v, label);
	moments(v);
      }

    const std::size_t n = acc::count(moments);
    if (n == 0)
      return GroupSummary(label, mKind, 0, 0.0, 0.0, mVarianceModel);

    const double mean = acc::mean(moments);
    // Boost reports the population variance; rescale to the n-1 denominator
    const double sampleVariance = (n > 1)
      ? acc::variance(moments) * static_cast<double>(n) / static_cast<double>(n - 1)
      : 0.0;

    return GroupSummary(label, mKind, n, acc::sum(moments),
			modelVariance(mKind, mVarianceModel, n, mean, std::max(0.0, sampleVariance)),
			mVarianceModel);
  }

  GroupSummaryMap SummaryStatisticsExtractor::summarize(const std::vector<Observation>& observations,
							TestType requirement,
							const std::vector<std::string>& expectedLabels) const
  {
    return summarize(observations, GroupAssignment(), requirement, expectedLabels);
  }

  GroupSummaryMap SummaryStatisticsExtractor::summarize(const std::vector<Observation>& observations,
							const GroupAssignment& assignment,
							TestType requirement,
							const std::vector<std::string>& expectedLabels) const
  {
    std::map<std::string, std::vector<double>> valuesByGroup;
    for (const auto& label : expectedLabels)
      valuesByGroup[label];

    for (const auto& obs : observations)
      {
	std::string group;
	if (obs.group)
	  group = *obs.group;
	else
	  {
	    const auto it = assignment.find(obs.subjectId);
	    if (it == assignment.end())
	      throw ConfigurationError("subject '" + obs.subjectId +
				       "' has no group label and no assignment");
	    group = it->second;
	  }

	validateValue(obs.value, obs.subjectId);
	valuesByGroup[group].push_back(obs.value);
      }

    GroupSummaryMap result;
    for (const auto& entry : valuesByGroup)
      {
	GroupSummary summary = summarizeValues(entry.first, entry.second);
	requireSampleSize(summary, requirement);
	result.emplace(entry.first, std::move(summary));
      }

    return result;
  }

} // namespace mkc_abtest
