// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __SUMMARY_STATISTICS_H
#define __SUMMARY_STATISTICS_H 1

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "ABTestTypes.h"
#include "Bucketing.h"

namespace mkc_abtest
{
  /**
   * @brief One recorded subject: identifier, metric value and optional
   * pre-assigned group and timestamp.
   */
  struct Observation
  {
    std::string subjectId;
    double value = 0.0;
    std::optional<std::string> group;
    std::optional<std::string> timestamp;
  };

  /**
   * @class GroupSummary
   * @brief Sufficient statistics of one experiment group.
   *
   * Value object. Variance follows the metric kind:
   *   - Binary: p(1-p)
   *   - Continuous: sample variance (n-1 denominator)
   *   - Count: the mean (Poisson) or the sample variance
   */
  class GroupSummary
  {
  public:
    GroupSummary(const std::string& label,
		 MetricKind kind,
		 std::size_t sampleSize,
		 double sum,
		 double variance,
		 CountVarianceModel varianceModel = CountVarianceModel::Poisson);

    // Binary summary from a conversion count
    static GroupSummary fromConversions(const std::string& label,
					std::size_t conversions,
					std::size_t trials);

    // Continuous or count summary from its first two moments
    static GroupSummary fromMoments(const std::string& label,
				    MetricKind kind,
				    std::size_t sampleSize,
				    double mean,
				    double variance,
				    CountVarianceModel varianceModel = CountVarianceModel::Sample);

    const std::string& getLabel() const { return mLabel; }
    MetricKind getMetricKind() const { return mKind; }
    std::size_t getSampleSize() const { return mSampleSize; }
    double getSum() const { return mSum; }
    double getMean() const { return mMean; }
    double getVariance() const { return mVariance; }
    double getStdDev() const;
    CountVarianceModel getVarianceModel() const { return mVarianceModel; }

    // Standard error of the mean; zero for an empty group
    double getStandardError() const;

    // Conversions for binary metrics, empty otherwise
    std::optional<std::size_t> getConversions() const;

    // Fewer than two observations: enough for a posterior, not for a test statistic
    bool isLowInformation() const
    {
      return mSampleSize < 2;
    }

    /**
     * @brief Pool this summary with a later batch of the same group.
     *
     * Uses Chan's parallel update for the second moment so the result equals
     * summarizing the concatenated data.
     *
     * @throws ConfigurationError if label or metric kind differ.
     */
    GroupSummary combine(const GroupSummary& other) const;

    GroupSummary withLabel(const std::string& label) const;

    bool operator==(const GroupSummary& rhs) const;
    bool operator!=(const GroupSummary& rhs) const
    {
      return !(*this == rhs);
    }

  private:
    std::string mLabel;
    MetricKind mKind;
    std::size_t mSampleSize;
    double mSum;
    double mMean;
    double mVariance;
    CountVarianceModel mVarianceModel;
  };

  using GroupSummaryMap = std::map<std::string, GroupSummary>;

  /**
   * @brief Reduces raw observations into per-group summaries.
   *
   * Values are validated against the metric kind (binary in {0,1}, counts
   * non-negative integers, everything finite) and accumulated with
   * Boost.Accumulators.
   */
  class SummaryStatisticsExtractor
  {
  public:
    explicit SummaryStatisticsExtractor(MetricKind kind,
					CountVarianceModel varianceModel = CountVarianceModel::Poisson);

    /**
     * @brief Summarize observations that carry a pre-assigned group.
     *
     * @param requirement Frequentist requires at least two observations per
     *        group, Bayesian at least one.
     * @param expectedLabels Groups that must be present even if no
     *        observation mentions them.
     *
     * @throws ConfigurationError for invalid values or a missing group label.
     * @throws InsufficientDataError when a group is too small.
     */
    GroupSummaryMap summarize(const std::vector<Observation>& observations,
			      TestType requirement = TestType::Frequentist,
			      const std::vector<std::string>& expectedLabels = {}) const;

    // As above, using the assignment for observations without a group
    GroupSummaryMap summarize(const std::vector<Observation>& observations,
			      const GroupAssignment& assignment,
			      TestType requirement = TestType::Frequentist,
			      const std::vector<std::string>& expectedLabels = {}) const;

    GroupSummary summarizeValues(const std::string& label,
				 const std::vector<double>& values) const;

    MetricKind getMetricKind() const
    {
      return mKind;
    }

    static std::size_t minimumSampleSize(TestType requirement);

    static void requireSampleSize(const GroupSummary& summary, TestType requirement);

  private:
    void validateValue(double value, const std::string& subjectId) const;

  private:
    MetricKind mKind;
    CountVarianceModel mVarianceModel;
  };

} // namespace mkc_abtest

#endif
