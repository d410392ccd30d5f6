// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __RESULT_AGGREGATOR_H
#define __RESULT_AGGREGATOR_H 1

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "ABTestTypes.h"
#include "MultipleTestingCorrection.h"
#include "TestResult.h"

namespace mkc_abtest
{
  struct NamedResult
  {
    std::string name;
    TestResult result;

    bool operator==(const NamedResult& rhs) const
    {
      return name == rhs.name && result == rhs.result;
    }
  };

  /**
   * @class AggregateReport
   * @brief Corrected results of a batch keyed by test name, in the order
   * the tests were supplied, with the correction entries and a count of
   * results per decision.
   */
  class AggregateReport
  {
  public:
    AggregateReport()
      : mCorrectionMethod(CorrectionMethod::None),
	mTargetAlpha(0.0),
	mResults(),
	mCorrections(),
	mDecisionCounts()
    {}

    AggregateReport(CorrectionMethod method,
		    double targetAlpha,
		    std::vector<NamedResult> results,
		    std::vector<CorrectionEntry> corrections);

    CorrectionMethod getCorrectionMethod() const { return mCorrectionMethod; }
    double getTargetAlpha() const { return mTargetAlpha; }
    const std::vector<NamedResult>& getResults() const { return mResults; }
    const std::vector<CorrectionEntry>& getCorrections() const { return mCorrections; }
    std::size_t size() const { return mResults.size(); }

    bool contains(const std::string& name) const;

    /**
     * @throws std::out_of_range when no result has that name.
     */
    const TestResult& getResult(const std::string& name) const;

    std::size_t count(Decision decision) const;

    // All decisions, including those with a zero count
    const std::map<Decision, std::size_t>& getDecisionCounts() const
    {
      return mDecisionCounts;
    }

    bool operator==(const AggregateReport& rhs) const;

  private:
    CorrectionMethod mCorrectionMethod;
    double mTargetAlpha;
    std::vector<NamedResult> mResults;
    std::vector<CorrectionEntry> mCorrections;
    std::map<Decision, std::size_t> mDecisionCounts;
  };

  /**
   * @class ResultAggregator
   * @brief Applies multiple-testing correction across a batch of named
   * results and assembles the report. Inputs are never modified.
   */
  class ResultAggregator
  {
  public:
    ResultAggregator(CorrectionMethod method, double targetAlpha);

    /**
     * @throws ConfigurationError on duplicate or empty test names.
     */
    AggregateReport aggregate(const std::vector<NamedResult>& results) const;

  private:
    MultipleTestingCorrection mCorrection;
  };

} // namespace mkc_abtest

#endif
