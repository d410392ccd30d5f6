// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ResultAggregator.h"
#include "ABTestException.h"
#include <set>
#include <stdexcept>

namespace mkc_abtest
{
  AggregateReport::AggregateReport(CorrectionMethod method,
				   double targetAlpha,
				   std::vector<NamedResult> results,
				   std::vector<CorrectionEntry> corrections)
    : mCorrectionMethod(method),
      mTargetAlpha(targetAlpha),
      mResults(std::move(results)),
      mCorrections(std::move(corrections)),
      mDecisionCounts{ { Decision::Significant, 0 },
		       { Decision::NotSignificant, 0 },
		       { Decision::ContinueSampling, 0 },
		       { Decision::Inconclusive, 0 } }
  {
    for (const auto& named : mResults)
      ++mDecisionCounts[named.result.decision];
  }

  bool AggregateReport::contains(const std::string& name) const
  {
    for (const auto& named : mResults)
      if (named.name == name)
	return true;

    return false;
  }

  const TestResult& AggregateReport::getResult(const std::string& name) const
  {
    for (const auto& named : mResults)
      if (named.name == name)
	return named.result;

    throw std::out_of_range("AggregateReport: no result named '" + name + "'");
  }

  std::size_t AggregateReport::count(Decision decision) const
  {
    auto it = mDecisionCounts.find(decision);
    return (it == mDecisionCounts.end()) ? 0 : it->second;
  }

  bool AggregateReport::operator==(const AggregateReport& rhs) const
  {
    return mCorrectionMethod == rhs.mCorrectionMethod &&
      mTargetAlpha == rhs.mTargetAlpha &&
      mResults == rhs.mResults &&
      mCorrections == rhs.mCorrections;
  }

  ResultAggregator::ResultAggregator(CorrectionMethod method, double targetAlpha)
    : mCorrection(method, targetAlpha)
  {}

  AggregateReport ResultAggregator::aggregate(const std::vector<NamedResult>& results) const
  {
    std::set<std::string> names;
    std::vector<TestResult> raw;
    raw.reserve(results.size());

    for (const auto& named : results)
      {
	if (named.name.empty())
	  throw ConfigurationError("ResultAggregator: test names must not be empty");

	if (!names.insert(named.name).second)
	  throw ConfigurationError("ResultAggregator: duplicate test name '" + named.name + "'");

	raw.push_back(named.result);
      }

    std::vector<CorrectionEntry> entries;
    std::vector<TestResult> corrected = mCorrection.apply(raw, entries);

    std::vector<NamedResult> out;
    out.reserve(results.size());
    for (std::size_t i = 0; i < results.size(); ++i)
      out.push_back(NamedResult{ results[i].name, std::move(corrected[i]) });

    return AggregateReport(mCorrection.getMethod(), mCorrection.getTargetAlpha(),
			   std::move(out), std::move(entries));
  }

} // namespace mkc_abtest
