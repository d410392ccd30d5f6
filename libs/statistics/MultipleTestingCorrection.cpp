// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "MultipleTestingCorrection.h"
#include "ABTestException.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace mkc_abtest
{
  namespace detail
  {
    void validatePValues(const std::vector<double>& pValues)
    {
      for (std::size_t i = 0; i < pValues.size(); ++i)
	{
	  const double p = pValues[i];
	  if (std::isnan(p) || p < 0.0 || p > 1.0)
	    {
	      std::ostringstream os;
	      os << "multiple testing correction: p-value " << p << " at position " << i
		 << " is outside [0, 1]";
	      throw ConfigurationError(os.str());
	    }
	}
    }

    std::vector<std::size_t> ascendingOrder(const std::vector<double>& pValues)
    {
      std::vector<std::size_t> order(pValues.size());
      std::iota(order.begin(), order.end(), 0);
      std::stable_sort(order.begin(), order.end(),
		       [&pValues](std::size_t a, std::size_t b) {
			 return pValues[a] < pValues[b];
		       });
      return order;
    }

    std::vector<CorrectionEntry> makeEntries(const std::vector<double>& pValues,
					     const std::vector<std::size_t>& order)
    {
      std::vector<CorrectionEntry> entries(pValues.size());
      for (std::size_t i = 0; i < pValues.size(); ++i)
	{
	  entries[i].index = i;
	  entries[i].rawPValue = pValues[i];
	}

      for (std::size_t r = 0; r < order.size(); ++r)
	entries[order[r]].rank = r + 1;

      return entries;
    }
  }

  std::vector<CorrectionEntry> NoCorrection::correct(const std::vector<double>& pValues, double targetAlpha)
  {
    auto entries = detail::makeEntries(pValues, detail::ascendingOrder(pValues));
    for (auto& entry : entries)
      {
	entry.adjustedPValue = entry.rawPValue;
	entry.threshold = targetAlpha;
	entry.significant = entry.rawPValue <= targetAlpha;
      }

    return entries;
  }

  std::vector<CorrectionEntry> BonferroniCorrection::correct(const std::vector<double>& pValues,
							     double targetAlpha)
  {
    const double n = static_cast<double>(pValues.size());
    auto entries = detail::makeEntries(pValues, detail::ascendingOrder(pValues));
    for (auto& entry : entries)
      {
	entry.threshold = targetAlpha / n;
	entry.adjustedPValue = std::min(1.0, n * entry.rawPValue);
	entry.significant = entry.rawPValue <= entry.threshold;
      }

    return entries;
  }

  std::vector<CorrectionEntry> HolmCorrection::correct(const std::vector<double>& pValues, double targetAlpha)
  {
    const std::size_t n = pValues.size();
    const auto order = detail::ascendingOrder(pValues);
    auto entries = detail::makeEntries(pValues, order);

    bool rejecting = true;
    double runningMax = 0.0;
    for (std::size_t i = 0; i < n; ++i)
      {
	CorrectionEntry& entry = entries[order[i]];
	const double remaining = static_cast<double>(n - i);

	entry.threshold = targetAlpha / remaining;
	runningMax = std::max(runningMax, std::min(1.0, remaining * entry.rawPValue));
	entry.adjustedPValue = runningMax;

	if (rejecting && entry.rawPValue <= entry.threshold)
	  entry.significant = true;
	else
	  rejecting = false;
      }

    return entries;
  }

  std::vector<CorrectionEntry> BenjaminiHochbergFdr::correct(const std::vector<double>& pValues,
							     double targetAlpha)
  {
    const std::size_t n = pValues.size();
    const auto order = detail::ascendingOrder(pValues);
    auto entries = detail::makeEntries(pValues, order);

    // Largest rank k with p(k) <= (k / n) alpha
    std::size_t cutoff = 0;
    for (std::size_t i = 0; i < n; ++i)
      {
	CorrectionEntry& entry = entries[order[i]];
	const double k = static_cast<double>(i + 1);
	entry.threshold = k / static_cast<double>(n) * targetAlpha;
	if (entry.rawPValue <= entry.threshold)
	  cutoff = i + 1;
      }

    double runningMin = 1.0;
    for (std::size_t i = n; i-- > 0; )
      {
	CorrectionEntry& entry = entries[order[i]];
	const double k = static_cast<double>(i + 1);
	runningMin = std::min(runningMin, static_cast<double>(n) * entry.rawPValue / k);
	entry.adjustedPValue = std::min(1.0, runningMin);
	entry.significant = (i + 1) <= cutoff;
      }

    return entries;
  }

  MultipleTestingCorrection::MultipleTestingCorrection(CorrectionMethod method, double targetAlpha)
    : mMethod(method),
      mTargetAlpha(targetAlpha)
  {
    if (!(targetAlpha > 0.0 && targetAlpha < 1.0))
      {
	std::ostringstream os;
	os << "multiple testing correction: target alpha " << targetAlpha << " is outside (0, 1)";
	throw ConfigurationError(os.str());
      }
  }

  std::vector<CorrectionEntry> MultipleTestingCorrection::correct(const std::vector<double>& pValues) const
  {
    detail::validatePValues(pValues);

    if (pValues.size() <= 1)
      return NoCorrection::correct(pValues, mTargetAlpha);

    switch (mMethod)
      {
      case CorrectionMethod::None:
	return NoCorrection::correct(pValues, mTargetAlpha);
      case CorrectionMethod::Bonferroni:
	return BonferroniCorrection::correct(pValues, mTargetAlpha);
      case CorrectionMethod::Holm:
	return HolmCorrection::correct(pValues, mTargetAlpha);
      case CorrectionMethod::BenjaminiHochberg:
	return BenjaminiHochbergFdr::correct(pValues, mTargetAlpha);
      }

    throw ConfigurationError("multiple testing correction: unknown method");
  }

  std::vector<TestResult> MultipleTestingCorrection::apply(const std::vector<TestResult>& results,
							   std::vector<CorrectionEntry>& entries) const
  {
    // Unscored results count as p = 1 so the family size is the batch size
    std::vector<double> scores;
    scores.reserve(results.size());
    for (const auto& result : results)
      {
	const auto score = result.significanceScore();
	scores.push_back(score ? std::clamp(*score, 0.0, 1.0) : 1.0);
      }

    const std::vector<CorrectionEntry> family = correct(scores);

    entries.clear();
    std::vector<TestResult> corrected(results);
    for (const auto& entry : family)
      {
	TestResult& result = corrected[entry.index];
	if (!result.significanceScore())
	  continue;

	result.adjustedPValue = entry.adjustedPValue;
	result.adjustedThreshold = entry.threshold;

	if (result.decision == Decision::Significant && !entry.significant)
	  {
	    result.decision = Decision::NotSignificant;
	    result.addNote("demoted to not significant by " + toString(mMethod) + " correction");
	  }
	entries.push_back(entry);
      }

    return corrected;
  }

  std::vector<TestResult> MultipleTestingCorrection::apply(const std::vector<TestResult>& results) const
  {
    std::vector<CorrectionEntry> entries;
    return apply(results, entries);
  }

} // namespace mkc_abtest
