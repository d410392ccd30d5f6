// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __MULTIPLE_TESTING_CORRECTION_H
#define __MULTIPLE_TESTING_CORRECTION_H 1

#include <cstddef>
#include <vector>
#include "ABTestTypes.h"
#include "TestResult.h"

namespace mkc_abtest
{
  /**
   * @brief Outcome of a correction for one test of the family.
   *
   * index is the position of the test in the input; rank is its 1-based
   * position after sorting the p-values ascending (ties keep input order).
   */
  struct CorrectionEntry
  {
    std::size_t index = 0;
    double rawPValue = 0.0;
    double adjustedPValue = 0.0;
    double threshold = 0.0;
    std::size_t rank = 0;
    bool significant = false;

    bool operator==(const CorrectionEntry& rhs) const
    {
      return index == rhs.index && rawPValue == rhs.rawPValue &&
	adjustedPValue == rhs.adjustedPValue && threshold == rhs.threshold &&
	rank == rhs.rank && significant == rhs.significant;
    }
  };

  namespace detail
  {
    // Throws ConfigurationError on NaN or values outside [0, 1]
    void validatePValues(const std::vector<double>& pValues);

    // Input positions ordered by ascending p-value, stable for ties
    std::vector<std::size_t> ascendingOrder(const std::vector<double>& pValues);

    // Entries in input order, with index, raw p-value and rank filled in
    std::vector<CorrectionEntry> makeEntries(const std::vector<double>& pValues,
					     const std::vector<std::size_t>& order);
  }

  //===========================================================================
  // Policy: NoCorrection
  //
  // Every test is compared against the target alpha unchanged.
  //===========================================================================
  struct NoCorrection
  {
    static std::vector<CorrectionEntry> correct(const std::vector<double>& pValues, double targetAlpha);
  };

  //===========================================================================
  // Policy: BonferroniCorrection
  //
  // Controls the family-wise error rate: threshold alpha / n, adjusted
  // p-value min(1, n p).
  //===========================================================================
  struct BonferroniCorrection
  {
    static std::vector<CorrectionEntry> correct(const std::vector<double>& pValues, double targetAlpha);
  };

  //===========================================================================
  // Policy: HolmCorrection
  //
  // Step-down Holm-Bonferroni. The sorted p-values p(0) <= ... <= p(n-1) are
  // tested against alpha / (n - i) in turn; testing stops at the first
  // failure and every later test is retained as null. Adjusted p-values are
  // the running maximum of (n - i) p(i), capped at 1.
  //===========================================================================
  struct HolmCorrection
  {
    static std::vector<CorrectionEntry> correct(const std::vector<double>& pValues, double targetAlpha);
  };

  //===========================================================================
  // Policy: BenjaminiHochbergFdr
  //
  // Step-up Benjamini-Hochberg controlling the false discovery rate. With
  // k the largest rank such that p(k) <= (k / n) alpha, all tests of rank
  // <= k are rejected. Adjusted p-values (q-values) are the running minimum
  // of n p(i) / i taken from the largest p-value down, capped at 1.
  //===========================================================================
  struct BenjaminiHochbergFdr
  {
    static std::vector<CorrectionEntry> correct(const std::vector<double>& pValues, double targetAlpha);
  };

  /**
   * @class MultipleTestingCorrection
   * @brief Applies the configured correction to a family of p-values or to
   * a batch of test results.
   *
   * A frequentist result enters the family with its p-value and a Bayesian
   * one with 1 - P(superiority). Results without a score (inconclusive runs)
   * enter the family with p = 1, so the family size is always the number of
   * results; they receive no adjusted value or entry. The correction can only demote a significant
   * result to not significant; other decisions are left as they are.
   */
  class MultipleTestingCorrection
  {
  public:
    /**
     * @throws ConfigurationError if targetAlpha is outside (0, 1).
     */
    MultipleTestingCorrection(CorrectionMethod method, double targetAlpha);

    CorrectionMethod getMethod() const
    {
      return mMethod;
    }

    double getTargetAlpha() const
    {
      return mTargetAlpha;
    }

    /**
     * @brief One entry per p-value, in input order.
     *
     * A single test, or method none, is returned unadjusted.
     *
     * @throws ConfigurationError on an invalid p-value.
     */
    std::vector<CorrectionEntry> correct(const std::vector<double>& pValues) const;

    /**
     * @brief Corrected copies of results; entries receives one entry per
     * scored result, in input order, whose index refers to the position in
     * results.
     */
    std::vector<TestResult> apply(const std::vector<TestResult>& results,
				  std::vector<CorrectionEntry>& entries) const;

    std::vector<TestResult> apply(const std::vector<TestResult>& results) const;

  private:
    CorrectionMethod mMethod;
    double mTargetAlpha;
  };

} // namespace mkc_abtest

#endif
