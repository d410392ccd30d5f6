// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>

namespace mkc_abtest
{
  /**
   * @brief Inference family used to evaluate a comparison.
   */
  enum class TestType
  {
    Frequentist,  ///< Sampling-distribution tests (p-values, confidence intervals)
    Bayesian      ///< Posterior-based tests (probability of superiority, expected loss)
  };

  /**
   * @brief Kind of metric observed for every subject.
   */
  enum class MetricKind
  {
    Binary,      ///< Conversion (0 or 1)
    Continuous,  ///< Real valued metric (revenue, duration, ...)
    Count        ///< Non-negative integer count (clicks, sessions, ...)
  };

  /**
   * @brief Multiple testing correction applied across a batch of tests.
   */
  enum class CorrectionMethod
  {
    None,
    Bonferroni,
    BenjaminiHochberg,
    Holm
  };

  /**
   * @brief Decision signal attached to every test result.
   */
  enum class Decision
  {
    Significant,
    NotSignificant,
    ContinueSampling,
    Inconclusive    ///< Valid result: the decision cannot be made yet (budget exhausted, non-convergent)
  };

  enum class AlternativeHypothesis
  {
    TwoTailed,
    OneTailed     ///< treatment > control
  };

  /**
   * @brief How the Bayesian engine expresses uplift of treatment over control.
   */
  enum class UpliftMethod
  {
    Percent,     ///< (t - c) / c
    Ratio,       ///< t / c
    Difference   ///< t - c
  };

  enum class BucketingStrategy
  {
    Hash,          ///< uniform [0,1) from a hash of subject id + experiment key
    SeededRandom,  ///< uniform [0,1) from an explicitly seeded engine
    Bucket         ///< hash modulo bucket count, mapped through bucket ranges
  };

  enum class CountVarianceModel
  {
    Poisson,  ///< variance equals the mean
    Sample    ///< sample variance with n-1 denominator
  };

  std::string toString(TestType type);
  std::string toString(MetricKind kind);
  std::string toString(CorrectionMethod method);
  std::string toString(Decision decision);
  std::string toString(AlternativeHypothesis alternative);
  std::string toString(UpliftMethod method);
  std::string toString(BucketingStrategy strategy);
  std::string toString(CountVarianceModel model);

  // Parsers accept the external interface spelling (e.g. "benjamini-hochberg")
  // and throw ConfigurationError on anything else.
  TestType parseTestType(const std::string& name);
  MetricKind parseMetricKind(const std::string& name);
  CorrectionMethod parseCorrectionMethod(const std::string& name);
  Decision parseDecision(const std::string& name);
  AlternativeHypothesis parseAlternativeHypothesis(const std::string& name);
  UpliftMethod parseUpliftMethod(const std::string& name);
  BucketingStrategy parseBucketingStrategy(const std::string& name);
  CountVarianceModel parseCountVarianceModel(const std::string& name);

} // namespace mkc_abtest
