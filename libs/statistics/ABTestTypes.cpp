// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ABTestTypes.h"
#include "ABTestException.h"
#include <boost/algorithm/string.hpp>

namespace mkc_abtest
{
  namespace
  {
    // Lower-cases and maps '_' to '-' so "two_tailed" and "Two-Tailed" both parse
    std::string normalizeName(const std::string& name)
    {
      std::string normalized = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
      boost::algorithm::replace_all(normalized, "_", "-");
      return normalized;
    }
  }

  std::string toString(TestType type)
  {
    switch (type)
      {
      case TestType::Frequentist:
	return "frequentist";
      case TestType::Bayesian:
	return "bayesian";
      default:
	throw ConfigurationError("Unknown test type");
      }
  }

  std::string toString(MetricKind kind)
  {
    switch (kind)
      {
      case MetricKind::Binary:
	return "binary";
      case MetricKind::Continuous:
	return "continuous";
      case MetricKind::Count:
	return "count";
      default:
	throw ConfigurationError("Unknown metric kind");
      }
  }

  std::string toString(CorrectionMethod method)
  {
    switch (method)
      {
      case CorrectionMethod::None:
	return "none";
      case CorrectionMethod::Bonferroni:
	return "bonferroni";
      case CorrectionMethod::BenjaminiHochberg:
	return "benjamini-hochberg";
      case CorrectionMethod::Holm:
	return "holm";
      default:
	throw ConfigurationError("Unknown correction method");
      }
  }

  std::string toString(Decision decision)
  {
    switch (decision)
      {
      case Decision::Significant:
	return "significant";
      case Decision::NotSignificant:
	return "not significant";
      case Decision::ContinueSampling:
	return "continue sampling";
      case Decision::Inconclusive:
	return "inconclusive";
      default:
	throw ConfigurationError("Unknown decision");
      }
  }

  std::string toString(AlternativeHypothesis alternative)
  {
    switch (alternative)
      {
      case AlternativeHypothesis::TwoTailed:
	return "two-tailed";
      case AlternativeHypothesis::OneTailed:
	return "one-tailed";
      default:
	throw ConfigurationError("Unknown alternative hypothesis");
      }
  }

  std::string toString(UpliftMethod method)
  {
    switch (method)
      {
      case UpliftMethod::Percent:
	return "percent";
      case UpliftMethod::Ratio:
	return "ratio";
      case UpliftMethod::Difference:
	return "difference";
      default:
	throw ConfigurationError("Unknown uplift method");
      }
  }

  std::string toString(BucketingStrategy strategy)
  {
    switch (strategy)
      {
      case BucketingStrategy::Hash:
	return "hash";
      case BucketingStrategy::SeededRandom:
	return "seeded-random";
      case BucketingStrategy::Bucket:
	return "bucket";
      default:
	throw ConfigurationError("Unknown bucketing strategy");
      }
  }

  std::string toString(CountVarianceModel model)
  {
    switch (model)
      {
      case CountVarianceModel::Poisson:
	return "poisson";
      case CountVarianceModel::Sample:
	return "sample";
      default:
	throw ConfigurationError("Unknown count variance model");
      }
  }

  TestType parseTestType(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "frequentist")
      return TestType::Frequentist;
    if (key == "bayesian")
      return TestType::Bayesian;

    throw ConfigurationError("Unrecognized test type '" + name +
			     "': expected 'frequentist' or 'bayesian'");
  }

  MetricKind parseMetricKind(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "binary" || key == "conversion")
      return MetricKind::Binary;
    if (key == "continuous")
      return MetricKind::Continuous;
    if (key == "count")
      return MetricKind::Count;

    throw ConfigurationError("Unrecognized metric kind '" + name +
			     "': expected 'binary', 'continuous' or 'count'");
  }

  CorrectionMethod parseCorrectionMethod(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "none")
      return CorrectionMethod::None;
    if (key == "bonferroni")
      return CorrectionMethod::Bonferroni;
    if (key == "benjamini-hochberg" || key == "bh" || key == "fdr-bh")
      return CorrectionMethod::BenjaminiHochberg;
    if (key == "holm")
      return CorrectionMethod::Holm;

    throw ConfigurationError("Unrecognized correction method '" + name +
			     "': expected 'none', 'bonferroni', 'benjamini-hochberg' or 'holm'");
  }

  Decision parseDecision(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "significant")
      return Decision::Significant;
    if (key == "not significant")
      return Decision::NotSignificant;
    if (key == "continue sampling")
      return Decision::ContinueSampling;
    if (key == "inconclusive")
      return Decision::Inconclusive;

    throw ConfigurationError("Unrecognized decision '" + name + "'");
  }

  AlternativeHypothesis parseAlternativeHypothesis(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "two-tailed")
      return AlternativeHypothesis::TwoTailed;
    if (key == "one-tailed")
      return AlternativeHypothesis::OneTailed;

    throw ConfigurationError("Unrecognized alternative hypothesis '" + name +
			     "': expected 'two-tailed' or 'one-tailed'");
  }

  UpliftMethod parseUpliftMethod(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "percent")
      return UpliftMethod::Percent;
    if (key == "ratio")
      return UpliftMethod::Ratio;
    if (key == "difference")
      return UpliftMethod::Difference;

    throw ConfigurationError("Unrecognized uplift method '" + name +
			     "': expected 'percent', 'ratio' or 'difference'");
  }

  BucketingStrategy parseBucketingStrategy(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "hash")
      return BucketingStrategy::Hash;
    if (key == "seeded-random" || key == "random")
      return BucketingStrategy::SeededRandom;
    if (key == "bucket")
      return BucketingStrategy::Bucket;

    throw ConfigurationError("Unrecognized bucketing strategy '" + name + "'");
  }

  CountVarianceModel parseCountVarianceModel(const std::string& name)
  {
    const std::string key = normalizeName(name);
    if (key == "poisson")
      return CountVarianceModel::Poisson;
    if (key == "sample")
      return CountVarianceModel::Sample;

    throw ConfigurationError("Unrecognized count variance model '" + name + "'");
  }

} // namespace mkc_abtest
