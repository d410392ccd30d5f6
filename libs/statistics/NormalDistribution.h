// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//
// Normal distribution helpers used by the hypothesis tests: CDF, tail areas,
// quantiles and critical values. Delegates to the Acklam quantile in
// NormalQuantile.h.

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include "NormalQuantile.h"
#include "ABTestTypes.h"

namespace mkc_abtest
{
  /**
   * @struct NormalDistribution
   * @brief Utility functions for the standard normal distribution N(0,1).
   *
   * Unlike the functions in NormalQuantile.h these never throw: boundary
   * probabilities map to +/- infinity, which the callers treat as "never
   * reject" or "always reject" as appropriate.
   */
  struct NormalDistribution
  {
    static inline double standardNormalCdf(double x) noexcept
    {
      return detail::compute_normal_cdf(x);
    }

    static inline double upperTail(double x) noexcept
    {
      return detail::compute_normal_survival(x);
    }

    static inline double density(double x) noexcept
    {
      return detail::compute_normal_pdf(x);
    }

    /**
     * @brief Inverse of the standard normal CDF.
     *
     * @return x such that Phi(x) = p; -inf for p <= 0, +inf for p >= 1 and
     *         NaN for NaN input.
     */
    static inline double inverseNormalCdf(double p) noexcept
    {
      if (std::isnan(p))
	return std::numeric_limits<double>::quiet_NaN();
      if (p <= 0.0)
	return -std::numeric_limits<double>::infinity();
      if (p >= 1.0)
	return std::numeric_limits<double>::infinity();

      return detail::compute_normal_quantile(p);
    }

    /**
     * @brief Critical value for a test of size alpha.
     *
     * Two-tailed tests return z_{1 - alpha/2}, one-tailed tests z_{1 - alpha}.
     */
    static inline double criticalValue(double alpha, AlternativeHypothesis alternative) noexcept
    {
      if (!(alpha > 0.0 && alpha < 1.0))
	return std::numeric_limits<double>::infinity();

      const double tail = (alternative == AlternativeHypothesis::TwoTailed) ? alpha / 2.0 : alpha;
      return inverseNormalCdf(1.0 - tail);
    }

    /**
     * @brief p-value of an observed z statistic.
     *
     * The one-tailed alternative is "treatment > control", so only large
     * positive statistics are evidence against the null.
     */
    static inline double pValue(double z, AlternativeHypothesis alternative) noexcept
    {
      if (alternative == AlternativeHypothesis::TwoTailed)
	return std::min(1.0, 2.0 * upperTail(std::fabs(z)));

      return upperTail(z);
    }
  };

} // namespace mkc_abtest
