// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __POSTERIOR_STAT_UTILS_H
#define __POSTERIOR_STAT_UTILS_H 1

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <vector>
#include "NormalQuantile.h"

namespace mkc_abtest
{
  /**
   * @brief Statistics over posterior draws: moments, quantiles, convergence
   * diagnostics and kernel density estimates.
   *
   * All functions work on plain std::vector<double>; chains are passed as a
   * vector of equally long vectors.
   */
  struct PosteriorStatUtils
  {
    static double mean(const std::vector<double>& x)
    {
      if (x.empty())
	return 0.0;

      return std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
    }

    // Sample variance (n-1 denominator) via Welford's update
    static double variance(const std::vector<double>& x)
    {
      if (x.size() < 2)
	return 0.0;

      double m = 0.0, m2 = 0.0;
      std::size_t k = 0;
      for (double v : x)
	{
	  ++k;
	  const double delta = v - m;
	  m += delta / static_cast<double>(k);
	  m2 += delta * (v - m);
	}

      return std::max(0.0, m2 / static_cast<double>(k - 1));
    }

    /**
     * @brief Quantile of already sorted data, linear interpolation between
     * order statistics (Hyndman-Fan type 7).
     */
    static double quantileSorted(const std::vector<double>& sorted, double p)
    {
      if (sorted.empty())
	throw std::invalid_argument("quantileSorted: empty input");

      if (p <= 0.0)
	return sorted.front();
      if (p >= 1.0)
	return sorted.back();

      const double h = (static_cast<double>(sorted.size()) - 1.0) * p;
      const auto lo = static_cast<std::size_t>(std::floor(h));
      const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
      return sorted[lo] + (h - static_cast<double>(lo)) * (sorted[hi] - sorted[lo]);
    }

    static double quantile(std::vector<double> x, double p)
    {
      std::sort(x.begin(), x.end());
      return quantileSorted(x, p);
    }

    /**
     * @brief Split-R-hat (Gelman et al., BDA3).
     *
     * Every chain is cut in half and the halves are treated as separate
     * chains, which also detects drift within a chain. Returns NaN when the
     * within-chain variance is zero, which callers treat as a failed
     * diagnostic.
     */
    static double splitRHat(const std::vector<std::vector<double>>& chains)
    {
      std::vector<std::vector<double>> halves;
      for (const auto& chain : chains)
	{
	  const std::size_t half = chain.size() / 2;
	  if (half < 2)
	    continue;

	  halves.emplace_back(chain.begin(), chain.begin() + static_cast<std::ptrdiff_t>(half));
	  halves.emplace_back(chain.begin() + static_cast<std::ptrdiff_t>(half),
			      chain.begin() + static_cast<std::ptrdiff_t>(2 * half));
	}

      if (halves.size() < 2)
	return std::numeric_limits<double>::quiet_NaN();

      const double n = static_cast<double>(halves.front().size());
      const double m = static_cast<double>(halves.size());

      std::vector<double> chainMeans;
      double within = 0.0;
      for (const auto& h : halves)
	{
	  chainMeans.push_back(mean(h));
	  within += variance(h);
	}
      within /= m;

      const double between = n * variance(chainMeans);
      if (!(within > 0.0))
	return std::numeric_limits<double>::quiet_NaN();

      const double varPlus = (n - 1.0) / n * within + between / n;
      return std::sqrt(varPlus / within);
    }

    /**
     * @brief Effective sample size over all chains.
     *
     * Autocorrelations are averaged across chains and summed in pairs until
     * the first negative pair (Geyer's initial positive sequence).
     */
    static double effectiveSampleSize(const std::vector<std::vector<double>>& chains)
    {
      if (chains.empty())
	return 0.0;

      const std::size_t n = chains.front().size();
      for (const auto& c : chains)
	if (c.size() != n)
	  throw std::invalid_argument("effectiveSampleSize: chains must have equal length");

      const double total = static_cast<double>(n * chains.size());
      if (n < 4)
	return total;

      std::vector<double> means, variances;
      for (const auto& c : chains)
	{
	  means.push_back(mean(c));
	  variances.push_back(variance(c));
	}

      const double within = mean(variances);
      if (!(within > 0.0))
	return 0.0;

      const std::size_t maxLag = std::min<std::size_t>(n - 1, 1000);
      auto rho = [&](std::size_t lag) {
	double acov = 0.0;
	for (std::size_t c = 0; c < chains.size(); ++c)
	  {
	    double s = 0.0;
	    for (std::size_t t = lag; t < n; ++t)
	      s += (chains[c][t] - means[c]) * (chains[c][t - lag] - means[c]);
	    acov += s / static_cast<double>(n);
	  }
	acov /= static_cast<double>(chains.size());
	return acov / within;
      };

      double tau = -1.0;  // 1 + 2 * sum(rho_t) written as sum over pairs minus rho_0
      for (std::size_t lag = 0; lag + 1 <= maxLag; lag += 2)
	{
	  const double pairSum = rho(lag) + rho(lag + 1);
	  if (pairSum < 0.0)
	    break;
	  tau += 2.0 * pairSum;
	}

      if (!(tau > 0.0))
	return total;

      return std::min(total, total / tau);
    }

    /**
     * @brief Silverman's rule of thumb bandwidth,
     * 0.9 * min(sd, IQR / 1.34) * n^(-1/5).
     */
    static double silvermanBandwidth(const std::vector<double>& sorted)
    {
      if (sorted.size() < 2)
	return 0.0;

      const double sd = std::sqrt(variance(sorted));
      const double iqr = quantileSorted(sorted, 0.75) - quantileSorted(sorted, 0.25);
      double spread = sd;
      if (iqr > 0.0)
	spread = std::min(sd, iqr / 1.34);

      return 0.9 * spread * std::pow(static_cast<double>(sorted.size()), -0.2);
    }

    // Evenly spaced grid of points over [lo, hi]
    static std::vector<double> linearGrid(double lo, double hi, std::size_t points)
    {
      std::vector<double> grid;
      if (points == 0)
	return grid;

      if (points == 1 || hi <= lo)
	{
	  grid.assign(points, lo);
	  return grid;
	}

      const double step = (hi - lo) / static_cast<double>(points - 1);
      for (std::size_t i = 0; i < points; ++i)
	grid.push_back(lo + step * static_cast<double>(i));

      return grid;
    }

    /**
     * @brief Gaussian kernel density of the draws evaluated on grid.
     */
    static std::vector<double> gaussianKde(const std::vector<double>& draws,
					   const std::vector<double>& grid,
					   double bandwidth)
    {
      std::vector<double> density(grid.size(), 0.0);
      if (draws.empty() || !(bandwidth > 0.0))
	return density;

      const double norm = 1.0 / (static_cast<double>(draws.size()) * bandwidth);
      for (std::size_t i = 0; i < grid.size(); ++i)
	{
	  double s = 0.0;
	  for (double d : draws)
	    s += detail::compute_normal_pdf((grid[i] - d) / bandwidth);
	  density[i] = s * norm;
	}

      return density;
    }
  };

} // namespace mkc_abtest

#endif
