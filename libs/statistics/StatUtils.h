#pragma once
#include <vector>
#include <cmath>
#include <numeric>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <optional>
#include <limits>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace theory_validator
{
  namespace statistics
  {
    /**
     * @brief Descriptive summary of a sample of doubles.
     *
     * std is the unbiased sample standard deviation (N-1); it is 0 for fewer
     * than two values. Quartiles use StatUtils::quantile.
     */
    struct DescriptiveSummary
    {
      std::size_t count{0};
      double mean{0.0};
      double std{0.0};
      double min{0.0};
      double max{0.0};
      double p25{0.0};
      double p75{0.0};
    };

    struct StatUtils
    {
      static double mean(const std::vector<double>& v)
      {
	if (v.empty())
	  return 0.0;
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
      }

      /**
       * @brief Single-pass, numerically stable mean and (unbiased) variance via Welford.
       *        Returns {0,0} for empty; variance=0 for n<2.
       */
      static std::pair<double, double> computeMeanAndVariance(const std::vector<double>& data)
      {
	const size_t n = data.size();
	if (n == 0)
	  return {0.0, 0.0};

	long double mean = 0.0L;
	long double m2   = 0.0L;
	size_t k = 0;

	for (double d : data)
	  {
	    const long double x = static_cast<long double>(d);
	    ++k;
	    const long double delta  = x - mean;
	    mean += delta / static_cast<long double>(k);
	    const long double delta2 = x - mean;
	    m2 += delta * delta2;
	  }

	if (k < 2)
	  return {static_cast<double>(mean), 0.0};

	const long double var = m2 / static_cast<long double>(k - 1);
	return {static_cast<double>(mean), static_cast<double>(var)};
      }

      static double standardDeviation(const std::vector<double>& data)
      {
	return std::sqrt(computeMeanAndVariance(data).second);
      }

      /**
       * @brief Computes the q-th quantile with linear interpolation.
       *
       * The continuous index is q * (N-1); when it is fractional the two
       * surrounding order statistics are interpolated. q is clamped to [0,1].
       * Operates on a copy of the input.
       *
       * @return The quantile, or 0.0 if the input is empty.
       */
      static double quantile(std::vector<double> v, double q)
      {
	if (v.empty())
	  return 0.0;

	q = std::min(std::max(q, 0.0), 1.0);

	const double idx = q * (static_cast<double>(v.size()) - 1.0);
	const auto lo = static_cast<std::size_t>(std::floor(idx));
	const auto hi = static_cast<std::size_t>(std::ceil(idx));

	std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(lo), v.end());
	const double vlo = v[lo];

	if (hi == lo)
	  return vlo;

	std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(hi), v.end());
	const double vhi = v[hi];

	const double frac = idx - static_cast<double>(lo);
	return vlo + (vhi - vlo) * frac;
      }

      /**
       * @brief Mean, sample std, min, max and quartiles in one call.
       *
       * Uses a Boost accumulator set for the moments and extremes.
       */
      static DescriptiveSummary describe(const std::vector<double>& v)
      {
	using namespace boost::accumulators;

	DescriptiveSummary out;
	if (v.empty())
	  return out;

	accumulator_set<double, stats<tag::count, tag::mean, tag::variance, tag::min, tag::max>> acc;
	for (double x : v)
	  acc(x);

	const double n = static_cast<double>(v.size());
	out.count = v.size();
	out.mean = boost::accumulators::mean(acc);
	out.min = boost::accumulators::min(acc);
	out.max = boost::accumulators::max(acc);
	// accumulators report the population variance; rescale to N-1
	out.std = v.size() > 1 ? std::sqrt(boost::accumulators::variance(acc) * n / (n - 1.0)) : 0.0;
	out.p25 = quantile(v, 0.25);
	out.p75 = quantile(v, 0.75);
	return out;
      }

      /**
       * @brief Pearson correlation of two equally sized samples.
       *
       * @return std::nullopt when fewer than minPairs values are given or
       *         either sample has zero spread.
       */
      static std::optional<double> pearson(const std::vector<double>& x,
					   const std::vector<double>& y,
					   std::size_t minPairs = 2)
      {
	const std::size_t n = std::min(x.size(), y.size());
	if (n < minPairs || n < 2)
	  return std::nullopt;

	double mx = 0.0, my = 0.0;
	for (std::size_t i = 0; i < n; ++i)
	  {
	    mx += x[i];
	    my += y[i];
	  }
	mx /= static_cast<double>(n);
	my /= static_cast<double>(n);

	double sxy = 0.0, sxx = 0.0, syy = 0.0;
	for (std::size_t i = 0; i < n; ++i)
	  {
	    const double dx = x[i] - mx;
	    const double dy = y[i] - my;
	    sxy += dx * dy;
	    sxx += dx * dx;
	    syy += dy * dy;
	  }

	if (sxx <= 0.0 || syy <= 0.0)
	  return std::nullopt;

	const double r = sxy / std::sqrt(sxx * syy);
	return std::max(-1.0, std::min(1.0, r));
      }
    };
  }
}
