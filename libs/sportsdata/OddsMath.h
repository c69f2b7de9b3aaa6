#pragma once

#include <cmath>
#include <optional>

namespace theory_validator
{
  namespace sportsdata
  {
    /**
     * @brief Conversions for American odds under a flat one-unit stake.
     */
    struct OddsMath
    {
      static constexpr double kDefaultReferencePrice = -110.0;

      /**
       * @brief Break-even probability of an American price.
       * @return std::nullopt for a price of 0, which is not a valid quote.
       */
      static std::optional<double> impliedProbability(double americanPrice)
      {
	if (americanPrice > 0.0)
	  return 100.0 / (americanPrice + 100.0);
	if (americanPrice < 0.0)
	  {
	    const double a = std::fabs(americanPrice);
	    return a / (a + 100.0);
	  }
	return std::nullopt;
      }

      // Profit on a winning one-unit bet.
      static std::optional<double> winProfit(double americanPrice)
      {
	if (americanPrice > 0.0)
	  return americanPrice / 100.0;
	if (americanPrice < 0.0)
	  return 100.0 / std::fabs(americanPrice);
	return std::nullopt;
      }

      static std::optional<double> unitPnl(double americanPrice, bool won)
      {
	if (!won)
	  return -1.0;
	return winProfit(americanPrice);
      }
    };
  }
}
