#pragma once

#include <vector>
#include <cstddef>

namespace theory_validator
{
  namespace statistics
  {
    /**
     * @brief Drawdown of a cumulative unit-PnL path (magnitude-only API).
     *
     * Bets are flat unit stakes, so the equity curve is additive and starts at 0.
     * All values are drawdown magnitudes (non-negative, larger = worse), measured
     * in units rather than as a fraction of the peak.
     */
    class UnitDrawdowns
    {
    public:
      /**
       * @brief Maximum peak-to-trough drop of the cumulative sum of pnl.
       *
       * @param pnl per-bet profit or loss in units
       * @return The maximum drawdown magnitude. Returns 0 if input empty.
       */
      static double maxDrawdown(const std::vector<double>& pnl)
      {
	double maxDD = 0.0;
	double peak = 0.0;
	double equity = 0.0;

	for (double change : pnl)
	  {
	    equity += change;
	    if (equity > peak) {
	      peak = equity;
	    }
	    else
	      {
		const double dd = peak - equity;
		if (dd > maxDD) {
		  maxDD = dd;
		}
	      }
	  }
	return maxDD;
      }

      /**
       * @brief Running cumulative pnl and running drawdown after each bet.
       */
      static void runningPath(const std::vector<double>& pnl,
			      std::vector<double>& cumulative,
			      std::vector<double>& drawdown)
      {
	cumulative.clear();
	drawdown.clear();
	cumulative.reserve(pnl.size());
	drawdown.reserve(pnl.size());

	double peak = 0.0;
	double equity = 0.0;
	for (double change : pnl)
	  {
	    equity += change;
	    if (equity > peak)
	      peak = equity;
	    cumulative.push_back(equity);
	    drawdown.push_back(peak - equity);
	  }
      }
    };
  }
}
