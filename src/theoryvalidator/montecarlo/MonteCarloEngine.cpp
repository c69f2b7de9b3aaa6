#include "MonteCarloEngine.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include "ParallelFor.h"
#include "RngUtils.h"
#include "StatUtils.h"
#include "UnitDrawdowns.h"

namespace theory_validator
{
  namespace montecarlo
  {
    using statistics::StatUtils;

    namespace
    {
      std::string fmt(double v, int precision)
      {
	std::ostringstream os;
	os << std::fixed << std::setprecision(precision) << v;
	return os.str();
      }

      constexpr uint32_t kCancelCheckInterval = 64;
    }

    MonteCarloEngine::MonteCarloEngine(const MonteCarloPolicy& policy,
				       concurrency::IParallelExecutor& executor,
				       const concurrency::CancellationToken& token)
      : mPolicy(policy),
	mExecutor(executor),
	mToken(token)
    {}

    MonteCarloStatus MonteCarloEngine::run(const std::vector<double>& unitPnl,
					   const MonteCarloAssumptions& assumptions,
					   bool exposureWarnings,
					   std::ostream& os) const
    {
      if (unitPnl.empty())
	{
	  os << "   [MonteCarlo] No bet tape, skipping" << std::endl;
	  return MonteCarloStatus::Unavailable("no_bet_tape", "No selected bets to resample.");
	}
      if (unitPnl.size() < mPolicy.minBets)
	{
	  os << "   [MonteCarlo] " << unitPnl.size() << " bets < minimum " << mPolicy.minBets << std::endl;
	  return MonteCarloStatus::Unavailable("insufficient_bets",
					       "Monte Carlo needs at least " + std::to_string(mPolicy.minBets) +
					       " settled bets; got " + std::to_string(unitPnl.size()) + ".");
	}

      const std::size_t n = unitPnl.size();
      const std::size_t runs = std::max<std::size_t>(mPolicy.resamples, 1);
      std::vector<double> finals(runs, 0.0);
      std::vector<double> drawdowns(runs, 0.0);

      os << "   [MonteCarlo] " << runs << " bootstrap trials over " << n << " bets" << std::endl;

      concurrency::parallel_for(static_cast<uint32_t>(runs), mExecutor, [&](uint32_t trial) {
	if (trial % kCancelCheckInterval == 0)
	  mToken.throwIfCancelled("Monte Carlo resampling");

	auto rng = rng_utils::make_replicate_engine(mPolicy.seed, trial);
	double equity = 0.0;
	double peak = 0.0;
	double maxDD = 0.0;
	for (std::size_t i = 0; i < n; ++i)
	  {
	    equity += unitPnl[rng_utils::draw_index(rng, n)];
	    if (equity > peak)
	      peak = equity;
	    else if (peak - equity > maxDD)
	      maxDD = peak - equity;
	  }
	finals[trial] = equity;
	drawdowns[trial] = maxDD;
      });
      mToken.throwIfCancelled("Monte Carlo resampling");

      MonteCarloMetrics m;
      m.runs = runs;
      m.betCount = n;
      m.seed = mPolicy.seed;
      const auto meanVar = StatUtils::computeMeanAndVariance(finals);
      m.meanPnl = meanVar.first;
      m.stdPnl = std::sqrt(meanVar.second);
      m.p5Pnl = StatUtils::quantile(finals, 0.05);
      m.p50Pnl = StatUtils::quantile(finals, 0.50);
      m.p95Pnl = StatUtils::quantile(finals, 0.95);
      m.p5MaxDrawdown = StatUtils::quantile(drawdowns, 0.05);
      m.p50MaxDrawdown = StatUtils::quantile(drawdowns, 0.50);
      m.p95MaxDrawdown = StatUtils::quantile(drawdowns, 0.95);

      const auto negatives = std::count_if(finals.begin(), finals.end(), [](double v) { return v < 0.0; });
      m.probNegative = static_cast<double>(negatives) / static_cast<double>(runs);

      m.actualPnl = std::accumulate(unitPnl.begin(), unitPnl.end(), 0.0);
      m.actualMaxDrawdown = statistics::UnitDrawdowns::maxDrawdown(unitPnl);
      const auto atOrBelow = std::count_if(finals.begin(), finals.end(),
					   [&m](double v) { return v <= m.actualPnl + 1e-12; });
      m.actualPercentile = static_cast<double>(atOrBelow) / static_cast<double>(runs);
      m.luckScore = m.stdPnl > 0.0 ? (m.actualPnl - m.meanPnl) / m.stdPnl : 0.0;

      m.assumptions = assumptions;
      m.interpretation = interpretationLines(m, exposureWarnings);

      os << "   [MonteCarlo] p5/p50/p95 final PnL: " << fmt(m.p5Pnl, 2) << " / " << fmt(m.p50Pnl, 2)
	 << " / " << fmt(m.p95Pnl, 2) << std::endl;
      return MonteCarloStatus::Complete(m);
    }

    std::vector<std::string> MonteCarloEngine::interpretationLines(const MonteCarloMetrics& m, bool exposureWarnings)
    {
      std::vector<std::string> lines;
      const double span = m.p95Pnl - m.p5Pnl;
      lines.push_back("MC is decision-support: it is a distribution over outcomes, not a promise.");
      lines.push_back("Variance range (P5->P95) spans " + fmt(span, 1) +
		      " units over this bet set; wider spans mean variance dominates.");
      if (std::fabs(m.meanPnl) < 1e-6)
	lines.push_back("Median/mean are near 0 under the MC baseline; edges may be fragile.");
      if (std::fabs(m.luckScore) > 2.0)
	lines.push_back("Luck score is large vs the MC baseline; be cautious attributing results to skill.");
      lines.push_back("Luck score = (actual " + fmt(m.actualPnl, 1) + " - mean " + fmt(m.meanPnl, 1) +
		      ") / std " + fmt(m.stdPnl, 2) + " = " + fmt(m.luckScore, 2) +
		      "; actual sits at percentile " + fmt(100.0 * m.actualPercentile, 1) + ".");
      lines.push_back("Bets are resampled as independent, exchangeable outcomes; streaks are not modeled.");
      if (exposureWarnings)
	lines.push_back("Exposure warnings apply: selection/caps can create over-betting artifacts.");
      return lines;
    }
  }
}
