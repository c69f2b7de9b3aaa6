#include "MonteCarloStage.h"
#include <iomanip>
#include <sstream>
#include "BetTape.h"
#include "MonteCarloEngine.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      namespace
      {
	std::string formatDouble(double v, int precision)
	{
	  std::ostringstream os;
	  os << std::fixed << std::setprecision(precision) << v;
	  return os.str();
	}

	std::string capText(const std::optional<int>& cap)
	{
	  return cap ? std::to_string(*cap) : std::string("none");
	}
      }

      MonteCarloStage::MonteCarloStage(const montecarlo::MonteCarloPolicy& policy,
				       concurrency::IParallelExecutor& executor,
				       const concurrency::CancellationToken& token)
	: mPolicy(policy),
	  mExecutor(executor),
	  mToken(token)
      {}

      montecarlo::MonteCarloAssumptions MonteCarloStage::assumptionsFor(const AnalysisRequest& request)
      {
	montecarlo::MonteCarloAssumptions assumptions;
	assumptions.oddsAssumption = request.target.isMarket()
	  ? evaluation::oddsAssumptionToString(request.target.oddsAssumption)
	  : std::string("even money (binary stat target)");

	const auto& trigger = request.trigger;
	const auto& exposure = request.exposure;
	assumptions.selectionPolicy.push_back("prob_threshold " + formatDouble(trigger.probThreshold, 3));
	if (trigger.confidenceBand)
	  assumptions.selectionPolicy.push_back("confidence_band " + formatDouble(*trigger.confidenceBand, 3));
	if (trigger.minEdgeVsImplied)
	  assumptions.selectionPolicy.push_back("min_edge_vs_implied " + formatDouble(*trigger.minEdgeVsImplied, 3));
	assumptions.selectionPolicy.push_back("max_bets_per_day " + capText(exposure.maxBetsPerDay));
	assumptions.selectionPolicy.push_back("max_bets_per_side_per_day " + capText(exposure.maxBetsPerSidePerDay));
	return assumptions;
      }

      StageDecision MonteCarloStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	if (!ctx.simulation || !ctx.simulation->isComplete())
	  {
	    ctx.monteCarlo = montecarlo::MonteCarloStatus::Unavailable("no_bet_tape",
								      "No bet tape: the trigger simulation did not run.");
	    return StageDecision::Stop("no_bet_tape");
	  }

	const auto& output = ctx.simulation->output();
	montecarlo::MonteCarloEngine engine(mPolicy, mExecutor, mToken);
	ctx.monteCarlo = engine.run(simulation::tapePnl(output.tape),
				    assumptionsFor(ctx.request),
				    !output.exposure.warnings.empty(),
				    os);

	if (!ctx.monteCarlo->available())
	  return StageDecision::Stop(ctx.monteCarlo->reason());
	return StageDecision::Continue();
      }
    }
  }
}
