#include "CohortStage.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      CohortStage::CohortStage(const sportsdata::HistoricalGameStore& store, int gamesLimitMax)
	: mStore(store),
	  mGamesLimitMax(gamesLimitMax)
      {}

      StageDecision CohortStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	const auto& target = ctx.request.target;
	const bool spreadMarket = target.isMarket() && target.marketType == evaluation::MarketType::Spread;

	cohort::CohortBuilder builder(mStore, mGamesLimitMax);
	ctx.selection = builder.build(ctx.request.filters, spreadMarket);
	ctx.computer = std::make_shared<const features::FeatureComputer>(ctx.selection.history,
									 ctx.request.filters.player);

	os << "   [Cohort] " << ctx.request.filters.league << ": " << ctx.selection.history->size()
	   << " games in " << ctx.selection.seasons.size() << " season(s), baseline "
	   << ctx.selection.baseline.size() << ", cohort " << ctx.selection.cohort.size();
	if (ctx.selection.gamesLimitApplied)
	  os << " (games_limit applied)";
	os << "\n";

	if (ctx.selection.cohort.empty())
	  os << "✗ Cohort is empty for the requested filters\n";

	return StageDecision::Continue();
      }
    }
  }
}
