#include "DatasetStage.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      DatasetStage::DatasetStage(const sportsdata::HistoricalGameStore& store,
				 concurrency::IParallelExecutor& executor,
				 const concurrency::CancellationToken& token)
	: mStore(store),
	  mExecutor(executor),
	  mToken(token)
      {}

      StageDecision DatasetStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	const auto& request = ctx.request;

	features::FeaturePolicy policy(request.context,
				       request.target.aliasFeatures(),
				       mStore.teamStatKeys(request.filters.league),
				       request.filters.player.has_value());
	ctx.featureSelection = policy.select(request.features);

	os << "   [Features] " << ctx.featureSelection.used.size() << " of "
	   << ctx.featureSelection.requested.size() << " requested features used ("
	   << features::runContextToString(request.context) << ")";
	if (!ctx.featureSelection.dropped.empty())
	  os << ", " << ctx.featureSelection.dropped.size() << " dropped";
	os << "\n";

	cohort::DatasetBuilder builder(*ctx.computer, mExecutor, mToken);
	ctx.dataset = builder.build(ctx.selection.cohort,
				    ctx.featureSelection.used,
				    ctx.featureSelection.usedSpecs,
				    request.target);

	cohort::DatasetCleaner cleaner(request.cleaning);
	ctx.cleaning = cleaner.clean(ctx.dataset.rows);

	os << "   [Cleaning] " << ctx.cleaning.rawRows << " rows -> " << ctx.cleaning.rowsAfterCleaning
	   << " (null " << ctx.cleaning.droppedNull << ", non-numeric "
	   << ctx.cleaning.droppedNonNumeric << ")\n";

	return StageDecision::Continue();
      }
    }
  }
}
