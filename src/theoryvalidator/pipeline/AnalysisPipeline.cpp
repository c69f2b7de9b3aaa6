#include "AnalysisPipeline.h"

namespace theory_validator
{
  namespace pipeline
  {
    AnalysisPipeline::AnalysisPipeline(const sportsdata::HistoricalGameStore& store,
				       const EngineConfiguration& config,
				       concurrency::IParallelExecutor& executor,
				       const concurrency::CancellationToken& token)
      : mCohortStage(store, config.gamesLimitMax),
	mDatasetStage(store, executor, token),
	mEvaluationStage(config.verdict),
	mModelingStage(config.model),
	mSimulationStage(token),
	mMonteCarloStage(config.monteCarlo, executor, token),
	mToken(token)
    {}

    void AnalysisPipeline::executeDataset(AnalysisContext& ctx, std::ostream& os) const
    {
      mToken.throwIfCancelled("cohort selection");
      mCohortStage.execute(ctx, os);

      mToken.throwIfCancelled("feature computation");
      mDatasetStage.execute(ctx, os);
    }

    void AnalysisPipeline::executeAnalysis(AnalysisContext& ctx, std::ostream& os) const
    {
      executeDataset(ctx, os);

      mToken.throwIfCancelled("evaluation");
      mEvaluationStage.execute(ctx, os);
    }

    void AnalysisPipeline::executeBuild(AnalysisContext& ctx, std::ostream& os) const
    {
      executeAnalysis(ctx, os);

      mToken.throwIfCancelled("model fitting");
      auto decision = mModelingStage.execute(ctx, os);
      if (!decision.proceed())
	os << "✗ Modeling stopped: " << decision.rationale << "\n";

      // Simulation and Monte Carlo record their own not-run statuses.
      decision = mSimulationStage.execute(ctx, os);
      if (decision.proceed())
	mToken.throwIfCancelled("Monte Carlo");
      mMonteCarloStage.execute(ctx, os);
    }
  }
}
