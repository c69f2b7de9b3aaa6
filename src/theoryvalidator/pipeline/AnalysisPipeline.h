#pragma once

#include <ostream>
#include "CancellationToken.h"
#include "EngineConfiguration.h"
#include "HistoricalGameStore.h"
#include "IParallelExecutor.h"
#include "PipelineTypes.h"
#include "stages/CohortStage.h"
#include "stages/DatasetStage.h"
#include "stages/EvaluationStage.h"
#include "stages/ModelingStage.h"
#include "stages/MonteCarloStage.h"
#include "stages/SimulationStage.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Runs the analysis stages for one request.
     *
     * Order:
     * 1. Cohort: baseline and cohort games, feature computer.
     * 2. Dataset: feature policy, feature values, cleaning.
     * 3. Evaluation: cohort versus baseline, correlations, feature quality.
     * 4. Modeling (build only): pruning and fitting.
     * 5. Simulation (build only): trigger, exposure, bet tape, slices.
     * 6. Monte Carlo (build only): bootstrap of the bet tape.
     *
     * A stage that stops leaves the later statuses at their not-run values;
     * everything computed so far stays in the context. The token is polled
     * between stages and inside the parallel ones.
     */
    class AnalysisPipeline
    {
    public:
      AnalysisPipeline(const sportsdata::HistoricalGameStore& store,
		       const EngineConfiguration& config,
		       concurrency::IParallelExecutor& executor,
		       const concurrency::CancellationToken& token);

      // Stages 1 to 3.
      void executeAnalysis(AnalysisContext& ctx, std::ostream& os) const;

      // Stages 1 to 6.
      void executeBuild(AnalysisContext& ctx, std::ostream& os) const;

      // Stages 1 and 2; the walk-forward validator takes over from there.
      void executeDataset(AnalysisContext& ctx, std::ostream& os) const;

    private:
      stages::CohortStage mCohortStage;
      stages::DatasetStage mDatasetStage;
      stages::EvaluationStage mEvaluationStage;
      stages::ModelingStage mModelingStage;
      stages::SimulationStage mSimulationStage;
      stages::MonteCarloStage mMonteCarloStage;
      const concurrency::CancellationToken& mToken;
    };
  }
}
