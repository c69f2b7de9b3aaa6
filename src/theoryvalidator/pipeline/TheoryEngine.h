#pragma once

#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "CancellationToken.h"
#include "EngineConfiguration.h"
#include "FeatureTypes.h"
#include "HistoricalGameStore.h"
#include "IParallelExecutor.h"
#include "PipelineTypes.h"
#include "RetryingGameStore.h"
#include "RunStore.h"
#include "SnapshotBuilder.h"

namespace theory_validator
{
  namespace pipeline
  {
    /**
     * @brief Entry point for every engine operation.
     *
     * Requests are validated before the game store is touched. Store reads go
     * through a RetryingGameStore. analyze, buildModel and runWalkforward save
     * their run only after the complete result has been assembled and the
     * token has been checked one last time, so a cancelled operation leaves
     * the run store unchanged. Repeating a request returns the same run id and
     * result; the first stored copy is kept.
     */
    class TheoryEngine
    {
    public:
      TheoryEngine(const sportsdata::HistoricalGameStore& store,
		   runstore::RunStore& runs,
		   const EngineConfiguration& config);

      TheoryEngine(const sportsdata::HistoricalGameStore& store,
		   runstore::RunStore& runs,
		   const EngineConfiguration& config,
		   sportsdata::RetryingGameStore::Sleeper sleeper);

      features::FeatureCatalog generateFeatures(const features::FeatureGenerationRequest& request) const;

      AnalyzeResult analyze(const AnalysisRequest& request,
			    const concurrency::CancellationToken& token,
			    std::ostream& os);

      BuildModelResult buildModel(const AnalysisRequest& request,
				  const concurrency::CancellationToken& token,
				  std::ostream& os);

      WalkforwardRunResult runWalkforward(const AnalysisRequest& request,
					  const concurrency::CancellationToken& token,
					  std::ostream& os);

      runstore::StoredRun getRun(const std::string& runId) const;

      std::vector<runstore::StoredRun> listRuns() const;

      const EngineConfiguration& configuration() const
      {
	return mConfig;
      }

    private:
      void persist(RunType runType,
		   const RunSnapshot& snapshot,
		   const AnalysisContext& ctx,
		   const std::string& resultJson,
		   const concurrency::CancellationToken& token,
		   std::ostream& os);

    private:
      EngineConfiguration mConfig;
      sportsdata::RetryingGameStore mStore;
      runstore::RunStore& mRuns;
      std::unique_ptr<concurrency::IParallelExecutor> mExecutor;
    };

    // UTC timestamp, ISO 8601 with microseconds.
    std::string utcTimestamp();
  }
}
