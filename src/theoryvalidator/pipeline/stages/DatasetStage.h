#pragma once

#include <ostream>
#include "CancellationToken.h"
#include "HistoricalGameStore.h"
#include "IParallelExecutor.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      /**
       * @brief Applies the feature policy, materializes cohort rows and cleans
       * them.
       *
       * Feature values are computed on the executor. Rows dropped by cleaning
       * are gone for every later stage.
       */
      class DatasetStage
      {
      public:
	DatasetStage(const sportsdata::HistoricalGameStore& store,
		     concurrency::IParallelExecutor& executor,
		     const concurrency::CancellationToken& token);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

      private:
	const sportsdata::HistoricalGameStore& mStore;
	concurrency::IParallelExecutor& mExecutor;
	const concurrency::CancellationToken& mToken;
      };
    }
  }
}
