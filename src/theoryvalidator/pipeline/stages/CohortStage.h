#pragma once

#include <ostream>
#include "HistoricalGameStore.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      /**
       * @brief Selects baseline and cohort games and prepares the feature
       * computer over the season history.
       *
       * An empty cohort does not stop the pipeline; the evaluator reports it
       * as insufficient_sample.
       */
      class CohortStage
      {
      public:
	CohortStage(const sportsdata::HistoricalGameStore& store, int gamesLimitMax);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

      private:
	const sportsdata::HistoricalGameStore& mStore;
	int mGamesLimitMax;
      };
    }
  }
}
