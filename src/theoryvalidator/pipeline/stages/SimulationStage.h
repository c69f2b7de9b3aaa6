#pragma once

#include <ostream>
#include "CancellationToken.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      /**
       * @brief Scores the cleaned cohort with the fitted model, applies the
       * trigger and exposure controls and settles the selected bets.
       *
       * Scoring is in-sample: the rows scored are the rows the model was fitted
       * on. Only rows with a resolved target can trigger.
       */
      class SimulationStage
      {
      public:
	explicit SimulationStage(const concurrency::CancellationToken& token);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

      private:
	const concurrency::CancellationToken& mToken;
      };
    }
  }
}
