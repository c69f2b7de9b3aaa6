#pragma once

#include <ostream>
#include "CancellationToken.h"
#include "IParallelExecutor.h"
#include "MonteCarloTypes.h"
#include "PipelineTypes.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      // Resamples the settled bet tape; unavailable when no tape was produced.
      class MonteCarloStage
      {
      public:
	MonteCarloStage(const montecarlo::MonteCarloPolicy& policy,
			concurrency::IParallelExecutor& executor,
			const concurrency::CancellationToken& token);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

	static montecarlo::MonteCarloAssumptions assumptionsFor(const AnalysisRequest& request);

      private:
	montecarlo::MonteCarloPolicy mPolicy;
	concurrency::IParallelExecutor& mExecutor;
	const concurrency::CancellationToken& mToken;
      };
    }
  }
}
