#pragma once

#include <ostream>
#include "ModelBuilder.h"
#include "PipelineTypes.h"
#include "TheoryCandidateGenerator.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      /**
       * @brief Fits the scoring model on the cleaned cohort.
       *
       * Draft theory candidates are mined from the features the model kept,
       * or from every feature that survived pruning when no model was fitted.
       * A model that cannot be fitted stops the simulation stages but leaves
       * the evaluation intact.
       */
      class ModelingStage
      {
      public:
	explicit ModelingStage(const modeling::ModelPolicy& policy);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

      private:
	modeling::ModelBuilder mBuilder;
	modeling::TheoryCandidateGenerator mCandidates;
      };
    }
  }
}
