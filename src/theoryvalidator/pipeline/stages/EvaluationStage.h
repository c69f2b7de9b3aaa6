#pragma once

#include <ostream>
#include "PipelineTypes.h"
#include "VerdictPolicy.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      // Cohort versus baseline comparison, correlations and feature quality.
      class EvaluationStage
      {
      public:
	explicit EvaluationStage(const evaluation::VerdictPolicy& policy);

	StageDecision execute(AnalysisContext& ctx, std::ostream& os) const;

      private:
	evaluation::VerdictPolicy mPolicy;
      };
    }
  }
}
