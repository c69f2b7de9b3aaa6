#pragma once

#include <optional>
#include <string>
#include <vector>
#include "SimulationTypes.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace simulation
  {
    /**
     * @brief Applies a TriggerDefinition to scored rows.
     *
     * Edge is model_prob minus the implied probability for market targets
     * and model_prob minus 0.5 for binary stat targets. Conditions are checked
     * in the order threshold, confidence band, minimum edge; the first failing
     * condition is recorded as the reason.
     */
    class TriggerEvaluator
    {
    public:
      TriggerEvaluator(const TriggerDefinition& trigger, const evaluation::TargetDefinition& target);

      // Reason code when the target cannot drive triggers at all.
      static std::optional<std::string> ineligibility(const evaluation::TargetDefinition& target);

      // The side a bet on this target takes.
      static std::string betSide(const evaluation::TargetDefinition& target);

      ScoredRow evaluate(const cohort::CohortRow& row, double modelProb) const;

    private:
      TriggerDefinition mTrigger;
      evaluation::TargetDefinition mTarget;
      std::string mSide;
    };
  }
}
