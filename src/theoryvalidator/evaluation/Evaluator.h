#pragma once

#include <vector>
#include "CohortDataset.h"
#include "EvaluationTypes.h"
#include "GameRecord.h"
#include "TargetDefinition.h"
#include "VerdictPolicy.h"

namespace theory_validator
{
  namespace evaluation
  {
    /**
     * @brief Compares a cohort against its baseline population for a target.
     *
     * Stat targets compare means (numeric) or rates (binary). Market targets
     * compare hit rates over resolved rows and, where closing odds exist,
     * report implied probability, EV versus implied and unit ROI under the
     * target's odds assumption. Data-insufficiency is reported through
     * EvaluationResult::reasonCode, never thrown.
     */
    class Evaluator
    {
    public:
      explicit Evaluator(const VerdictPolicy& policy);

      EvaluationResult evaluate(const TargetDefinition& target,
				const std::vector<const sportsdata::GameRecord*>& baseline,
				const std::vector<cohort::CohortRow>& rows) const;

    private:
      std::optional<double> baselineValue(const TargetDefinition& target,
					  const std::vector<const sportsdata::GameRecord*>& baseline) const;
      void evaluateStat(const TargetDefinition& target,
			const std::vector<cohort::CohortRow>& rows,
			EvaluationResult& result) const;
      void evaluateMarket(const TargetDefinition& target,
			  const std::vector<cohort::CohortRow>& rows,
			  EvaluationResult& result) const;
      void applyVerdict(EvaluationResult& result) const;

    private:
      VerdictPolicy mPolicy;
    };

    // Season and YYYY-MM buckets in ascending key order.
    std::vector<StabilityBucket> stabilityBySeason(const std::vector<cohort::CohortRow>& rows);
    std::vector<StabilityBucket> stabilityByMonth(const std::vector<cohort::CohortRow>& rows);
  }
}
