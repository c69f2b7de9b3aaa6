#pragma once

#include <ostream>
#include <vector>
#include "CancellationToken.h"
#include "CohortDataset.h"
#include "ModelBuilder.h"
#include "SimulationTypes.h"
#include "TargetDefinition.h"
#include "WalkForwardTypes.h"

namespace theory_validator
{
  namespace walkforward
  {
    /**
     * @brief Rolling train/test replay of the model and trigger rules.
     *
     * The cursor starts train_days after the first game. Each step fits on
     * [cursor - train, cursor), then scores, triggers and caps bets on
     * [cursor, cursor + test) without refitting. Windows whose train or test
     * side is too thin are skipped and counted.
     */
    class WalkForwardValidator
    {
    public:
      WalkForwardValidator(const WalkForwardWindow& window,
			   const WalkForwardPolicy& policy,
			   const modeling::ModelPolicy& modelPolicy,
			   const simulation::TriggerDefinition& trigger,
			   const simulation::ExposureControls& exposure,
			   const concurrency::CancellationToken& token);

      /**
       * @param rows cohort rows in chronological order
       */
      WalkForwardResult run(const std::vector<features::GeneratedFeature>& columns,
			    const std::vector<const cohort::CohortRow*>& rows,
			    const evaluation::TargetDefinition& target,
			    std::ostream& os) const;

      /**
       * @brief Days from the first slice with a positive average edge to the
       *        first later slice whose edge is at most half of it.
       */
      static std::optional<int> edgeHalfLife(const std::vector<WalkforwardSlice>& slices);

    private:
      std::optional<WalkforwardSlice> runSlice(const std::vector<features::GeneratedFeature>& columns,
					       const std::vector<const cohort::CohortRow*>& train,
					       const std::vector<const cohort::CohortRow*>& test,
					       const evaluation::TargetDefinition& target,
					       std::ostream& os) const;

    private:
      WalkForwardWindow mWindow;
      WalkForwardPolicy mPolicy;
      modeling::ModelPolicy mModelPolicy;
      simulation::TriggerDefinition mTrigger;
      simulation::ExposureControls mExposure;
      const concurrency::CancellationToken& mToken;
    };
  }
}
