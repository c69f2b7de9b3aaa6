#pragma once

#include <vector>
#include "FeatureComputer.h"
#include "SimulationTypes.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace simulation
  {
    /**
     * @brief Settles selected bets in order and tracks the running PnL path.
     *
     * Market bets settle at the quote's price under the odds assumption;
     * binary stat bets settle at even money. Drawdown is measured from the
     * running peak of cumulative PnL, which starts at 0.
     */
    class BetTapeBuilder
    {
    public:
      BetTapeBuilder(const evaluation::TargetDefinition& target, const features::FeatureComputer& computer);

      std::vector<BetTapeRow> build(const std::vector<ScoredRow>& selected) const;

    private:
      evaluation::TargetDefinition mTarget;
      const features::FeatureComputer& mComputer;
    };

    // Unit PnL series of a tape.
    std::vector<double> tapePnl(const std::vector<BetTapeRow>& tape);
  }
}
