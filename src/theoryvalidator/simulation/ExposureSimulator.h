#pragma once

#include <vector>
#include "SimulationTypes.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace simulation
  {
    struct ExposureResult
    {
      ExposureSummary summary;
      // Selected rows in chronological order (date, then game id).
      std::vector<ScoredRow> selected;
    };

    /**
     * @brief Turns triggered rows into bets under ExposureControls.
     *
     * The spread band gates spread-market rows first. Within each calendar day
     * the remaining rows are ranked by edge descending, then game id
     * ascending, and accepted while the day count and the side count are below
     * their caps. No day ever exceeds a cap.
     */
    class ExposureSimulator
    {
    public:
      ExposureSimulator(const ExposureControls& controls, const evaluation::TargetDefinition& target);

      ExposureResult select(const std::vector<ScoredRow>& scored) const;

    private:
      bool passesSpreadBand(const ScoredRow& row, ExposureSummary& summary) const;

    private:
      ExposureControls mControls;
      bool mSpreadMarket;
    };
  }
}
