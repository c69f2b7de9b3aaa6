#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "CohortDataset.h"

namespace theory_validator
{
  namespace simulation
  {
    struct TriggerDefinition
    {
      double probThreshold{0.55};
      std::optional<double> confidenceBand;
      std::optional<double> minEdgeVsImplied;
    };

    struct ExposureControls
    {
      std::optional<int> maxBetsPerDay{5};
      std::optional<int> maxBetsPerSidePerDay;
      std::optional<double> spreadAbsMin;
      std::optional<double> spreadAbsMax;
    };

    /**
     * @throws ConfigurationException for a threshold outside [0, 1], a band
     *         outside [0, 0.5] or a minimum edge outside [-1, 1]
     */
    void validateTrigger(const TriggerDefinition& trigger);

    /**
     * @throws ConfigurationException for a negative cap or band, or a band
     *         with min above max
     */
    void validateExposure(const ExposureControls& exposure);

    // A cohort row with its model probability and trigger decision.
    struct ScoredRow
    {
      const cohort::CohortRow* row{nullptr};
      std::string side;
      double modelProb{0.0};
      std::optional<double> impliedProb;
      std::optional<double> edge;
      bool triggered{false};
      std::string reason;
    };

    struct ExposureSummary
    {
      std::size_t triggered{0};
      std::size_t selected{0};
      std::size_t droppedDueToControls{0};
      std::map<std::string, std::size_t> dropReasons;
      std::size_t uniqueDays{0};
      double avgBetsPerDay{0.0};
      std::map<std::string, std::size_t> bySide;
      std::vector<std::string> warnings;
      std::vector<std::string> notes;
    };

    struct BetTapeRow
    {
      std::size_t sequence{0};
      int64_t gameId{0};
      boost::gregorian::date gameDate;
      std::string matchup;
      std::string side;
      std::optional<double> line;
      std::optional<double> price;
      double modelProb{0.0};
      std::optional<double> impliedProb;
      std::optional<double> edge;
      int outcome{0};
      double stake{1.0};
      double pnl{0.0};
      double cumulativePnl{0.0};
      double drawdown{0.0};
      std::string reason;
      // Home closing spread, used for favorite/underdog slicing.
      std::optional<double> homeLine;
      std::optional<double> paceGame;

      bool won() const
      {
	return outcome == 1;
      }
    };
  }
}
