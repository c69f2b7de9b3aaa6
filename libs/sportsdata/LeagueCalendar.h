#pragma once

#include <optional>
#include <string>
#include "DateRange.h"
#include "GameRecord.h"

namespace theory_validator
{
  namespace sportsdata
  {
    enum class SeasonPhase
    {
      All,
      OutOfConference,
      Conference,
      Postseason
    };

    std::optional<SeasonPhase> parseSeasonPhase(const std::string& name);
    const char* seasonPhaseToString(SeasonPhase phase);

    /**
     * @brief League-specific season phase windows.
     *
     * Only NCAAB defines phases; for every other league a phase request
     * matches all games.
     */
    class LeagueCalendar
    {
    public:
      static bool supportsPhases(const std::string& league);

      /**
       * @brief Date window of a phase for the season starting in seasonStartYear.
       * @return std::nullopt for SeasonPhase::All or a league without phases.
       */
      static std::optional<DateRange> phaseRange(const std::string& league,
						 int seasonStartYear,
						 SeasonPhase phase);

      static bool inPhase(const GameRecord& game, SeasonPhase phase);
    };
  }
}
