#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "LeagueCalendar.h"

namespace theory_validator
{
  namespace cohort
  {
    enum class SeasonScope
    {
      Full,
      Current,
      Recent
    };

    const char* seasonScopeToString(SeasonScope scope);

    // full, current or recent; std::nullopt for anything else.
    std::optional<SeasonScope> parseSeasonScope(const std::string& name);

    /**
     * @brief Filters that select the cohort and the baseline population.
     *
     * league, seasons, seasonScope, the date bounds and the phase shape the
     * baseline. team, player, the spread band and gamesLimit narrow the
     * baseline to the cohort.
     */
    struct FilterBundle
    {
      std::string league;
      std::vector<int> seasons;
      SeasonScope seasonScope{SeasonScope::Full};
      std::optional<int> recentDays;
      std::optional<boost::gregorian::date> dateStart;
      std::optional<boost::gregorian::date> dateEnd;
      sportsdata::SeasonPhase phase{sportsdata::SeasonPhase::All};
      std::optional<std::string> team;
      std::optional<std::string> player;
      std::optional<double> spreadAbsMin;
      std::optional<double> spreadAbsMax;
      std::optional<int> gamesLimit;

      bool hasSpreadBand() const
      {
	return spreadAbsMin.has_value() || spreadAbsMax.has_value();
      }
    };

    /**
     * @brief Rejects malformed filters before any store access.
     *
     * @param knownLeagues upper-case league codes the engine accepts
     * @throws ConfigurationException naming the offending field
     */
    void validateFilters(const FilterBundle& filters, const std::set<std::string>& knownLeagues);
  }
}
