#include "FilterBundle.h"
#include <boost/algorithm/string.hpp>
#include "TheoryValidatorException.h"

namespace theory_validator
{
  namespace cohort
  {
    const char* seasonScopeToString(SeasonScope scope)
    {
      switch (scope)
	{
	case SeasonScope::Current:
	  return "current";
	case SeasonScope::Recent:
	  return "recent";
	case SeasonScope::Full:
	default:
	  return "full";
	}
    }

    std::optional<SeasonScope> parseSeasonScope(const std::string& name)
    {
      const std::string s = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
      if (s.empty() || s == "full")
	return SeasonScope::Full;
      if (s == "current")
	return SeasonScope::Current;
      if (s == "recent")
	return SeasonScope::Recent;
      return std::nullopt;
    }

    void validateFilters(const FilterBundle& filters, const std::set<std::string>& knownLeagues)
    {
      if (filters.league.empty())
	throw ConfigurationException("league", "missing_league", "league is required");

      if (knownLeagues.count(boost::algorithm::to_upper_copy(filters.league)) == 0)
	throw ConfigurationException("league", "unknown_league", "unknown league '" + filters.league + "'");

      for (int season : filters.seasons)
	{
	  if (season <= 0)
	    throw ConfigurationException("seasons", "invalid_value",
					 "season must be a positive start year, got " + std::to_string(season));
	}

      if (filters.seasonScope == SeasonScope::Recent && (!filters.recentDays || *filters.recentDays <= 0))
	throw ConfigurationException("recent_days", "invalid_value",
				     "season_scope recent requires recent_days > 0");

      if (filters.dateStart && filters.dateEnd && *filters.dateStart > *filters.dateEnd)
	throw ConfigurationException("date_end", "invalid_range", "date_start is after date_end");

      if (filters.spreadAbsMin && *filters.spreadAbsMin < 0.0)
	throw ConfigurationException("spread_abs_min", "invalid_value", "spread_abs_min must be >= 0");
      if (filters.spreadAbsMax && *filters.spreadAbsMax < 0.0)
	throw ConfigurationException("spread_abs_max", "invalid_value", "spread_abs_max must be >= 0");
      if (filters.spreadAbsMin && filters.spreadAbsMax && *filters.spreadAbsMin > *filters.spreadAbsMax)
	throw ConfigurationException("spread_abs_min", "invalid_range",
				     "spread_abs_min is greater than spread_abs_max");

      if (filters.gamesLimit && *filters.gamesLimit <= 0)
	throw ConfigurationException("games_limit", "invalid_value", "games_limit must be > 0");
    }
  }
}
