#include "CohortBuilder.h"
#include <algorithm>
#include <cmath>
#include "DerivedMetrics.h"
#include "FeatureComputer.h"

namespace theory_validator
{
  namespace cohort
  {
    using sportsdata::GameRecord;
    using sportsdata::GameQuery;

    namespace
    {
      bool matchesTeamInfo(const sportsdata::TeamInfo& team, const std::string& filter)
      {
	return features::containsIgnoreCase(team.name, filter) ||
	  features::containsIgnoreCase(team.shortName, filter) ||
	  features::containsIgnoreCase(team.abbreviation, filter);
      }
    }

    bool matchesTeam(const GameRecord& game, const std::string& teamFilter)
    {
      return matchesTeamInfo(game.home, teamFilter) || matchesTeamInfo(game.away, teamFilter);
    }

    CohortBuilder::CohortBuilder(const sportsdata::HistoricalGameStore& store, int gamesLimitMax)
      : mStore(store),
	mGamesLimitMax(gamesLimitMax)
    {}

    std::vector<int> CohortBuilder::resolveSeasons(const FilterBundle& filters) const
    {
      std::vector<int> seasons = filters.seasons;
      if (seasons.empty())
	seasons = mStore.leagueSeasons(filters.league);

      std::sort(seasons.begin(), seasons.end());
      seasons.erase(std::unique(seasons.begin(), seasons.end()), seasons.end());

      if (filters.seasonScope == SeasonScope::Current && !seasons.empty())
	return {seasons.back()};
      return seasons;
    }

    bool CohortBuilder::inBaseline(const GameRecord& game,
				   const FilterBundle& filters,
				   const std::optional<boost::gregorian::date>& recentCutoff) const
    {
      if (filters.dateStart && game.gameDate < *filters.dateStart)
	return false;
      if (filters.dateEnd && game.gameDate > *filters.dateEnd)
	return false;
      if (recentCutoff && game.gameDate < *recentCutoff)
	return false;
      return sportsdata::LeagueCalendar::inPhase(game, filters.phase);
    }

    bool CohortBuilder::inCohort(const GameRecord& game,
				 const FilterBundle& filters,
				 bool spreadMarketTarget) const
    {
      if (filters.team && !filters.team->empty() && !matchesTeam(game, *filters.team))
	return false;

      if (filters.player && !filters.player->empty() &&
	  features::findPlayer(game, *filters.player) == nullptr)
	return false;

      if (spreadMarketTarget && filters.hasSpreadBand())
	{
	  auto line = sportsdata::DerivedMetrics::closingSpread(game, sportsdata::Side::Home);
	  if (!line)
	    return false;
	  const double absLine = std::fabs(*line);
	  if (filters.spreadAbsMin && absLine < *filters.spreadAbsMin)
	    return false;
	  if (filters.spreadAbsMax && absLine > *filters.spreadAbsMax)
	    return false;
	}
      return true;
    }

    CohortSelection CohortBuilder::build(const FilterBundle& filters, bool spreadMarketTarget) const
    {
      CohortSelection selection;
      selection.seasons = resolveSeasons(filters);

      GameQuery query;
      query.league = filters.league;
      query.seasons = selection.seasons;
      auto games = std::make_shared<std::vector<GameRecord>>(mStore.fetchGames(query));
      std::stable_sort(games->begin(), games->end(), sportsdata::chronologicalLess);
      selection.history = games;

      if (filters.seasonScope == SeasonScope::Recent)
	{
	  auto latest = mStore.latestGameDate(filters.league, selection.seasons);
	  if (latest)
	    selection.recentCutoff = *latest - boost::gregorian::date_duration(*filters.recentDays);
	}

      for (const auto& game : *selection.history)
	{
	  if (!inBaseline(game, filters, selection.recentCutoff))
	    continue;
	  selection.baseline.push_back(&game);
	  if (inCohort(game, filters, spreadMarketTarget))
	    selection.cohort.push_back(&game);
	}

      if (!filters.gamesLimit)
	return selection;

      int limit = *filters.gamesLimit;
      if (mGamesLimitMax > 0)
	limit = std::min(limit, mGamesLimitMax);
      if (selection.cohort.size() > static_cast<std::size_t>(limit))
	{
	  selection.cohort.resize(static_cast<std::size_t>(limit));
	  selection.gamesLimitApplied = true;
	}
      return selection;
    }
  }
}
