#include "InMemoryGameStore.h"
#include <algorithm>
#include <boost/algorithm/string.hpp>

namespace theory_validator
{
  namespace sportsdata
  {
    InMemoryGameStore::InMemoryGameStore(std::vector<GameRecord> games)
      : mGames(std::move(games))
    {
      std::stable_sort(mGames.begin(), mGames.end(), chronologicalLess);
    }

    void InMemoryGameStore::addGame(GameRecord game)
    {
      auto pos = std::upper_bound(mGames.begin(), mGames.end(), game, chronologicalLess);
      mGames.insert(pos, std::move(game));
    }

    std::vector<int> InMemoryGameStore::leagueSeasons(const std::string& league) const
    {
      std::set<int> seasons;
      for (const auto& game : mGames)
	{
	  if (boost::algorithm::iequals(game.league, league))
	    seasons.insert(game.season);
	}
      return std::vector<int>(seasons.begin(), seasons.end());
    }

    bool InMemoryGameStore::matches(const GameRecord& game, const GameQuery& query) const
    {
      if (!boost::algorithm::iequals(game.league, query.league))
	return false;
      if (!query.seasons.empty() &&
	  std::find(query.seasons.begin(), query.seasons.end(), game.season) == query.seasons.end())
	return false;
      if (query.dateFrom && game.gameDate < *query.dateFrom)
	return false;
      if (query.dateTo && game.gameDate > *query.dateTo)
	return false;
      return true;
    }

    std::vector<GameRecord> InMemoryGameStore::fetchGames(const GameQuery& query) const
    {
      std::vector<GameRecord> out;
      for (const auto& game : mGames)
	{
	  if (matches(game, query))
	    out.push_back(game);
	}
      return out;
    }

    std::set<std::string> InMemoryGameStore::teamStatKeys(const std::string& league) const
    {
      std::set<std::string> keys;
      for (const auto& game : mGames)
	{
	  if (!boost::algorithm::iequals(game.league, league))
	    continue;
	  for (const auto& kv : game.homeBox.stats)
	    keys.insert(kv.first);
	  for (const auto& kv : game.awayBox.stats)
	    keys.insert(kv.first);
	}
      return keys;
    }

    std::set<std::string> InMemoryGameStore::playerStatKeys(const std::string& league) const
    {
      std::set<std::string> keys;
      for (const auto& game : mGames)
	{
	  if (!boost::algorithm::iequals(game.league, league))
	    continue;
	  for (const auto& player : game.players)
	    for (const auto& kv : player.stats)
	      keys.insert(kv.first);
	}
      return keys;
    }

    std::optional<boost::gregorian::date>
    InMemoryGameStore::latestGameDate(const std::string& league, const std::vector<int>& seasons) const
    {
      GameQuery query;
      query.league = league;
      query.seasons = seasons;

      std::optional<boost::gregorian::date> latest;
      for (const auto& game : mGames)
	{
	  if (matches(game, query) && (!latest || game.gameDate > *latest))
	    latest = game.gameDate;
	}
      return latest;
    }
  }
}
