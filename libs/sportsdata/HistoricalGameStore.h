#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "GameRecord.h"

namespace theory_validator
{
  namespace sportsdata
  {
    /**
     * @brief Read-only selection of games.
     *
     * An empty season list means every season of the league. Date bounds are
     * inclusive.
     */
    struct GameQuery
    {
      std::string league;
      std::vector<int> seasons;
      std::optional<boost::gregorian::date> dateFrom;
      std::optional<boost::gregorian::date> dateTo;
    };

    /**
     * @brief Read-only access to historical games, boxscores and odds.
     *
     * Implementations throw GameStoreUnavailableException when the backing
     * data cannot be read. fetchGames returns games ordered by date, then
     * game id. Implementations must be safe for concurrent readers.
     */
    class HistoricalGameStore
    {
    public:
      virtual ~HistoricalGameStore() = default;

      virtual std::vector<int> leagueSeasons(const std::string& league) const = 0;
      virtual std::vector<GameRecord> fetchGames(const GameQuery& query) const = 0;
      virtual std::set<std::string> teamStatKeys(const std::string& league) const = 0;
      virtual std::set<std::string> playerStatKeys(const std::string& league) const = 0;
      virtual std::optional<boost::gregorian::date> latestGameDate(const std::string& league,
								  const std::vector<int>& seasons) const = 0;
    };
  }
}
