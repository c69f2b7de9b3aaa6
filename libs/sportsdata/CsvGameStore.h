#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "InMemoryGameStore.h"

namespace theory_validator
{
  namespace sportsdata
  {
    /**
     * @brief Game store backed by a directory of CSV exports.
     *
     * Expected files (headers required, extra columns ignored):
     *   games.csv            game_id, league, season, game_date, home_team, home_short,
     *                        home_abbr, away_team, away_short, away_abbr, home_score,
     *                        away_score, is_conference_game
     *   team_boxscores.csv   game_id, side, stat_key, value            (optional)
     *   player_boxscores.csv game_id, side, player_name, stat_key, value (optional)
     *   odds.csv             game_id, market_type, side, line, price, is_closing (optional)
     *
     * Files are read on first access. A missing games.csv or a malformed file
     * raises GameStoreUnavailableException and the next access tries again.
     */
    class CsvGameStore : public HistoricalGameStore
    {
    public:
      explicit CsvGameStore(const std::string& dataDirectory);

      std::vector<int> leagueSeasons(const std::string& league) const override;
      std::vector<GameRecord> fetchGames(const GameQuery& query) const override;
      std::set<std::string> teamStatKeys(const std::string& league) const override;
      std::set<std::string> playerStatKeys(const std::string& league) const override;
      std::optional<boost::gregorian::date> latestGameDate(const std::string& league,
							  const std::vector<int>& seasons) const override;

    private:
      const InMemoryGameStore& loaded() const;
      std::unique_ptr<InMemoryGameStore> readDirectory() const;

    private:
      std::string mDataDirectory;
      mutable std::mutex mLoadMutex;
      mutable std::unique_ptr<InMemoryGameStore> mGames;
    };
  }
}
