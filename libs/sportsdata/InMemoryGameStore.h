#pragma once

#include <vector>
#include "HistoricalGameStore.h"

namespace theory_validator
{
  namespace sportsdata
  {
    /**
     * @brief Game store over a vector of records held in memory.
     *
     * Populate with addGame() before sharing; the const interface is then
     * safe for concurrent readers.
     */
    class InMemoryGameStore : public HistoricalGameStore
    {
    public:
      InMemoryGameStore() = default;
      explicit InMemoryGameStore(std::vector<GameRecord> games);

      void addGame(GameRecord game);
      std::size_t size() const
      {
	return mGames.size();
      }

      std::vector<int> leagueSeasons(const std::string& league) const override;
      std::vector<GameRecord> fetchGames(const GameQuery& query) const override;
      std::set<std::string> teamStatKeys(const std::string& league) const override;
      std::set<std::string> playerStatKeys(const std::string& league) const override;
      std::optional<boost::gregorian::date> latestGameDate(const std::string& league,
							  const std::vector<int>& seasons) const override;

    private:
      bool matches(const GameRecord& game, const GameQuery& query) const;

    private:
      std::vector<GameRecord> mGames;
    };
  }
}
