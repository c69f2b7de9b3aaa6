#pragma once

#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <vector>
#include "GameRecord.h"
#include "InMemoryGameStore.h"

namespace theory_validator
{
  namespace testing
  {
    using sportsdata::GameRecord;
    using sportsdata::OddsQuote;
    using sportsdata::TeamInfo;

    inline std::vector<TeamInfo> nbaTeams()
    {
      return {
	{"Los Angeles Lakers", "Lakers", "LAL"},
	{"Boston Celtics", "Celtics", "BOS"},
	{"Miami Heat", "Heat", "MIA"},
	{"Denver Nuggets", "Nuggets", "DEN"},
	{"Golden State Warriors", "Warriors", "GSW"},
	{"Phoenix Suns", "Suns", "PHX"}
      };
    }

    struct LeagueSpec
    {
      std::string league{"NBA"};
      std::vector<int> seasons{2022, 2023};
      int daysPerSeason{120};
      bool withOdds{true};
      bool withPlayers{true};
      uint64_t seed{7};
    };

    /**
     * @brief Deterministic synthetic league.
     *
     * Each season starts on Oct 20 of its start year and every day hosts three
     * games covering all six teams. Stronger teams win more often and the
     * closing spread tracks strength, so spread and total markets resolve to
     * a mix of wins, losses and the occasional push.
     */
    inline std::vector<GameRecord> makeLeagueGames(const LeagueSpec& spec)
    {
      std::mt19937_64 rng(spec.seed);
      std::normal_distribution<double> noise(0.0, 11.0);
      std::uniform_real_distribution<double> unit(0.0, 1.0);
      const auto teams = nbaTeams();
      const double strength[] = {4.0, 3.0, -1.0, 2.0, 0.0, -4.0};

      std::vector<GameRecord> games;
      int64_t nextId = 1000;
      for (int season : spec.seasons)
	{
	  const boost::gregorian::date start(season, boost::gregorian::Oct, 20);
	  for (int day = 0; day < spec.daysPerSeason; ++day)
	    {
	      const auto gameDate = start + boost::gregorian::days(day);
	      std::vector<int> order = {0, 1, 2, 3, 4, 5};
	      std::rotate(order.begin(), order.begin() + (day % 5) + 1, order.end());
	      for (int g = 0; g < 3; ++g)
		{
		  const int h = order[2 * g];
		  const int a = order[2 * g + 1];
		  GameRecord game;
		  game.gameId = nextId++;
		  game.league = spec.league;
		  game.season = season;
		  game.gameDate = gameDate;
		  game.home = teams[h];
		  game.away = teams[a];
		  game.isConferenceGame = (h + a) % 2 == 0;

		  const double expectedMargin = strength[h] - strength[a] + 2.5;
		  const double margin = std::round(expectedMargin + noise(rng));
		  const int awayScore = 100 + static_cast<int>(std::round(noise(rng) / 2.0));
		  int homeScore = awayScore + static_cast<int>(margin);
		  if (homeScore == awayScore)
		    homeScore += 1;
		  game.homeScore = homeScore;
		  game.awayScore = awayScore;

		  const double homePace = 97.0 + 6.0 * unit(rng);
		  game.homeBox.stats["fg_pct"] = std::to_string(0.40 + 0.12 * unit(rng));
		  game.awayBox.stats["fg_pct"] = std::to_string(0.40 + 0.12 * unit(rng));
		  game.homeBox.stats["rebounds"] = std::to_string(38 + static_cast<int>(12 * unit(rng)));
		  game.awayBox.stats["rebounds"] = std::to_string(38 + static_cast<int>(12 * unit(rng)));
		  game.homeBox.stats["pace"] = std::to_string(homePace);
		  game.awayBox.stats["pace"] = std::to_string(homePace + unit(rng) - 0.5);

		  if (spec.withPlayers && (h == 0 || a == 0))
		    {
		      sportsdata::PlayerBoxscore player;
		      player.side = h == 0 ? sportsdata::Side::Home : sportsdata::Side::Away;
		      player.playerName = "LeBron James";
		      player.stats["minutes"] = std::to_string(30 + day % 8) + ":30";
		      game.players.push_back(player);
		    }

		  if (spec.withOdds)
		    {
		      const double line = -std::round(expectedMargin * 2.0) / 2.0;
		      const double homePrice = unit(rng) < 0.5 ? -110.0 : -105.0;
		      game.odds.push_back(OddsQuote{"spread", "home", line, homePrice, true});
		      game.odds.push_back(OddsQuote{"spread", "away", -line, -110.0, true});
		      game.odds.push_back(OddsQuote{"total", "over", 200.5, -110.0, true});
		      game.odds.push_back(OddsQuote{"total", "under", 200.5, -110.0, true});
		      const double homeMl = expectedMargin >= 0 ? -150.0 : 130.0;
		      const double awayMl = expectedMargin >= 0 ? 130.0 : -150.0;
		      game.odds.push_back(OddsQuote{"moneyline", "home", std::nullopt, homeMl, true});
		      game.odds.push_back(OddsQuote{"moneyline", "away", std::nullopt, awayMl, true});
		    }
		  games.push_back(std::move(game));
		}
	    }
	}
      return games;
    }

    inline sportsdata::InMemoryGameStore makeLeagueStore(const LeagueSpec& spec = LeagueSpec())
    {
      return sportsdata::InMemoryGameStore(makeLeagueGames(spec));
    }
  }
}
