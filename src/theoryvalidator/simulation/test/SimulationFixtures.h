#pragma once

#include <deque>
#include <vector>
#include "CohortDataset.h"
#include "OddsMath.h"
#include "SimulationTypes.h"

namespace theory_validator
{
  namespace testing
  {
    // Owns games and rows so tests can hand out stable pointers.
    struct BetFixture
    {
      std::deque<sportsdata::GameRecord> games;
      std::deque<cohort::CohortRow> rows;

      cohort::CohortRow& add(int64_t gameId, boost::gregorian::date day, double line, double price, int outcome)
      {
	sportsdata::GameRecord g;
	g.gameId = gameId;
	g.league = "NBA";
	g.season = 2023;
	g.gameDate = day;
	g.home.shortName = "Home" + std::to_string(gameId);
	g.away.shortName = "Away" + std::to_string(gameId);
	g.homeScore = 100;
	g.awayScore = 98;
	g.odds.push_back(sportsdata::OddsQuote{"spread", "home", line, price, true});
	games.push_back(g);

	cohort::CohortRow row;
	row.game = &games.back();
	row.target = outcome;
	row.market.line = line;
	row.market.price = price;
	row.market.impliedProbability = sportsdata::OddsMath::impliedProbability(price);
	row.market.hasOdds = true;
	rows.push_back(row);
	return rows.back();
      }
    };

    inline simulation::ScoredRow triggeredRow(const cohort::CohortRow& row, double prob, const std::string& side = "home")
    {
      simulation::ScoredRow s;
      s.row = &row;
      s.side = side;
      s.modelProb = prob;
      s.impliedProb = row.market.impliedProbability;
      s.edge = prob - *row.market.impliedProbability;
      s.triggered = true;
      s.reason = "test";
      return s;
    }
  }
}
