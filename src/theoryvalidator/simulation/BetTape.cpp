#include "BetTape.h"
#include "DerivedMetrics.h"
#include "FeatureNames.h"
#include "UnitDrawdowns.h"

namespace theory_validator
{
  namespace simulation
  {
    namespace
    {
      std::string displayName(const sportsdata::TeamInfo& team)
      {
	if (!team.shortName.empty())
	  return team.shortName;
	return team.name;
      }
    }

    BetTapeBuilder::BetTapeBuilder(const evaluation::TargetDefinition& target, const features::FeatureComputer& computer)
      : mTarget(target),
	mComputer(computer)
    {}

    std::vector<BetTapeRow> BetTapeBuilder::build(const std::vector<ScoredRow>& selected) const
    {
      const features::FeatureSpec paceSpec{features::FeatureKind::PaceGame, "", 0};

      std::vector<BetTapeRow> tape;
      tape.reserve(selected.size());
      for (const auto& bet : selected)
	{
	  const auto& row = *bet.row;
	  const auto& game = *row.game;
	  if (!row.target)
	    continue;

	  BetTapeRow t;
	  t.sequence = tape.size() + 1;
	  t.gameId = game.gameId;
	  t.gameDate = game.gameDate;
	  t.matchup = displayName(game.away) + " @ " + displayName(game.home);
	  t.side = bet.side;
	  t.line = row.market.line;
	  t.price = row.market.price;
	  t.modelProb = bet.modelProb;
	  t.impliedProb = bet.impliedProb;
	  t.edge = bet.edge;
	  t.outcome = *row.target > 0.5 ? 1 : 0;
	  t.reason = bet.reason;
	  t.homeLine = sportsdata::DerivedMetrics::closingSpread(game, sportsdata::Side::Home);
	  t.paceGame = mComputer.compute(paceSpec, game).asOptional();

	  if (mTarget.isMarket())
	    t.pnl = evaluation::TargetResolver::unitPnl(row.market, t.won()).value_or(0.0);
	  else
	    t.pnl = t.won() ? 1.0 : -1.0;
	  t.pnl *= t.stake;
	  tape.push_back(t);
	}

      std::vector<double> cumulative;
      std::vector<double> drawdown;
      statistics::UnitDrawdowns::runningPath(tapePnl(tape), cumulative, drawdown);
      for (std::size_t i = 0; i < tape.size(); ++i)
	{
	  tape[i].cumulativePnl = cumulative[i];
	  tape[i].drawdown = drawdown[i];
	}
      return tape;
    }

    std::vector<double> tapePnl(const std::vector<BetTapeRow>& tape)
    {
      std::vector<double> pnl;
      pnl.reserve(tape.size());
      for (const auto& row : tape)
	pnl.push_back(row.pnl);
      return pnl;
    }
  }
}
