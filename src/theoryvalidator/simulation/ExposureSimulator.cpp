#include "ExposureSimulator.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace theory_validator
{
  namespace simulation
  {
    ExposureSimulator::ExposureSimulator(const ExposureControls& controls, const evaluation::TargetDefinition& target)
      : mControls(controls),
	mSpreadMarket(target.isMarket() && *target.marketType == evaluation::MarketType::Spread)
    {}

    bool ExposureSimulator::passesSpreadBand(const ScoredRow& row, ExposureSummary& summary) const
    {
      if (!mSpreadMarket || (!mControls.spreadAbsMin && !mControls.spreadAbsMax))
	return true;

      const auto& line = row.row->market.line;
      if (!line)
	{
	  ++summary.dropReasons["missing_line_for_spread_band"];
	  return false;
	}
      const double absLine = std::fabs(*line);
      if (mControls.spreadAbsMin && absLine < *mControls.spreadAbsMin)
	{
	  ++summary.dropReasons["spread_band_low"];
	  return false;
	}
      if (mControls.spreadAbsMax && absLine > *mControls.spreadAbsMax)
	{
	  ++summary.dropReasons["spread_band_high"];
	  return false;
	}
      return true;
    }

    ExposureResult ExposureSimulator::select(const std::vector<ScoredRow>& scored) const
    {
      ExposureResult result;
      ExposureSummary& summary = result.summary;

      std::map<boost::gregorian::date, std::vector<const ScoredRow*>> byDay;
      for (const auto& row : scored)
	{
	  if (!row.triggered)
	    continue;
	  ++summary.triggered;
	  if (passesSpreadBand(row, summary))
	    byDay[row.row->game->gameDate].push_back(&row);
	}

      std::size_t cappedByDay = 0;
      for (auto& kv : byDay)
	{
	  auto& rows = kv.second;
	  std::sort(rows.begin(), rows.end(), [](const ScoredRow* a, const ScoredRow* b) {
	    const double ea = a->edge.value_or(-1e9);
	    const double eb = b->edge.value_or(-1e9);
	    if (ea != eb)
	      return ea > eb;
	    return a->row->game->gameId < b->row->game->gameId;
	  });

	  int taken = 0;
	  std::map<std::string, int> perSide;
	  for (const auto* row : rows)
	    {
	      if (mControls.maxBetsPerDay && taken >= *mControls.maxBetsPerDay)
		{
		  ++summary.dropReasons["max_bets_per_day"];
		  ++cappedByDay;
		  continue;
		}
	      if (mControls.maxBetsPerSidePerDay && perSide[row->side] >= *mControls.maxBetsPerSidePerDay)
		{
		  ++summary.dropReasons["max_per_side_per_day"];
		  continue;
		}
	      ++taken;
	      ++perSide[row->side];
	      result.selected.push_back(*row);
	    }
	}

      std::sort(result.selected.begin(), result.selected.end(), [](const ScoredRow& a, const ScoredRow& b) {
	return sportsdata::chronologicalLess(*a.row->game, *b.row->game);
      });

      std::set<boost::gregorian::date> days;
      for (const auto& row : result.selected)
	{
	  days.insert(row.row->game->gameDate);
	  ++summary.bySide[row.side];
	}
      summary.selected = result.selected.size();
      summary.droppedDueToControls = summary.triggered - summary.selected;
      summary.uniqueDays = days.size();
      summary.avgBetsPerDay = days.empty() ? 0.0
	: static_cast<double>(summary.selected) / static_cast<double>(days.size());

      if (cappedByDay > 0)
	summary.warnings.push_back("Daily caps removed " + std::to_string(cappedByDay) +
				   " triggered bets; results may reflect throttling rather than signal scarcity.");
      if (summary.dropReasons.count("spread_band_low") || summary.dropReasons.count("spread_band_high"))
	summary.warnings.push_back("Spread band gating removed triggered bets; improvements may be a filter "
				   "artifact rather than edge.");

      summary.notes.push_back("Bets are ranked by edge within each day; ties go to the lower game id.");
      summary.notes.push_back("Historical selection simulation at one unit per bet, not an execution record.");
      return result;
    }
  }
}
