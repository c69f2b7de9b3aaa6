#include "PerformanceSlicer.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include "StatUtils.h"

namespace theory_validator
{
  namespace simulation
  {
    using statistics::StatUtils;

    namespace
    {
      std::optional<double> meanOf(const std::vector<double>& v)
      {
	if (v.empty())
	  return std::nullopt;
	return StatUtils::mean(v);
      }

      std::vector<const BetTapeRow*> where(const std::vector<BetTapeRow>& tape,
					   const std::function<bool(const BetTapeRow&)>& pred)
      {
	std::vector<const BetTapeRow*> out;
	for (const auto& row : tape)
	  {
	    if (pred(row))
	      out.push_back(&row);
	  }
	return out;
      }
    }

    SliceMetrics PerformanceSlicer::metrics(const std::string& label, const std::vector<const BetTapeRow*>& rows)
    {
      SliceMetrics m;
      m.label = label;
      m.n = rows.size();
      if (rows.empty())
	return m;

      std::vector<double> probs;
      std::vector<double> implied;
      std::vector<double> edges;
      for (const auto* row : rows)
	{
	  if (row->won())
	    ++m.wins;
	  else
	    ++m.losses;
	  m.pnlUnits += row->pnl;
	  probs.push_back(row->modelProb);
	  if (row->impliedProb)
	    implied.push_back(*row->impliedProb);
	  if (row->edge)
	    edges.push_back(*row->edge);
	}

      const double n = static_cast<double>(m.n);
      m.hitRate = static_cast<double>(m.wins) / n;
      m.roiPerBet = m.pnlUnits / n;
      m.avgModelProb = meanOf(probs);
      m.avgImpliedProb = meanOf(implied);
      m.avgEdge = meanOf(edges);
      if (m.avgImpliedProb)
	m.hitMinusImplied = m.hitRate - *m.avgImpliedProb;
      m.redZone = m.roiPerBet < 0.0 || (m.hitMinusImplied && *m.hitMinusImplied < 0.0);
      return m;
    }

    PerformanceSlices PerformanceSlicer::slice(const std::vector<BetTapeRow>& tape,
					       const evaluation::TargetDefinition& target)
    {
      PerformanceSlices slices;
      slices.overall = metrics("overall", where(tape, [](const BetTapeRow&) { return true; }));

      slices.confidence.push_back(metrics("p>=0.60", where(tape, [](const BetTapeRow& r) {
	return r.modelProb >= 0.60;
      })));
      slices.confidence.push_back(metrics("0.55-0.60", where(tape, [](const BetTapeRow& r) {
	return r.modelProb >= 0.55 && r.modelProb < 0.60;
      })));
      slices.confidence.push_back(metrics("0.50-0.55", where(tape, [](const BetTapeRow& r) {
	return r.modelProb >= 0.50 && r.modelProb < 0.55;
      })));

      const bool spread = target.isMarket() && *target.marketType == evaluation::MarketType::Spread;
      const bool moneyline = target.isMarket() && *target.marketType == evaluation::MarketType::Moneyline;
      if (spread)
	{
	  auto absIn = [&tape](double lo, double hi) {
	    return where(tape, [lo, hi](const BetTapeRow& r) {
	      if (!r.line)
		return false;
	      const double a = std::fabs(*r.line);
	      return a >= lo && a < hi;
	    });
	  };
	  slices.spreadBuckets.push_back(metrics("abs_line<3", absIn(0.0, 3.0)));
	  slices.spreadBuckets.push_back(metrics("3<=abs_line<6", absIn(3.0, 6.0)));
	  slices.spreadBuckets.push_back(metrics("6<=abs_line<10", absIn(6.0, 10.0)));
	  slices.spreadBuckets.push_back(metrics("abs_line>=10", absIn(10.0, HUGE_VAL)));

	  auto favorite = [](const BetTapeRow& r) {
	    return (r.side == "home" && *r.homeLine < 0.0) || (r.side == "away" && *r.homeLine > 0.0);
	  };
	  slices.favoriteUnderdog.push_back(metrics("favorite", where(tape, [&](const BetTapeRow& r) {
	    return r.homeLine && favorite(r);
	  })));
	  slices.favoriteUnderdog.push_back(metrics("underdog", where(tape, [&](const BetTapeRow& r) {
	    return r.homeLine && !favorite(r);
	  })));
	}
      else if (moneyline)
	{
	  slices.favoriteUnderdog.push_back(metrics("favorite", where(tape, [](const BetTapeRow& r) {
	    return r.price && *r.price < 0.0;
	  })));
	  slices.favoriteUnderdog.push_back(metrics("underdog", where(tape, [](const BetTapeRow& r) {
	    return r.price && *r.price > 0.0;
	  })));
	}

      std::vector<double> paces;
      for (const auto& row : tape)
	{
	  if (row.paceGame)
	    paces.push_back(*row.paceGame);
	}
      if (paces.size() >= kMinPaceBets)
	{
	  const double q1 = StatUtils::quantile(paces, 0.25);
	  const double q2 = StatUtils::quantile(paces, 0.50);
	  const double q3 = StatUtils::quantile(paces, 0.75);
	  auto paceIn = [&tape](double lo, double hi) {
	    return where(tape, [lo, hi](const BetTapeRow& r) {
	      return r.paceGame && *r.paceGame > lo && *r.paceGame <= hi;
	    });
	  };
	  slices.paceQuartiles.push_back(metrics("pace Q1 (slow)", paceIn(-HUGE_VAL, q1)));
	  slices.paceQuartiles.push_back(metrics("pace Q2", paceIn(q1, q2)));
	  slices.paceQuartiles.push_back(metrics("pace Q3", paceIn(q2, q3)));
	  slices.paceQuartiles.push_back(metrics("pace Q4 (fast)", paceIn(q3, HUGE_VAL)));
	}

      slices.notes.push_back("Slices cover selected bets after exposure controls.");
      slices.notes.push_back("Pace quartiles appear only when at least " + std::to_string(kMinPaceBets) +
			     " bets have pace_game; pace is post-game information.");
      return slices;
    }

    FailureAnalysis PerformanceSlicer::failures(const std::vector<BetTapeRow>& tape)
    {
      FailureAnalysis analysis;

      std::vector<BetTapeRow> losses;
      for (const auto& row : tape)
	{
	  if (row.pnl < 0.0)
	    losses.push_back(row);
	}

      analysis.largestLosses = losses;
      std::stable_sort(analysis.largestLosses.begin(), analysis.largestLosses.end(),
		       [](const BetTapeRow& a, const BetTapeRow& b) { return a.pnl < b.pnl; });
      if (analysis.largestLosses.size() > kFailureRows)
	analysis.largestLosses.resize(kFailureRows);

      analysis.overconfidentLosses = losses;
      std::stable_sort(analysis.overconfidentLosses.begin(), analysis.overconfidentLosses.end(),
		       [](const BetTapeRow& a, const BetTapeRow& b) { return a.modelProb > b.modelProb; });
      if (analysis.overconfidentLosses.size() > kFailureRows)
	analysis.overconfidentLosses.resize(kFailureRows);

      const bool anyEdge = std::any_of(tape.begin(), tape.end(), [](const BetTapeRow& r) { return r.edge.has_value(); });
      if (anyEdge)
	{
	  auto edgeIn = [&tape](double lo, double hi) {
	    return where(tape, [lo, hi](const BetTapeRow& r) { return r.edge && *r.edge >= lo && *r.edge < hi; });
	  };
	  analysis.edgeBuckets.push_back(metrics("edge<0", edgeIn(-HUGE_VAL, 0.0)));
	  analysis.edgeBuckets.push_back(metrics("0-1%", edgeIn(0.0, 0.01)));
	  analysis.edgeBuckets.push_back(metrics("1-2%", edgeIn(0.01, 0.02)));
	  analysis.edgeBuckets.push_back(metrics("2-4%", edgeIn(0.02, 0.04)));
	  analysis.edgeBuckets.push_back(metrics("4%+", edgeIn(0.04, HUGE_VAL)));
	}

      analysis.notes.push_back("Largest losses are single-bet historical PnL under the selected odds assumption.");
      analysis.notes.push_back("Overconfident losses point at calibration failures: high model_prob with a losing outcome.");
      analysis.notes.push_back("If higher edge buckets do not outperform lower ones the edge estimate is not informative.");
      return analysis;
    }
  }
}
