#include "Evaluator.h"
#include <cmath>
#include <map>
#include <sstream>
#include "StatUtils.h"
#include "UnitDrawdowns.h"

namespace theory_validator
{
  namespace evaluation
  {
    using cohort::CohortRow;
    using sportsdata::GameRecord;
    using statistics::StatUtils;

    namespace
    {
      std::vector<StabilityBucket> bucketize(const std::map<std::string, std::vector<double>>& groups)
      {
	std::vector<StabilityBucket> buckets;
	for (const auto& kv : groups)
	  {
	    StabilityBucket bucket;
	    bucket.key = kv.first;
	    bucket.n = kv.second.size();
	    if (!kv.second.empty())
	      bucket.value = StatUtils::mean(kv.second);
	    buckets.push_back(bucket);
	  }
	return buckets;
      }

      std::string monthKey(const boost::gregorian::date& d)
      {
	return boost::gregorian::to_iso_extended_string(d).substr(0, 7);
      }
    }

    std::vector<StabilityBucket> stabilityBySeason(const std::vector<CohortRow>& rows)
    {
      std::map<std::string, std::vector<double>> groups;
      for (const auto& row : rows)
	{
	  if (row.target)
	    groups[std::to_string(row.game->season)].push_back(*row.target);
	}
      return bucketize(groups);
    }

    std::vector<StabilityBucket> stabilityByMonth(const std::vector<CohortRow>& rows)
    {
      std::map<std::string, std::vector<double>> groups;
      for (const auto& row : rows)
	{
	  if (row.target)
	    groups[monthKey(row.game->gameDate)].push_back(*row.target);
	}
      return bucketize(groups);
    }

    Evaluator::Evaluator(const VerdictPolicy& policy)
      : mPolicy(policy)
    {}

    std::optional<double> Evaluator::baselineValue(const TargetDefinition& target,
						   const std::vector<const GameRecord*>& baseline) const
    {
      std::vector<double> values;
      values.reserve(baseline.size());
      for (const auto* game : baseline)
	{
	  if (auto v = TargetResolver::targetValue(target, *game))
	    values.push_back(*v);
	}
      if (values.empty())
	return std::nullopt;
      return StatUtils::mean(values);
    }

    EvaluationResult Evaluator::evaluate(const TargetDefinition& target,
					 const std::vector<const GameRecord*>& baseline,
					 const std::vector<CohortRow>& rows) const
    {
      EvaluationResult result;
      result.targetName = target.targetName;
      result.targetClass = target.targetClass;
      result.metricType = target.metricType;
      result.sampleSize = rows.size();
      result.baselineSize = baseline.size();
      result.baselineValue = baselineValue(target, baseline);
      result.sampleLabel = mPolicy.sampleLabel(result.sampleSize);
      result.liftLabel = "n/a";
      result.notes.push_back("Lift and sample-size labels are advisory bands, not statistical tests.");

      if (rows.empty())
	{
	  result.reasonCode = "insufficient_sample";
	  result.notes.push_back("No cohort rows remain after filtering and cleaning.");
	  return result;
	}

      if (target.isMarket())
	evaluateMarket(target, rows, result);
      else
	evaluateStat(target, rows, result);

      if (result.available())
	applyVerdict(result);
      return result;
    }

    void Evaluator::evaluateStat(const TargetDefinition& target,
				 const std::vector<CohortRow>& rows,
				 EvaluationResult& result) const
    {
      std::vector<double> values;
      for (const auto& row : rows)
	{
	  if (row.target)
	    values.push_back(*row.target);
	}

      if (values.empty())
	{
	  result.reasonCode = "insufficient_sample";
	  result.notes.push_back("No cohort row has a value for " + target.targetName + ".");
	  return;
	}

      result.cohortValue = StatUtils::mean(values);
      if (!target.isBinary())
	result.cohortSummary = StatUtils::describe(values);
      else
	result.notes.push_back("Binary stat target: values are rates of " + target.targetName + ".");

      result.bySeason = stabilityBySeason(rows);
      result.byMonth = stabilityByMonth(rows);
    }

    void Evaluator::evaluateMarket(const TargetDefinition& target,
				   const std::vector<CohortRow>& rows,
				   EvaluationResult& result) const
    {
      MarketStatistics stats;
      for (const auto& row : rows)
	{
	  if (row.market.hasOdds)
	    ++stats.rowsWithOdds;
	}
      stats.oddsCoveragePct = 100.0 * static_cast<double>(stats.rowsWithOdds) / static_cast<double>(rows.size());

      if (target.oddsRequired && stats.rowsWithOdds == 0)
	{
	  result.market = stats;
	  result.reasonCode = "no_odds_coverage";
	  result.notes.push_back(std::string("No closing ") + marketTypeToString(*target.marketType) +
				 " odds in the cohort; odds are required for this target.");
	  return;
	}

      std::vector<double> implied;
      std::vector<double> pnl;
      std::size_t winsWithOdds = 0;
      for (const auto& row : rows)
	{
	  const GameRecord& game = *row.game;
	  if (!row.target)
	    {
	      const bool settled = game.homeScore && game.awayScore;
	      const bool quoted = *target.marketType == MarketType::Moneyline || row.market.line.has_value();
	      if (settled && quoted)
		++stats.pushCount;
	      continue;
	    }

	  ++stats.resolvedCount;
	  const bool won = *row.target > 0.5;
	  if (won)
	    ++stats.wins;
	  else
	    ++stats.losses;

	  if (row.market.hasOdds)
	    {
	      implied.push_back(*row.market.impliedProbability);
	      if (auto p = TargetResolver::unitPnl(row.market, won))
		pnl.push_back(*p);
	      if (won)
		++winsWithOdds;
	    }
	}

      if (stats.resolvedCount == 0)
	{
	  result.market = stats;
	  result.reasonCode = "insufficient_sample";
	  result.notes.push_back("No cohort row has a resolved " + target.targetName + " outcome.");
	  return;
	}

      result.cohortValue = static_cast<double>(stats.wins) / static_cast<double>(stats.resolvedCount);

      if (!implied.empty())
	{
	  stats.avgImpliedProbability = StatUtils::mean(implied);
	  const double hitWithOdds = static_cast<double>(winsWithOdds) / static_cast<double>(implied.size());
	  stats.evVsImplied = hitWithOdds - *stats.avgImpliedProbability;
	}
      if (!pnl.empty())
	{
	  const double meanPnl = StatUtils::mean(pnl);
	  stats.roiUnits = meanPnl;
	  stats.sharpeLike = meanPnl / (StatUtils::standardDeviation(pnl) + 1e-9);
	  stats.maxDrawdown = statistics::UnitDrawdowns::maxDrawdown(pnl);
	}

      if (target.oddsAssumption.kind == OddsAssumptionKind::FlatReference)
	result.notes.push_back("ROI uses a flat reference price of " +
			       oddsAssumptionToString(target.oddsAssumption) +
			       "; diagnostic comparison only.");
      if (stats.pushCount > 0)
	result.notes.push_back(std::to_string(stats.pushCount) + " pushes excluded from the hit rate.");

      result.market = stats;
      result.bySeason = stabilityBySeason(rows);
      result.byMonth = stabilityByMonth(rows);
    }

    void Evaluator::applyVerdict(EvaluationResult& result) const
    {
      if (!result.cohortValue || !result.baselineValue)
	return;

      result.delta = *result.cohortValue - *result.baselineValue;
      if (*result.baselineValue != 0.0)
	result.relativeDelta = *result.delta / std::fabs(*result.baselineValue);

      const bool numericStat = result.targetClass == TargetClass::Stat && result.metricType == MetricType::Numeric;
      if (numericStat)
	{
	  if (result.relativeDelta)
	    result.liftLabel = mPolicy.liftLabel(*result.relativeDelta);
	  result.notes.push_back("Numeric target: the lift label uses delta / |baseline|.");
	}
      else
	result.liftLabel = mPolicy.liftLabel(*result.delta);
    }
  }
}
