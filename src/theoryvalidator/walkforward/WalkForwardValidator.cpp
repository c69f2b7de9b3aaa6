#include "WalkForwardValidator.h"
#include "ExposureSimulator.h"
#include "StatUtils.h"
#include "TriggerEvaluator.h"

namespace theory_validator
{
  namespace walkforward
  {
    using boost::gregorian::date;
    using boost::gregorian::days;

    WalkForwardValidator::WalkForwardValidator(const WalkForwardWindow& window,
					       const WalkForwardPolicy& policy,
					       const modeling::ModelPolicy& modelPolicy,
					       const simulation::TriggerDefinition& trigger,
					       const simulation::ExposureControls& exposure,
					       const concurrency::CancellationToken& token)
      : mWindow(window),
	mPolicy(policy),
	mModelPolicy(modelPolicy),
	mTrigger(trigger),
	mExposure(exposure),
	mToken(token)
    {}

    WalkForwardResult WalkForwardValidator::run(const std::vector<features::GeneratedFeature>& columns,
						const std::vector<const cohort::CohortRow*>& rows,
						const evaluation::TargetDefinition& target,
						std::ostream& os) const
    {
      WalkForwardResult result;
      result.window = mWindow;

      if (!target.isMarket())
	{
	  os << "   [WalkForward] Stat targets have no market to settle against" << std::endl;
	  result.eligible = false;
	  result.reasonCode = "stat_target_not_eligible";
	  result.notes.push_back("Walk-forward replay settles bets against closing markets; "
				 "choose a market target to run it.");
	  return result;
	}

      std::vector<const cohort::CohortRow*> resolved;
      for (const auto* row : rows)
	{
	  if (row->target)
	    resolved.push_back(row);
	}
      if (resolved.empty())
	{
	  os << "   [WalkForward] No games with a resolved outcome" << std::endl;
	  result.eligible = false;
	  result.reasonCode = "insufficient_sample";
	  result.notes.push_back("No games with a resolved outcome.");
	  return result;
	}

      const date minDate = resolved.front()->game->gameDate;
      const date maxDate = resolved.back()->game->gameDate;

      std::size_t testRows = 0;
      std::size_t testRowsWithOdds = 0;
      date cursor = minDate + days(mWindow.trainDays);
      while (cursor + days(mWindow.testDays) <= maxDate)
	{
	  mToken.throwIfCancelled("walk-forward");

	  const date trainStart = cursor - days(mWindow.trainDays);
	  const date testEnd = cursor + days(mWindow.testDays);
	  std::vector<const cohort::CohortRow*> train;
	  std::vector<const cohort::CohortRow*> test;
	  for (const auto* row : resolved)
	    {
	      const date& d = row->game->gameDate;
	      if (d >= trainStart && d < cursor)
		train.push_back(row);
	      else if (d >= cursor && d < testEnd)
		{
		  test.push_back(row);
		  if (row->market.hasOdds)
		    ++testRowsWithOdds;
		}
	    }
	  testRows += test.size();

	  if (train.size() < mPolicy.minTrainRows || test.size() < mPolicy.minTestRows)
	    ++result.skippedSlices;
	  else
	    {
	      auto slice = runSlice(columns, train, test, target, os);
	      if (slice)
		{
		  slice->startDate = cursor;
		  slice->endDate = testEnd;
		  result.slices.push_back(*slice);
		}
	      else
		++result.skippedSlices;
	    }
	  cursor += days(mWindow.stepDays);
	}

      os << "   [WalkForward] " << result.slices.size() << " slices, " << result.skippedSlices
	 << " skipped" << std::endl;

      if (target.oddsRequired && testRows > 0 && testRowsWithOdds == 0)
	{
	  result.eligible = false;
	  result.reasonCode = "no_odds_coverage";
	  result.notes.push_back("None of the " + std::to_string(testRows) +
				 " test games carry closing odds; bets cannot be settled.");
	}
      else if (result.slices.empty())
	{
	  result.eligible = false;
	  result.reasonCode = "insufficient_sample";
	  result.notes.push_back("Every walk-forward window was skipped.");
	}

      result.edgeHalfLifeDays = edgeHalfLife(result.slices);
      result.notes.push_back("Data-blind rolling evaluation: each test window is scored by a model fitted "
			     "only on the preceding train window.");
      result.notes.push_back("Slices with fewer than " + std::to_string(mPolicy.minTrainRows) + " train rows or " +
			     std::to_string(mPolicy.minTestRows) + " test rows are skipped.");
      if (!result.edgeHalfLifeDays)
	result.notes.push_back("Edge half-life is null: the edge never fell to half of its first positive value.");
      return result;
    }

    std::optional<WalkforwardSlice>
    WalkForwardValidator::runSlice(const std::vector<features::GeneratedFeature>& columns,
				   const std::vector<const cohort::CohortRow*>& train,
				   const std::vector<const cohort::CohortRow*>& test,
				   const evaluation::TargetDefinition& target,
				   std::ostream& os) const
    {
      modeling::ModelBuilder builder(mModelPolicy);
      const auto built = builder.build(columns, train, target, os);
      if (!built.status.isComplete() || !built.model)
	return std::nullopt;

      simulation::TriggerEvaluator trigger(mTrigger, target);
      std::vector<simulation::ScoredRow> scored;
      scored.reserve(test.size());
      std::size_t withOdds = 0;
      for (const auto* row : test)
	{
	  if (row->market.hasOdds)
	    ++withOdds;
	  scored.push_back(trigger.evaluate(*row, built.model->score(*row)));
	}

      const auto exposure = simulation::ExposureSimulator(mExposure, target).select(scored);

      WalkforwardSlice slice;
      slice.trainRows = train.size();
      slice.sampleSize = test.size();
      slice.betCount = exposure.selected.size();
      slice.oddsCoveragePct = static_cast<double>(withOdds) / static_cast<double>(test.size());

      std::vector<double> pnl;
      std::vector<double> edges;
      std::size_t hits = 0;
      for (const auto& bet : exposure.selected)
	{
	  const bool won = *bet.row->target > 0.5;
	  if (won)
	    ++hits;
	  pnl.push_back(evaluation::TargetResolver::unitPnl(bet.row->market, won).value_or(0.0));
	  if (bet.edge)
	    edges.push_back(*bet.edge);
	}
      if (!exposure.selected.empty())
	{
	  slice.hitRate = static_cast<double>(hits) / static_cast<double>(exposure.selected.size());
	  slice.roiUnits = statistics::StatUtils::mean(pnl);
	}
      if (!edges.empty())
	slice.edgeAvg = statistics::StatUtils::mean(edges);
      return slice;
    }

    std::optional<int> WalkForwardValidator::edgeHalfLife(const std::vector<WalkforwardSlice>& slices)
    {
      auto first = slices.end();
      for (auto it = slices.begin(); it != slices.end(); ++it)
	{
	  if (it->edgeAvg)
	    {
	      first = it;
	      break;
	    }
	}
      if (first == slices.end() || *first->edgeAvg <= 0.0)
	return std::nullopt;

      const double half = *first->edgeAvg / 2.0;
      for (auto it = first + 1; it != slices.end(); ++it)
	{
	  if (it->edgeAvg && *it->edgeAvg <= half)
	    return static_cast<int>((it->startDate - first->startDate).days());
	}
      return std::nullopt;
    }
  }
}
