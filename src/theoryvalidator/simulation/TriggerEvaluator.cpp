#include "TriggerEvaluator.h"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace theory_validator
{
  namespace simulation
  {
    namespace
    {
      std::string fmt3(double v)
      {
	std::ostringstream os;
	os << std::fixed << std::setprecision(3) << v;
	return os.str();
      }
    }

    TriggerEvaluator::TriggerEvaluator(const TriggerDefinition& trigger, const evaluation::TargetDefinition& target)
      : mTrigger(trigger),
	mTarget(target),
	mSide(betSide(target))
    {}

    std::optional<std::string> TriggerEvaluator::ineligibility(const evaluation::TargetDefinition& target)
    {
      if (!target.isMarket() && !target.isBinary())
	return std::string("stat_target_numeric");
      return std::nullopt;
    }

    std::string TriggerEvaluator::betSide(const evaluation::TargetDefinition& target)
    {
      if (target.isMarket())
	return target.side;
      if (target.targetName == "away_win")
	return "away";
      return "home";
    }

    ScoredRow TriggerEvaluator::evaluate(const cohort::CohortRow& row, double modelProb) const
    {
      ScoredRow scored;
      scored.row = &row;
      scored.side = mSide;
      scored.modelProb = modelProb;

      if (mTarget.isMarket())
	{
	  if (!row.market.hasOdds)
	    {
	      scored.reason = "missing odds for implied probability";
	      return scored;
	    }
	  scored.impliedProb = row.market.impliedProbability;
	  scored.edge = modelProb - *row.market.impliedProbability;
	}
      else
	scored.edge = modelProb - 0.5;

      if (modelProb < mTrigger.probThreshold)
	{
	  scored.reason = "model_prob " + fmt3(modelProb) + " < threshold " + fmt3(mTrigger.probThreshold);
	  return scored;
	}

      const double confidence = std::fabs(modelProb - 0.5);
      if (mTrigger.confidenceBand && confidence < *mTrigger.confidenceBand)
	{
	  scored.reason = "confidence |p-0.5| " + fmt3(confidence) + " < band " + fmt3(*mTrigger.confidenceBand);
	  return scored;
	}

      if (mTrigger.minEdgeVsImplied && *scored.edge < *mTrigger.minEdgeVsImplied)
	{
	  scored.reason = "edge " + fmt3(*scored.edge) + " < min_edge " + fmt3(*mTrigger.minEdgeVsImplied);
	  return scored;
	}

      scored.triggered = true;
      scored.reason = "model_prob " + fmt3(modelProb) + " passes trigger";
      return scored;
    }
  }
}
