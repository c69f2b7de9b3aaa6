#include "TheoryCandidateGenerator.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include "StatUtils.h"

namespace theory_validator
{
  namespace modeling
  {
    using statistics::StatUtils;

    namespace
    {
      std::string formatFixed(double v, int precision)
      {
	std::ostringstream os;
	os << std::fixed << std::setprecision(precision) << v;
	return os.str();
      }

      std::string targetLabel(const evaluation::TargetDefinition& target)
      {
	if (target.isMarket() && target.marketType)
	  return std::string(evaluation::marketTypeToString(*target.marketType)) + ":" + target.side;
	return target.targetName;
      }

      std::string correlationConfidence(double absR)
      {
	if (absR > 0.12)
	  return "high";
	return absR > 0.07 ? "medium" : "exploratory";
      }

      std::string liftConfidence(double absLift)
      {
	if (absLift > 0.08)
	  return "high";
	return absLift > 0.04 ? "medium" : "exploratory";
      }
    }

    TheoryCandidateGenerator::TheoryCandidateGenerator(const CandidatePolicy& policy)
      : mPolicy(policy)
    {}

    std::vector<TheoryCandidate>
    TheoryCandidateGenerator::generate(const std::vector<features::GeneratedFeature>& columns,
				       const std::vector<std::size_t>& columnIndices,
				       const std::vector<const cohort::CohortRow*>& rows,
				       const evaluation::TargetDefinition& target) const
    {
      std::vector<TheoryCandidate> candidates;
      if (!target.isBinary() || columnIndices.empty())
	return candidates;

      std::vector<double> outcomes;
      for (const auto* row : rows)
	{
	  if (row->target)
	    outcomes.push_back(*row->target);
	}
      if (outcomes.size() < mPolicy.minSampleSize)
	return candidates;
      const double baseline = StatUtils::mean(outcomes);
      const std::string label = targetLabel(target);

      const std::size_t featureCount = std::min(mPolicy.maxFeatures, columnIndices.size());
      for (std::size_t k = 0; k < featureCount; ++k)
	{
	  const std::size_t column = columnIndices[k];
	  std::vector<double> values;
	  std::vector<double> y;
	  for (const auto* row : rows)
	    {
	      const auto v = row->feature(column);
	      if (!row->target || !v)
		continue;
	      values.push_back(*v);
	      y.push_back(*row->target);
	    }
	  if (values.size() < mPolicy.minSampleSize || StatUtils::standardDeviation(values) < 1e-9)
	    continue;

	  std::vector<double> winners;
	  std::vector<double> losers;
	  for (std::size_t i = 0; i < values.size(); ++i)
	    (y[i] >= 0.5 ? winners : losers).push_back(values[i]);
	  const bool upper = StatUtils::mean(winners) >= StatUtils::mean(losers);
	  const double threshold = StatUtils::quantile(values, upper ? 0.75 : 0.25);

	  std::size_t sample = 0;
	  std::size_t hits = 0;
	  for (std::size_t i = 0; i < values.size(); ++i)
	    {
	      if (upper ? values[i] >= threshold : values[i] <= threshold)
		{
		  ++sample;
		  if (y[i] >= 0.5)
		    ++hits;
		}
	    }
	  if (sample < mPolicy.minSampleSize)
	    continue;

	  const double hitRate = static_cast<double>(hits) / static_cast<double>(sample);
	  const double lift = hitRate - baseline;
	  if (std::fabs(lift) < mPolicy.minLift)
	    continue;

	  TheoryCandidate c;
	  c.feature = columns[column].name;
	  c.op = upper ? ">=" : "<=";
	  c.threshold = threshold;
	  c.condition = c.feature + " " + c.op + " " + formatFixed(threshold, 3);
	  c.sampleSize = sample;
	  c.hitRate = hitRate;
	  c.baselineRate = baseline;
	  c.lift = lift;
	  c.framingDraft = "When " + c.condition + ", " + label + (lift >= 0.0 ? " outperforms" : " underperforms") +
	    " baseline by " + formatFixed(std::fabs(lift) * 100.0, 1) + "% over " + std::to_string(sample) + " games.";
	  candidates.push_back(c);
	}

      std::sort(candidates.begin(), candidates.end(), [](const TheoryCandidate& a, const TheoryCandidate& b) {
	if (std::fabs(a.lift) != std::fabs(b.lift))
	  return std::fabs(a.lift) > std::fabs(b.lift);
	if (a.sampleSize != b.sampleSize)
	  return a.sampleSize > b.sampleSize;
	return a.feature < b.feature;
      });
      if (candidates.size() > mPolicy.maxCandidates)
	candidates.resize(mPolicy.maxCandidates);
      return candidates;
    }

    std::vector<SuggestedTheory>
    TheoryCandidateGenerator::suggest(const std::vector<evaluation::FeatureCorrelation>& correlations,
				      const std::vector<TheoryCandidate>& candidates)
    {
      std::vector<evaluation::FeatureCorrelation> ranked = correlations;
      std::stable_sort(ranked.begin(), ranked.end(),
		       [](const evaluation::FeatureCorrelation& a, const evaluation::FeatureCorrelation& b) {
			 return std::fabs(a.r) > std::fabs(b.r);
		       });

      std::vector<SuggestedTheory> theories;
      for (std::size_t i = 0; i < std::min<std::size_t>(3, ranked.size()); ++i)
	{
	  const auto& c = ranked[i];
	  SuggestedTheory t;
	  t.text = "Outcomes improve when " + c.feature + " tends to " + (c.r > 0.0 ? "increase." : "decrease.");
	  t.featuresUsed = {c.feature};
	  t.historicalEdge = std::fabs(c.r);
	  t.confidence = correlationConfidence(std::fabs(c.r));
	  theories.push_back(t);
	}

      for (std::size_t i = 0; i < std::min<std::size_t>(2, candidates.size()); ++i)
	{
	  const auto& c = candidates[i];
	  SuggestedTheory t;
	  t.text = "Segment '" + c.condition + "' shows an edge of " + formatFixed(c.lift * 100.0, 1) + "% on target.";
	  t.featuresUsed = {c.feature};
	  t.historicalEdge = c.lift;
	  t.confidence = liftConfidence(std::fabs(c.lift));
	  theories.push_back(t);
	}
      return theories;
    }
  }
}
