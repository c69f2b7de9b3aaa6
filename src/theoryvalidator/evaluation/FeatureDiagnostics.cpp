#include "FeatureDiagnostics.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include "StatUtils.h"

namespace theory_validator
{
  namespace evaluation
  {
    using statistics::StatUtils;

    std::vector<FeatureCorrelation> FeatureDiagnostics::correlations(const cohort::CohortDataset& dataset)
    {
      std::vector<FeatureCorrelation> out;
      for (std::size_t c = 0; c < dataset.columns.size(); ++c)
	{
	  std::vector<double> x;
	  std::vector<double> y;
	  for (const auto& row : dataset.rows)
	    {
	      auto v = row.feature(c);
	      if (v && row.target)
		{
		  x.push_back(*v);
		  y.push_back(*row.target);
		}
	    }

	  auto r = StatUtils::pearson(x, y, kMinCorrelationPairs);
	  if (!r)
	    continue;

	  FeatureCorrelation corr;
	  corr.feature = dataset.columns[c].name;
	  corr.group = dataset.columns[c].group;
	  corr.r = *r;
	  corr.n = x.size();
	  corr.significant = std::fabs(*r) > kSignificantAbsR && corr.n >= kSignificantPairs;
	  out.push_back(corr);
	}

      std::sort(out.begin(), out.end(), [](const FeatureCorrelation& a, const FeatureCorrelation& b) {
	const double ra = std::fabs(a.r);
	const double rb = std::fabs(b.r);
	if (ra != rb)
	  return ra > rb;
	return a.feature < b.feature;
      });
      return out;
    }

    std::vector<FeatureQuality> FeatureDiagnostics::quality(const cohort::CohortDataset& dataset)
    {
      std::vector<FeatureQuality> out;
      for (std::size_t c = 0; c < dataset.columns.size(); ++c)
	{
	  FeatureQuality q;
	  q.feature = dataset.columns[c].name;
	  q.count = dataset.rows.size();

	  std::vector<double> values;
	  std::set<double> distinct;
	  for (const auto& row : dataset.rows)
	    {
	      const auto& value = row.features[c];
	      if (value.isNull())
		++q.nulls;
	      else if (!value.isNumeric())
		++q.nonNumeric;
	      else
		{
		  values.push_back(value.value());
		  distinct.insert(value.value());
		}
	    }

	  q.distinct = distinct.size();
	  if (q.count > 0)
	    q.nullPct = 100.0 * static_cast<double>(q.nulls) / static_cast<double>(q.count);
	  if (!values.empty())
	    {
	      q.min = *std::min_element(values.begin(), values.end());
	      q.max = *std::max_element(values.begin(), values.end());
	      q.mean = StatUtils::mean(values);
	    }
	  out.push_back(q);
	}
      return out;
    }

    std::vector<std::string> FeatureDiagnostics::insights(const EvaluationResult& evaluation,
							  const std::vector<FeatureCorrelation>& correlations)
    {
      std::vector<std::string> out;
      std::ostringstream line;
      line << "Sample size: " << evaluation.sampleSize << " cohort rows (" << evaluation.sampleLabel
	   << ") against " << evaluation.baselineSize << " baseline games.";
      out.push_back(line.str());

      if (evaluation.sampleSize < kSmallSample)
	out.push_back("Small sample (< " + std::to_string(kSmallSample) + " rows): treat every figure as exploratory.");

      if (!correlations.empty())
	{
	  const auto& top = correlations.front();
	  std::ostringstream os;
	  os << std::fixed << std::setprecision(3)
	     << "Strongest correlation: " << top.feature << " (r=" << top.r << ", n=" << top.n << ")"
	     << (top.significant ? "." : ", below the significance screen.");
	  out.push_back(os.str());
	}
      else
	out.push_back("No feature had enough paired values for a correlation.");

      if (evaluation.reasonCode)
	out.push_back("Evaluation not available: " + *evaluation.reasonCode + ".");
      else if (evaluation.delta)
	{
	  std::ostringstream os;
	  os << std::fixed << std::setprecision(3) << std::showpos
	     << "Cohort " << evaluation.targetName << " differs from baseline by " << *evaluation.delta
	     << std::noshowpos << " (" << evaluation.liftLabel << ").";
	  out.push_back(os.str());
	}
      return out;
    }
  }
}
