#include "FeaturePruner.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>
#include "StatUtils.h"

namespace theory_validator
{
  namespace modeling
  {
    using features::DroppedFeature;
    using statistics::StatUtils;

    namespace
    {
      DroppedFeature drop(const std::string& feature, const std::string& reason, const std::string& detail)
      {
	DroppedFeature d;
	d.feature = feature;
	d.reason = reason;
	d.detail = detail;
	return d;
      }

      std::string roundedKey(const std::vector<std::optional<double>>& column)
      {
	std::ostringstream os;
	os << std::fixed << std::setprecision(6);
	for (const auto& v : column)
	  {
	    if (v)
	      os << (std::round(*v * 1e6) / 1e6);
	    else
	      os << "NA";
	    os << '|';
	  }
	return os.str();
      }
    }

    FeaturePruner::FeaturePruner(const PruningPolicy& policy)
      : mPolicy(policy)
    {}

    PruneResult FeaturePruner::prune(const std::vector<features::GeneratedFeature>& columns,
				     const std::vector<const cohort::CohortRow*>& rows) const
    {
      PruneResult result;
      const std::size_t n = rows.size();

      std::vector<std::size_t> candidates;
      std::vector<std::vector<std::optional<double>>> values(columns.size());
      for (std::size_t c = 0; c < columns.size(); ++c)
	{
	  values[c].reserve(n);
	  std::vector<double> present;
	  for (const auto* row : rows)
	    {
	      values[c].push_back(row->feature(c));
	      if (values[c].back())
		present.push_back(*values[c].back());
	    }

	  const double missing = n == 0 ? 1.0 : 1.0 - static_cast<double>(present.size()) / static_cast<double>(n);
	  if (missing >= mPolicy.maxMissingFraction)
	    {
	      std::ostringstream os;
	      os << std::fixed << std::setprecision(3) << "missing fraction " << missing
		 << " >= " << mPolicy.maxMissingFraction;
	      result.dropped.push_back(drop(columns[c].name, "too_many_missing", os.str()));
	      continue;
	    }
	  if (present.size() < mPolicy.minValues)
	    {
	      result.dropped.push_back(drop(columns[c].name, "too_few_values",
					    std::to_string(present.size()) + " values < " +
					    std::to_string(mPolicy.minValues)));
	      continue;
	    }
	  if (StatUtils::standardDeviation(present) < mPolicy.zeroVarianceEpsilon)
	    {
	      result.dropped.push_back(drop(columns[c].name, "zero_variance", "no observed variance"));
	      continue;
	    }
	  candidates.push_back(c);
	}

      std::map<std::string, std::size_t> seen;
      std::vector<std::size_t> distinct;
      for (std::size_t c : candidates)
	{
	  const std::string key = roundedKey(values[c]);
	  auto it = seen.find(key);
	  if (it != seen.end())
	    {
	      DroppedFeature d = drop(columns[c].name, "duplicate_vector", "identical to an earlier feature");
	      d.with = columns[it->second].name;
	      d.absCorr = 1.0;
	      result.dropped.push_back(d);
	      continue;
	    }
	  seen.emplace(key, c);
	  distinct.push_back(c);
	}

      std::vector<std::vector<double>> imputed;
      std::vector<std::size_t> imputedColumn;
      for (std::size_t i = 0; i < distinct.size(); ++i)
	{
	  const std::size_t c = distinct[i];
	  if (i >= mPolicy.maxCollinearityFeatures)
	    {
	      result.kept.push_back(c);
	      continue;
	    }

	  std::vector<double> present;
	  for (const auto& v : values[c])
	    if (v)
	      present.push_back(*v);
	  const double mean = StatUtils::mean(present);
	  std::vector<double> column;
	  column.reserve(n);
	  for (const auto& v : values[c])
	    column.push_back(v ? *v : mean);

	  bool collinear = false;
	  for (std::size_t k = 0; k < imputed.size(); ++k)
	    {
	      auto r = StatUtils::pearson(imputed[k], column);
	      if (r && std::fabs(*r) >= mPolicy.collinearityThreshold)
		{
		  DroppedFeature d = drop(columns[c].name, "near_collinear", "highly correlated with an earlier feature");
		  d.with = columns[imputedColumn[k]].name;
		  d.absCorr = std::fabs(*r);
		  d.threshold = mPolicy.collinearityThreshold;
		  result.dropped.push_back(d);
		  collinear = true;
		  break;
		}
	    }
	  if (collinear)
	    continue;

	  imputed.push_back(std::move(column));
	  imputedColumn.push_back(c);
	  result.kept.push_back(c);
	}

      std::sort(result.kept.begin(), result.kept.end());
      return result;
    }
  }
}
