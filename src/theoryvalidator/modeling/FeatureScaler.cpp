#include "FeatureScaler.h"
#include <cmath>
#include "StatUtils.h"

namespace theory_validator
{
  namespace modeling
  {
    using statistics::StatUtils;

    FeatureScaler FeatureScaler::fit(const std::vector<const cohort::CohortRow*>& rows,
				     const std::vector<std::size_t>& columns)
    {
      FeatureScaler scaler;
      scaler.mColumns = columns;
      for (std::size_t c : columns)
	{
	  std::vector<double> present;
	  for (const auto* row : rows)
	    {
	      if (auto v = row->feature(c))
		present.push_back(*v);
	    }

	  const auto [mean, variance] = StatUtils::computeMeanAndVariance(present);
	  const double sd = std::sqrt(variance);
	  scaler.mMeans.push_back(present.empty() ? 0.0 : mean);
	  scaler.mScales.push_back(sd > 1e-12 ? sd : 1.0);
	}
      return scaler;
    }

    std::vector<double> FeatureScaler::transform(const cohort::CohortRow& row) const
    {
      std::vector<double> x(mColumns.size(), 0.0);
      for (std::size_t j = 0; j < mColumns.size(); ++j)
	{
	  if (auto v = row.feature(mColumns[j]))
	    x[j] = (*v - mMeans[j]) / mScales[j];
	}
      return x;
    }
  }
}
