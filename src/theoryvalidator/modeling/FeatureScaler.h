#pragma once

#include <cstddef>
#include <vector>
#include "CohortDataset.h"

namespace theory_validator
{
  namespace modeling
  {
    /**
     * @brief Standardizes selected columns with statistics from training rows.
     *
     * A missing value maps to the training mean, i.e. 0 after scaling. A
     * column without spread in training has a scale of 1.
     */
    class FeatureScaler
    {
    public:
      FeatureScaler() = default;

      static FeatureScaler fit(const std::vector<const cohort::CohortRow*>& rows,
			       const std::vector<std::size_t>& columns);

      std::vector<double> transform(const cohort::CohortRow& row) const;

      const std::vector<std::size_t>& columns() const
      {
	return mColumns;
      }

      const std::vector<double>& means() const
      {
	return mMeans;
      }

      const std::vector<double>& scales() const
      {
	return mScales;
      }

    private:
      std::vector<std::size_t> mColumns;
      std::vector<double> mMeans;
      std::vector<double> mScales;
    };
  }
}
