#pragma once

#include <string>
#include <vector>
#include "CohortDataset.h"
#include "EvaluationTypes.h"

namespace theory_validator
{
  namespace evaluation
  {
    class FeatureDiagnostics
    {
    public:
      static constexpr std::size_t kMinCorrelationPairs = 5;
      static constexpr std::size_t kSignificantPairs = 30;
      static constexpr double kSignificantAbsR = 0.03;
      static constexpr std::size_t kSmallSample = 30;

      /**
       * @brief Pearson correlation of every column with the target.
       *
       * Uses rows where both the feature and the target are present. Columns
       * with fewer than kMinCorrelationPairs pairs or no spread are left out.
       * Sorted by |r| descending, then by feature name.
       */
      static std::vector<FeatureCorrelation> correlations(const cohort::CohortDataset& dataset);

      static std::vector<FeatureQuality> quality(const cohort::CohortDataset& dataset);

      // Human-readable findings for the analyze response.
      static std::vector<std::string> insights(const EvaluationResult& evaluation,
					       const std::vector<FeatureCorrelation>& correlations);
    };
  }
}
