#pragma once

#include <cstddef>
#include <vector>
#include "CohortDataset.h"
#include "FeatureTypes.h"

namespace theory_validator
{
  namespace modeling
  {
    struct PruningPolicy
    {
      double maxMissingFraction{0.5};
      std::size_t minValues{5};
      double zeroVarianceEpsilon{1e-9};
      double collinearityThreshold{0.98};
      std::size_t maxCollinearityFeatures{600};
    };

    struct PruneResult
    {
      // Surviving column indices in declaration order.
      std::vector<std::size_t> kept;
      std::vector<features::DroppedFeature> dropped;
    };

    /**
     * @brief Removes uninformative columns before fitting.
     *
     * Checks in order: too_many_missing, too_few_values, zero_variance,
     * duplicate_vector (identical after rounding to six places) and
     * near_collinear (|r| at or above the threshold after mean imputation).
     * For duplicate and collinear pairs the column declared first is kept.
     * Only rows with a target value are inspected.
     */
    class FeaturePruner
    {
    public:
      explicit FeaturePruner(const PruningPolicy& policy);

      PruneResult prune(const std::vector<features::GeneratedFeature>& columns,
			const std::vector<const cohort::CohortRow*>& rows) const;

    private:
      PruningPolicy mPolicy;
    };
  }
}
