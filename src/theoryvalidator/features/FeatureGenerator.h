#pragma once

#include <vector>
#include "FeatureTypes.h"
#include "HistoricalGameStore.h"

namespace theory_validator
{
  namespace features
  {
    /**
     * @brief Builds the ordered catalog of features a run can select from.
     *
     * Catalog order: engineered features, then per stat the raw home/away,
     * diff, total and ratio features, then rest features, then rolling
     * averages. Stat keys unknown to the league are skipped and named in the
     * summary string.
     */
    class FeatureGenerator
    {
    public:
      explicit FeatureGenerator(const sportsdata::HistoricalGameStore& store);

      FeatureCatalog generate(const FeatureGenerationRequest& request) const;

      static std::vector<GeneratedFeature> engineeredCatalog();

    private:
      const sportsdata::HistoricalGameStore& mStore;
    };
  }
}
