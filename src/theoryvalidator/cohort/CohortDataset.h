#pragma once

#include <optional>
#include <string>
#include <vector>
#include "CancellationToken.h"
#include "DerivedMetrics.h"
#include "FeatureComputer.h"
#include "FeatureTypes.h"
#include "GameRecord.h"
#include "IParallelExecutor.h"
#include "TargetDefinition.h"

namespace theory_validator
{
  namespace cohort
  {
    // One cohort game with its feature values, target and market quote.
    struct CohortRow
    {
      const sportsdata::GameRecord* game{nullptr};
      std::vector<sportsdata::StatValue> features;
      std::optional<double> target;
      evaluation::MarketQuote market;

      // Feature value as a double, std::nullopt unless numeric.
      std::optional<double> feature(std::size_t column) const
      {
	return features[column].asOptional();
      }
    };

    /**
     * @brief Materialized rows for a request.
     *
     * columns and specs are parallel: column i of every row holds the value of
     * columns[i].
     */
    struct CohortDataset
    {
      std::vector<features::GeneratedFeature> columns;
      std::vector<features::FeatureSpec> specs;
      std::vector<CohortRow> rows;

      std::vector<std::string> columnNames() const;

      // Index of a column by feature name.
      std::optional<std::size_t> columnIndex(const std::string& name) const;
    };

    class DatasetBuilder
    {
    public:
      DatasetBuilder(const features::FeatureComputer& computer,
		     concurrency::IParallelExecutor& executor,
		     const concurrency::CancellationToken& token);

      CohortDataset build(const std::vector<const sportsdata::GameRecord*>& games,
			  const std::vector<features::GeneratedFeature>& columns,
			  const std::vector<features::FeatureSpec>& specs,
			  const evaluation::TargetDefinition& target) const;

    private:
      const features::FeatureComputer& mComputer;
      concurrency::IParallelExecutor& mExecutor;
      const concurrency::CancellationToken& mToken;
    };
  }
}
