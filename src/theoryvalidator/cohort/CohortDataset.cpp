#include "CohortDataset.h"
#include <stdexcept>

namespace theory_validator
{
  namespace cohort
  {
    std::vector<std::string> CohortDataset::columnNames() const
    {
      std::vector<std::string> names;
      names.reserve(columns.size());
      for (const auto& column : columns)
	names.push_back(column.name);
      return names;
    }

    std::optional<std::size_t> CohortDataset::columnIndex(const std::string& name) const
    {
      for (std::size_t i = 0; i < columns.size(); ++i)
	{
	  if (columns[i].name == name)
	    return i;
	}
      return std::nullopt;
    }

    DatasetBuilder::DatasetBuilder(const features::FeatureComputer& computer,
				   concurrency::IParallelExecutor& executor,
				   const concurrency::CancellationToken& token)
      : mComputer(computer),
	mExecutor(executor),
	mToken(token)
    {}

    CohortDataset DatasetBuilder::build(const std::vector<const sportsdata::GameRecord*>& games,
					const std::vector<features::GeneratedFeature>& columns,
					const std::vector<features::FeatureSpec>& specs,
					const evaluation::TargetDefinition& target) const
    {
      if (columns.size() != specs.size())
	throw std::invalid_argument("DatasetBuilder::build - columns and specs differ in size");

      CohortDataset dataset;
      dataset.columns = columns;
      dataset.specs = specs;

      auto matrix = mComputer.computeMatrix(games, specs, mExecutor, mToken);

      dataset.rows.reserve(games.size());
      for (std::size_t i = 0; i < games.size(); ++i)
	{
	  CohortRow row;
	  row.game = games[i];
	  row.features = std::move(matrix[i]);
	  row.target = evaluation::TargetResolver::targetValue(target, *games[i]);
	  row.market = evaluation::TargetResolver::marketQuote(target, *games[i]);
	  dataset.rows.push_back(std::move(row));
	}
      return dataset;
    }
  }
}
