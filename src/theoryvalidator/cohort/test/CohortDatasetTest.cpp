#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "CohortBuilder.h"
#include "CohortDataset.h"
#include "FeatureNames.h"
#include "ParallelExecutors.h"
#include "TestGameFactory.h"

using namespace theory_validator;
using namespace theory_validator::cohort;
using Catch::Approx;

namespace
{
  std::vector<features::GeneratedFeature> columnsFor(const std::vector<std::string>& names,
						     std::vector<features::FeatureSpec>& specs)
  {
    std::vector<features::GeneratedFeature> columns;
    for (const auto& name : names)
      {
	specs.push_back(*features::parseFeatureName(name));
	features::GeneratedFeature f;
	f.name = name;
	columns.push_back(f);
      }
    return columns;
  }
}

TEST_CASE("DatasetBuilder materializes features, targets and market quotes", "[CohortDataset]")
{
  auto store = testing::makeLeagueStore();
  CohortBuilder builder(store, 5000);
  FilterBundle filters;
  filters.league = "NBA";
  filters.team = "Lakers";
  auto selection = builder.build(filters, true);

  features::FeatureComputer computer(selection.history, std::nullopt);
  concurrency::SingleThreadExecutor executor;
  concurrency::CancellationToken token;
  DatasetBuilder datasetBuilder(computer, executor, token);

  std::vector<features::FeatureSpec> specs;
  auto columns = columnsFor({"home_rebounds", "rebounds_diff"}, specs);
  auto target = evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  auto dataset = datasetBuilder.build(selection.cohort, columns, specs, target);

  REQUIRE(dataset.rows.size() == 240);
  REQUIRE(dataset.columnNames() == std::vector<std::string>{"home_rebounds", "rebounds_diff"});
  REQUIRE(dataset.columnIndex("rebounds_diff") == std::size_t(1));
  REQUIRE_FALSE(dataset.columnIndex("pace_game"));

  for (const auto& row : dataset.rows)
    {
      REQUIRE(row.features.size() == 2);
      REQUIRE(row.feature(0));
      REQUIRE(row.market.hasOdds);
      REQUIRE(row.market.line);
      REQUIRE(row.market.impliedProbability);
      if (row.target)
	REQUIRE((*row.target == 0.0 || *row.target == 1.0));
    }
}

TEST_CASE("DatasetBuilder marks rows without odds", "[CohortDataset]")
{
  testing::LeagueSpec spec;
  spec.withOdds = false;
  auto store = testing::makeLeagueStore(spec);
  CohortBuilder builder(store, 5000);
  FilterBundle filters;
  filters.league = "NBA";
  auto selection = builder.build(filters, false);

  features::FeatureComputer computer(selection.history, std::nullopt);
  concurrency::SingleThreadExecutor executor;
  concurrency::CancellationToken token;
  DatasetBuilder datasetBuilder(computer, executor, token);

  auto target = evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  auto dataset = datasetBuilder.build(selection.cohort, {}, {}, target);
  REQUIRE(dataset.rows.size() == 720);
  for (const auto& row : dataset.rows)
    {
      REQUIRE_FALSE(row.market.hasOdds);
      REQUIRE_FALSE(row.target);
    }

  auto stat = evaluation::TargetDefinitionFactory::defaultStatTarget();
  auto statDataset = datasetBuilder.build(selection.cohort, {}, {}, stat);
  for (const auto& row : statDataset.rows)
    {
      REQUIRE(row.target);
      REQUIRE(*row.target == Approx(*row.game->homeScore + *row.game->awayScore));
    }
}
