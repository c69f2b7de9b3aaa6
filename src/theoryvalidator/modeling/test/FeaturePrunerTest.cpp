#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include "FeaturePruner.h"

using namespace theory_validator;
using namespace theory_validator::modeling;
using sportsdata::StatValue;

namespace
{
  struct Fixture
  {
    std::vector<features::GeneratedFeature> columns;
    std::vector<cohort::CohortRow> rows;

    std::vector<const cohort::CohortRow*> pointers() const
    {
      std::vector<const cohort::CohortRow*> out;
      for (const auto& row : rows)
	out.push_back(&row);
      return out;
    }
  };

  // Columns: base, mostly_missing, sparse, constant, base_copy, near_base, other
  Fixture makeFixture()
  {
    Fixture f;
    for (const char* name : {"base", "mostly_missing", "sparse", "constant", "base_copy", "near_base", "other"})
      {
	features::GeneratedFeature g;
	g.name = name;
	f.columns.push_back(g);
      }

    for (int i = 0; i < 40; ++i)
      {
	const double x = static_cast<double>(i);
	cohort::CohortRow row;
	row.target = i % 2;
	row.features.push_back(StatValue::numeric(x));
	row.features.push_back(i < 10 ? StatValue::numeric(x) : StatValue::null());
	row.features.push_back(i < 4 ? StatValue::numeric(x) : StatValue::null());
	row.features.push_back(StatValue::numeric(7.0));
	row.features.push_back(StatValue::numeric(x + 1e-9));
	row.features.push_back(StatValue::numeric(2.0 * x + (i % 2 == 0 ? 0.01 : -0.01)));
	row.features.push_back(StatValue::numeric(static_cast<double>((i * 7) % 11)));
	f.rows.push_back(row);
      }
    return f;
  }

  const features::DroppedFeature* findDropped(const PruneResult& r, const std::string& name)
  {
    auto it = std::find_if(r.dropped.begin(), r.dropped.end(),
			   [&](const features::DroppedFeature& d) { return d.feature == name; });
    return it == r.dropped.end() ? nullptr : &*it;
  }
}

TEST_CASE("FeaturePruner applies each pruning rule", "[FeaturePruner]")
{
  auto fixture = makeFixture();
  PruningPolicy policy;
  policy.maxMissingFraction = 0.5;
  auto result = FeaturePruner(policy).prune(fixture.columns, fixture.pointers());

  REQUIRE(result.kept == std::vector<std::size_t>{0, 6});

  REQUIRE(findDropped(result, "mostly_missing")->reason == "too_many_missing");
  REQUIRE(findDropped(result, "sparse")->reason == "too_many_missing");
  REQUIRE(findDropped(result, "constant")->reason == "zero_variance");

  const auto* copy = findDropped(result, "base_copy");
  REQUIRE(copy->reason == "duplicate_vector");
  REQUIRE(copy->with == std::string("base"));

  const auto* near = findDropped(result, "near_base");
  REQUIRE(near->reason == "near_collinear");
  REQUIRE(near->with == std::string("base"));
  REQUIRE(*near->absCorr >= 0.98);
  REQUIRE(*near->threshold == Catch::Approx(0.98));
}

TEST_CASE("FeaturePruner too_few_values when missing fraction is tolerated", "[FeaturePruner]")
{
  auto fixture = makeFixture();
  PruningPolicy policy;
  policy.maxMissingFraction = 0.95;
  auto result = FeaturePruner(policy).prune(fixture.columns, fixture.pointers());

  REQUIRE(findDropped(result, "sparse")->reason == "too_few_values");
  REQUIRE(findDropped(result, "mostly_missing") == nullptr);
  REQUIRE(std::find(result.kept.begin(), result.kept.end(), 1u) != result.kept.end());
}

TEST_CASE("FeaturePruner collinearity cap leaves later features unchecked", "[FeaturePruner]")
{
  auto fixture = makeFixture();
  PruningPolicy policy;
  policy.maxCollinearityFeatures = 1;
  auto result = FeaturePruner(policy).prune(fixture.columns, fixture.pointers());
  REQUIRE(findDropped(result, "near_base") == nullptr);
  REQUIRE(result.kept == std::vector<std::size_t>{0, 5, 6});
}
