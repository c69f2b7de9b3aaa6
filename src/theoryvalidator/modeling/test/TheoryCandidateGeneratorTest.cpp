#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <numeric>
#include "TheoryCandidateGenerator.h"

using namespace theory_validator;
using namespace theory_validator::modeling;
using sportsdata::StatValue;

namespace
{
  features::GeneratedFeature column(const std::string& name)
  {
    features::GeneratedFeature f;
    f.name = name;
    f.group = "general";
    return f;
  }

  // 800 games with a 0.5 baseline. The last 200 games win at 0.8 and the
  // rest at 0.4, and games whose id ends in 0-3 always win.
  struct QuartileFixture
  {
    cohort::CohortDataset ds;

    QuartileFixture()
    {
      ds.columns = {column("strong"), column("weak"), column("digit"), column("sparse"),
		    column("inverse"), column("flat"), column("modest")};
      for (int i = 0; i < 800; ++i)
	{
	  cohort::CohortRow row;
	  row.features = {
	    StatValue::numeric(i),
	    StatValue::numeric((i * 173) % 800),
	    StatValue::numeric(i % 10),
	    i < 100 ? StatValue::numeric(i) : StatValue::null(),
	    StatValue::numeric(799 - i),
	    StatValue::numeric(4.0),
	    StatValue::numeric((i * 3) % 800),
	  };
	  const bool win = i >= 600 ? i % 10 < 8 : i % 10 < 4;
	  row.target = win ? 1.0 : 0.0;
	  ds.rows.push_back(row);
	}
    }

    std::vector<const cohort::CohortRow*> rows() const
    {
      std::vector<const cohort::CohortRow*> out;
      for (const auto& r : ds.rows)
	out.push_back(&r);
      return out;
    }

    std::vector<std::size_t> allColumns() const
    {
      std::vector<std::size_t> idx(ds.columns.size());
      std::iota(idx.begin(), idx.end(), 0);
      return idx;
    }
  };

  evaluation::TargetDefinition spreadHome()
  {
    return evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  }
}

TEST_CASE("Quartile conditions become candidates when sample and lift clear the bar", "[TheoryCandidateGenerator]")
{
  QuartileFixture f;
  const auto candidates = TheoryCandidateGenerator(CandidatePolicy())
    .generate(f.ds.columns, f.allColumns(), f.rows(), spreadHome());

  // weak has |lift| 0.01, sparse has 100 values, flat has no variance
  REQUIRE(candidates.size() == 4);
  REQUIRE(candidates[0].feature == "digit");
  REQUIRE(candidates[1].feature == "inverse");
  REQUIRE(candidates[2].feature == "strong");
  REQUIRE(candidates[3].feature == "modest");

  const auto& digit = candidates[0];
  REQUIRE(digit.op == "<=");
  REQUIRE(digit.threshold == Catch::Approx(2.0));
  REQUIRE(digit.sampleSize == 240);
  REQUIRE(digit.hitRate == Catch::Approx(1.0));
  REQUIRE(digit.baselineRate == Catch::Approx(0.5));
  REQUIRE(digit.lift == Catch::Approx(0.5));
  REQUIRE(digit.condition == "digit <= 2.000");
  REQUIRE(digit.framingDraft == "When digit <= 2.000, spread:home outperforms baseline by 50.0% over 240 games.");
  REQUIRE(digit.status == "draft");

  // inverse and strong select the same 200 games; the name breaks the tie
  REQUIRE(candidates[1].op == "<=");
  REQUIRE(candidates[1].threshold == Catch::Approx(199.75));
  REQUIRE(candidates[2].op == ">=");
  REQUIRE(candidates[2].threshold == Catch::Approx(599.25));
  REQUIRE(candidates[1].lift == Catch::Approx(0.3));
  REQUIRE(candidates[2].lift == Catch::Approx(0.3));
  REQUIRE(candidates[2].sampleSize == 200);

  REQUIRE(candidates[3].lift == Catch::Approx(0.04));
}

TEST_CASE("Candidate policy limits", "[TheoryCandidateGenerator]")
{
  QuartileFixture f;

  SECTION("only the strongest candidates are kept")
    {
      CandidatePolicy policy;
      policy.maxCandidates = 2;
      const auto candidates = TheoryCandidateGenerator(policy)
	.generate(f.ds.columns, f.allColumns(), f.rows(), spreadHome());
      REQUIRE(candidates.size() == 2);
      REQUIRE(candidates[0].feature == "digit");
      REQUIRE(candidates[1].feature == "inverse");
    }

  SECTION("a higher lift bar removes the modest condition")
    {
      CandidatePolicy policy;
      policy.minLift = 0.05;
      const auto candidates = TheoryCandidateGenerator(policy)
	.generate(f.ds.columns, f.allColumns(), f.rows(), spreadHome());
      REQUIRE(candidates.size() == 3);
      REQUIRE(candidates.back().feature == "strong");
    }

  SECTION("a lower lift bar admits the weak condition")
    {
      CandidatePolicy policy;
      policy.minLift = 0.005;
      const auto candidates = TheoryCandidateGenerator(policy)
	.generate(f.ds.columns, f.allColumns(), f.rows(), spreadHome());
      REQUIRE(candidates.size() == 5);
      REQUIRE(candidates.back().feature == "weak");
    }

  SECTION("conditions met by fewer games than the minimum are skipped")
    {
      CandidatePolicy policy;
      policy.minSampleSize = 220;
      const auto candidates = TheoryCandidateGenerator(policy)
	.generate(f.ds.columns, f.allColumns(), f.rows(), spreadHome());
      REQUIRE(candidates.size() == 1);
      REQUIRE(candidates[0].feature == "digit");
    }

  SECTION("only the requested columns are considered")
    {
      const auto candidates = TheoryCandidateGenerator(CandidatePolicy())
	.generate(f.ds.columns, {0, 1}, f.rows(), spreadHome());
      REQUIRE(candidates.size() == 1);
      REQUIRE(candidates[0].feature == "strong");
    }

  SECTION("numeric targets have no candidates")
    {
      const auto candidates = TheoryCandidateGenerator(CandidatePolicy())
	.generate(f.ds.columns, f.allColumns(), f.rows(),
		  evaluation::TargetDefinitionFactory::defaultStatTarget());
      REQUIRE(candidates.empty());
    }
}

TEST_CASE("Suggested theories come from correlations and candidates", "[TheoryCandidateGenerator]")
{
  std::vector<evaluation::FeatureCorrelation> correlations{
    {"pace", "pace", 0.05, 500, false},
    {"rest_days", "schedule", -0.15, 500, true},
    {"efg", "efficiency", 0.09, 500, true},
    {"travel", "schedule", 0.01, 500, false},
  };

  TheoryCandidate a;
  a.feature = "efg";
  a.condition = "efg >= 0.560";
  a.lift = 0.06;
  TheoryCandidate b;
  b.feature = "pace";
  b.condition = "pace <= 97.000";
  b.lift = -0.03;
  TheoryCandidate c;
  c.feature = "travel";
  c.lift = 0.025;

  const auto theories = TheoryCandidateGenerator::suggest(correlations, {a, b, c});
  REQUIRE(theories.size() == 5);

  REQUIRE(theories[0].text == "Outcomes improve when rest_days tends to decrease.");
  REQUIRE(theories[0].confidence == "high");
  REQUIRE(theories[0].historicalEdge == Catch::Approx(0.15));
  REQUIRE(theories[1].featuresUsed == std::vector<std::string>{"efg"});
  REQUIRE(theories[1].confidence == "medium");
  REQUIRE(theories[2].confidence == "exploratory");

  REQUIRE(theories[3].text == "Segment 'efg >= 0.560' shows an edge of 6.0% on target.");
  REQUIRE(theories[3].confidence == "medium");
  REQUIRE(theories[4].historicalEdge == Catch::Approx(-0.03));
  REQUIRE(theories[4].confidence == "exploratory");

  REQUIRE(TheoryCandidateGenerator::suggest({}, {}).empty());
}
