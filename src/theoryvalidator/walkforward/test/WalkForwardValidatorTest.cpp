#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <deque>
#include <random>
#include <sstream>
#include "OddsMath.h"
#include "TheoryValidatorException.h"
#include "WalkForwardValidator.h"

using namespace theory_validator;
using namespace theory_validator::walkforward;
using boost::gregorian::date;
using boost::gregorian::days;
using sportsdata::StatValue;

namespace
{
  // Two games a day; a "signal" feature drives the home cover outcome.
  struct SignalSeason
  {
    std::deque<sportsdata::GameRecord> games;
    std::deque<cohort::CohortRow> rows;
    std::vector<features::GeneratedFeature> columns;

    explicit SignalSeason(int numDays, uint64_t seed = 11, bool withOdds = true)
    {
      features::GeneratedFeature signal;
      signal.name = "signal";
      signal.group = "efficiency";
      features::GeneratedFeature noise;
      noise.name = "noise";
      noise.group = "pace";
      columns = {signal, noise};

      std::mt19937_64 rng(seed);
      std::normal_distribution<double> z(0.0, 1.0);
      std::uniform_real_distribution<double> u(0.0, 1.0);
      const date start(2022, 10, 20);
      int64_t id = 1;
      for (int d = 0; d < numDays; ++d)
	{
	  for (int k = 0; k < 2; ++k)
	    {
	      sportsdata::GameRecord g;
	      g.gameId = id++;
	      g.league = "NBA";
	      g.season = 2022;
	      g.gameDate = start + days(d);
	      games.push_back(g);

	      const double s = z(rng);
	      cohort::CohortRow row;
	      row.game = &games.back();
	      row.features = {StatValue::numeric(s), StatValue::numeric(z(rng))};
	      row.target = u(rng) < 1.0 / (1.0 + std::exp(-2.5 * s)) ? 1.0 : 0.0;
	      if (withOdds)
		{
		  row.market.line = -3.5;
		  row.market.price = -110.0;
		  row.market.impliedProbability = sportsdata::OddsMath::impliedProbability(-110.0);
		  row.market.hasOdds = true;
		}
	      rows.push_back(row);
	    }
	}
    }

    std::vector<const cohort::CohortRow*> rowPtrs() const
    {
      std::vector<const cohort::CohortRow*> out;
      for (const auto& r : rows)
	out.push_back(&r);
      return out;
    }
  };

  evaluation::TargetDefinition spreadHome()
  {
    return evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  }

  WalkforwardSlice sliceAt(date start, std::optional<double> edge)
  {
    WalkforwardSlice s;
    s.startDate = start;
    s.endDate = start + days(14);
    s.edgeAvg = edge;
    return s;
  }
}

TEST_CASE("Walk-forward slices are chronological test windows", "[WalkForwardValidator]")
{
  SignalSeason season(300);
  WalkForwardWindow window;
  window.trainDays = 60;
  window.testDays = 14;
  window.stepDays = 7;
  concurrency::CancellationToken token;
  std::ostringstream log;

  WalkForwardValidator validator(window, WalkForwardPolicy(), modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);
  auto result = validator.run(season.columns, season.rowPtrs(), spreadHome(), log);

  REQUIRE(result.eligible);
  // cursor runs from day 60 to day 285 in steps of 7
  REQUIRE(result.slices.size() + result.skippedSlices == 33);
  REQUIRE(result.slices.size() == 33);
  REQUIRE(result.slices.front().startDate == date(2022, 10, 20) + days(60));

  for (std::size_t i = 0; i < result.slices.size(); ++i)
    {
      const auto& s = result.slices[i];
      REQUIRE(s.endDate > s.startDate);
      REQUIRE((s.endDate - s.startDate).days() == 14);
      REQUIRE(s.trainRows == 120);
      REQUIRE(s.sampleSize == 28);
      REQUIRE(s.oddsCoveragePct == Catch::Approx(1.0));
      REQUIRE(s.betCount <= 28);
      if (i > 0)
	REQUIRE((s.startDate - result.slices[i - 1].startDate).days() == 7);
      if (s.betCount > 0)
	{
	  REQUIRE(s.hitRate);
	  REQUIRE(*s.hitRate >= 0.0);
	  REQUIRE(*s.hitRate <= 1.0);
	  REQUIRE(s.edgeAvg);
	}
    }
  REQUIRE(log.str().find("[WalkForward]") != std::string::npos);
}

TEST_CASE("Thin windows are skipped and counted", "[WalkForwardValidator]")
{
  SignalSeason season(120);
  WalkForwardWindow window;
  window.trainDays = 60;
  concurrency::CancellationToken token;
  std::ostringstream log;

  WalkForwardPolicy policy;
  policy.minTrainRows = 1000;
  WalkForwardValidator validator(window, policy, modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);
  auto result = validator.run(season.columns, season.rowPtrs(), spreadHome(), log);

  REQUIRE(result.slices.empty());
  REQUIRE(result.skippedSlices == 7);
  REQUIRE_FALSE(result.edgeHalfLifeDays);
  REQUIRE_FALSE(result.eligible);
  REQUIRE(result.reasonCode == "insufficient_sample");
}

TEST_CASE("No resolved rows is an insufficient sample", "[WalkForwardValidator]")
{
  concurrency::CancellationToken token;
  std::ostringstream log;
  WalkForwardValidator validator(WalkForwardWindow(), WalkForwardPolicy(), modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);

  SECTION("empty cohort")
  {
    SignalSeason season(0);
    auto result = validator.run(season.columns, {}, spreadHome(), log);
    REQUIRE_FALSE(result.eligible);
    REQUIRE(result.reasonCode == "insufficient_sample");
    REQUIRE(result.slices.empty());
  }

  SECTION("rows without outcomes")
  {
    SignalSeason season(40);
    for (auto& row : season.rows)
      row.target.reset();
    auto result = validator.run(season.columns, season.rowPtrs(), spreadHome(), log);
    REQUIRE_FALSE(result.eligible);
    REQUIRE(result.reasonCode == "insufficient_sample");
  }
}

TEST_CASE("Market target without odds in any test window has no odds coverage", "[WalkForwardValidator]")
{
  SignalSeason season(300, 11, false);
  WalkForwardWindow window;
  window.trainDays = 60;
  window.testDays = 14;
  window.stepDays = 7;
  concurrency::CancellationToken token;
  std::ostringstream log;

  WalkForwardValidator validator(window, WalkForwardPolicy(), modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);
  const auto moneylineHome =
    evaluation::TargetDefinitionFactory::marketTarget("moneyline", "home", evaluation::OddsAssumption());
  auto result = validator.run(season.columns, season.rowPtrs(), moneylineHome, log);

  REQUIRE_FALSE(result.eligible);
  REQUIRE(result.reasonCode == "no_odds_coverage");
  for (const auto& s : result.slices)
    {
      REQUIRE(s.oddsCoveragePct == Catch::Approx(0.0));
      REQUIRE(s.betCount == 0);
    }
}

TEST_CASE("Stat targets are reported as not eligible", "[WalkForwardValidator]")
{
  SignalSeason season(100);
  concurrency::CancellationToken token;
  std::ostringstream log;
  WalkForwardValidator validator(WalkForwardWindow(), WalkForwardPolicy(), modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);
  auto result = validator.run(season.columns, season.rowPtrs(),
			      evaluation::TargetDefinitionFactory::statTarget("home_win"), log);
  REQUIRE_FALSE(result.eligible);
  REQUIRE(result.reasonCode == "stat_target_not_eligible");
  REQUIRE(result.slices.empty());
}

TEST_CASE("Cancellation stops the replay", "[WalkForwardValidator]")
{
  SignalSeason season(300);
  WalkForwardWindow window;
  window.trainDays = 60;
  concurrency::CancellationToken token;
  token.cancel();
  std::ostringstream log;
  WalkForwardValidator validator(window, WalkForwardPolicy(), modeling::ModelPolicy(),
				 simulation::TriggerDefinition(), simulation::ExposureControls(), token);
  REQUIRE_THROWS_AS(validator.run(season.columns, season.rowPtrs(), spreadHome(), log),
		    OperationCancelledException);
}

TEST_CASE("Edge half-life", "[WalkForwardValidator]")
{
  const date d0(2023, 1, 1);

  SECTION("First defined edge is the reference")
  {
    std::vector<WalkforwardSlice> slices{
      sliceAt(d0, std::nullopt),
      sliceAt(d0 + days(7), 0.08),
      sliceAt(d0 + days(14), 0.05),
      sliceAt(d0 + days(21), std::nullopt),
      sliceAt(d0 + days(28), 0.04),
    };
    REQUIRE(WalkForwardValidator::edgeHalfLife(slices) == 21);
  }

  SECTION("Non-positive initial edge has no half-life")
  {
    std::vector<WalkforwardSlice> slices{sliceAt(d0, -0.01), sliceAt(d0 + days(7), -0.05)};
    REQUIRE_FALSE(WalkForwardValidator::edgeHalfLife(slices));
  }

  SECTION("Edge that never halves has no half-life")
  {
    std::vector<WalkforwardSlice> slices{sliceAt(d0, 0.04), sliceAt(d0 + days(7), 0.03)};
    REQUIRE_FALSE(WalkForwardValidator::edgeHalfLife(slices));
  }

  SECTION("No slices")
  {
    REQUIRE_FALSE(WalkForwardValidator::edgeHalfLife({}));
  }
}

TEST_CASE("Window bounds are validated", "[WalkForwardValidator]")
{
  WalkForwardWindow window;
  REQUIRE_NOTHROW(validateWindow(window));

  window.trainDays = 29;
  REQUIRE_THROWS_AS(validateWindow(window), ConfigurationException);
  window.trainDays = 731;
  REQUIRE_THROWS_AS(validateWindow(window), ConfigurationException);
  window.trainDays = 730;
  window.testDays = 2;
  try {
    validateWindow(window);
    FAIL("expected ConfigurationException");
  }
  catch (const ConfigurationException& e) {
    REQUIRE(e.field() == "window.test_days");
    REQUIRE(e.reasonCode() == "out_of_range");
  }
  window.testDays = 90;
  window.stepDays = 91;
  REQUIRE_THROWS_AS(validateWindow(window), ConfigurationException);
}
