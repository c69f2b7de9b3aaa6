#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TriggerEvaluator.h"
#include "TheoryValidatorException.h"
#include "SimulationFixtures.h"

using namespace theory_validator;
using namespace theory_validator::simulation;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  evaluation::TargetDefinition spreadHome()
  {
    return evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  }
}

TEST_CASE("Trigger threshold is inclusive", "[TriggerEvaluator]")
{
  testing::BetFixture fx;
  const auto& row = fx.add(1, date(2023, 11, 1), -3.5, 110.0, 1);

  TriggerDefinition trigger;
  trigger.probThreshold = 0.55;
  TriggerEvaluator evaluator(trigger, spreadHome());

  auto below = evaluator.evaluate(row, 0.54);
  REQUIRE_FALSE(below.triggered);
  REQUIRE(below.reason == "model_prob 0.540 < threshold 0.550");

  auto at = evaluator.evaluate(row, 0.55);
  REQUIRE(at.triggered);
  REQUIRE(at.reason == "model_prob 0.550 passes trigger");
  REQUIRE(*at.impliedProb == Approx(100.0 / 210.0));
  REQUIRE(*at.edge == Approx(0.55 - 100.0 / 210.0));
  REQUIRE(at.side == "home");
}

TEST_CASE("Trigger confidence band and minimum edge", "[TriggerEvaluator]")
{
  testing::BetFixture fx;
  const auto& row = fx.add(1, date(2023, 11, 1), -3.5, -110.0, 1);

  TriggerDefinition trigger;
  trigger.probThreshold = 0.5;
  trigger.confidenceBand = 0.05;
  trigger.minEdgeVsImplied = 0.02;
  TriggerEvaluator evaluator(trigger, spreadHome());

  auto weak = evaluator.evaluate(row, 0.52);
  REQUIRE_FALSE(weak.triggered);
  REQUIRE(weak.reason == "confidence |p-0.5| 0.020 < band 0.050");

  // implied for -110 is 0.5238, so edge is 0.0162
  auto thin = evaluator.evaluate(row, 0.54);
  REQUIRE_FALSE(thin.triggered);
  REQUIRE(thin.reason.rfind("confidence", 0) == 0);

  auto enoughEdge = evaluator.evaluate(row, 0.555);
  REQUIRE(enoughEdge.triggered);

  trigger.minEdgeVsImplied = 0.04;
  TriggerEvaluator strict(trigger, spreadHome());
  auto rejected = strict.evaluate(row, 0.555);
  REQUIRE_FALSE(rejected.triggered);
  REQUIRE(rejected.reason == "edge 0.031 < min_edge 0.040");

  REQUIRE(strict.evaluate(row, 0.60).triggered);
}

TEST_CASE("Market rows without odds never trigger", "[TriggerEvaluator]")
{
  testing::BetFixture fx;
  auto& row = fx.add(1, date(2023, 11, 1), -3.5, -110.0, 1);
  row.market = evaluation::MarketQuote();

  TriggerEvaluator evaluator(TriggerDefinition(), spreadHome());
  auto scored = evaluator.evaluate(row, 0.9);
  REQUIRE_FALSE(scored.triggered);
  REQUIRE(scored.reason == "missing odds for implied probability");
}

TEST_CASE("Binary stat targets use a 0.5 proxy edge", "[TriggerEvaluator]")
{
  testing::BetFixture fx;
  const auto& row = fx.add(1, date(2023, 11, 1), -3.5, -110.0, 1);

  auto target = evaluation::TargetDefinitionFactory::statTarget("away_win");
  TriggerEvaluator evaluator(TriggerDefinition(), target);
  auto scored = evaluator.evaluate(row, 0.6);
  REQUIRE(scored.triggered);
  REQUIRE(scored.side == "away");
  REQUIRE_FALSE(scored.impliedProb);
  REQUIRE(*scored.edge == Approx(0.1));

  REQUIRE_FALSE(TriggerEvaluator::ineligibility(target));
  REQUIRE(TriggerEvaluator::ineligibility(evaluation::TargetDefinitionFactory::defaultStatTarget()) ==
	  std::string("stat_target_numeric"));
}

TEST_CASE("Trigger and exposure validation", "[TriggerEvaluator]")
{
  TriggerDefinition trigger;
  REQUIRE_NOTHROW(validateTrigger(trigger));
  trigger.probThreshold = 1.2;
  REQUIRE_THROWS_AS(validateTrigger(trigger), ConfigurationException);
  trigger.probThreshold = 0.6;
  trigger.confidenceBand = 0.7;
  REQUIRE_THROWS_AS(validateTrigger(trigger), ConfigurationException);
  trigger.confidenceBand.reset();
  trigger.minEdgeVsImplied = -1.5;
  REQUIRE_THROWS_AS(validateTrigger(trigger), ConfigurationException);

  ExposureControls exposure;
  REQUIRE(*exposure.maxBetsPerDay == 5);
  REQUIRE_NOTHROW(validateExposure(exposure));
  exposure.maxBetsPerSidePerDay = -1;
  REQUIRE_THROWS_AS(validateExposure(exposure), ConfigurationException);
  exposure.maxBetsPerSidePerDay = 2;
  exposure.spreadAbsMin = 8.0;
  exposure.spreadAbsMax = 4.0;
  REQUIRE_THROWS_AS(validateExposure(exposure), ConfigurationException);
}
