#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "TargetDefinition.h"
#include "TheoryValidatorException.h"

using namespace theory_validator;
using namespace theory_validator::evaluation;
using Catch::Approx;
using sportsdata::GameRecord;
using sportsdata::OddsQuote;

namespace
{
  GameRecord settledGame(int home, int away)
  {
    GameRecord g;
    g.gameId = 1;
    g.league = "NBA";
    g.season = 2023;
    g.gameDate = boost::gregorian::date(2023, 11, 1);
    g.homeScore = home;
    g.awayScore = away;
    g.odds.push_back(OddsQuote{"spread", "home", -4.5, -105.0, true});
    g.odds.push_back(OddsQuote{"spread", "away", 4.5, -115.0, true});
    g.odds.push_back(OddsQuote{"total", "over", 210.0, -110.0, true});
    g.odds.push_back(OddsQuote{"total", "under", 210.0, -110.0, true});
    g.odds.push_back(OddsQuote{"moneyline", "home", std::nullopt, -200.0, true});
    g.odds.push_back(OddsQuote{"moneyline", "away", std::nullopt, 170.0, true});
    return g;
  }
}

TEST_CASE("TargetDefinitionFactory stat targets", "[TargetDefinition]")
{
  auto def = TargetDefinitionFactory::defaultStatTarget();
  REQUIRE(def.targetName == "combined_score");
  REQUIRE(def.targetClass == TargetClass::Stat);
  REQUIRE(def.metricType == MetricType::Numeric);
  REQUIRE_FALSE(def.oddsRequired);

  REQUIRE(TargetDefinitionFactory::statTarget("Home_Win").metricType == MetricType::Binary);
  REQUIRE(TargetDefinitionFactory::statTarget("margin_of_victory").metricType == MetricType::Numeric);

  try
    {
      TargetDefinitionFactory::statTarget("assists_per_minute");
      FAIL("expected ConfigurationException");
    }
  catch (const ConfigurationException& e)
    {
      REQUIRE(e.field() == "target_name");
      REQUIRE(e.reasonCode() == "unknown_target");
    }
}

TEST_CASE("TargetDefinitionFactory market targets validate side against market", "[TargetDefinition]")
{
  OddsAssumption closing;
  auto spread = TargetDefinitionFactory::marketTarget("spread", "home", closing);
  REQUIRE(spread.targetName == "spread_home");
  REQUIRE(spread.isMarket());
  REQUIRE(spread.isBinary());
  REQUIRE(spread.oddsRequired);

  REQUIRE(TargetDefinitionFactory::marketTarget("total", "UNDER", closing).targetName == "total_under");

  REQUIRE_THROWS_AS(TargetDefinitionFactory::marketTarget("total", "home", closing), ConfigurationException);
  REQUIRE_THROWS_AS(TargetDefinitionFactory::marketTarget("spread", "over", closing), ConfigurationException);
  REQUIRE_THROWS_AS(TargetDefinitionFactory::marketTarget("parlay", "home", closing), ConfigurationException);

  OddsAssumption badFlat{OddsAssumptionKind::FlatReference, -50.0};
  REQUIRE_THROWS_AS(TargetDefinitionFactory::marketTarget("spread", "home", badFlat), ConfigurationException);
}

TEST_CASE("Target aliases name the features that restate the target", "[TargetDefinition]")
{
  auto combined = TargetDefinitionFactory::defaultStatTarget().aliasFeatures();
  REQUIRE(combined.count("final_total_points") == 1);
  REQUIRE(combined.count("total_delta") == 1);

  auto spread = TargetDefinitionFactory::marketTarget("spread", "away", OddsAssumption()).aliasFeatures();
  REQUIRE(spread == std::set<std::string>{"cover_margin"});
}

TEST_CASE("TargetResolver resolves stat and market outcomes", "[TargetDefinition]")
{
  const auto game = settledGame(110, 104);

  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::statTarget("combined_score"), game) == 214.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::statTarget("margin_of_victory"), game) == 6.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::statTarget("home_win"), game) == 1.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::statTarget("away_win"), game) == 0.0);

  OddsAssumption closing;
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::marketTarget("spread", "home", closing), game) == 1.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::marketTarget("spread", "away", closing), game) == 0.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::marketTarget("total", "over", closing), game) == 1.0);
  REQUIRE(*TargetResolver::targetValue(TargetDefinitionFactory::marketTarget("moneyline", "away", closing), game) == 0.0);
}

TEST_CASE("TargetResolver leaves pushes and unsettled games unresolved", "[TargetDefinition]")
{
  OddsAssumption closing;
  auto total = TargetDefinitionFactory::marketTarget("total", "over", closing);
  REQUIRE_FALSE(TargetResolver::targetValue(total, settledGame(105, 105)));

  auto unsettled = settledGame(0, 0);
  unsettled.homeScore.reset();
  unsettled.awayScore.reset();
  REQUIRE_FALSE(TargetResolver::targetValue(TargetDefinitionFactory::defaultStatTarget(), unsettled));
  REQUIRE_FALSE(TargetResolver::targetValue(total, unsettled));
}

TEST_CASE("TargetResolver market quotes follow the odds assumption", "[TargetDefinition]")
{
  const auto game = settledGame(110, 104);

  auto closing = TargetResolver::marketQuote(
    TargetDefinitionFactory::marketTarget("spread", "away", OddsAssumption()), game);
  REQUIRE(closing.hasOdds);
  REQUIRE(*closing.line == 4.5);
  REQUIRE(*closing.price == -115.0);
  REQUIRE(*closing.impliedProbability == Approx(115.0 / 215.0));

  OddsAssumption flat{OddsAssumptionKind::FlatReference, -110.0};
  auto flatQuote = TargetResolver::marketQuote(TargetDefinitionFactory::marketTarget("spread", "away", flat), game);
  REQUIRE(*flatQuote.price == -110.0);
  REQUIRE(*TargetResolver::unitPnl(flatQuote, true) == Approx(100.0 / 110.0));
  REQUIRE(*TargetResolver::unitPnl(flatQuote, false) == -1.0);

  auto ml = TargetResolver::marketQuote(TargetDefinitionFactory::marketTarget("moneyline", "away", OddsAssumption()), game);
  REQUIRE(ml.hasOdds);
  REQUIRE_FALSE(ml.line);
  REQUIRE(*TargetResolver::unitPnl(ml, true) == Approx(1.7));

  GameRecord bare = game;
  bare.odds.clear();
  auto none = TargetResolver::marketQuote(TargetDefinitionFactory::marketTarget("spread", "home", flat), bare);
  REQUIRE_FALSE(none.hasOdds);
  REQUIRE_FALSE(none.price);
}
