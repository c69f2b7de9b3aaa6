#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "BetTape.h"
#include "SimulationFixtures.h"

using namespace theory_validator;
using namespace theory_validator::simulation;
using boost::gregorian::date;
using Catch::Approx;

TEST_CASE("Bet tape settles at the quoted price and tracks drawdown", "[BetTape]")
{
  testing::BetFixture fx;
  std::vector<ScoredRow> selected;
  selected.push_back(testing::triggeredRow(fx.add(1, date(2023, 11, 1), -3.0, -110.0, 1), 0.6));
  selected.push_back(testing::triggeredRow(fx.add(2, date(2023, 11, 2), -3.0, 150.0, 0), 0.6));
  selected.push_back(testing::triggeredRow(fx.add(3, date(2023, 11, 3), -3.0, 150.0, 0), 0.6));
  selected.push_back(testing::triggeredRow(fx.add(4, date(2023, 11, 4), -3.0, 150.0, 1), 0.6));
  fx.games[0].homeBox.stats["pace"] = "98";
  fx.games[0].awayBox.stats["pace"] = "102";

  auto history = std::make_shared<std::vector<sportsdata::GameRecord>>(fx.games.begin(), fx.games.end());
  features::FeatureComputer computer(history, std::nullopt);
  auto target = evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  auto tape = BetTapeBuilder(target, computer).build(selected);

  REQUIRE(tape.size() == 4);
  REQUIRE(tape[0].sequence == 1);
  REQUIRE(tape[0].matchup == "Away1 @ Home1");
  REQUIRE(tape[0].pnl == Approx(100.0 / 110.0));
  REQUIRE(tape[1].pnl == Approx(-1.0));
  REQUIRE(tape[3].pnl == Approx(1.5));

  REQUIRE(tape[0].cumulativePnl == Approx(0.909090).epsilon(1e-4));
  REQUIRE(tape[2].cumulativePnl == Approx(100.0 / 110.0 - 2.0));
  REQUIRE(tape[2].drawdown == Approx(2.0));
  REQUIRE(tape[3].drawdown == Approx(0.5));

  REQUIRE(*tape[0].homeLine == Approx(-3.0));
  REQUIRE(*tape[0].paceGame == Approx(100.0));
  REQUIRE_FALSE(tape[1].paceGame);

  auto pnl = tapePnl(tape);
  REQUIRE(pnl.size() == 4);
  REQUIRE(pnl[3] == Approx(1.5));
}

TEST_CASE("Stat bets settle at even money and unresolved rows are skipped", "[BetTape]")
{
  testing::BetFixture fx;
  std::vector<ScoredRow> selected;
  selected.push_back(testing::triggeredRow(fx.add(1, date(2023, 11, 1), -3.0, -110.0, 1), 0.6));
  auto& unresolved = fx.add(2, date(2023, 11, 2), -3.0, -110.0, 0);
  unresolved.target.reset();
  selected.push_back(testing::triggeredRow(unresolved, 0.6));
  selected.push_back(testing::triggeredRow(fx.add(3, date(2023, 11, 3), -3.0, -110.0, 0), 0.6));

  auto history = std::make_shared<std::vector<sportsdata::GameRecord>>(fx.games.begin(), fx.games.end());
  features::FeatureComputer computer(history, std::nullopt);
  auto target = evaluation::TargetDefinitionFactory::statTarget("home_win");
  auto tape = BetTapeBuilder(target, computer).build(selected);

  REQUIRE(tape.size() == 2);
  REQUIRE(tape[0].pnl == 1.0);
  REQUIRE(tape[1].pnl == -1.0);
  REQUIRE(tape[1].sequence == 2);
  REQUIRE(tape[1].cumulativePnl == Approx(0.0));
  REQUIRE(tape[1].drawdown == Approx(1.0));
}
