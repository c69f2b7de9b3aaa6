#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <numeric>
#include <sstream>
#include "MonteCarloEngine.h"
#include "ParallelExecutors.h"

using namespace theory_validator;
using namespace theory_validator::montecarlo;
using Catch::Approx;

namespace
{
  std::vector<double> realizedPnl(std::size_t wins, std::size_t losses)
  {
    std::vector<double> pnl(wins, 100.0 / 110.0);
    pnl.insert(pnl.end(), losses, -1.0);
    return pnl;
  }
}

TEST_CASE("Monte Carlo is unavailable for short tapes", "[MonteCarloEngine]")
{
  concurrency::SingleThreadExecutor executor;
  concurrency::CancellationToken token;
  std::ostringstream log;
  MonteCarloEngine engine(MonteCarloPolicy(), executor, token);

  auto empty = engine.run({}, MonteCarloAssumptions(), false, log);
  REQUIRE_FALSE(empty.available());
  REQUIRE(empty.reason() == "no_bet_tape");

  auto shortTape = engine.run(realizedPnl(5, 4), MonteCarloAssumptions(), false, log);
  REQUIRE_FALSE(shortTape.available());
  REQUIRE(shortTape.reason() == "insufficient_bets");
  REQUIRE_THROWS_AS(shortTape.metrics(), std::logic_error);
}

TEST_CASE("Bootstrap median converges to the realized mean path", "[MonteCarloEngine]")
{
  concurrency::SingleThreadExecutor executor;
  concurrency::CancellationToken token;
  std::ostringstream log;
  MonteCarloPolicy policy;
  policy.resamples = 5000;
  MonteCarloEngine engine(policy, executor, token);

  const auto pnl = realizedPnl(20, 10);
  const double expected = std::accumulate(pnl.begin(), pnl.end(), 0.0);
  auto status = engine.run(pnl, MonteCarloAssumptions(), false, log);
  REQUIRE(status.available());

  const auto& m = status.metrics();
  REQUIRE(m.runs == 5000);
  REQUIRE(m.betCount == 30);
  REQUIRE(m.meanPnl == Approx(expected).margin(0.3));
  REQUIRE(m.p50Pnl == Approx(expected).margin(1.0));
  REQUIRE(m.p5Pnl < m.p50Pnl);
  REQUIRE(m.p50Pnl < m.p95Pnl);
  REQUIRE(m.p5MaxDrawdown <= m.p95MaxDrawdown);
  REQUIRE(m.actualPnl == Approx(expected));
  REQUIRE(m.actualMaxDrawdown == Approx(10.0));
  REQUIRE(m.luckScore == Approx((m.actualPnl - m.meanPnl) / m.stdPnl));
  REQUIRE(m.actualPercentile > 0.3);
  REQUIRE(m.actualPercentile < 0.8);
  REQUIRE(m.probNegative < 0.2);
}

TEST_CASE("Results do not depend on the thread count", "[MonteCarloEngine]")
{
  concurrency::CancellationToken token;
  std::ostringstream log;
  MonteCarloPolicy policy;
  policy.resamples = 700;
  const auto pnl = realizedPnl(14, 12);

  concurrency::SingleThreadExecutor single;
  concurrency::ThreadPoolExecutor pool(4);
  auto a = MonteCarloEngine(policy, single, token).run(pnl, MonteCarloAssumptions(), false, log);
  auto b = MonteCarloEngine(policy, pool, token).run(pnl, MonteCarloAssumptions(), false, log);

  REQUIRE(a.metrics().meanPnl == b.metrics().meanPnl);
  REQUIRE(a.metrics().p5Pnl == b.metrics().p5Pnl);
  REQUIRE(a.metrics().p95MaxDrawdown == b.metrics().p95MaxDrawdown);
  REQUIRE(a.metrics().luckScore == b.metrics().luckScore);

  policy.seed = 99;
  auto c = MonteCarloEngine(policy, single, token).run(pnl, MonteCarloAssumptions(), false, log);
  REQUIRE(c.metrics().meanPnl != a.metrics().meanPnl);
}

TEST_CASE("Cancelled runs throw", "[MonteCarloEngine]")
{
  concurrency::SingleThreadExecutor executor;
  concurrency::CancellationToken token;
  token.cancel();
  std::ostringstream log;
  MonteCarloEngine engine(MonteCarloPolicy(), executor, token);
  REQUIRE_THROWS_AS(engine.run(realizedPnl(20, 20), MonteCarloAssumptions(), false, log),
		    OperationCancelledException);
}

TEST_CASE("Interpretation lines flag exposure warnings and large luck", "[MonteCarloEngine]")
{
  MonteCarloMetrics m;
  m.p5Pnl = -4.0;
  m.p95Pnl = 6.0;
  m.meanPnl = 1.0;
  m.stdPnl = 1.0;
  m.actualPnl = 4.5;
  m.luckScore = 3.5;
  m.actualPercentile = 0.99;

  auto lines = MonteCarloEngine::interpretationLines(m, true);
  REQUIRE(lines.front().rfind("MC is decision-support", 0) == 0);
  REQUIRE(lines[1] == "Variance range (P5->P95) spans 10.0 units over this bet set; wider spans mean variance dominates.");
  REQUIRE(std::find(lines.begin(), lines.end(),
		    "Luck score is large vs the MC baseline; be cautious attributing results to skill.") != lines.end());
  REQUIRE(lines.back() == "Exposure warnings apply: selection/caps can create over-betting artifacts.");

  m.meanPnl = 0.0;
  m.luckScore = 0.1;
  auto quiet = MonteCarloEngine::interpretationLines(m, false);
  REQUIRE(std::find(quiet.begin(), quiet.end(),
		    "Median/mean are near 0 under the MC baseline; edges may be fragile.") != quiet.end());
  REQUIRE(quiet.back() != "Exposure warnings apply: selection/caps can create over-betting artifacts.");
}
