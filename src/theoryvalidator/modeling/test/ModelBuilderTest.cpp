#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <algorithm>
#include <random>
#include <sstream>
#include "ModelBuilder.h"

using namespace theory_validator;
using namespace theory_validator::modeling;
using sportsdata::StatValue;

namespace
{
  features::GeneratedFeature column(const std::string& name, const std::string& group)
  {
    features::GeneratedFeature f;
    f.name = name;
    f.group = group;
    return f;
  }

  // signal drives a binary outcome, noise is independent of it.
  cohort::CohortDataset binaryDataset(std::size_t n, uint64_t seed = 3)
  {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> z(0.0, 1.0);
    std::uniform_real_distribution<double> u(0.0, 1.0);

    cohort::CohortDataset ds;
    ds.columns = {column("signal", "efficiency"), column("noise", "pace")};
    for (std::size_t i = 0; i < n; ++i)
      {
	const double s = z(rng);
	cohort::CohortRow row;
	row.features = {StatValue::numeric(s), StatValue::numeric(z(rng))};
	row.target = u(rng) < 1.0 / (1.0 + std::exp(-2.0 * s)) ? 1.0 : 0.0;
	ds.rows.push_back(row);
      }
    return ds;
  }
}

TEST_CASE("ModelBuilder fits a logistic model for binary targets", "[ModelBuilder]")
{
  auto ds = binaryDataset(400);
  auto target = evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  std::ostringstream log;

  auto result = ModelBuilder(ModelPolicy()).build(ds, target, log);
  REQUIRE(result.status.isComplete());
  REQUIRE(result.model);
  REQUIRE(result.model->model().isLogistic());

  const auto& metrics = result.status.metrics();
  REQUIRE(metrics.modelType == "logistic_l2");
  REQUIRE(metrics.trainingRows == 400);
  REQUIRE(metrics.weights.front().feature == "signal");
  REQUIRE(metrics.weights.front().weight > 0.0);
  REQUIRE(metrics.drivers.front().group == "efficiency");
  REQUIRE(*metrics.accuracy > 0.6);
  REQUIRE(metrics.roiProxy);
  REQUIRE(*metrics.roiProxy > 0.0);

  const double p = result.model->score(ds.rows[0]);
  REQUIRE(p > 0.0);
  REQUIRE(p < 1.0);
  REQUIRE(log.str().find("[Model]") != std::string::npos);
}

TEST_CASE("ModelBuilder fits ridge for numeric targets", "[ModelBuilder]")
{
  auto ds = binaryDataset(200);
  for (auto& row : ds.rows)
    row.target = 200.0 + 10.0 * row.features[0].value();

  auto target = evaluation::TargetDefinitionFactory::defaultStatTarget();
  std::ostringstream log;
  auto result = ModelBuilder(ModelPolicy()).build(ds, target, log);

  REQUIRE(result.status.isComplete());
  const auto& metrics = result.status.metrics();
  REQUIRE(metrics.modelType == "ridge");
  REQUIRE_FALSE(metrics.roiProxy);
  REQUIRE(*metrics.accuracy > 0.95);
  REQUIRE(metrics.intercept == Catch::Approx(200.0).margin(2.0));
}

TEST_CASE("ModelBuilder reports insufficient training rows", "[ModelBuilder]")
{
  auto ds = binaryDataset(30);
  for (std::size_t i = 5; i < ds.rows.size(); ++i)
    ds.rows[i].target.reset();

  auto target = evaluation::TargetDefinitionFactory::statTarget("home_win");
  std::ostringstream log;
  auto result = ModelBuilder(ModelPolicy()).build(ds, target, log);
  REQUIRE(result.status.state() == ModelingState::Unavailable);
  REQUIRE(result.status.reason() == "insufficient_sample");
  REQUIRE_FALSE(result.model);
  REQUIRE_THROWS_AS(result.status.metrics(), std::logic_error);
}

TEST_CASE("ModelBuilder reports when every feature is pruned", "[ModelBuilder]")
{
  auto ds = binaryDataset(50);
  for (auto& row : ds.rows)
    row.features = {StatValue::numeric(1.0), StatValue::null()};

  auto target = evaluation::TargetDefinitionFactory::statTarget("home_win");
  std::ostringstream log;
  auto result = ModelBuilder(ModelPolicy()).build(ds, target, log);
  REQUIRE(result.status.reason() == "no_features_after_pruning");
  REQUIRE(result.dropped.size() == 2);
}

TEST_CASE("ModelBuilder converts a singular fit into dropped features", "[ModelBuilder]")
{
  cohort::CohortDataset ds;
  ds.columns = {column("a", "general"), column("b", "general")};
  for (int i = 0; i < 40; ++i)
    {
      cohort::CohortRow row;
      row.features = {StatValue::numeric(i), StatValue::numeric(2.0 * i)};
      row.target = static_cast<double>(i % 5);
      ds.rows.push_back(row);
    }

  ModelPolicy policy;
  policy.fit.l2Lambda = 0.0;
  policy.pruning.collinearityThreshold = 1.5;

  auto target = evaluation::TargetDefinitionFactory::defaultStatTarget();
  std::ostringstream log;
  auto result = ModelBuilder(policy).build(ds, target, log);

  REQUIRE(result.status.state() == ModelingState::Unavailable);
  REQUIRE(result.status.reason() == "model_fit_failed");
  REQUIRE(result.dropped.size() == 2);
  REQUIRE(std::all_of(result.dropped.begin(), result.dropped.end(),
		      [](const features::DroppedFeature& d) { return d.reason == "model_fit_failed"; }));
  REQUIRE(log.str().find("✗") != std::string::npos);
}

TEST_CASE("ModelBuilder refits without near-zero-weight features", "[ModelBuilder]")
{
  auto ds = binaryDataset(400);
  auto target = evaluation::TargetDefinitionFactory::marketTarget("spread", "home", evaluation::OddsAssumption());
  std::ostringstream log;

  ModelPolicy policy;
  policy.zeroWeightEpsilon = 0.5;
  auto result = ModelBuilder(policy).build(ds, target, log);

  REQUIRE(result.status.isComplete());
  REQUIRE(result.model);
  REQUIRE(result.model->model().weights().size() == 1);
  REQUIRE(result.model->scaler().columns().size() == 1);
  REQUIRE(result.status.metrics().weights.size() == 1);
  REQUIRE(result.status.metrics().weights.front().feature == "signal");

  REQUIRE(result.dropped.size() == 1);
  REQUIRE(result.dropped.front().feature == "noise");
  REQUIRE(result.dropped.front().reason == "near_zero_weight");
  REQUIRE(*result.dropped.front().threshold == Catch::Approx(0.5));

  // The dropped feature no longer moves the score.
  auto shifted = ds.rows[0];
  shifted.features[1] = StatValue::numeric(shifted.features[1].value() + 25.0);
  REQUIRE(result.model->score(shifted) == Catch::Approx(result.model->score(ds.rows[0])));

  SECTION("no feature carries weight")
  {
    policy.zeroWeightEpsilon = 1e6;
    auto none = ModelBuilder(policy).build(ds, target, log);
    REQUIRE(none.status.reason() == "no_features_after_pruning");
    REQUIRE_FALSE(none.model);
    REQUIRE(none.dropped.size() == 2);
  }
}

TEST_CASE("ModelingStatus variants", "[ModelBuilder]")
{
  auto notRun = ModelingStatus::NotRun("stat_target_numeric", "triggers need a binary target");
  REQUIRE(notRun.state() == ModelingState::NotRun);
  REQUIRE(notRun.detail() == "triggers need a binary target");
  REQUIRE(std::string(modelingStateToString(notRun.state())) == "not_run");
}
