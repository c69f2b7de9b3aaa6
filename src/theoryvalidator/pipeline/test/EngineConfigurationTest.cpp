#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include "EngineConfiguration.h"
#include "TheoryValidatorException.h"

using namespace theory_validator;
using namespace theory_validator::pipeline;
using Catch::Approx;

TEST_CASE("EngineConfiguration defaults", "[EngineConfiguration]")
{
  EngineConfiguration config;
  REQUIRE(config.leagues.count("NBA") == 1);
  REQUIRE(config.leagues.count("NCAAB") == 1);
  REQUIRE(config.gamesLimitMax == 5000);
  REQUIRE(config.monteCarlo.resamples == 2000);
  REQUIRE(config.monteCarlo.seed == 20240601);
  REQUIRE(config.model.pruning.collinearityThreshold == Approx(0.98));
  REQUIRE(config.storeRetry.maxAttempts == 3);
  REQUIRE(config.model.candidates.minSampleSize == 150);
  REQUIRE(config.model.candidates.minLift == Approx(0.02));
  REQUIRE_NOTHROW(EngineConfigurationReader::validate(config));
}

TEST_CASE("EngineConfiguration reads every section", "[EngineConfiguration]")
{
  std::istringstream in(
    "[engine]\n"
    "leagues = nba, nfl\n"
    "threads = 2\n"
    "timeout_seconds = 30\n"
    "[cohort]\n"
    "games_limit_max = 800\n"
    "[verdict]\n"
    "strong_lift = 0.2\n"
    "moderate_lift = 0.1\n"
    "[model]\n"
    "epochs = 50\n"
    "l2_lambda = 0.5\n"
    "min_training_rows = 40\n"
    "candidate_min_sample = 60\n"
    "candidate_min_lift = 0.05\n"
    "[montecarlo]\n"
    "resamples = 500\n"
    "seed = 99\n"
    "[walkforward]\n"
    "min_train_rows = 60\n"
    "[store]\n"
    "retry_attempts = 5\n"
    "retry_base_delay_ms = 10\n"
    "retry_max_delay_ms = 80\n");

  const auto config = EngineConfigurationReader::read(in);
  REQUIRE(config.leagues == std::set<std::string>{"NBA", "NFL"});
  REQUIRE(config.threads == 2);
  REQUIRE(config.timeoutSeconds == 30);
  REQUIRE(config.gamesLimitMax == 800);
  REQUIRE(config.verdict.strongLift == Approx(0.2));
  REQUIRE(config.verdict.moderateLift == Approx(0.1));
  REQUIRE(config.model.fit.epochs == 50);
  REQUIRE(config.model.fit.l2Lambda == Approx(0.5));
  REQUIRE(config.model.minTrainingRows == 40);
  REQUIRE(config.model.candidates.minSampleSize == 60);
  REQUIRE(config.model.candidates.minLift == Approx(0.05));
  REQUIRE(config.monteCarlo.resamples == 500);
  REQUIRE(config.monteCarlo.seed == 99);
  REQUIRE(config.walkForward.minTrainRows == 60);
  REQUIRE(config.walkForward.minTestRows == 5);
  REQUIRE(config.storeRetry.maxAttempts == 5);
  REQUIRE(config.storeRetry.baseDelay.count() == 10);
  REQUIRE(config.storeRetry.maxDelay.count() == 80);
}

TEST_CASE("EngineConfiguration rejects bad files", "[EngineConfiguration]")
{
  auto readText = [](const std::string& text) {
    std::istringstream in(text);
    return EngineConfigurationReader::read(in);
  };

  SECTION("unknown key")
    {
      try
	{
	  readText("[model]\nlearnin_rate = 0.1\n");
	  FAIL("expected ConfigurationException");
	}
      catch (const ConfigurationException& e)
	{
	  REQUIRE(e.field() == "config");
	  REQUIRE(e.reasonCode() == "invalid_config");
	}
    }

  SECTION("malformed value")
    {
      REQUIRE_THROWS_AS(readText("[montecarlo]\nresamples = many\n"), ConfigurationException);
    }

  SECTION("inconsistent thresholds")
    {
      REQUIRE_THROWS_AS(readText("[verdict]\nstrong_lift = 0.01\nmoderate_lift = 0.05\n"), ConfigurationException);
    }

  SECTION("negative candidate lift")
    {
      REQUIRE_THROWS_AS(readText("[model]\ncandidate_min_lift = -0.01\n"), ConfigurationException);
    }

  SECTION("empty league list")
    {
      REQUIRE_THROWS_AS(readText("[engine]\nleagues = ,\n"), ConfigurationException);
    }

  SECTION("missing file")
    {
      try
	{
	  EngineConfigurationReader::readFile("/nonexistent/theoryvalidator.ini");
	  FAIL("expected ConfigurationException");
	}
      catch (const ConfigurationException& e)
	{
	  REQUIRE(e.reasonCode() == "file_not_found");
	}
    }
}
