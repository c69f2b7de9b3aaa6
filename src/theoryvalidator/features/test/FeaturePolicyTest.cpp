#include <catch2/catch_test_macros.hpp>
#include "FeaturePolicy.h"

using namespace theory_validator::features;

namespace
{
  std::vector<std::string> reasons(const FeatureSelection& s)
  {
    std::vector<std::string> out;
    for (const auto& d : s.dropped)
      out.push_back(d.feature + ":" + d.reason);
    return out;
  }
}

TEST_CASE("Deployable context drops post_game features", "[FeaturePolicy]")
{
  FeaturePolicy policy(RunContext::Deployable, {"final_total_points"}, {"fg_pct"}, false);
  auto selection = policy.select({"rolling_fg_pct_5_home", "home_fg_pct", "final_total_points",
				  "rolling_fg_pct_5_home", "mystery", "player_minutes"});

  REQUIRE(selection.requested.size() == 5);
  REQUIRE(selection.used.size() == 1);
  REQUIRE(selection.used[0].name == "rolling_fg_pct_5_home");
  REQUIRE(reasons(selection) == std::vector<std::string>{
      "home_fg_pct:post_game_leakage",
      "final_total_points:target_alias",
      "mystery:unknown_feature",
      "player_minutes:requires_player_filter"});
  REQUIRE(selection.report.droppedPostGameFeatures == std::vector<std::string>{"home_fg_pct"});
  REQUIRE_FALSE(selection.report.containsPostGameFeatures);
}

TEST_CASE("Diagnostic context keeps post_game features but not target aliases", "[FeaturePolicy]")
{
  FeaturePolicy policy(RunContext::Diagnostic, {"total_delta"}, {"fg_pct"}, true);
  auto selection = policy.select({"home_fg_pct", "total_delta", "player_minutes", "home_steals"});

  REQUIRE(selection.used.size() == 2);
  REQUIRE(selection.report.containsPostGameFeatures);
  REQUIRE(reasons(selection) == std::vector<std::string>{"total_delta:target_alias", "home_steals:unknown_feature"});
}
