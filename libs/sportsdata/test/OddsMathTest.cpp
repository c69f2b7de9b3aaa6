#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "OddsMath.h"

using namespace theory_validator::sportsdata;

TEST_CASE("OddsMath::impliedProbability", "[OddsMath]")
{
  REQUIRE(*OddsMath::impliedProbability(-110.0) == Catch::Approx(110.0 / 210.0));
  REQUIRE(*OddsMath::impliedProbability(150.0) == Catch::Approx(0.4));
  REQUIRE(*OddsMath::impliedProbability(-200.0) == Catch::Approx(2.0 / 3.0));
  REQUIRE_FALSE(OddsMath::impliedProbability(0.0).has_value());
}

TEST_CASE("OddsMath::unitPnl", "[OddsMath]")
{
  SECTION("Favorite win pays less than stake")
  {
    REQUIRE(*OddsMath::unitPnl(-110.0, true) == Catch::Approx(100.0 / 110.0));
  }

  SECTION("Underdog win pays price over 100")
  {
    REQUIRE(*OddsMath::unitPnl(150.0, true) == Catch::Approx(1.5));
  }

  SECTION("A loss always costs one unit")
  {
    REQUIRE(*OddsMath::unitPnl(-110.0, false) == Catch::Approx(-1.0));
    REQUIRE(*OddsMath::unitPnl(250.0, false) == Catch::Approx(-1.0));
  }
}
