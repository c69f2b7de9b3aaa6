// UnitDrawdownsTest.cpp
// Unit tests for the additive unit-stake drawdown helpers

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include "UnitDrawdowns.h"

using namespace theory_validator::statistics;

TEST_CASE("UnitDrawdowns::maxDrawdown", "[UnitDrawdowns]") {
    SECTION("Empty input returns 0") {
        REQUIRE(UnitDrawdowns::maxDrawdown({}) == Catch::Approx(0.0));
    }

    SECTION("Only wins -> no drawdown") {
        REQUIRE(UnitDrawdowns::maxDrawdown({0.91, 0.91, 1.5}) == Catch::Approx(0.0));
    }

    SECTION("Losses from the start count against a zero peak") {
        REQUIRE(UnitDrawdowns::maxDrawdown({-1.0, -1.0, 0.5}) == Catch::Approx(2.0));
    }

    SECTION("Peak to trough after a run-up") {
        // path: 1, 2, 1, 0, 0.5, 3
        REQUIRE(UnitDrawdowns::maxDrawdown({1.0, 1.0, -1.0, -1.0, 0.5, 2.5}) == Catch::Approx(2.0));
    }
}

TEST_CASE("UnitDrawdowns::runningPath", "[UnitDrawdowns]") {
    std::vector<double> cum, dd;
    UnitDrawdowns::runningPath({1.0, -1.0, -1.0, 2.0}, cum, dd);

    REQUIRE(cum == std::vector<double>{1.0, 0.0, -1.0, 1.0});
    REQUIRE(dd == std::vector<double>{0.0, 1.0, 2.0, 0.0});
}
