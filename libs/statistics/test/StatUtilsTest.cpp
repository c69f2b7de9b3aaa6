// StatUtilsTest.cpp
//
// Unit tests for the double-precision helpers in StatUtils.h.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>
#include <cmath>

#include "StatUtils.h"

using namespace theory_validator::statistics;

TEST_CASE("StatUtils::computeMeanAndVariance", "[StatUtils]") {
    SECTION("Empty input") {
        auto mv = StatUtils::computeMeanAndVariance({});
        REQUIRE(mv.first == 0.0);
        REQUIRE(mv.second == 0.0);
    }

    SECTION("Single value has zero variance") {
        auto mv = StatUtils::computeMeanAndVariance({4.0});
        REQUIRE(mv.first == Catch::Approx(4.0));
        REQUIRE(mv.second == 0.0);
    }

    SECTION("Unbiased variance") {
        // mean 5, squared deviations 9+1+1+9 = 20, /3
        auto mv = StatUtils::computeMeanAndVariance({2.0, 4.0, 6.0, 8.0});
        REQUIRE(mv.first == Catch::Approx(5.0));
        REQUIRE(mv.second == Catch::Approx(20.0 / 3.0));
    }
}

TEST_CASE("StatUtils::quantile interpolates linearly", "[StatUtils]") {
    std::vector<double> v = {10.0, 1.0, 4.0, 7.0};   // sorted: 1 4 7 10

    REQUIRE(StatUtils::quantile(v, 0.0) == Catch::Approx(1.0));
    REQUIRE(StatUtils::quantile(v, 1.0) == Catch::Approx(10.0));
    // idx = 0.5 * 3 = 1.5 -> between 4 and 7
    REQUIRE(StatUtils::quantile(v, 0.5) == Catch::Approx(5.5));
    // idx = 0.25 * 3 = 0.75 -> 1 + 0.75 * 3
    REQUIRE(StatUtils::quantile(v, 0.25) == Catch::Approx(3.25));

    SECTION("Out-of-range q is clamped") {
        REQUIRE(StatUtils::quantile(v, -0.5) == Catch::Approx(1.0));
        REQUIRE(StatUtils::quantile(v, 2.0) == Catch::Approx(10.0));
    }

    SECTION("Empty input returns zero") {
        REQUIRE(StatUtils::quantile({}, 0.5) == 0.0);
    }
}

TEST_CASE("StatUtils::describe", "[StatUtils]") {
    std::vector<double> v = {220.0, 210.0, 230.0, 240.0, 200.0};
    DescriptiveSummary s = StatUtils::describe(v);

    REQUIRE(s.count == 5);
    REQUIRE(s.mean == Catch::Approx(220.0));
    REQUIRE(s.min == Catch::Approx(200.0));
    REQUIRE(s.max == Catch::Approx(240.0));
    REQUIRE(s.std == Catch::Approx(std::sqrt(250.0)));
    REQUIRE(s.p25 == Catch::Approx(210.0));
    REQUIRE(s.p75 == Catch::Approx(230.0));
}

TEST_CASE("StatUtils::pearson", "[StatUtils]") {
    SECTION("Perfect positive correlation") {
        auto r = StatUtils::pearson({1, 2, 3, 4, 5}, {2, 4, 6, 8, 10});
        REQUIRE(r.has_value());
        REQUIRE(*r == Catch::Approx(1.0));
    }

    SECTION("Perfect negative correlation") {
        auto r = StatUtils::pearson({1, 2, 3, 4, 5}, {5, 4, 3, 2, 1});
        REQUIRE(r.has_value());
        REQUIRE(*r == Catch::Approx(-1.0));
    }

    SECTION("Constant input has no correlation") {
        REQUIRE_FALSE(StatUtils::pearson({1, 1, 1, 1, 1}, {1, 2, 3, 4, 5}).has_value());
    }

    SECTION("Too few pairs") {
        REQUIRE_FALSE(StatUtils::pearson({1, 2, 3}, {3, 2, 1}, 5).has_value());
    }
}
