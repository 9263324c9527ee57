/**
 * @file TestStatistics.cpp
 * @brief Unit tests for math::Statistics.
 */

#include <catch2/catch.hpp>

#include "tks/math/Statistics.hpp"

#include <vector>

namespace tks::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Statistics::mean averages samples", "[math][statistics]")
{
    const std::vector<double> samples = {1.0, 2.0, 3.0, 6.0};
    REQUIRE_THAT(Statistics::mean(samples), WithinAbs(3.0, 1e-12));
    REQUIRE(Statistics::mean({}) == 0.0);
}

TEST_CASE("Statistics::linearSlope fits a least-squares line", "[math][statistics]")
{
    SECTION("exact line")
    {
        const std::vector<double> xs = {0.0, 0.5, 1.0, 1.5};
        const std::vector<double> ys = {10.0, 40.0, 70.0, 100.0};
        REQUIRE_THAT(Statistics::linearSlope(xs, ys), WithinAbs(60.0, 1e-9));
    }

    SECTION("noisy samples")
    {
        const std::vector<double> xs = {0.0, 1.0, 2.0, 3.0};
        const std::vector<double> ys = {0.0, 2.0, 2.0, 4.0};
        REQUIRE_THAT(Statistics::linearSlope(xs, ys), WithinAbs(1.2, 1e-9));
    }

    SECTION("degenerate input returns zero")
    {
        const std::vector<double> one = {1.0};
        const std::vector<double> flat = {2.0, 2.0, 2.0};
        const std::vector<double> ys = {1.0, 5.0, 9.0};
        REQUIRE(Statistics::linearSlope(one, one) == 0.0);
        REQUIRE(Statistics::linearSlope(flat, ys) == 0.0);
    }
}

TEST_CASE("Statistics::smooth blends toward the sample", "[math][statistics]")
{
    REQUIRE_THAT(Statistics::smooth(10.0, 20.0, 0.125), WithinAbs(11.25, 1e-12));
    REQUIRE_THAT(Statistics::smooth(10.0, 20.0, 0.0), WithinAbs(10.0, 1e-12));
    REQUIRE_THAT(Statistics::smooth(10.0, 20.0, 1.0), WithinAbs(20.0, 1e-12));
}

} // namespace tks::math
