/**
 * @file TestInterpolation.cpp
 * @brief Unit tests for the per-type interpolation traits.
 */

#include <catch2/catch.hpp>

#include "tks/math/Interpolation.hpp"

#include <cmath>

namespace tks::math {

using Catch::Matchers::WithinAbs;

TEST_CASE("Scalars blend and extrapolate linearly", "[math][interpolation]")
{
    REQUIRE_THAT(Interpolation<float>::lerp(2.0f, 4.0f, 0.25), WithinAbs(2.5f, 1e-6f));
    REQUIRE_THAT(Interpolation<float>::lerp(2.0f, 4.0f, 2.0), WithinAbs(6.0f, 1e-6f));

    REQUIRE(Interpolation<core::i32>::lerp(0, 10, 0.26) == 3);
    REQUIRE(Interpolation<core::i32>::lerp(0, 10, -0.5) == -5);
}

TEST_CASE("Booleans hold the left sample", "[math][interpolation]")
{
    REQUIRE_FALSE(Interpolation<bool>::lerp(false, true, 0.99));
    REQUIRE(Interpolation<bool>::lerp(false, true, 1.0));
    REQUIRE_FALSE(Interpolation<bool>::kCorrectable);
}

TEST_CASE("Vector errors cancel through correct()", "[math][interpolation]")
{
    using Traits = Interpolation<Vec3f>;
    const Vec3f predicted{5.0f, 1.0f, 0.0f};
    const Vec3f authoritative{4.5f, 1.0f, 2.0f};

    const Vec3f err = Traits::error(predicted, authoritative);
    REQUIRE(Traits::correct(predicted, err) == authoritative);

    const Vec3f mid = Traits::lerp(predicted, authoritative, 0.5);
    REQUIRE_THAT(mid.x, WithinAbs(4.75f, 1e-6f));
    REQUIRE_THAT(mid.z, WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("Rotation errors cancel through correct()", "[math][interpolation]")
{
    using Traits = Interpolation<Quatf>;
    const Vec3f up{0.0f, 0.0f, 1.0f};
    const Quatf predicted = Quatf::fromAxisAngle(up, 0.8f);
    const Quatf authoritative = Quatf::fromAxisAngle(up, 0.5f);

    const Quatf corrected = Traits::correct(predicted, Traits::error(predicted, authoritative));
    REQUIRE_THAT(std::abs(corrected.dot(authoritative)), WithinAbs(1.0f, 1e-5f));

    const Quatf half = Traits::lerp(authoritative, predicted, 0.5);
    REQUIRE_THAT(std::abs(half.dot(Quatf::fromAxisAngle(up, 0.65f))), WithinAbs(1.0f, 1e-4f));
}

} // namespace tks::math
