/**
 * @file TestHistoryBuffer.cpp
 * @brief Unit tests for container::HistoryBuffer.
 */

#include <catch2/catch.hpp>

#include "tks/container/HistoryBuffer.hpp"

namespace tks::container {

using Catch::Matchers::WithinAbs;

namespace {

HistoryBuffer<float> makeBuffer(core::usize capacity, InterpolationMode intra, InterpolationMode gap)
{
    HistoryBuffer<float> buffer{capacity};
    buffer.setIntraTickMode(intra);
    buffer.setGapFillMode(gap);
    return buffer;
}

} // namespace

TEST_CASE("HistoryBuffer linear scenario with gaps", "[history]")
{
    auto buffer = makeBuffer(6, InterpolationMode::kLinear, InterpolationMode::kLinear);

    buffer.write(11, 111.0f);
    buffer.write(12, 112.0f);
    buffer.write(14, 114.0f);
    buffer.write(18, 118.0f);

    REQUIRE(buffer.lastTick() == 18);
    REQUIRE(buffer.oldestTick() == 13);

    REQUIRE_THAT(buffer.read(13.5), WithinAbs(113.5, 1e-4));
    REQUIRE_THAT(buffer.read(20.3), WithinAbs(120.3, 1e-3));
    REQUIRE_THAT(buffer.read(12.0), WithinAbs(113.0, 1e-4));

    REQUIRE(buffer.isSynthesized(16));
    REQUIRE_FALSE(buffer.isSynthesized(14));
}

TEST_CASE("HistoryBuffer step scenario", "[history]")
{
    auto buffer = makeBuffer(10, InterpolationMode::kNone, InterpolationMode::kNone);

    buffer.write(12, 100.0f);
    buffer.write(15, 200.0f);

    REQUIRE(buffer.read(14.5) == 100.0f);
    REQUIRE(buffer.read(16.0) == 200.0f);
    REQUIRE(buffer.read(1.0) == 100.0f);
}

TEST_CASE("HistoryBuffer integer reads are exact", "[history]")
{
    auto buffer = makeBuffer(16, InterpolationMode::kLinear, InterpolationMode::kLinear);

    for (core::Tick t = 1; t <= 20; ++t)
        buffer.write(t, static_cast<float>(t * t));

    for (core::Tick t = buffer.oldestTick(); t <= buffer.lastTick(); ++t)
        REQUIRE(buffer.read(static_cast<double>(t)) == static_cast<float>(t * t));
}

TEST_CASE("HistoryBuffer first write fills the whole range", "[history]")
{
    auto buffer = makeBuffer(8, InterpolationMode::kLinear, InterpolationMode::kLinear);

    REQUIRE(buffer.empty());
    buffer.write(30, 5.0f);
    REQUIRE_FALSE(buffer.empty());

    for (core::Tick t = 23; t <= 30; ++t)
        REQUIRE(buffer.at(t) == 5.0f);
    REQUIRE(buffer.lastChangedTick() == 30);
}

TEST_CASE("HistoryBuffer extrapolation is capped", "[history]")
{
    auto buffer = makeBuffer(8, InterpolationMode::kLinear, InterpolationMode::kLinear);
    buffer.setMaxExtrapolation(3);

    buffer.write(1, 0.0f);
    buffer.write(2, 10.0f);

    REQUIRE_THAT(buffer.read(4.0), WithinAbs(30.0, 1e-4));
    REQUIRE_THAT(buffer.read(5.0), WithinAbs(40.0, 1e-4));
    REQUIRE_THAT(buffer.read(500.0), WithinAbs(40.0, 1e-4));
}

TEST_CASE("HistoryBuffer ignores writes older than the retained range", "[history]")
{
    auto buffer = makeBuffer(4, InterpolationMode::kLinear, InterpolationMode::kLinear);

    buffer.write(10, 1.0f);
    buffer.write(3, 99.0f);

    REQUIRE(buffer.lastTick() == 10);
    REQUIRE(buffer.at(7) == 1.0f);
}

TEST_CASE("HistoryBuffer historic write re-interpolates synthesized neighbours", "[history]")
{
    auto buffer = makeBuffer(16, InterpolationMode::kLinear, InterpolationMode::kLinear);

    buffer.write(10, 0.0f);
    buffer.write(14, 40.0f);
    REQUIRE_THAT(buffer.read(12.0), WithinAbs(20.0, 1e-4));

    buffer.write(12, 100.0f);

    REQUIRE(buffer.read(12.0) == 100.0f);
    REQUIRE_THAT(buffer.read(11.0), WithinAbs(50.0, 1e-4));
    REQUIRE_THAT(buffer.read(13.0), WithinAbs(70.0, 1e-4));
    REQUIRE(buffer.read(14.0) == 40.0f);
    REQUIRE(buffer.lastTick() == 14);
}

TEST_CASE("HistoryBuffer rollback flattens the future and is idempotent", "[history]")
{
    auto buffer = makeBuffer(16, InterpolationMode::kLinear, InterpolationMode::kLinear);

    for (core::Tick t = 1; t <= 10; ++t)
        buffer.write(t, static_cast<float>(t));

    buffer.rollback(6);

    REQUIRE(buffer.lastTick() == 10);
    for (core::Tick t = 7; t <= 10; ++t)
        REQUIRE(buffer.at(t) == 6.0f);
    REQUIRE(buffer.at(5) == 5.0f);

    SECTION("second identical rollback is a no-op")
    {
        buffer.write(8, 42.0f);
        buffer.rollback(6);
        REQUIRE(buffer.at(8) == 42.0f);
    }

    SECTION("a historic write inside the plateau extends forward")
    {
        buffer.write(8, 42.0f);
        REQUIRE(buffer.at(10) == 42.0f);
        REQUIRE_THAT(buffer.read(7.0), WithinAbs(24.0, 1e-4));
    }
}

TEST_CASE("HistoryBuffer correction shifts every later tick", "[history]")
{
    auto buffer = makeBuffer(16, InterpolationMode::kLinear, InterpolationMode::kLinear);

    for (core::Tick t = 1; t <= 8; ++t)
        buffer.write(t, static_cast<float>(t) * 2.0f);

    buffer.applyCorrection(5, 8.5f);

    REQUIRE(buffer.at(4) == 8.0f);
    REQUIRE(buffer.at(5) == 8.5f);
    REQUIRE(buffer.at(8) == 14.5f);

    SECTION("the corrected tick holds the authoritative value exactly")
    {
        buffer.write(6, 4.013f);
        buffer.applyCorrection(6, 0.7f);
        REQUIRE(buffer.at(6) == 0.7f);
    }
    SECTION("ticks outside the retained range are ignored")
    {
        buffer.applyCorrection(9, 0.0f);
        REQUIRE(buffer.at(8) == 14.5f);
    }
}

TEST_CASE("HistoryBuffer change tracking", "[history]")
{
    auto buffer = makeBuffer(32, InterpolationMode::kNone, InterpolationMode::kNone);

    buffer.write(1, 1.0f);
    buffer.write(5, 1.0f);
    REQUIRE_FALSE(buffer.changed(1, 5));

    buffer.write(6, 2.0f);
    REQUIRE(buffer.lastChangedTick() == 6);
    REQUIRE(buffer.changed(5, 6));
    REQUIRE_FALSE(buffer.changed(6, 6));

    SECTION("change then change back is not detected")
    {
        buffer.write(7, 1.0f);
        REQUIRE(buffer.lastChangedTick() == 7);
        REQUIRE_FALSE(buffer.changed(5, 7));
    }
}

TEST_CASE("HistoryBuffer of booleans steps", "[history]")
{
    HistoryBuffer<bool> buffer{8};

    buffer.write(1, false);
    buffer.write(4, true);

    REQUIRE_FALSE(buffer.read(3.5));
    REQUIRE(buffer.read(4.0));
    REQUIRE(buffer.read(7.0));
}

TEST_CASE("HistoryBuffer of vectors blends componentwise", "[history]")
{
    HistoryBuffer<math::Vec3f> buffer{8};

    buffer.write(1, {0.0f, 0.0f, 0.0f});
    buffer.write(3, {2.0f, 4.0f, -2.0f});

    const auto mid = buffer.read(1.5);
    REQUIRE_THAT(mid.x, WithinAbs(0.5, 1e-5));
    REQUIRE_THAT(mid.y, WithinAbs(1.0, 1e-5));
    REQUIRE_THAT(mid.z, WithinAbs(-0.5, 1e-5));
}

} // namespace tks::container
