/**
 * @file TestGameLoop.cpp
 * @brief Unit tests for the fixed-step accumulator.
 */

#include <catch2/catch.hpp>

#include "tks/engine/GameLoop.hpp"

#include <vector>

using Catch::Matchers::WithinAbs;

namespace tks::engine {

TEST_CASE("GameLoop runs whole ticks and reports the remainder as alpha", "[engine][loop]")
{
    const Config cfg = Config::Builder{}.tickRate(10).build();
    GameLoop loop{cfg};

    std::vector<core::f64> stamps;
    core::f64 lastAlpha = -1.0;
    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&](core::f64 dt, core::f64 now) {
        CHECK_THAT(dt, WithinAbs(0.1, 1e-12));
        stamps.push_back(now);
    };
    callbacks.render = [&](core::f64 alpha) { lastAlpha = alpha; };

    const core::f64 alpha = loop.advance(0.25, callbacks);

    REQUIRE(stamps.size() == 2);
    CHECK_THAT(stamps[0], WithinAbs(0.1, 1e-9));
    CHECK_THAT(stamps[1], WithinAbs(0.2, 1e-9));
    CHECK_THAT(alpha, WithinAbs(0.5, 1e-9));
    CHECK_THAT(lastAlpha, WithinAbs(alpha, 1e-12));
    CHECK(loop.tickCount() == 2);

    loop.advance(0.06, callbacks);
    CHECK(loop.tickCount() == 3);
    CHECK_THAT(loop.time(), WithinAbs(0.3, 1e-9));
}

TEST_CASE("GameLoop caps long frames", "[engine][loop]")
{
    const Config cfg = Config::Builder{}.tickRate(100).build();
    GameLoop loop{cfg};

    int ticks = 0;
    LoopCallbacks callbacks;
    callbacks.fixedUpdate = [&](core::f64, core::f64) { ++ticks; };

    loop.advance(5.0, callbacks);

    CHECK(ticks == 25);
    CHECK_THAT(loop.droppedTime(), WithinAbs(4.75, 1e-9));

    loop.advance(0.1, callbacks);
    CHECK_THAT(loop.droppedTime(), WithinAbs(4.75, 1e-9));
}

TEST_CASE("GameLoop invokes frame hooks around the ticks", "[engine][loop]")
{
    const Config cfg = Config::Builder{}.tickRate(60).build();
    GameLoop loop{cfg};

    std::vector<char> order;
    LoopCallbacks callbacks;
    callbacks.preFrame    = [&](core::f64) { order.push_back('p'); };
    callbacks.fixedUpdate = [&](core::f64, core::f64) { order.push_back('f'); };
    callbacks.render      = [&](core::f64) { order.push_back('r'); };
    callbacks.postFrame   = [&]() { order.push_back('e'); };

    loop.advance(1.0 / 60.0 + 1e-9, callbacks);

    CHECK(order == std::vector<char>{'p', 'f', 'r', 'e'});
    CHECK_FALSE(loop.isRunning());
}

} // namespace tks::engine
