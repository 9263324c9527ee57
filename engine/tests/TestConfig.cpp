/**
 * @file TestConfig.cpp
 * @brief Unit tests for Config::Builder and Config::validate.
 */

#include <catch2/catch.hpp>

#include "tks/engine/Config.hpp"

using Catch::Matchers::WithinAbs;

namespace tks::engine {

TEST_CASE("Default configuration is valid", "[engine][config]")
{
    const Config cfg = Config::Builder{}.build();

    CHECK(cfg.tickRate() == core::kTickRate);
    CHECK(cfg.interpolationLag() == core::kInterpolationLag);
    CHECK(cfg.serverSendRate() == core::kServerSendRate);
    CHECK_FALSE(cfg.serverMode());
    CHECK(cfg.simulatedPacketLoss() == 0.0f);
    CHECK_THAT(cfg.fixedDeltaTime(), WithinAbs(1.0 / 60.0, 1e-12));
    CHECK(cfg.validate().has_value());
}

TEST_CASE("Builder carries every option", "[engine][config]")
{
    const Config cfg = Config::Builder{}
        .tickRate(30)
        .serverMode(true)
        .historyCapacity(128)
        .interpolationLag(6)
        .serverSendRate(10)
        .inputSendRate(15)
        .inputBatchSize(4)
        .inputHistory(32)
        .maxExtrapolation(2)
        .maxOfflineExtrapolation(12)
        .stalenessDelay(5)
        .predictionMaxFrames(3)
        .inputTickLookback(64)
        .simulatedLatencyRange(0.05, 0.15)
        .simulatedPacketLossPercent(10.0f)
        .simulationSeed(42)
        .build();

    CHECK(cfg.tickRate() == 30);
    CHECK(cfg.serverMode());
    CHECK(cfg.historyCapacity() == 128);
    CHECK(cfg.interpolationLag() == 6);
    CHECK(cfg.serverSendRate() == 10);
    CHECK(cfg.inputSendRate() == 15);
    CHECK(cfg.inputBatchSize() == 4);
    CHECK(cfg.inputHistory() == 32);
    CHECK(cfg.maxExtrapolation() == 2);
    CHECK(cfg.maxOfflineExtrapolation() == 12);
    CHECK(cfg.stalenessDelay() == 5);
    CHECK(cfg.predictionMaxFrames() == 3);
    CHECK(cfg.inputTickLookback() == 64);
    CHECK_THAT(cfg.simulatedMinLatency(), WithinAbs(0.05, 1e-12));
    CHECK_THAT(cfg.simulatedMaxLatency(), WithinAbs(0.15, 1e-12));
    CHECK(cfg.simulatedPacketLoss() == 10.0f);
    CHECK(cfg.simulationSeed() == 42);
    CHECK(cfg.validate().has_value());
}

TEST_CASE("Inconsistent options are rejected", "[engine][config]")
{
    SECTION("send rate above tick rate")
    {
        const auto r = Config::Builder{}.tickRate(20).serverSendRate(30).build().validate();
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == core::ErrorCode::InvalidArgument);
    }
    SECTION("history shorter than the interpolation lag")
    {
        const auto r = Config::Builder{}.historyCapacity(4).interpolationLag(4).build().validate();
        CHECK_FALSE(r.has_value());
    }
    SECTION("batch larger than the input history")
    {
        const auto r = Config::Builder{}.inputBatchSize(40).inputHistory(32).build().validate();
        CHECK_FALSE(r.has_value());
    }
    SECTION("inverted latency range")
    {
        const auto r = Config::Builder{}.simulatedLatencyRange(0.2, 0.1).build().validate();
        CHECK_FALSE(r.has_value());
    }
    SECTION("loss above 100 percent")
    {
        const auto r = Config::Builder{}.simulatedPacketLossPercent(150.0f).build().validate();
        CHECK_FALSE(r.has_value());
    }
    SECTION("zero tick rate")
    {
        const auto r = Config::Builder{}.tickRate(0).build().validate();
        CHECK_FALSE(r.has_value());
    }
}

} // namespace tks::engine
