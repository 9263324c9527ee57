/**
 * @file TestReconciliation.cpp
 * @brief Unit tests for the prediction state machine and server reconciliation.
 */

#include <catch2/catch.hpp>

#include "tks/sync/PredictionController.hpp"
#include "tks/sync/SyncedEntity.hpp"

using Catch::Matchers::WithinAbs;

namespace tks::sync {

namespace {

using net::protocol::FrameFlag;

constexpr core::PeerId kClient = 2;

engine::Config clientConfig()
{
    return engine::Config::Builder{}.historyCapacity(32).build();
}

net::protocol::StateFrame makeFrame(core::Tick tick, std::optional<core::InputId> consumed,
                                    net::protocol::Value value, bool predicted)
{
    net::protocol::StateFrame frame;
    frame.entityKey = 1;
    frame.tick = tick;
    frame.lastConsumedInputId = consumed;
    frame.set(FrameFlag::Predicted, predicted);
    const net::protocol::IndexedValue entry{0, std::move(value)};
    frame.assign(std::span{&entry, 1});
    return frame;
}

} // namespace

// ========================================================================== //
//  PredictionController                                                      //
// ========================================================================== //

TEST_CASE("Forced prediction lasts until the write was consumed", "[sync][prediction]")
{
    PredictionController pc;
    REQUIRE_FALSE(pc.active());
    REQUIRE(pc.weight() == 0.0);

    pc.onLocalWrite(12);
    pc.onLocalWrite(9);
    REQUIRE(pc.state() == PredictionState::ForcedOn);
    REQUIRE(pc.forcedUntil() == 12);

    CHECK_FALSE(pc.onServerFrame(false, std::nullopt, 4));
    CHECK_FALSE(pc.onServerFrame(false, 11, 4));
    REQUIRE(pc.active());

    REQUIRE(pc.onServerFrame(false, 12, 4));
    REQUIRE(pc.state() == PredictionState::SmoothingOff);
    REQUIRE_FALSE(pc.active());
}

TEST_CASE("Server confirmation overrides local writes", "[sync][prediction]")
{
    PredictionController pc;
    CHECK_FALSE(pc.onServerFrame(true, std::nullopt, 4));
    REQUIRE(pc.state() == PredictionState::ServerConfirmedOn);

    pc.onLocalWrite(3);
    REQUIRE(pc.state() == PredictionState::ServerConfirmedOn);

    REQUIRE(pc.onServerFrame(false, 100, 4));
    REQUIRE(pc.state() == PredictionState::SmoothingOff);

    CHECK_FALSE(pc.onServerFrame(false, 101, 4));
    CHECK_FALSE(pc.onServerFrame(true, 102, 4));
    REQUIRE(pc.state() == PredictionState::ServerConfirmedOn);
}

TEST_CASE("Leaving prediction ramps the display weight down", "[sync][prediction]")
{
    PredictionController pc;
    pc.onLocalWrite(1);
    REQUIRE(pc.onServerFrame(false, 1, 4));

    CHECK_THAT(pc.weight(), WithinAbs(1.0, 1e-12));
    pc.step();
    CHECK_THAT(pc.weight(), WithinAbs(0.75, 1e-12));
    pc.step();
    pc.step();
    CHECK_THAT(pc.weight(), WithinAbs(0.25, 1e-12));
    pc.step();
    REQUIRE(pc.state() == PredictionState::ServerConfirmedOff);
    REQUIRE(pc.weight() == 0.0);

    SECTION("an empty ramp still lasts one step")
    {
        pc.onLocalWrite(2);
        REQUIRE(pc.onServerFrame(false, 2, 0));
        REQUIRE(pc.state() == PredictionState::SmoothingOff);
        pc.step();
        REQUIRE(pc.state() == PredictionState::ServerConfirmedOff);
    }
}

// ========================================================================== //
//  Reconciliation                                                            //
// ========================================================================== //

TEST_CASE("Authoritative state shifts the predicted history", "[sync][reconcile]")
{
    const auto cfg = clientConfig();
    ClockSequencer clock{ClockRole::Client, cfg};

    SyncedEntity::Builder builder{"avatar"};
    const auto position = builder.add<math::Vec3f>("position", {.predicted = true});
    auto entity = builder.key(1).belongsTo(kClient).build(cfg.historyCapacity());
    auto &history = entity->get(position).history();

    for (core::Tick t = 1; t <= 10; ++t)
    {
        clock.step(0.0);
        history.write(t, math::Vec3f{static_cast<core::f32>(t), 0.0f, 0.0f});
    }
    REQUIRE(clock.tickForInput(5) == 5);

    const auto frame = makeFrame(5, 5, math::Vec3f{4.5f, 0.0f, 0.0f}, true);
    REQUIRE(entity->apply(frame, clock, kClient, 4).has_value());

    REQUIRE(entity->property(position.index).prediction().state() == PredictionState::ServerConfirmedOn);
    CHECK_THAT(history.at(5).x, WithinAbs(4.5, 1e-5));
    CHECK_THAT(history.at(10).x, WithinAbs(9.5, 1e-5));
    CHECK_THAT(history.at(4).x, WithinAbs(4.0, 1e-5));
    REQUIRE(entity->get(position).lastCorrectedTick() == 5);

    SECTION("the same frame twice corrects once")
    {
        REQUIRE(entity->apply(frame, clock, kClient, 4).has_value());
        CHECK_THAT(history.at(10).x, WithinAbs(9.5, 1e-5));
    }
    SECTION("an older input is ignored")
    {
        REQUIRE(entity->apply(makeFrame(3, 3, math::Vec3f{0.0f, 0.0f, 0.0f}, true), clock, kClient, 4).has_value());
        CHECK_THAT(history.at(10).x, WithinAbs(9.5, 1e-5));
    }
    SECTION("a frame without an input id leaves the history alone")
    {
        REQUIRE(entity->apply(makeFrame(6, std::nullopt, math::Vec3f{0.0f, 0.0f, 0.0f}, true), clock, kClient, 4).has_value());
        CHECK_THAT(history.at(6).x, WithinAbs(5.5, 1e-5));
        CHECK_THAT(history.at(10).x, WithinAbs(9.5, 1e-5));
    }
}

TEST_CASE("The reconciled tick holds the authoritative value exactly", "[sync][reconcile]")
{
    const auto cfg = clientConfig();
    ClockSequencer clock{ClockRole::Client, cfg};

    SyncedEntity::Builder builder{"turret"};
    const auto angle = builder.add<core::f32>("angle", {.predicted = true});
    auto entity = builder.key(1).belongsTo(kClient).build(cfg.historyCapacity());
    auto &history = entity->get(angle).history();

    for (core::Tick t = 1; t <= 8; ++t)
    {
        clock.step(0.0);
        history.write(t, static_cast<core::f32>(t) + 0.013f);
    }
    const core::f32 predicted = history.at(4);
    const core::f32 later = history.at(8);

    REQUIRE(entity->apply(makeFrame(4, 4, 0.7f, true), clock, kClient, 4).has_value());

    CHECK(history.at(4) == 0.7f);
    CHECK(history.at(3) == static_cast<core::f32>(3) + 0.013f);
    CHECK_THAT(history.at(8), WithinAbs(later - (predicted - 0.7f), 1e-5));
}

TEST_CASE("A local write forces prediction until the server caught up", "[sync][reconcile]")
{
    const auto cfg = clientConfig();
    ClockSequencer clock{ClockRole::Client, cfg};

    SyncedEntity::Builder builder{"door"};
    const auto angle = builder.add<core::f32>("angle", {.strategy = SyncStrategy::Reliable});
    auto entity = builder.key(1).build(cfg.historyCapacity());
    auto &property = entity->get(angle);

    core::f32 field = 0.0f;
    entity->bindAutoSync<core::f32>(angle, [&] { return field; }, [&](const core::f32 &v) { field = v; });

    clock.step(0.0);
    REQUIRE(entity->apply(makeFrame(1, std::nullopt, core::f32{10.0f}, false), clock, kClient, 2).has_value());
    entity->pushDisplay(1.0, 1.0, kClient);
    REQUIRE(field == 10.0f);

    // Game logic opens the door during input 1.
    field = 90.0f;
    entity->captureLocal(1, clock.inputId(), kClient);
    REQUIRE(property.prediction().state() == PredictionState::ForcedOn);
    REQUIRE(property.prediction().forcedUntil() == 1);

    clock.step(0.0);
    entity->captureLocal(2, clock.inputId(), kClient);
    REQUIRE(property.history().at(2) == 90.0f);

    // The server has not seen the write yet: its stale value is not applied.
    REQUIRE(entity->apply(makeFrame(2, std::nullopt, core::f32{10.0f}, false), clock, kClient, 2).has_value());
    REQUIRE(property.prediction().active());
    REQUIRE(property.history().at(2) == 90.0f);

    // Input 1 consumed: prediction ends and the server value is written.
    REQUIRE(entity->apply(makeFrame(3, 1, core::f32{90.0f}, false), clock, kClient, 2).has_value());
    REQUIRE(property.prediction().state() == PredictionState::SmoothingOff);
    REQUIRE(property.history().at(3) == 90.0f);

    entity->stepPrediction();
    CHECK_THAT(property.prediction().weight(), WithinAbs(0.5, 1e-12));
    entity->stepPrediction();
    REQUIRE(property.prediction().state() == PredictionState::ServerConfirmedOff);
}

TEST_CASE("Mistyped or out of range entries are rejected", "[sync][reconcile]")
{
    const auto cfg = clientConfig();
    ClockSequencer clock{ClockRole::Client, cfg};

    SyncedEntity::Builder builder{"crate"};
    const auto mass = builder.add<core::f32>("mass");
    auto entity = builder.key(1).build(cfg.historyCapacity());

    auto r = entity->apply(makeFrame(1, std::nullopt, core::i32{3}, false), clock, kClient, 2);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == core::ErrorCode::CorruptedData);

    auto frame = makeFrame(1, std::nullopt, core::f32{3.0f}, false);
    frame.indices = {4};
    r = entity->apply(frame, clock, kClient, 2);
    REQUIRE_FALSE(r.has_value());
    CHECK(entity->get(mass).history().empty());
}

} // namespace tks::sync
