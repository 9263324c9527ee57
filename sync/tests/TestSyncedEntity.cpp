/**
 * @file TestSyncedEntity.cpp
 * @brief Unit tests for property ordering and the server send cycle.
 */

#include <catch2/catch.hpp>

#include "tks/sync/SyncedEntity.hpp"

#include <algorithm>
#include <string_view>

using Catch::Matchers::WithinAbs;

namespace tks::sync {

namespace {

using net::protocol::FrameFlag;
using net::protocol::IndexedValue;

struct Mixed
{
    std::unique_ptr<SyncedEntity>  entity;
    PropertyHandle<core::i32>      score;
    PropertyHandle<core::f32>      speed;
    PropertyHandle<math::Vec3f>    position;
    PropertyHandle<bool>           debug;
    PropertyHandle<core::f32>      aim;
};

Mixed makeMixed(core::PeerId owner = core::kLocalPeer)
{
    SyncedEntity::Builder builder{"mixed"};
    Mixed m;
    m.score    = builder.add<core::i32>("score", {.strategy = SyncStrategy::Reliable});
    m.speed    = builder.add<core::f32>("speed", {.strategy = SyncStrategy::Unreliable});
    m.position = builder.add<math::Vec3f>("position", {.strategy = SyncStrategy::Auto});
    m.debug    = builder.add<bool>("debug", {.strategy = SyncStrategy::NoSync});
    m.aim      = builder.add<core::f32>("aim", {.strategy = SyncStrategy::ClientOwned});
    m.entity = builder.key(7).belongsTo(owner).build(32);
    return m;
}

std::vector<core::u8> indicesOf(const OutgoingFrame &out)
{
    std::vector<core::u8> result;
    for (const auto &e : out.frame.entries())
    {
        result.push_back(e.index);
    }
    return result;
}

} // namespace

TEST_CASE("Properties are ordered by strategy, declaration order within", "[sync][entity]")
{
    auto m = makeMixed();
    const SyncedEntity &e = *m.entity;

    REQUIRE(e.propertyCount() == 5);
    CHECK(e.wireProperty(0).name() == "speed");
    CHECK(e.wireProperty(1).name() == "position");
    CHECK(e.wireProperty(2).name() == "score");
    CHECK(e.wireProperty(3).name() == "debug");
    CHECK(e.wireProperty(4).name() == "aim");

    CHECK(e.property(m.score.index).name() == "score");
    CHECK(m.entity->find("aim") == &m.entity->property(m.aim.index));
    CHECK(m.entity->find("missing") == nullptr);

    CHECK(std::string_view{toString(e.wireProperty(0).strategy())} == "unreliable");
    CHECK(std::string_view{toString(e.wireProperty(3).strategy())} == "no-sync");
    CHECK(std::string_view{toString(e.wireProperty(4).strategy())} == "client-owned");
}

TEST_CASE("Send cycle splits reliable and unreliable content", "[sync][entity][send]")
{
    auto m = makeMixed();
    SyncedEntity &e = *m.entity;
    constexpr core::PeerId kPeer = 2;
    constexpr core::u32 kStaleness = 5;

    e.get(m.score).history().write(10, 5);
    e.get(m.speed).history().write(10, 1.5f);
    e.get(m.position).history().write(10, math::Vec3f{1.0f, 2.0f, 3.0f});
    e.get(m.debug).history().write(10, true);

    SECTION("first cycle sends everything")
    {
        const auto out = e.collect(kPeer, kPeer, 10, kStaleness);
        REQUIRE(out.size() == 2);

        REQUIRE_FALSE(out[0].reliable);
        CHECK(indicesOf(out[0]) == std::vector<core::u8>{0, 1});
        CHECK(out[0].frame.has(FrameFlag::UnchangedElsewhere));

        REQUIRE(out[1].reliable);
        CHECK(indicesOf(out[1]) == std::vector<core::u8>{2});
        CHECK_FALSE(out[1].frame.has(FrameFlag::UnchangedElsewhere));
        CHECK(out[1].frame.tick == 10);
    }

    SECTION("auto escalates to reliable once stable")
    {
        (void)e.collect(kPeer, kPeer, 10, kStaleness);

        auto out = e.collect(kPeer, kPeer, 11, kStaleness);
        REQUIRE(out.size() == 1);
        CHECK(indicesOf(out[0]) == std::vector<core::u8>{0, 1});

        out = e.collect(kPeer, kPeer, 15, kStaleness);
        REQUIRE(out.size() == 2);
        REQUIRE(out[1].reliable);
        CHECK(indicesOf(out[1]) == std::vector<core::u8>{1});

        out = e.collect(kPeer, kPeer, 16, kStaleness);
        REQUIRE(out.size() == 1);
        CHECK(indicesOf(out[0]) == std::vector<core::u8>{0});
    }

    SECTION("reliable values are resent only after a change")
    {
        (void)e.collect(kPeer, kPeer, 10, kStaleness);
        e.get(m.score).history().write(12, 6);

        const auto out = e.collect(kPeer, kPeer, 12, kStaleness);
        const auto reliable = std::find_if(out.begin(), out.end(), [](const OutgoingFrame &f) { return f.reliable; });
        REQUIRE(reliable != out.end());
        REQUIRE(reliable->frame.entries() == std::vector<IndexedValue>{{2, core::i32{6}}});
    }

    SECTION("bookkeeping is per peer")
    {
        (void)e.collect(kPeer, kPeer, 10, kStaleness);
        const auto other = e.collect(3, 3, 11, kStaleness);
        REQUIRE(other.size() == 2);

        e.forgetPeer(kPeer);
        const auto again = e.collect(kPeer, kPeer, 11, kStaleness);
        REQUIRE(again.size() == 2);
    }
}

TEST_CASE("Heartbeat travels once on the reliable channel", "[sync][entity][send]")
{
    SyncedEntity::Builder builder{"door"};
    const auto open = builder.add<bool>("open", {.strategy = SyncStrategy::Reliable});
    auto e = builder.key(1).build(16);

    e->get(open).history().write(10, false);

    auto out = e->collect(2, 2, 10, 5);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].reliable);
    REQUIRE_FALSE(out[0].frame.isEmpty());

    out = e->collect(2, 2, 11, 5);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].reliable);
    REQUIRE(out[0].frame.isEmpty());
    REQUIRE(out[0].frame.has(FrameFlag::UnchangedElsewhere));

    REQUIRE(e->collect(2, 2, 12, 5).empty());
    REQUIRE(e->collect(2, 2, 13, 5).empty());

    e->get(open).history().write(14, true);
    out = e->collect(2, 2, 14, 5);
    REQUIRE(out.size() == 1);
    REQUIRE_FALSE(out[0].frame.isEmpty());

    out = e->collect(2, 2, 15, 5);
    REQUIRE(out.size() == 1);
    REQUIRE(out[0].frame.isEmpty());
}

TEST_CASE("Client-owned values are relayed to everyone but their owner", "[sync][entity][owned]")
{
    auto m = makeMixed(2);
    SyncedEntity &e = *m.entity;

    REQUIRE(e.applyOwned(10, input::OwnedBlock{7, {core::f32{0.5f}}}).has_value());
    REQUIRE(e.get(m.aim).history().at(10) == 0.5f);

    const auto toOwner = e.collect(2, 2, 10, 5);
    for (const auto &out : toOwner)
    {
        for (const auto &entry : out.frame.entries())
        {
            CHECK(entry.index != 4);
        }
    }

    const auto toOther = e.collect(3, 3, 10, 5);
    bool relayed = false;
    for (const auto &out : toOther)
    {
        for (const auto &entry : out.frame.entries())
        {
            if (entry.index == 4)
            {
                relayed = out.reliable;
            }
        }
    }
    CHECK(relayed);
}

TEST_CASE("Malformed client-owned blocks are rejected", "[sync][entity][owned]")
{
    auto m = makeMixed(2);

    auto r = m.entity->applyOwned(10, input::OwnedBlock{7, {}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == core::ErrorCode::CorruptedData);

    r = m.entity->applyOwned(10, input::OwnedBlock{7, {true}});
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == core::ErrorCode::CorruptedData);
    CHECK(m.entity->get(m.aim).history().empty());
}

TEST_CASE("Batching is refused when frames differ per peer", "[sync][entity][send]")
{
    SECTION("plain entity")
    {
        SyncedEntity::Builder b{"crate"};
        (void)b.add<math::Vec3f>("position");
        CHECK(b.build(16)->batchable());
    }
    SECTION("predicted by a remote owner")
    {
        SyncedEntity::Builder b{"avatar"};
        (void)b.add<math::Vec3f>("position", {.predicted = true});
        CHECK_FALSE(b.belongsTo(2).build(16)->batchable());
    }
    SECTION("predicted but owned by the server")
    {
        SyncedEntity::Builder b{"bot"};
        (void)b.add<math::Vec3f>("position", {.predicted = true});
        CHECK(b.build(16)->batchable());
    }
    SECTION("lag compensated")
    {
        SyncedEntity::Builder b{"target"};
        const auto p = b.add<math::Vec3f>("position");
        CHECK_FALSE(b.lagCompensated(p).build(16)->batchable());
    }
    SECTION("client-owned values")
    {
        CHECK_FALSE(makeMixed(2).entity->batchable());
    }
}

TEST_CASE("Auto-sync binding captures and pushes game fields", "[sync][entity][bind]")
{
    SyncedEntity::Builder builder{"lamp"};
    const auto level = builder.add<core::f32>("level", {.strategy = SyncStrategy::Unreliable});
    auto e = builder.build(16);

    core::f32 field = 2.0f;
    e->bindAutoSync<core::f32>(level, [&] { return field; }, [&](const core::f32 &v) { field = v; });

    e->captureAuthoritative(1);
    field = 4.0f;
    e->captureAuthoritative(3);

    REQUIRE(e->get(level).history().at(2) == 3.0f);

    e->pushDisplay(3.0, 1.5, core::kLocalPeer);
    CHECK_THAT(field, WithinAbs(2.5, 1e-6));
}

} // namespace tks::sync
