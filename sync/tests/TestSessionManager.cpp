/**
 * @file TestSessionManager.cpp
 * @brief Unit tests for sync::session::SessionManager.
 */

#include <catch2/catch.hpp>

#include "tks/sync/session/SessionManager.hpp"

using Catch::Matchers::WithinAbs;

namespace tks::sync::session {

namespace {

input::ActionTable makeTable()
{
    input::ActionTable table;
    table.add("fire", input::ActionKind::Bool);
    return table;
}

} // namespace

TEST_CASE("Local session exists from the start", "[session]")
{
    const auto table = makeTable();
    input::PeerInputLedger ledger{table, core::kLocalPeer};
    SessionManager manager{table, ledger};

    REQUIRE(manager.activeCount() == 1);
    REQUIRE(manager.local().isLocal());
    REQUIRE(&manager.local().ledger() == &ledger);
    REQUIRE(manager.remotePeers().empty());

    const auto r = manager.disconnect(core::kLocalPeer);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == core::ErrorCode::InvalidArgument);
}

TEST_CASE("Connect and disconnect peers", "[session]")
{
    const auto table = makeTable();
    input::PeerInputLedger ledger{table, core::kLocalPeer};
    SessionManager manager{table, ledger};

    REQUIRE(manager.connect(5).has_value());
    REQUIRE(manager.connect(3).has_value());
    REQUIRE(manager.activeCount() == 3);
    REQUIRE(manager.remotePeers() == std::vector<core::PeerId>{3, 5});

    SECTION("duplicates are refused")
    {
        const auto again = manager.connect(3);
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().code() == core::ErrorCode::AlreadyExists);
    }
    SECTION("unknown peers are reported")
    {
        const auto r = manager.disconnect(9);
        REQUIRE_FALSE(r.has_value());
        CHECK(r.error().code() == core::ErrorCode::NotFound);
    }
    SECTION("disconnect frees the session")
    {
        REQUIRE(manager.disconnect(3).has_value());
        REQUIRE(manager.find(3) == nullptr);
        REQUIRE(manager.remotePeers() == std::vector<core::PeerId>{5});
    }

    int visited = 0;
    core::PeerId previous = 0;
    bool ordered = true;
    manager.forEach([&](const Session &s) {
        ordered = ordered && (visited == 0 || s.peer() > previous);
        previous = s.peer();
        ++visited;
    });
    CHECK(ordered);
    CHECK(visited == static_cast<int>(manager.activeCount()));
}

TEST_CASE("Latency is a smoothed moving average", "[session]")
{
    const auto table = makeTable();
    Session session{4, table, core::kInputHistory, core::kPredictionMaxFrames};

    REQUIRE(session.latencyTicks() == 0.0);
    session.recordLatency(10.0);
    CHECK_THAT(session.latencyTicks(), WithinAbs(10.0, 1e-12));
    session.recordLatency(20.0);
    CHECK_THAT(session.latencyTicks(), WithinAbs(11.25, 1e-12));
}

TEST_CASE("Owned entities are tracked once", "[session]")
{
    const auto table = makeTable();
    Session session{4, table, core::kInputHistory, core::kPredictionMaxFrames};
    const EntityHandle a{0, 1};
    const EntityHandle b{0, 2};

    session.addOwned(a);
    session.addOwned(a);
    session.addOwned(b);
    REQUIRE(session.owned().size() == 2);
    REQUIRE(session.owns(a));

    session.removeOwned(a);
    REQUIRE_FALSE(session.owns(a));
    REQUIRE(session.owns(b));
}

} // namespace tks::sync::session
