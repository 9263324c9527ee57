/**
 * @file TestLoopbackTransport.cpp
 * @brief Unit tests for the loopback transport hub.
 */

#include <catch2/catch.hpp>

#include "tks/net/transport/LoopbackTransport.hpp"

#include <vector>

namespace tks::net::transport {

namespace {

std::vector<core::byte> bytesOf(core::u8 tag)
{
    return {core::byte{tag}};
}

struct Inbox
{
    std::vector<std::pair<core::PeerId, core::u8>> received;
    std::vector<std::pair<core::PeerId, bool>>     connections;

    void attach(ITransport &transport)
    {
        transport.setReceiveHandler([this](core::PeerId from, std::span<const core::byte> payload) {
            received.emplace_back(from, static_cast<core::u8>(payload[0]));
        });
        transport.setConnectionHandler([this](core::PeerId peer, bool connected) {
            connections.emplace_back(peer, connected);
        });
    }
};

} // namespace

TEST_CASE("Loopback delivers immediately on advance without fault injection", "[net][loopback]")
{
    LoopbackNetwork network;
    auto server = network.createServer();
    auto client = network.createClient();

    Inbox serverInbox;
    Inbox clientInbox;
    serverInbox.attach(*server);
    clientInbox.attach(*client);

    network.advance(0.0);
    REQUIRE(serverInbox.connections.size() == 1);
    REQUIRE(serverInbox.connections[0].first == client->localPeerId());
    REQUIRE(clientInbox.connections[0].first == core::kServerPeer);

    REQUIRE(server->connectedPeers() == std::vector<core::PeerId>{client->localPeerId()});
    REQUIRE(client->connectedPeers() == std::vector<core::PeerId>{core::kServerPeer});

    REQUIRE(client->sendUnreliable(core::kServerPeer, bytesOf(1)).has_value());
    REQUIRE(server->sendReliable(core::kBroadcastPeer, bytesOf(2)).has_value());
    REQUIRE(serverInbox.received.empty());

    network.advance(0.0);
    REQUIRE(serverInbox.received.size() == 1);
    REQUIRE(serverInbox.received[0].second == 1);
    REQUIRE(clientInbox.received.size() == 1);
    REQUIRE(clientInbox.received[0].second == 2);
}

TEST_CASE("Loopback reliable channel keeps order under latency", "[net][loopback]")
{
    LoopbackNetwork network{LoopbackConfig{0.01, 0.2, 0.0f, 7}};
    auto server = network.createServer();
    auto client = network.createClient();

    Inbox clientInbox;
    clientInbox.attach(*client);
    network.advance(0.0);

    for (core::u8 i = 0; i < 50; ++i)
    {
        REQUIRE(server->sendReliable(client->localPeerId(), bytesOf(i)).has_value());
    }

    network.advance(0.005);
    REQUIRE(clientInbox.received.empty());

    network.advance(10.0);
    REQUIRE(clientInbox.received.size() == 50);
    for (core::u8 i = 0; i < 50; ++i)
    {
        REQUIRE(clientInbox.received[i].second == i);
    }
}

TEST_CASE("Loopback loss only affects the unreliable channel", "[net][loopback]")
{
    LoopbackNetwork network{LoopbackConfig{0.0, 0.0, 50.0f, 99}};
    auto server = network.createServer();
    auto client = network.createClient();

    Inbox serverInbox;
    serverInbox.attach(*server);
    network.advance(0.0);

    for (int i = 0; i < 200; ++i)
    {
        REQUIRE(client->sendUnreliable(core::kServerPeer, bytesOf(0)).has_value());
        REQUIRE(client->sendReliable(core::kServerPeer, bytesOf(1)).has_value());
    }
    network.flush();

    core::usize reliable = 0;
    core::usize unreliable = 0;
    for (const auto &[from, tag] : serverInbox.received)
    {
        (tag == 1 ? reliable : unreliable)++;
    }

    REQUIRE(reliable == 200);
    REQUIRE(unreliable > 0);
    REQUIRE(unreliable < 200);
    REQUIRE(network.stats().dropped == 200 - unreliable);
}

TEST_CASE("Loopback disconnect drops queued payloads and notifies both sides", "[net][loopback]")
{
    LoopbackNetwork network{LoopbackConfig{0.1, 0.1, 0.0f, 1}};
    auto server = network.createServer();
    auto client = network.createClient();

    Inbox serverInbox;
    Inbox clientInbox;
    serverInbox.attach(*server);
    clientInbox.attach(*client);
    network.advance(0.0);

    REQUIRE(server->sendReliable(client->localPeerId(), bytesOf(5)).has_value());
    network.disconnect(client->localPeerId());
    network.advance(1.0);

    REQUIRE(clientInbox.received.empty());
    REQUIRE(clientInbox.connections.back() == std::pair<core::PeerId, bool>{core::kServerPeer, false});
    REQUIRE(serverInbox.connections.back() == std::pair<core::PeerId, bool>{client->localPeerId(), false});

    auto result = server->sendReliable(client->localPeerId(), bytesOf(6));
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::NetworkDisconnected);
    REQUIRE(server->connectedPeers().empty());
}

} // namespace tks::net::transport
