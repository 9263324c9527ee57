/**
 * @file LoopbackTransport.cpp
 * @brief In-process transport hub implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/net/transport/LoopbackTransport.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <queue>
#include <random>
#include <set>
#include <unordered_map>
#include <utility>

namespace tks::net::transport {

namespace {

enum class DeliveryKind : core::u8
{
    Data,
    Connect,
    Disconnect
};

/**
 * @brief A payload or connection event awaiting its delivery time.
 *
 * Ordered so that std::priority_queue pops the earliest delivery time
 * first, then the earliest scheduled.
 */
struct Delivery
{
    core::f64               at;
    core::u64               sequence;
    core::PeerId            from;
    core::PeerId            to;
    DeliveryKind            kind;
    std::vector<core::byte> payload;

    [[nodiscard]] bool operator<(const Delivery& other) const noexcept
    {
        if (at != other.at)
        {
            return at > other.at;
        }
        return sequence > other.sequence;
    }
};

} // namespace

// -------------------------------------------------------------------------- //
//  LoopbackNetwork                                                           //
// -------------------------------------------------------------------------- //

struct LoopbackNetwork::Impl
{
    LoopbackConfig                                        config;
    std::mt19937                                          rng;
    core::f64                                             now{0.0};
    core::u64                                             nextSequence{0};
    core::PeerId                                          nextClientId{core::kServerPeer + 1};
    std::unordered_map<core::PeerId, LoopbackTransport*>  endpoints;
    std::set<core::PeerId>                                links;
    std::map<std::pair<core::PeerId, core::PeerId>, core::f64> lastReliable;
    std::priority_queue<Delivery>                         queue;
    LoopbackStats                                         stats;

    explicit Impl(LoopbackConfig c) : config{c}, rng{c.seed} {}

    [[nodiscard]] bool hasServer() const
    {
        return endpoints.contains(core::kServerPeer);
    }

    [[nodiscard]] bool linked(core::PeerId a, core::PeerId b) const
    {
        if (!hasServer())
        {
            return false;
        }
        if (a == core::kServerPeer)
        {
            return links.contains(b);
        }
        if (b == core::kServerPeer)
        {
            return links.contains(a);
        }
        return false;
    }

    [[nodiscard]] core::f64 drawLatency()
    {
        if (config.maxLatency <= 0.0)
        {
            return 0.0;
        }
        const core::f64 lo = std::max(0.0, config.minLatency);
        const core::f64 hi = std::max(lo, config.maxLatency);
        std::uniform_real_distribution<core::f64> dist{lo, hi};
        return dist(rng);
    }

    [[nodiscard]] bool drawLoss()
    {
        if (config.lossPercent <= 0.0f)
        {
            return false;
        }
        std::uniform_real_distribution<core::f32> dist{0.0f, 100.0f};
        return dist(rng) < config.lossPercent;
    }

    void schedule(core::f64 at, core::PeerId from, core::PeerId to, DeliveryKind kind,
                  std::vector<core::byte> payload = {})
    {
        queue.push(Delivery{at, nextSequence++, from, to, kind, std::move(payload)});
    }

    void deliver(Delivery& d)
    {
        auto it = endpoints.find(d.to);
        if (it == endpoints.end())
        {
            ++stats.dropped;
            return;
        }
        LoopbackTransport& target = *it->second;

        switch (d.kind)
        {
            case DeliveryKind::Data:
                if (!linked(d.from, d.to))
                {
                    ++stats.dropped;
                    return;
                }
                ++stats.delivered;
                if (target._onReceive)
                {
                    target._onReceive(d.from, d.payload);
                }
                break;
            case DeliveryKind::Connect:
                if (linked(d.from, d.to) && target._onConnection)
                {
                    target._onConnection(d.from, true);
                }
                break;
            case DeliveryKind::Disconnect:
                if (target._onConnection)
                {
                    target._onConnection(d.from, false);
                }
                break;
        }
    }
};

LoopbackNetwork::LoopbackNetwork(LoopbackConfig config)
    : _impl{std::make_unique<Impl>(config)}
{}

LoopbackNetwork::~LoopbackNetwork() = default;

std::unique_ptr<LoopbackTransport> LoopbackNetwork::createServer()
{
    TKS_VERIFY(!_impl->hasServer());

    auto endpoint = std::make_unique<LoopbackTransport>(*this, core::kServerPeer);
    _impl->endpoints.emplace(core::kServerPeer, endpoint.get());

    core::Log::info("NET", "LoopbackNetwork: server endpoint created");
    return endpoint;
}

std::unique_ptr<LoopbackTransport> LoopbackNetwork::createClient()
{
    TKS_VERIFY(_impl->hasServer());

    const core::PeerId id = _impl->nextClientId++;
    auto endpoint = std::make_unique<LoopbackTransport>(*this, id);
    _impl->endpoints.emplace(id, endpoint.get());
    _impl->links.insert(id);

    _impl->schedule(_impl->now, id, core::kServerPeer, DeliveryKind::Connect);
    _impl->schedule(_impl->now, core::kServerPeer, id, DeliveryKind::Connect);

    core::Log::info("NET", std::format("LoopbackNetwork: client {} connected", id));
    return endpoint;
}

void LoopbackNetwork::disconnect(core::PeerId client)
{
    if (_impl->links.erase(client) == 0)
    {
        return;
    }

    _impl->lastReliable.erase({client, core::kServerPeer});
    _impl->lastReliable.erase({core::kServerPeer, client});
    _impl->schedule(_impl->now, client, core::kServerPeer, DeliveryKind::Disconnect);
    _impl->schedule(_impl->now, core::kServerPeer, client, DeliveryKind::Disconnect);

    core::Log::info("NET", std::format("LoopbackNetwork: client {} disconnected", client));
}

void LoopbackNetwork::advance(core::f64 now)
{
    _impl->now = std::max(_impl->now, now);

    while (!_impl->queue.empty() && _impl->queue.top().at <= _impl->now)
    {
        Delivery d = std::move(const_cast<Delivery&>(_impl->queue.top()));
        _impl->queue.pop();
        _impl->deliver(d);
    }
}

void LoopbackNetwork::flush()
{
    while (!_impl->queue.empty())
    {
        Delivery d = std::move(const_cast<Delivery&>(_impl->queue.top()));
        _impl->queue.pop();
        _impl->now = std::max(_impl->now, d.at);
        _impl->deliver(d);
    }
}

core::f64 LoopbackNetwork::now() const noexcept { return _impl->now; }

core::usize LoopbackNetwork::pending() const noexcept { return _impl->queue.size(); }

LoopbackStats LoopbackNetwork::stats() const noexcept { return _impl->stats; }

core::ExpectedVoid LoopbackNetwork::send(
    core::PeerId from,
    core::PeerId to,
    std::span<const core::byte> payload,
    bool reliable)
{
    if (to == core::kBroadcastPeer)
    {
        for (auto peer : peersOf(from))
        {
            TKS_TRY_VOID(send(from, peer, payload, reliable));
        }
        return {};
    }

    if (!_impl->linked(from, to))
    {
        return core::makeError(core::ErrorCode::NetworkDisconnected,
                               std::format("peer {} is not reachable from {}", to, from));
    }

    ++_impl->stats.sent;

    if (!reliable && _impl->drawLoss())
    {
        ++_impl->stats.dropped;
        return {};
    }

    core::f64 at = _impl->now + _impl->drawLatency();
    if (reliable)
    {
        auto& last = _impl->lastReliable[{from, to}];
        at = std::max(at, last);
        last = at;
    }

    _impl->schedule(at, from, to, DeliveryKind::Data,
                    std::vector<core::byte>{payload.begin(), payload.end()});
    return {};
}

std::vector<core::PeerId> LoopbackNetwork::peersOf(core::PeerId id) const
{
    if (!_impl->hasServer())
    {
        return {};
    }
    if (id == core::kServerPeer)
    {
        return {_impl->links.begin(), _impl->links.end()};
    }
    if (_impl->links.contains(id))
    {
        return {core::kServerPeer};
    }
    return {};
}

void LoopbackNetwork::detach(core::PeerId id)
{
    if (id == core::kServerPeer)
    {
        for (auto client : _impl->links)
        {
            _impl->schedule(_impl->now, core::kServerPeer, client, DeliveryKind::Disconnect);
        }
        _impl->links.clear();
        _impl->lastReliable.clear();
    }
    else
    {
        disconnect(id);
    }
    _impl->endpoints.erase(id);
}

// -------------------------------------------------------------------------- //
//  LoopbackTransport                                                         //
// -------------------------------------------------------------------------- //

LoopbackTransport::LoopbackTransport(LoopbackNetwork& network, core::PeerId id)
    : _network{network}
    , _id{id}
{}

LoopbackTransport::~LoopbackTransport()
{
    _network.detach(_id);
}

core::ExpectedVoid LoopbackTransport::sendReliable(
    core::PeerId peer,
    std::span<const core::byte> payload)
{
    return _network.send(_id, peer, payload, true);
}

core::ExpectedVoid LoopbackTransport::sendUnreliable(
    core::PeerId peer,
    std::span<const core::byte> payload)
{
    return _network.send(_id, peer, payload, false);
}

std::vector<core::PeerId> LoopbackTransport::connectedPeers() const
{
    return _network.peersOf(_id);
}

core::PeerId LoopbackTransport::localPeerId() const noexcept { return _id; }

void LoopbackTransport::setReceiveHandler(ReceiveHandler handler)
{
    _onReceive = std::move(handler);
}

void LoopbackTransport::setConnectionHandler(ConnectionHandler handler)
{
    _onConnection = std::move(handler);
}

const char* LoopbackTransport::name() const noexcept { return "loopback"; }

} // namespace tks::net::transport
