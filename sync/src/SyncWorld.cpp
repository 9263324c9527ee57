/**
 * @file SyncWorld.cpp
 * @brief SyncWorld implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/SyncWorld.hpp>
#include <tks/input/InputBatch.hpp>
#include <tks/input/InputManager.hpp>
#include <tks/net/protocol/Bitstream.hpp>
#include <tks/net/protocol/Protocol.hpp>
#include <tks/net/protocol/StateFrame.hpp>
#include <tks/math/Statistics.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>
#include <string>
#include <unordered_map>
#include <vector>

namespace tks::sync {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct SyncWorld::Impl
{
    struct Slot
    {
        std::unique_ptr<SyncedEntity> entity;
        core::u32                     generation{0};
    };

    engine::Config                          config;
    net::transport::ITransport             &transport;
    const input::ActionTable               &actions;
    ClockSequencer                          clock;
    input::InputManager                     inputs;
    session::SessionManager                 sessions;
    input::InputFrame                       neutral;

    std::vector<Slot>                       slots;
    std::vector<core::u32>                  freeSlots;
    std::unordered_map<core::u32, EntityHandle> byKey;

    core::f64                               now{0.0};
    core::u32                               sendAccumulator{0};
    core::f64                               roundTrip{0.0};
    bool                                    hasRoundTrip{false};

    Impl(const engine::Config &cfg, net::transport::ITransport &t, const input::ActionTable &table)
        : config{cfg}
        , transport{t}
        , actions{table}
        , clock{cfg.serverMode() ? ClockRole::Server : ClockRole::Client, cfg}
        , inputs{table, cfg.inputBatchSize(), cfg.inputSendRate(), cfg.inputHistory()}
        , sessions{table, inputs.localLedger(), cfg.inputHistory(), cfg.predictionMaxFrames()}
        , neutral{table.neutral()}
    {}

    [[nodiscard]] bool server() const noexcept { return clock.role() == ClockRole::Server; }

    /// "server@120" or "peer 2@118", prefixed to the lines logged during a step.
    [[nodiscard]] std::string logLabel() const
    {
        return server() ? std::format("server@{}", clock.tick())
                        : std::format("peer {}@{}", transport.localPeerId(), clock.tick());
    }

    [[nodiscard]] SyncedEntity *resolve(EntityHandle handle) const noexcept
    {
        if (!handle.isValid() || handle.slot() >= slots.size())
        {
            return nullptr;
        }
        const Slot &s = slots[handle.slot()];
        return (s.entity && s.generation == handle.generation()) ? s.entity.get() : nullptr;
    }

    template <typename Fn>
    void forEachEntity(Fn &&fn)
    {
        for (core::u32 i = 0; i < slots.size(); ++i)
        {
            if (slots[i].entity)
            {
                fn(EntityHandle{slots[i].generation, i}, *slots[i].entity);
            }
        }
    }

    [[nodiscard]] core::u32 smoothingTicks() const noexcept
    {
        return static_cast<core::u32>(std::max<core::i64>(1, std::llround(roundTrip)));
    }

    void onConnection(core::PeerId peer, bool connected);
    void consumeInputs();
    void updateCompensation();
    void sendFrames(core::Tick tick);
    void deliver(core::PeerId peer, const SyncedEntity &entity, const OutgoingFrame &out);
    core::ExpectedVoid onStateFrame(net::protocol::Bitstream &stream);
    core::ExpectedVoid onInputBatch(core::PeerId sender, net::protocol::Bitstream &stream);
};

void SyncWorld::Impl::onConnection(core::PeerId peer, bool connected)
{
    if (!server())
    {
        core::Log::info("NET", std::format("{} server {}", connected ? "connected to" : "disconnected from", peer));
        return;
    }

    if (connected)
    {
        auto result = sessions.connect(peer);
        if (core::Log::failed("SESSION", result))
        {
            return;
        }
        session::Session *session = *result;
        forEachEntity([&](EntityHandle handle, SyncedEntity &entity) {
            entity.forgetPeer(core::kBroadcastPeer);
            entity.forgetPeer(peer);
            if (entity.owner() == peer)
            {
                session->addOwned(handle);
            }
        });
        return;
    }

    core::Log::failed("SESSION", sessions.disconnect(peer));
    forEachEntity([&](EntityHandle, SyncedEntity &entity) { entity.forgetPeer(peer); });
}

void SyncWorld::Impl::consumeInputs()
{
    const core::Tick tick = clock.tick();
    sessions.forEach([&](session::Session &session) {
        if (session.isLocal())
        {
            return;
        }

        const input::ConsumedInput consumed = session.ledger().consume();
        if (!consumed.stale && consumed.tickEstimate != core::kNoTick)
        {
            session.recordLatency(static_cast<core::f64>(tick - consumed.tickEstimate));
        }

        for (const auto &block : consumed.frame.owned)
        {
            SyncedEntity *entity = nullptr;
            if (auto it = byKey.find(block.entityKey); it != byKey.end())
            {
                entity = resolve(it->second);
            }
            if (!entity || entity->owner() != session.peer())
            {
                core::Log::warn("SYNC", std::format("peer {} wrote entity {} it does not own",
                                                    session.peer(), block.entityKey));
                continue;
            }
            core::Log::failed("SYNC", entity->applyOwned(tick, block));
        }
    });
}

void SyncWorld::Impl::updateCompensation()
{
    const core::Tick tick = clock.tick();
    forEachEntity([&](EntityHandle, SyncedEntity &entity) {
        TimeDepthCompensator *compensator = entity.compensator();
        if (!compensator)
        {
            return;
        }

        if (!server())
        {
            const auto &history = entity.get(compensator->positionHandle()).history();
            if (!history.empty())
            {
                compensator->apply(entity, history.lastTick(), entity.receivedTimeDepth());
            }
            return;
        }

        const auto point = entity.position(tick);
        if (!point)
        {
            return;
        }

        std::vector<PeerPresence> presences;
        sessions.forEach([&](session::Session &session) {
            if (session.isLocal() || session.peer() == entity.owner())
            {
                return;
            }
            for (EntityHandle owned : session.owned())
            {
                const SyncedEntity *avatar = resolve(owned);
                const auto position = avatar ? avatar->position(tick) : std::nullopt;
                if (position)
                {
                    presences.push_back({session.peer(), *position, session.latencyTicks()});
                    break;
                }
            }
        });

        const TimeDepth depth = ClockSequencer::timeDepth(*point, presences);
        entity.setTimeDepth(depth);
        compensator->apply(entity, tick, depth.ticks);
    });
}

void SyncWorld::Impl::deliver(core::PeerId peer, const SyncedEntity &entity, const OutgoingFrame &out)
{
    net::protocol::StateFrame frame = out.frame;

    if (const session::Session *session = sessions.find(peer))
    {
        const input::PeerInputLedger &ledger = session->ledger();
        if (ledger.lastConsumedId() != core::kNoInputId && !ledger.stale())
        {
            frame.lastConsumedInputId = ledger.lastConsumedId();
        }
    }
    frame.set(net::protocol::FrameFlag::Predicted, entity.owner() == peer && entity.hasPredictedProperties());
    if (entity.lagCompensated())
    {
        frame.timeDepth = static_cast<core::f32>(entity.timeDepthFor(peer));
    }

    const auto bytes = net::protocol::encodeStateFrame(frame);
    const auto result = out.reliable
        ? transport.sendReliable(peer, bytes)
        : transport.sendUnreliable(peer, bytes);
    if (!result)
    {
        core::Log::warn("NET", std::format("send of entity {} to peer {} failed: {}",
                                           entity.key(), peer, result.error().describe()));
    }
}

void SyncWorld::Impl::sendFrames(core::Tick tick)
{
    const auto peers = sessions.remotePeers();
    if (peers.empty())
    {
        return;
    }

    const core::u32 staleness = config.stalenessDelay();
    forEachEntity([&](EntityHandle, SyncedEntity &entity) {
        if (entity.batchable())
        {
            const auto frames = entity.collect(core::kBroadcastPeer, core::kBroadcastPeer, tick, staleness);
            for (core::PeerId peer : peers)
            {
                for (const auto &out : frames)
                {
                    deliver(peer, entity, out);
                }
            }
            return;
        }

        for (core::PeerId peer : peers)
        {
            for (const auto &out : entity.collect(peer, peer, tick, staleness))
            {
                deliver(peer, entity, out);
            }
        }
    });
}

core::ExpectedVoid SyncWorld::Impl::onStateFrame(net::protocol::Bitstream &stream)
{
    const net::protocol::StateFrame frame = TKS_TRY(net::protocol::decodeStateFrame(stream));

    clock.onServerTick(frame.tick, now);

    if (frame.lastConsumedInputId)
    {
        const auto sample = static_cast<core::f64>(clock.inputId() - *frame.lastConsumedInputId);
        roundTrip = hasRoundTrip ? math::Statistics::smooth(roundTrip, sample, core::kLatencySmoothing) : sample;
        hasRoundTrip = true;
    }

    SyncedEntity *entity = nullptr;
    if (auto it = byKey.find(frame.entityKey); it != byKey.end())
    {
        entity = resolve(it->second);
    }
    if (!entity)
    {
        return core::makeError(core::ErrorCode::NotFound, std::format("unknown entity key {}", frame.entityKey));
    }

    TKS_TRY_WITHIN(entity->apply(frame, clock, transport.localPeerId(), smoothingTicks()),
                   std::format("entity {}", frame.entityKey));
    return {};
}

core::ExpectedVoid SyncWorld::Impl::onInputBatch(core::PeerId sender, net::protocol::Bitstream &stream)
{
    session::Session *session = sessions.find(sender);
    if (!session)
    {
        return core::makeError(core::ErrorCode::NotFound, std::format("input batch from unknown peer {}", sender));
    }

    const input::InputBatch batch = TKS_TRY(input::parseInputBatch(stream, actions));
    session->ledger().storeBatch(batch);
    return {};
}

// ========================================================================== //
//  SyncWorld                                                                 //
// ========================================================================== //

SyncWorld::SyncWorld(const engine::Config &config,
                     net::transport::ITransport &transport,
                     const input::ActionTable &actions)
    : _impl{std::make_unique<Impl>(config, transport, actions)}
{
    transport.setReceiveHandler([this](core::PeerId sender, std::span<const core::byte> payload) {
        const core::LogContext context{_impl->logLabel()};
        if (auto result = onPacket(sender, payload); !result)
        {
            const core::LogLevel level = core::isRemoteFault(result.error().code()) ? core::LogLevel::kWarn
                                                                                    : core::LogLevel::kError;
            core::Log::write(level, "NET", std::format("dropped payload from peer {}: {}", sender, result.error().describe()));
        }
    });
    transport.setConnectionHandler([this](core::PeerId peer, bool connected) {
        _impl->onConnection(peer, connected);
    });

    core::Log::info("SYNC", std::format("{} world on transport '{}' at {} Hz",
                                        _impl->server() ? "server" : "client", transport.name(), config.tickRate()));
}

SyncWorld::~SyncWorld()
{
    _impl->transport.setReceiveHandler({});
    _impl->transport.setConnectionHandler({});
}

ClockRole SyncWorld::role() const noexcept { return _impl->clock.role(); }

const engine::Config &SyncWorld::config() const noexcept { return _impl->config; }

EntityHandle SyncWorld::spawn(std::unique_ptr<SyncedEntity> entity)
{
    TKS_VERIFY(entity != nullptr);
    TKS_VERIFY(!_impl->byKey.contains(entity->key()));

    core::u32 slot = 0;
    if (!_impl->freeSlots.empty())
    {
        slot = _impl->freeSlots.back();
        _impl->freeSlots.pop_back();
    }
    else
    {
        TKS_VERIFY(_impl->slots.size() <= EntityHandle::kSlotMask);
        slot = static_cast<core::u32>(_impl->slots.size());
        _impl->slots.emplace_back();
    }

    for (core::usize i = 0; i < entity->propertyCount(); ++i)
    {
        entity->property(i).setDefaultMaxExtrapolation(_impl->config.maxExtrapolation());
    }
    if (!_impl->server() && entity->owner() == core::kLocalPeer)
    {
        entity->setOwner(core::kServerPeer);
    }

    auto &s = _impl->slots[slot];
    s.entity = std::move(entity);
    const EntityHandle handle{s.generation, slot};
    _impl->byKey.emplace(s.entity->key(), handle);

    const core::PeerId owner = s.entity->owner();
    const core::PeerId registry = (owner == _impl->transport.localPeerId()) ? core::kLocalPeer : owner;
    if (session::Session *session = _impl->sessions.find(registry))
    {
        session->addOwned(handle);
    }
    return handle;
}

core::ExpectedVoid SyncWorld::despawn(EntityHandle handle)
{
    SyncedEntity *entity = _impl->resolve(handle);
    if (!entity)
    {
        return core::makeError(core::ErrorCode::NotFound, "stale or null entity handle");
    }

    _impl->byKey.erase(entity->key());
    _impl->sessions.forEach([&](session::Session &session) { session.removeOwned(handle); });

    auto &s = _impl->slots[handle.slot()];
    s.entity.reset();
    s.generation = (s.generation + 1) & EntityHandle::kGenerationMask;
    _impl->freeSlots.push_back(handle.slot());
    return {};
}

SyncedEntity *SyncWorld::get(EntityHandle handle) noexcept { return _impl->resolve(handle); }

const SyncedEntity *SyncWorld::get(EntityHandle handle) const noexcept { return _impl->resolve(handle); }

SyncedEntity *SyncWorld::findByKey(core::u32 key) noexcept
{
    return _impl->resolve(handleOf(key));
}

EntityHandle SyncWorld::handleOf(core::u32 key) const noexcept
{
    const auto it = _impl->byKey.find(key);
    return it != _impl->byKey.end() ? it->second : EntityHandle{};
}

core::ExpectedVoid SyncWorld::setOwner(EntityHandle handle, core::PeerId peer)
{
    SyncedEntity *entity = _impl->resolve(handle);
    if (!entity)
    {
        return core::makeError(core::ErrorCode::NotFound, "stale or null entity handle");
    }

    const core::PeerId previous = entity->owner();
    _impl->sessions.forEach([&](session::Session &session) { session.removeOwned(handle); });

    entity->setOwner(peer);
    entity->forgetPeer(core::kBroadcastPeer);
    entity->forgetPeer(previous);
    entity->forgetPeer(peer);

    const core::PeerId registry = (peer == _impl->transport.localPeerId()) ? core::kLocalPeer : peer;
    if (session::Session *session = _impl->sessions.find(registry))
    {
        session->addOwned(handle);
    }

    core::Log::info("SYNC", std::format("entity {} moved from peer {} to peer {}", entity->key(), previous, peer));
    return {};
}

core::usize SyncWorld::entityCount() const noexcept { return _impl->byKey.size(); }

void SyncWorld::setInputSource(const input::IInputSource *source)
{
    _impl->inputs.setSource(source);
}

void SyncWorld::beginStep(core::f64 now)
{
    Impl &w = *_impl;
    w.now = now;
    w.clock.step(now);
    w.clock.setFraction(0.0);

    const core::LogContext context{w.logLabel()};
    const core::Tick tick = w.clock.tick();

    if (w.server())
    {
        w.inputs.sample(w.clock.inputId(), tick);
        w.consumeInputs();
        w.forEachEntity([&](EntityHandle, SyncedEntity &entity) { entity.pushOwned(tick); });
        return;
    }

    const core::Tick presented = w.clock.synchronized()
        ? static_cast<core::Tick>(std::floor(w.clock.renderTick()))
        : core::kNoTick;
    w.inputs.sample(w.clock.inputId(), presented);

    const core::PeerId local = w.transport.localPeerId();
    const core::f64 simulation = static_cast<core::f64>(tick - 1);
    const core::f64 display = w.clock.renderTick();
    w.forEachEntity([&](EntityHandle, SyncedEntity &entity) {
        entity.stepPrediction();
        entity.pushDisplay(simulation, display, local);
    });
}

void SyncWorld::endStep(core::f64 now)
{
    Impl &w = *_impl;
    w.now = now;
    const core::LogContext context{w.logLabel()};
    const core::Tick tick = w.clock.tick();

    if (w.server())
    {
        w.forEachEntity([&](EntityHandle, SyncedEntity &entity) { entity.captureAuthoritative(tick); });
        w.updateCompensation();

        w.sendAccumulator += w.config.serverSendRate();
        if (w.sendAccumulator >= w.config.tickRate())
        {
            w.sendAccumulator -= w.config.tickRate();
            w.sendFrames(tick);
        }
        return;
    }

    const core::PeerId local = w.transport.localPeerId();
    const core::InputId inputId = w.clock.inputId();
    std::vector<input::OwnedBlock> owned;
    w.forEachEntity([&](EntityHandle, SyncedEntity &entity) {
        entity.captureLocal(tick, inputId, local);
        if (auto block = entity.ownedBlock(tick, local))
        {
            owned.push_back(std::move(*block));
        }
    });
    if (!owned.empty())
    {
        w.inputs.attachOwned(inputId, std::move(owned));
    }

    w.updateCompensation();

    if (auto batch = w.inputs.pollBatch(now))
    {
        if (auto result = w.transport.sendUnreliable(core::kServerPeer, *batch); !result)
        {
            core::Log::warn("NET", std::format("input batch send failed: {}", result.error().describe()));
        }
    }
}

void SyncWorld::render(core::f64 alpha)
{
    Impl &w = *_impl;
    w.clock.setFraction(alpha);
    if (w.server())
    {
        return;
    }

    const core::PeerId local = w.transport.localPeerId();
    const core::f64 simulation = static_cast<core::f64>(w.clock.tick());
    const core::f64 display = w.clock.renderTick();
    w.forEachEntity([&](EntityHandle, SyncedEntity &entity) {
        entity.pushDisplay(simulation, display, local);
    });
}

core::ExpectedVoid SyncWorld::onPacket(core::PeerId sender, std::span<const core::byte> payload)
{
    net::protocol::Bitstream stream{payload};
    const net::protocol::PacketType type = TKS_TRY(net::protocol::readHeader(stream));

    switch (type)
    {
        case net::protocol::PacketType::StateFrame:
            if (_impl->server())
            {
                return core::makeError(core::ErrorCode::ProtocolViolation,
                                       std::format("state frame sent to the server by peer {}", sender));
            }
            return _impl->onStateFrame(stream);

        case net::protocol::PacketType::InputBatch:
            if (!_impl->server())
            {
                return core::makeError(core::ErrorCode::ProtocolViolation, "input batch received by a client");
            }
            return _impl->onInputBatch(sender, stream);
    }
    return core::makeError(core::ErrorCode::ProtocolViolation, "unhandled packet type");
}

const input::InputFrame &SyncWorld::input(core::PeerId peer) const
{
    if (peer == core::kLocalPeer)
    {
        const input::InputFrame *frame = _impl->inputs.localLedger().find(_impl->inputs.lastSampledId());
        return frame ? *frame : _impl->neutral;
    }
    const session::Session *session = _impl->sessions.find(peer);
    return session ? session->ledger().current() : _impl->neutral;
}

bool SyncWorld::inputStale(core::PeerId peer) const
{
    if (peer == core::kLocalPeer)
    {
        return false;
    }
    const session::Session *session = _impl->sessions.find(peer);
    return !session || session->ledger().stale();
}

const ClockSequencer &SyncWorld::clock() const noexcept { return _impl->clock; }

session::SessionManager &SyncWorld::sessions() noexcept { return _impl->sessions; }

const session::SessionManager &SyncWorld::sessions() const noexcept { return _impl->sessions; }

core::f64 SyncWorld::roundTripTicks() const noexcept { return _impl->roundTrip; }

core::PeerId SyncWorld::localPeer() const noexcept { return _impl->transport.localPeerId(); }

} // namespace tks::sync
