/**
 * @file SyncedEntity.cpp
 * @brief SyncedEntity implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/SyncedEntity.hpp>
#include <tks/core/Log.hpp>

#include <algorithm>
#include <format>

namespace tks::sync {

// ========================================================================== //
//  Builder                                                                   //
// ========================================================================== //

SyncedEntity::Builder::Builder(std::string name)
    : _name{std::move(name)}
{}

SyncedEntity::Builder &SyncedEntity::Builder::key(core::u32 networkKey) noexcept
{
    _key = networkKey;
    return *this;
}

SyncedEntity::Builder &SyncedEntity::Builder::belongsTo(core::PeerId peer) noexcept
{
    _owner = peer;
    return *this;
}

SyncedEntity::Builder &SyncedEntity::Builder::gameObject(IGameObject *object) noexcept
{
    _object = object;
    return *this;
}

SyncedEntity::Builder &SyncedEntity::Builder::lagCompensated(PropertyHandle<math::Vec3f> position,
                                                             PropertyHandle<math::Quatf> rotation)
{
    TKS_VERIFY(position.isValid() && position.index < _properties.size());
    TKS_VERIFY(_properties[position.index]->type() == net::protocol::ValueType::Vec3);
    if (rotation.isValid())
    {
        TKS_VERIFY(rotation.index < _properties.size());
        TKS_VERIFY(_properties[rotation.index]->type() == net::protocol::ValueType::Quat);
    }
    _compensator.emplace(position, rotation);
    return *this;
}

std::unique_ptr<SyncedEntity> SyncedEntity::Builder::build(core::usize historyCapacity)
{
    TKS_VERIFY(!_built);
    TKS_VERIFY(historyCapacity > 0);
    _built = true;

    std::unique_ptr<SyncedEntity> entity{new SyncedEntity()};
    entity->_name = std::move(_name);
    entity->_key = _key;
    entity->_owner = _owner;
    entity->_object = _object;
    entity->_compensator = _compensator;
    entity->_properties = std::move(_properties);

    for (core::usize i = 0; i < entity->_properties.size(); ++i)
    {
        IProperty &p = *entity->_properties[i];
        const bool inserted = entity->_byName.emplace(p.name(), static_cast<core::u16>(i)).second;
        TKS_VERIFY(inserted);

        p.resize(historyCapacity);
        entity->_ordered.push_back(&p);
        entity->_hasPredicted = entity->_hasPredicted || p.options().predicted;
        if (p.strategy() == SyncStrategy::ClientOwned)
        {
            ++entity->_clientOwnedCount;
        }
    }

    std::stable_sort(entity->_ordered.begin(), entity->_ordered.end(),
                     [](const IProperty *a, const IProperty *b) {
                         return static_cast<core::u8>(a->strategy()) < static_cast<core::u8>(b->strategy());
                     });
    for (core::usize i = 0; i < entity->_ordered.size(); ++i)
    {
        entity->_ordered[i]->setWireIndex(static_cast<core::u8>(i));
        core::Log::debug("SYNC", std::format("{}.{}: {} at wire index {}", entity->_name,
                                             entity->_ordered[i]->name(), toString(entity->_ordered[i]->strategy()), i));
    }

    return entity;
}

// ========================================================================== //
//  Properties                                                                //
// ========================================================================== //

SyncedEntity::~SyncedEntity() = default;

IProperty &SyncedEntity::property(core::usize index)
{
    TKS_VERIFY(index < _properties.size());
    return *_properties[index];
}

const IProperty &SyncedEntity::property(core::usize index) const
{
    TKS_VERIFY(index < _properties.size());
    return *_properties[index];
}

const IProperty &SyncedEntity::wireProperty(core::u8 index) const
{
    TKS_VERIFY(index < _ordered.size());
    return *_ordered[index];
}

IProperty *SyncedEntity::find(std::string_view name) noexcept
{
    const auto it = _byName.find(std::string{name});
    return it != _byName.end() ? _properties[it->second].get() : nullptr;
}

std::optional<math::Vec3f> SyncedEntity::position(core::Tick tick) const
{
    if (_object)
    {
        return _object->worldPosition();
    }
    if (_compensator)
    {
        const auto &history = get(_compensator->positionHandle()).history();
        if (!history.empty())
        {
            return history.at(tick);
        }
    }
    return std::nullopt;
}

// ========================================================================== //
//  Server                                                                    //
// ========================================================================== //

bool SyncedEntity::batchable() const noexcept
{
    if (_hasPredicted && _owner != core::kLocalPeer)
    {
        return false;
    }
    return !lagCompensated() && _clientOwnedCount == 0;
}

net::protocol::StateFrame SyncedEntity::makeFrame(core::Tick now,
                                                  const std::vector<net::protocol::IndexedValue> &values) const
{
    net::protocol::StateFrame frame;
    frame.entityKey = _key;
    frame.tick = now;
    frame.assign(values);
    return frame;
}

std::vector<OutgoingFrame> SyncedEntity::collect(core::PeerId stateKey,
                                                 core::PeerId recipient,
                                                 core::Tick now,
                                                 core::u32 stalenessDelay)
{
    SendState &state = _sendStates[stateKey];
    if (state.lastReliable.size() != _ordered.size())
    {
        state.lastReliable.assign(_ordered.size(), core::kNoTick);
    }

    std::vector<net::protocol::IndexedValue> reliable;
    std::vector<net::protocol::IndexedValue> unreliable;

    for (IProperty *p : _ordered)
    {
        if (p->empty())
        {
            continue;
        }

        const core::u8 index = p->wireIndex();
        core::Tick &last = state.lastReliable[index];

        switch (p->strategy())
        {
            case SyncStrategy::NoSync:
                break;

            case SyncStrategy::Unreliable:
                unreliable.push_back({index, p->valueAt(now)});
                break;

            case SyncStrategy::Auto:
                if (p->changed(last, now))
                {
                    if (now - p->lastChangedTick() >= static_cast<core::Tick>(stalenessDelay))
                    {
                        reliable.push_back({index, p->valueAt(now)});
                        last = now;
                    }
                    else
                    {
                        unreliable.push_back({index, p->valueAt(now)});
                    }
                }
                break;

            case SyncStrategy::ClientOwned:
                if (recipient == _owner)
                {
                    break;
                }
                [[fallthrough]];
            case SyncStrategy::Reliable:
                if (p->changed(last, now))
                {
                    reliable.push_back({index, p->valueAt(now)});
                    last = now;
                }
                break;
        }
    }

    std::vector<OutgoingFrame> out;
    if (!unreliable.empty())
    {
        OutgoingFrame f{makeFrame(now, unreliable), false};
        f.frame.set(net::protocol::FrameFlag::UnchangedElsewhere, true);
        out.push_back(std::move(f));
    }
    if (!reliable.empty())
    {
        OutgoingFrame f{makeFrame(now, reliable), true};
        f.frame.set(net::protocol::FrameFlag::UnchangedElsewhere, unreliable.empty());
        out.push_back(std::move(f));
    }

    if (!out.empty())
    {
        state.heartbeatPending = true;
    }
    else if (state.heartbeatPending)
    {
        OutgoingFrame f{makeFrame(now, {}), true};
        f.frame.set(net::protocol::FrameFlag::UnchangedElsewhere, true);
        out.push_back(std::move(f));
        state.heartbeatPending = false;
    }
    return out;
}

void SyncedEntity::forgetPeer(core::PeerId peer)
{
    _sendStates.erase(peer);
}

void SyncedEntity::captureAuthoritative(core::Tick tick)
{
    for (auto &p : _properties)
    {
        if (p->strategy() == SyncStrategy::ClientOwned && _owner != core::kLocalPeer)
        {
            continue;
        }
        p->pull(tick, true);
    }
}

core::ExpectedVoid SyncedEntity::applyOwned(core::Tick tick, const input::OwnedBlock &block)
{
    if (block.values.size() != _clientOwnedCount)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("entity {} expects {} client-owned values, got {}",
                                           _key, _clientOwnedCount, block.values.size()));
    }

    core::usize next = 0;
    for (IProperty *p : _ordered)
    {
        if (p->strategy() != SyncStrategy::ClientOwned)
        {
            continue;
        }
        if (net::protocol::typeOf(block.values[next]) != p->type())
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("client-owned value {} of entity {} has the wrong type", next, _key));
        }
        ++next;
    }

    next = 0;
    for (IProperty *p : _ordered)
    {
        if (p->strategy() == SyncStrategy::ClientOwned)
        {
            TKS_TRY_VOID(p->writeValue(tick, block.values[next++]));
        }
    }
    return {};
}

void SyncedEntity::pushOwned(core::Tick tick)
{
    if (_owner == core::kLocalPeer)
    {
        return;
    }
    for (IProperty *p : _ordered)
    {
        if (p->strategy() == SyncStrategy::ClientOwned)
        {
            p->push(static_cast<core::f64>(tick));
        }
    }
}

core::f64 SyncedEntity::timeDepthFor(core::PeerId peer) const noexcept
{
    return (peer == _timeDepth.closest) ? _timeDepth.ticks : 0.0;
}

// ========================================================================== //
//  Client                                                                    //
// ========================================================================== //

core::ExpectedVoid SyncedEntity::apply(const net::protocol::StateFrame &frame,
                                       const ClockSequencer &clock,
                                       core::PeerId localPeer,
                                       core::u32 smoothingTicks)
{
    const auto entries = frame.entries();
    for (const auto &e : entries)
    {
        if (e.index >= _ordered.size())
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("entity {} has no property at index {}", _key, e.index));
        }
        if (net::protocol::typeOf(e.value) != _ordered[e.index]->type())
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("property '{}' of entity {} received a mistyped value",
                                               _ordered[e.index]->name(), _key));
        }
    }

    const bool mine = ownedLocally(localPeer);
    const auto isLocalValue = [&](const IProperty &p) {
        return p.strategy() == SyncStrategy::NoSync
            || (p.strategy() == SyncStrategy::ClientOwned && mine);
    };

    if (_compensator)
    {
        _receivedDepth = frame.timeDepth;
    }

    const bool confirmed = frame.has(net::protocol::FrameFlag::Predicted);
    for (IProperty *p : _ordered)
    {
        if (isLocalValue(*p))
        {
            continue;
        }
        const PredictionState before = p->prediction().state();
        if (p->prediction().onServerFrame(confirmed && p->options().predicted,
                                          frame.lastConsumedInputId, smoothingTicks))
        {
            p->rollback(frame.tick);
        }
        if (p->prediction().state() != before)
        {
            core::Log::debug("SYNC", std::format("{}.{}: prediction {} -> {}", _name, p->name(),
                                                 toString(before), toString(p->prediction().state())));
        }
    }

    std::optional<core::Tick> predictedTick;
    if (frame.lastConsumedInputId)
    {
        predictedTick = clock.tickForInput(*frame.lastConsumedInputId);
    }

    std::vector<bool> seen(_ordered.size(), false);
    for (const auto &e : entries)
    {
        IProperty *p = _ordered[e.index];
        seen[e.index] = true;
        if (isLocalValue(*p))
        {
            continue;
        }
        if (p->prediction().active())
        {
            if (predictedTick)
            {
                TKS_TRY_VOID(p->reconcile(*predictedTick, e.value));
            }
            continue;
        }
        TKS_TRY_VOID(p->writeValue(frame.tick, e.value));
    }

    if (frame.has(net::protocol::FrameFlag::UnchangedElsewhere))
    {
        for (core::usize i = 0; i < _ordered.size(); ++i)
        {
            IProperty *p = _ordered[i];
            if (seen[i] || isLocalValue(*p) || p->prediction().active())
            {
                continue;
            }
            p->replicateForward(frame.tick);
        }
    }
    return {};
}

void SyncedEntity::pushDisplay(core::f64 simulationTick, core::f64 renderTick, core::PeerId localPeer)
{
    const bool mine = ownedLocally(localPeer);
    for (IProperty *p : _ordered)
    {
        if (p->strategy() == SyncStrategy::NoSync || (p->strategy() == SyncStrategy::ClientOwned && mine))
        {
            continue;
        }
        const core::f64 w = p->prediction().weight();
        if (w >= 1.0)
        {
            p->push(simulationTick);
        }
        else if (w <= 0.0)
        {
            p->push(renderTick);
        }
        else
        {
            p->push(renderTick + w * (simulationTick - renderTick));
        }
    }
}

void SyncedEntity::captureLocal(core::Tick tick, core::InputId inputId, core::PeerId localPeer)
{
    const bool mine = ownedLocally(localPeer);
    for (IProperty *p : _ordered)
    {
        switch (p->strategy())
        {
            case SyncStrategy::NoSync:
                p->pull(tick, true);
                break;

            case SyncStrategy::ClientOwned:
                if (mine)
                {
                    p->pull(tick, true);
                }
                break;

            case SyncStrategy::Unreliable:
            case SyncStrategy::Auto:
            case SyncStrategy::Reliable:
            {
                const bool wasActive = p->prediction().active();
                if (p->pull(tick, wasActive))
                {
                    p->prediction().onLocalWrite(inputId);
                    if (!wasActive)
                    {
                        core::Log::debug("SYNC", std::format("{}.{}: local write at input {}, prediction forced on",
                                                             _name, p->name(), inputId));
                    }
                }
                break;
            }
        }
    }
}

std::optional<input::OwnedBlock> SyncedEntity::ownedBlock(core::Tick tick, core::PeerId localPeer) const
{
    if (_clientOwnedCount == 0 || !ownedLocally(localPeer))
    {
        return std::nullopt;
    }

    input::OwnedBlock block;
    block.entityKey = _key;
    for (const IProperty *p : _ordered)
    {
        if (p->strategy() != SyncStrategy::ClientOwned)
        {
            continue;
        }
        if (p->empty())
        {
            return std::nullopt;
        }
        block.values.push_back(p->valueAt(tick));
    }
    return block;
}

void SyncedEntity::stepPrediction()
{
    for (auto &p : _properties)
    {
        p->prediction().step();
    }
}

} // namespace tks::sync
