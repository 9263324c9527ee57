/**
 * @file SyncedEntity.hpp
 * @brief Ordered set of historized properties attached to one game object.
 *
 * On the server a SyncedEntity captures the authoritative game state into
 * its histories and builds the state frames of each send cycle.  On a
 * client it is the shadow of the server entity: frames are written into
 * the histories and interpolated values are pushed back to the game,
 * except for properties under client-side prediction, which are
 * reconciled instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_SYNCED_ENTITY_HPP
    #define TKS_SYNC_SYNCED_ENTITY_HPP

#include <tks/sync/ClockSequencer.hpp>
#include <tks/sync/IGameObject.hpp>
#include <tks/sync/Property.hpp>
#include <tks/sync/PropertyOptions.hpp>
#include <tks/sync/TimeDepthCompensator.hpp>
#include <tks/input/InputFrame.hpp>
#include <tks/net/protocol/StateFrame.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Expected.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tks::sync {

/**
 * @struct OutgoingFrame
 * @brief A sub-frame produced by a send cycle and the channel it travels on.
 */
struct OutgoingFrame
{
    net::protocol::StateFrame frame;
    bool                      reliable{false};
};

class SyncedEntity final : public core::NonCopyable<SyncedEntity>
{
public:
    /**
     * @class Builder
     * @brief Declares the properties of an entity once, before any data flows.
     */
    class Builder
    {
    public:
        explicit Builder(std::string name);

        /**
         * @brief Declare a property.
         * @return Typed handle holding the declaration index.
         */
        template <typename T>
        [[nodiscard]] PropertyHandle<T> add(std::string name, PropertyOptions options = {});

        /** @brief Network key shared by the server and client copies. */
        Builder &key(core::u32 networkKey) noexcept;

        /** @brief Peer the entity belongs to; kLocalPeer (default) is this process. */
        Builder &belongsTo(core::PeerId peer) noexcept;

        Builder &gameObject(IGameObject *object) noexcept;

        /** @brief Enable lag compensation driven by the given transform properties. */
        Builder &lagCompensated(PropertyHandle<math::Vec3f> position, PropertyHandle<math::Quatf> rotation = {});

        /**
         * @brief Freeze the property ordering and size every history.
         *
         * The builder is spent afterwards.
         */
        [[nodiscard]] std::unique_ptr<SyncedEntity> build(core::usize historyCapacity);

    private:
        std::string                             _name;
        core::u32                               _key{0};
        core::PeerId                            _owner{core::kLocalPeer};
        IGameObject                            *_object{nullptr};
        std::optional<TimeDepthCompensator>     _compensator;
        std::vector<std::unique_ptr<IProperty>> _properties;
        bool                                    _built{false};
    };

    ~SyncedEntity();

    // ------------------------------------------------------------------ //
    //  Identity and properties                                           //
    // ------------------------------------------------------------------ //

    [[nodiscard]] const std::string &name()       const noexcept { return _name; }
    [[nodiscard]] core::u32          key()        const noexcept { return _key; }
    [[nodiscard]] core::PeerId       owner()      const noexcept { return _owner; }
    [[nodiscard]] IGameObject       *gameObject() const noexcept { return _object; }

    /** @brief Ownership changes go through SyncWorld::setOwner(). */
    void setOwner(core::PeerId peer) noexcept { _owner = peer; }

    [[nodiscard]] core::usize propertyCount() const noexcept { return _properties.size(); }

    /** @brief Property by declaration index. */
    [[nodiscard]] IProperty       &property(core::usize index);
    [[nodiscard]] const IProperty &property(core::usize index) const;

    /** @brief Property at a position of the wire ordering. */
    [[nodiscard]] const IProperty &wireProperty(core::u8 index) const;

    [[nodiscard]] IProperty *find(std::string_view name) noexcept;

    template <typename T>
    [[nodiscard]] Property<T> &get(PropertyHandle<T> handle);

    template <typename T>
    [[nodiscard]] const Property<T> &get(PropertyHandle<T> handle) const;

    /**
     * @brief Bind a property to a game field.
     *
     * The getter is read at the end of each step, the setter receives the
     * interpolated or predicted value at the start of each step.
     */
    template <typename T>
    void bindAutoSync(PropertyHandle<T> handle,
                      typename Property<T>::Getter getter,
                      typename Property<T>::Setter setter);

    [[nodiscard]] bool hasPredictedProperties()   const noexcept { return _hasPredicted; }
    [[nodiscard]] bool hasClientOwnedProperties() const noexcept { return _clientOwnedCount > 0; }
    [[nodiscard]] bool lagCompensated()           const noexcept { return _compensator.has_value(); }

    [[nodiscard]] TimeDepthCompensator       *compensator()       noexcept { return _compensator ? &*_compensator : nullptr; }
    [[nodiscard]] const TimeDepthCompensator *compensator() const noexcept { return _compensator ? &*_compensator : nullptr; }

    /**
     * @brief World position used for time-depth distance checks.
     *
     * The game object when there is one, the compensated position
     * history otherwise.
     */
    [[nodiscard]] std::optional<math::Vec3f> position(core::Tick tick) const;

    // ------------------------------------------------------------------ //
    //  Server                                                            //
    // ------------------------------------------------------------------ //

    /**
     * @brief Whether one frame set can be shared by every peer.
     *
     * False when the owner predicts the entity, when the time depth
     * differs per peer, or when client-owned values must skip their owner.
     */
    [[nodiscard]] bool batchable() const noexcept;

    /**
     * @brief Build the sub-frames of one send cycle.
     *
     * @param stateKey  Peer whose reliable bookkeeping is used; kBroadcastPeer
     *                  for the shared state of a batchable entity.
     * @param recipient Receiving peer, used to skip client-owned values of
     *                  their owner.
     * @param now       Current server tick.
     * @param stalenessDelay Ticks an auto property must stay unchanged
     *                  before its reliable send.
     */
    [[nodiscard]] std::vector<OutgoingFrame> collect(core::PeerId stateKey,
                                                     core::PeerId recipient,
                                                     core::Tick now,
                                                     core::u32 stalenessDelay);

    /** @brief Drop the send bookkeeping of @p peer; everything is resent to it. */
    void forgetPeer(core::PeerId peer);

    /** @brief Store every bound game field at @p tick. */
    void captureAuthoritative(core::Tick tick);

    /** @brief Write client-owned values received from the owner at @p tick. */
    [[nodiscard]] core::ExpectedVoid applyOwned(core::Tick tick, const input::OwnedBlock &block);

    /** @brief Push client-owned values held at @p tick to the game fields. */
    void pushOwned(core::Tick tick);

    void setTimeDepth(TimeDepth depth) noexcept { _timeDepth = depth; }
    [[nodiscard]] const TimeDepth &timeDepth() const noexcept { return _timeDepth; }

    /** @brief Depth stamped in frames for @p peer: the closest observer gets it, others 0. */
    [[nodiscard]] core::f64 timeDepthFor(core::PeerId peer) const noexcept;

    // ------------------------------------------------------------------ //
    //  Client                                                            //
    // ------------------------------------------------------------------ //

    /**
     * @brief Apply a state frame received from the server.
     *
     * @param frame          Decoded frame for this entity.
     * @param clock          Client clock, maps the frame's input id to a local tick.
     * @param localPeer      This client's peer id.
     * @param smoothingTicks Length of the prediction exit ramp.
     */
    [[nodiscard]] core::ExpectedVoid apply(const net::protocol::StateFrame &frame,
                                           const ClockSequencer &clock,
                                           core::PeerId localPeer,
                                           core::u32 smoothingTicks);

    /**
     * @brief Push display values to the bound game fields.
     *
     * Predicted properties receive the value simulated at
     * @p simulationTick, others the interpolated value at @p renderTick,
     * properties leaving prediction a blend of both.
     */
    void pushDisplay(core::f64 simulationTick, core::f64 renderTick, core::PeerId localPeer);

    /**
     * @brief Read the bound game fields after local game logic ran.
     *
     * A field that differs from the value pushed into it is a local
     * write: prediction of that property is forced on until the server
     * consumed @p inputId.
     */
    void captureLocal(core::Tick tick, core::InputId inputId, core::PeerId localPeer);

    /** @brief Client-owned values to ship with the input of this step. */
    [[nodiscard]] std::optional<input::OwnedBlock> ownedBlock(core::Tick tick, core::PeerId localPeer) const;

    /** @brief Advance every prediction exit ramp by one step. */
    void stepPrediction();

    /** @brief Time depth received from the server for this client. */
    [[nodiscard]] core::f64 receivedTimeDepth() const noexcept { return _receivedDepth; }

private:
    struct SendState
    {
        std::vector<core::Tick> lastReliable; ///< Per wire index.
        bool                    heartbeatPending{true};
    };

    SyncedEntity() = default;

    [[nodiscard]] bool ownedLocally(core::PeerId localPeer) const noexcept
    {
        return _owner == core::kLocalPeer || _owner == localPeer;
    }

    [[nodiscard]] net::protocol::StateFrame makeFrame(core::Tick now,
                                                      const std::vector<net::protocol::IndexedValue> &values) const;

    std::string                             _name;
    core::u32                               _key{0};
    core::PeerId                            _owner{core::kLocalPeer};
    IGameObject                            *_object{nullptr};
    std::vector<std::unique_ptr<IProperty>> _properties;
    std::vector<IProperty *>                _ordered;
    std::unordered_map<std::string, core::u16> _byName;
    std::optional<TimeDepthCompensator>     _compensator;
    std::unordered_map<core::PeerId, SendState> _sendStates;
    TimeDepth                               _timeDepth;
    core::f64                               _receivedDepth{0.0};
    core::usize                             _clientOwnedCount{0};
    bool                                    _hasPredicted{false};
};

// ========================================================================== //
//  Template members                                                          //
// ========================================================================== //

template <typename T>
PropertyHandle<T> SyncedEntity::Builder::add(std::string name, PropertyOptions options)
{
    TKS_VERIFY(!_built);
    TKS_VERIFY(_properties.size() < core::kMaxProperties);

    const auto index = static_cast<core::u16>(_properties.size());
    _properties.push_back(std::make_unique<Property<T>>(std::move(name), options));
    return PropertyHandle<T>{index};
}

template <typename T>
Property<T> &SyncedEntity::get(PropertyHandle<T> handle)
{
    TKS_VERIFY(handle.index < _properties.size());
    IProperty &base = *_properties[handle.index];
    TKS_VERIFY(base.type() == net::protocol::ValueTypeOf<T>::value);
    return static_cast<Property<T> &>(base);
}

template <typename T>
const Property<T> &SyncedEntity::get(PropertyHandle<T> handle) const
{
    TKS_VERIFY(handle.index < _properties.size());
    const IProperty &base = *_properties[handle.index];
    TKS_VERIFY(base.type() == net::protocol::ValueTypeOf<T>::value);
    return static_cast<const Property<T> &>(base);
}

template <typename T>
void SyncedEntity::bindAutoSync(PropertyHandle<T> handle,
                                typename Property<T>::Getter getter,
                                typename Property<T>::Setter setter)
{
    get(handle).bind(std::move(getter), std::move(setter));
}

} // namespace tks::sync

#endif // TKS_SYNC_SYNCED_ENTITY_HPP
