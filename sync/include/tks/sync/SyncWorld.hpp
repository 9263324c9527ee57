/**
 * @file SyncWorld.hpp
 * @brief Façade orchestrating one synchronization session per process.
 *
 * A SyncWorld owns the clock, the local input manager, the peer sessions
 * and every SyncedEntity, and talks to the network through an
 * ITransport.  The game calls beginStep() before and endStep() after its
 * own fixed-step logic, and render() once per rendered frame.
 *
 * Server step:
 *   beginStep: advance the clock, consume one input frame per peer,
 *              apply client-owned values.
 *   endStep:   capture the game state, refresh lag compensation, send
 *              state frames when the send cadence is due.
 *
 * Client step:
 *   beginStep: advance the clock, sample local input, push interpolated
 *              or predicted values to the game.
 *   endStep:   capture local writes, attach client-owned values to the
 *              input frame, send an input batch when due.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_SYNCWORLD_HPP
    #define TKS_SYNC_SYNCWORLD_HPP

#include <tks/sync/ClockSequencer.hpp>
#include <tks/sync/EntityHandle.hpp>
#include <tks/sync/SyncedEntity.hpp>
#include <tks/sync/session/SessionManager.hpp>
#include <tks/input/ActionTable.hpp>
#include <tks/input/IInputSource.hpp>
#include <tks/input/InputFrame.hpp>
#include <tks/net/transport/ITransport.hpp>
#include <tks/engine/Config.hpp>
#include <tks/core/Expected.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <memory>
#include <span>

namespace tks::sync {

class SyncWorld final : public core::Pinned<SyncWorld>
{
public:
    /**
     * @param config    Validated configuration; serverMode() selects the role.
     * @param transport Transport to send through; must outlive the world.
     * @param actions   Action table shared by every peer.
     */
    SyncWorld(const engine::Config &config,
              net::transport::ITransport &transport,
              const input::ActionTable &actions);
    ~SyncWorld();

    [[nodiscard]] ClockRole             role()   const noexcept;
    [[nodiscard]] const engine::Config &config() const noexcept;

    // ------------------------------------------------------------------ //
    //  Entities                                                          //
    // ------------------------------------------------------------------ //

    /**
     * @brief Take ownership of an entity.
     *
     * Two entities with the same network key are a fatal error.  Properties
     * without an explicit extrapolation cap take Config::maxExtrapolation().
     * On a client, an entity built without an owner belongs to the server.
     */
    EntityHandle spawn(std::unique_ptr<SyncedEntity> entity);

    [[nodiscard]] core::ExpectedVoid despawn(EntityHandle handle);

    [[nodiscard]] SyncedEntity       *get(EntityHandle handle) noexcept;
    [[nodiscard]] const SyncedEntity *get(EntityHandle handle) const noexcept;

    [[nodiscard]] SyncedEntity *findByKey(core::u32 key) noexcept;
    [[nodiscard]] EntityHandle  handleOf(core::u32 key) const noexcept;

    /** @brief Move an entity to another peer, updating the peer registries. */
    [[nodiscard]] core::ExpectedVoid setOwner(EntityHandle handle, core::PeerId peer);

    [[nodiscard]] core::usize entityCount() const noexcept;

    // ------------------------------------------------------------------ //
    //  Step                                                              //
    // ------------------------------------------------------------------ //

    void setInputSource(const input::IInputSource *source);

    void beginStep(core::f64 now);
    void endStep(core::f64 now);

    /** @brief Set the render fraction and refresh the displayed values. */
    void render(core::f64 alpha);

    /**
     * @brief Handle a payload received from @p sender.
     *
     * Called by the transport receive handler; exposed for tests.
     */
    [[nodiscard]] core::ExpectedVoid onPacket(core::PeerId sender, std::span<const core::byte> payload);

    // ------------------------------------------------------------------ //
    //  Queries                                                           //
    // ------------------------------------------------------------------ //

    /**
     * @brief Input frame of @p peer for the current step.
     *
     * kLocalPeer yields the locally sampled frame; an unknown peer a
     * neutral frame.
     */
    [[nodiscard]] const input::InputFrame &input(core::PeerId peer) const;

    /** @brief The peer's input was substituted by a neutral frame this step. */
    [[nodiscard]] bool inputStale(core::PeerId peer) const;

    [[nodiscard]] const ClockSequencer &clock() const noexcept;

    [[nodiscard]] session::SessionManager       &sessions() noexcept;
    [[nodiscard]] const session::SessionManager &sessions() const noexcept;

    /** @brief Smoothed input round trip in ticks (client). */
    [[nodiscard]] core::f64 roundTripTicks() const noexcept;

    [[nodiscard]] core::PeerId localPeer() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tks::sync

#endif // TKS_SYNC_SYNCWORLD_HPP
