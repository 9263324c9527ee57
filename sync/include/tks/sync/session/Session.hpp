/**
 * @file Session.hpp
 * @brief Per-peer synchronization state.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_SESSION_SESSION_HPP
    #define TKS_SYNC_SESSION_SESSION_HPP

#include <tks/sync/EntityHandle.hpp>
#include <tks/input/ActionTable.hpp>
#include <tks/input/PeerInputLedger.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <memory>
#include <vector>

namespace tks::sync::session {

/**
 * @class Session
 * @brief A peer's input ledger, smoothed latency and owned entities.
 *
 * Remote sessions own their ledger.  The local session (peer 0) borrows
 * the ledger of the InputManager that samples it.
 */
class Session final : public core::NonCopyable<Session>
{
public:
    /** @brief Remote peer: creates its ledger. */
    Session(core::PeerId peer,
            const input::ActionTable &table,
            core::u32 inputHistory,
            core::u32 predictionMaxFrames);

    /** @brief Local peer: borrows @p ledger, which must outlive the session. */
    Session(core::PeerId peer, input::PeerInputLedger &ledger);

    ~Session();

    [[nodiscard]] core::PeerId peer()    const noexcept { return _peer; }
    [[nodiscard]] bool         isLocal() const noexcept { return _peer == core::kLocalPeer; }

    [[nodiscard]] input::PeerInputLedger       &ledger()       noexcept { return *_ledger; }
    [[nodiscard]] const input::PeerInputLedger &ledger() const noexcept { return *_ledger; }

    /** @brief Feed a latency measurement in ticks into the moving average. */
    void recordLatency(core::f64 ticks) noexcept;

    /** @brief Smoothed latency in ticks; 0 before the first measurement. */
    [[nodiscard]] core::f64 latencyTicks() const noexcept { return _latency; }

    void addOwned(EntityHandle handle);
    void removeOwned(EntityHandle handle);

    [[nodiscard]] bool owns(EntityHandle handle) const noexcept;
    [[nodiscard]] const std::vector<EntityHandle> &owned() const noexcept { return _owned; }

private:
    core::PeerId                            _peer;
    std::unique_ptr<input::PeerInputLedger> _storage;
    input::PeerInputLedger                 *_ledger;
    core::f64                               _latency{0.0};
    bool                                    _hasLatency{false};
    std::vector<EntityHandle>               _owned;
};

} // namespace tks::sync::session

#endif // TKS_SYNC_SESSION_SESSION_HPP
