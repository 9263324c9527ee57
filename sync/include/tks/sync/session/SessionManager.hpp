/**
 * @file SessionManager.hpp
 * @brief Registry of the peers taking part in a synchronization session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_SESSION_SESSIONMANAGER_HPP
    #define TKS_SYNC_SESSION_SESSIONMANAGER_HPP

#include <tks/sync/session/Session.hpp>
#include <tks/core/Expected.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <functional>
#include <memory>
#include <vector>

namespace tks::sync::session {

/**
 * @class SessionManager
 * @brief Session registry keyed by peer id.
 *
 * The local session (peer 0) is created with the manager and can never
 * be disconnected.  Disconnecting a remote peer frees its ledger at once.
 * Iteration follows increasing peer ids.
 */
class SessionManager final : public core::NonCopyable<SessionManager>
{
public:
    SessionManager(const input::ActionTable &table,
                   input::PeerInputLedger &localLedger,
                   core::u32 inputHistory = core::kInputHistory,
                   core::u32 predictionMaxFrames = core::kPredictionMaxFrames);
    ~SessionManager();

    /**
     * @brief Creates the session of a connecting peer.
     * @return The new session, or AlreadyExists.
     */
    [[nodiscard]] core::Expected<Session*> connect(core::PeerId peer);

    /**
     * @brief Destroys the session of a leaving peer.
     * @return NotFound for an unknown peer, InvalidArgument for peer 0.
     */
    [[nodiscard]] core::ExpectedVoid disconnect(core::PeerId peer);

    [[nodiscard]] Session       *find(core::PeerId peer) noexcept;
    [[nodiscard]] const Session *find(core::PeerId peer) const noexcept;

    [[nodiscard]] Session       &local() noexcept;
    [[nodiscard]] const Session &local() const noexcept;

    void forEach(const std::function<void(Session&)>& callback);
    void forEach(const std::function<void(const Session&)>& callback) const;

    /** @brief Connected remote peers, in increasing order. */
    [[nodiscard]] std::vector<core::PeerId> remotePeers() const;

    /** @brief Number of sessions, the local one included. */
    [[nodiscard]] core::u32 activeCount() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tks::sync::session

#endif // TKS_SYNC_SESSION_SESSIONMANAGER_HPP
