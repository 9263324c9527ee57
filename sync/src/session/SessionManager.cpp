/**
 * @file SessionManager.cpp
 * @brief SessionManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/session/SessionManager.hpp>
#include <tks/core/Log.hpp>

#include <format>
#include <map>

namespace tks::sync::session {

struct SessionManager::Impl
{
    const input::ActionTable                     &table;
    core::u32                                     inputHistory;
    core::u32                                     predictionMaxFrames;
    std::map<core::PeerId, std::unique_ptr<Session>> sessions;

    Impl(const input::ActionTable &t, core::u32 history, core::u32 maxFrames)
        : table{t}
        , inputHistory{history}
        , predictionMaxFrames{maxFrames}
    {}
};

SessionManager::SessionManager(const input::ActionTable &table,
                               input::PeerInputLedger &localLedger,
                               core::u32 inputHistory,
                               core::u32 predictionMaxFrames)
    : _impl{std::make_unique<Impl>(table, inputHistory, predictionMaxFrames)}
{
    _impl->sessions.emplace(core::kLocalPeer, std::make_unique<Session>(core::kLocalPeer, localLedger));
}

SessionManager::~SessionManager() = default;

core::Expected<Session*> SessionManager::connect(core::PeerId peer)
{
    if (_impl->sessions.contains(peer))
    {
        return core::makeError(core::ErrorCode::AlreadyExists,
                               std::format("session already exists for peer {}", peer));
    }

    auto session = std::make_unique<Session>(peer, _impl->table, _impl->inputHistory, _impl->predictionMaxFrames);
    auto *ptr = session.get();
    _impl->sessions.emplace(peer, std::move(session));

    core::Log::info("SESSION", std::format("peer {} connected", peer));
    return ptr;
}

core::ExpectedVoid SessionManager::disconnect(core::PeerId peer)
{
    if (peer == core::kLocalPeer)
    {
        return core::makeError(core::ErrorCode::InvalidArgument, "the local session cannot be disconnected");
    }

    auto it = _impl->sessions.find(peer);
    if (it == _impl->sessions.end())
    {
        return core::makeError(core::ErrorCode::NotFound, std::format("no session for peer {}", peer));
    }

    _impl->sessions.erase(it);

    core::Log::info("SESSION", std::format("peer {} disconnected", peer));
    return {};
}

Session *SessionManager::find(core::PeerId peer) noexcept
{
    auto it = _impl->sessions.find(peer);
    return (it != _impl->sessions.end()) ? it->second.get() : nullptr;
}

const Session *SessionManager::find(core::PeerId peer) const noexcept
{
    auto it = _impl->sessions.find(peer);
    return (it != _impl->sessions.end()) ? it->second.get() : nullptr;
}

Session &SessionManager::local() noexcept
{
    return *_impl->sessions.find(core::kLocalPeer)->second;
}

const Session &SessionManager::local() const noexcept
{
    return *_impl->sessions.find(core::kLocalPeer)->second;
}

void SessionManager::forEach(const std::function<void(Session&)>& callback)
{
    for (auto& [peer, session] : _impl->sessions)
    {
        callback(*session);
    }
}

void SessionManager::forEach(const std::function<void(const Session&)>& callback) const
{
    for (const auto& [peer, session] : _impl->sessions)
    {
        callback(*session);
    }
}

std::vector<core::PeerId> SessionManager::remotePeers() const
{
    std::vector<core::PeerId> peers;
    for (const auto& [peer, session] : _impl->sessions)
    {
        if (peer != core::kLocalPeer)
        {
            peers.push_back(peer);
        }
    }
    return peers;
}

core::u32 SessionManager::activeCount() const noexcept
{
    return static_cast<core::u32>(_impl->sessions.size());
}

} // namespace tks::sync::session
