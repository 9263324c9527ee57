/**
 * @file Session.cpp
 * @brief Session implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/session/Session.hpp>
#include <tks/math/Statistics.hpp>
#include <tks/core/Constants.hpp>

#include <algorithm>

namespace tks::sync::session {

Session::Session(core::PeerId peer,
                 const input::ActionTable &table,
                 core::u32 inputHistory,
                 core::u32 predictionMaxFrames)
    : _peer{peer}
    , _storage{std::make_unique<input::PeerInputLedger>(table, peer, inputHistory, predictionMaxFrames)}
    , _ledger{_storage.get()}
{}

Session::Session(core::PeerId peer, input::PeerInputLedger &ledger)
    : _peer{peer}
    , _ledger{&ledger}
{}

Session::~Session() = default;

void Session::recordLatency(core::f64 ticks) noexcept
{
    if (!_hasLatency)
    {
        _latency = ticks;
        _hasLatency = true;
        return;
    }
    _latency = math::Statistics::smooth(_latency, ticks, core::kLatencySmoothing);
}

void Session::addOwned(EntityHandle handle)
{
    if (!owns(handle))
    {
        _owned.push_back(handle);
    }
}

void Session::removeOwned(EntityHandle handle)
{
    std::erase(_owned, handle);
}

bool Session::owns(EntityHandle handle) const noexcept
{
    return std::find(_owned.begin(), _owned.end(), handle) != _owned.end();
}

} // namespace tks::sync::session
