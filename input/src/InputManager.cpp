/**
 * @file InputManager.cpp
 * @brief InputManager implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/input/InputManager.hpp>
#include <tks/input/InputBatch.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>

#include <format>

namespace tks::input {

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct InputManager::Impl
{
    const ActionTable   &table;
    const IInputSource  *source{nullptr};
    PeerInputLedger      ledger;
    core::u32            batchSize;
    core::f64            sendInterval;
    core::f64            nextSend{0.0};
    core::InputId        lastSampled{core::kNoInputId};

    Impl(const ActionTable &t, core::u32 batch, core::u32 rate, core::u32 history)
        : table{t}
        , ledger{t, core::kLocalPeer, history}
        , batchSize{batch}
        , sendInterval{rate > 0 ? 1.0 / static_cast<core::f64>(rate) : 0.0}
    {}
};

InputManager::InputManager(const ActionTable &table,
                           core::u32 batchSize,
                           core::u32 sendRate,
                           core::u32 history)
    : _impl{std::make_unique<Impl>(table, batchSize, sendRate, history)}
{
    TKS_VERIFY(batchSize > 0 && batchSize <= core::kMaxBatchFrames);
    TKS_VERIFY(batchSize <= history);
}

InputManager::~InputManager() = default;

void InputManager::setSource(const IInputSource *source)
{
    _impl->source = source;
    if (source)
    {
        core::Log::info("INPUT", std::format("sampling from '{}'", source->name()));
    }
}

const InputFrame &InputManager::sample(core::InputId id, core::Tick presentedTick)
{
    InputFrame frame = _impl->source ? _impl->table.sample(*_impl->source) : _impl->table.neutral();

    _impl->ledger.store(id, std::move(frame), presentedTick);
    _impl->lastSampled = id;

    const InputFrame *stored = _impl->ledger.find(id);
    TKS_VERIFY(stored != nullptr);
    return *stored;
}

bool InputManager::attachOwned(core::InputId id, std::vector<OwnedBlock> owned)
{
    return _impl->ledger.attachOwned(id, std::move(owned));
}

std::optional<std::vector<core::byte>> InputManager::pollBatch(core::f64 now)
{
    if (_impl->lastSampled == core::kNoInputId || now < _impl->nextSend)
    {
        return std::nullopt;
    }

    _impl->nextSend += _impl->sendInterval;
    if (_impl->nextSend <= now)
    {
        _impl->nextSend = now + _impl->sendInterval;
    }

    const InputBatch batch = _impl->ledger.makeBatch(_impl->lastSampled, _impl->batchSize);
    if (batch.frames.empty())
    {
        return std::nullopt;
    }
    return packInputBatch(batch, _impl->table);
}

PeerInputLedger &InputManager::localLedger() noexcept { return _impl->ledger; }

const PeerInputLedger &InputManager::localLedger() const noexcept { return _impl->ledger; }

const ActionTable &InputManager::table() const noexcept { return _impl->table; }

core::InputId InputManager::lastSampledId() const noexcept { return _impl->lastSampled; }

} // namespace tks::input
