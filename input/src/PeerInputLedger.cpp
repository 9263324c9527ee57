/**
 * @file PeerInputLedger.cpp
 * @brief PeerInputLedger implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/input/PeerInputLedger.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>

#include <format>

namespace tks::input {

PeerInputLedger::PeerInputLedger(const ActionTable &table,
                                 core::PeerId peer,
                                 core::u32 capacity,
                                 core::u32 predictionMaxFrames)
    : _table{table}
    , _peer{peer}
    , _predictionMaxFrames{predictionMaxFrames}
    , _ring(capacity)
    , _current{table.neutral()}
{
    TKS_VERIFY(capacity > 0);
}

const PeerInputLedger::Entry *PeerInputLedger::entry(core::InputId id) const
{
    if (id < 0)
    {
        return nullptr;
    }
    const auto &e = _ring[static_cast<core::usize>(id) % _ring.size()];
    return (e.id == id) ? &e : nullptr;
}

const InputFrame *PeerInputLedger::find(core::InputId id) const
{
    const Entry *e = entry(id);
    return e ? &e->frame : nullptr;
}

bool PeerInputLedger::attachOwned(core::InputId id, std::vector<OwnedBlock> owned)
{
    const Entry *e = entry(id);
    if (!e || id <= _consumedId)
    {
        return false;
    }
    _ring[static_cast<core::usize>(id) % _ring.size()].frame.owned = std::move(owned);
    return true;
}

void PeerInputLedger::store(core::InputId id, InputFrame frame, core::Tick tickEstimate)
{
    if (id < 0 || id <= _consumedId)
    {
        return;
    }
    if (_newestId != core::kNoInputId && id <= _newestId - static_cast<core::InputId>(_ring.size()))
    {
        return;
    }

    auto &e = _ring[static_cast<core::usize>(id) % _ring.size()];
    e.id = id;
    e.tickEstimate = tickEstimate;
    e.frame = std::move(frame);

    if (id > _newestId)
    {
        _newestId = id;
    }
}

void PeerInputLedger::storeBatch(const InputBatch &batch)
{
    for (core::usize i = 0; i < batch.frames.size(); ++i)
    {
        const auto offset = static_cast<core::InputId>(i);
        const core::Tick tick = (batch.firstTickEstimate == core::kNoTick)
            ? core::kNoTick
            : batch.firstTickEstimate + offset;
        store(batch.firstInputId + offset, batch.frames[i], tick);
    }
}

InputBatch PeerInputLedger::makeBatch(core::InputId newest, core::u32 count) const
{
    InputBatch batch;
    core::InputId first = newest + 1;
    while (first - 1 >= 0 && newest - (first - 1) < static_cast<core::InputId>(count) && entry(first - 1))
    {
        --first;
    }
    if (first > newest)
    {
        return batch;
    }

    batch.firstInputId = first;
    batch.firstTickEstimate = entry(first)->tickEstimate;
    for (core::InputId id = first; id <= newest; ++id)
    {
        batch.frames.push_back(entry(id)->frame);
    }
    return batch;
}

std::optional<core::InputId> PeerInputLedger::oldestAfter(core::InputId id) const
{
    std::optional<core::InputId> best;
    for (const auto &e : _ring)
    {
        if (e.id > id && (!best || e.id < *best))
        {
            best = e.id;
        }
    }
    return best;
}

core::usize PeerInputLedger::backlog() const noexcept
{
    core::usize count = 0;
    for (const auto &e : _ring)
    {
        if (e.id != core::kNoInputId && e.id > _consumedId)
        {
            ++count;
        }
    }
    return count;
}

ConsumedInput PeerInputLedger::take(const Entry &e)
{
    if (_stale)
    {
        core::Log::info("INPUT", std::format("peer {} input resumed at {}", _peer, e.id));
    }

    _consumedId = e.id;
    _current = e.frame;
    _replays = 0;
    _stale = false;

    return ConsumedInput{e.id, _current, e.tickEstimate, false, false};
}

ConsumedInput PeerInputLedger::consume()
{
    if (_consumedId == core::kNoInputId)
    {
        if (auto first = oldestAfter(core::kNoInputId))
        {
            return take(*entry(*first));
        }
        return ConsumedInput{core::kNoInputId, _table.neutral(), core::kNoTick, false, true};
    }

    // Running too far behind the sender: drop the oldest frames.
    const auto limit = static_cast<core::InputId>(_ring.size() / 2);
    if (_newestId - _consumedId > limit)
    {
        const core::InputId skipTo = _newestId - limit;
        core::Log::warn("INPUT", std::format("peer {} input backlog trimmed from {} to {}",
                                             _peer, _consumedId + 1, skipTo));
        if (auto next = oldestAfter(skipTo - 1))
        {
            return take(*entry(*next));
        }
    }

    if (const Entry *next = entry(_consumedId + 1))
    {
        return take(*next);
    }

    if (_replays < _predictionMaxFrames && !_stale)
    {
        ++_replays;
        ++_consumedId;
        return ConsumedInput{_consumedId, _current, core::kNoTick, true, false};
    }

    if (auto later = oldestAfter(_consumedId))
    {
        return take(*entry(*later));
    }

    if (!_stale)
    {
        core::Log::info("INPUT", std::format("peer {} input starved after {} replays", _peer, _replays));
    }
    _stale = true;
    _current = _table.neutral();
    return ConsumedInput{_consumedId, _current, core::kNoTick, false, true};
}

} // namespace tks::input
