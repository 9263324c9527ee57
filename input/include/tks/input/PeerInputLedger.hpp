/**
 * @file PeerInputLedger.hpp
 * @brief Per-peer ring of input frames keyed by input id.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_PEERINPUTLEDGER_HPP
    #define TKS_INPUT_PEERINPUTLEDGER_HPP

#include <tks/input/InputBatch.hpp>
#include <tks/input/InputFrame.hpp>
#include <tks/core/Constants.hpp>
#include <tks/core/NonCopyable.hpp>
#include <tks/core/Types.hpp>

#include <optional>
#include <vector>

namespace tks::input {

/**
 * @struct ConsumedInput
 * @brief What the server applies for a peer during one step.
 */
struct ConsumedInput
{
    core::InputId inputId{core::kNoInputId}; ///< Last consumed id after this step.
    InputFrame    frame;
    core::Tick    tickEstimate{core::kNoTick}; ///< Tick the peer presented when sampling, if known.
    bool          replayed{false};             ///< The previous frame was repeated.
    bool          stale{false};                ///< Nothing usable: neutral frame substituted.
};

/**
 * @class PeerInputLedger
 * @brief Input history of one peer.
 *
 * Sampling side: store() the local frame at every input id, makeBatch()
 * the most recent ones for sending.
 *
 * Consuming side: storeBatch() whatever arrives (duplicates and late
 * frames are harmless), consume() exactly once per step.  A missing
 * frame is covered by replaying the previous one at most
 * predictionMaxFrames times; past that a neutral frame is returned and
 * the ledger reports itself stale.
 */
class PeerInputLedger final : public core::NonCopyable<PeerInputLedger>
{
public:
    PeerInputLedger(const ActionTable &table,
                    core::PeerId peer,
                    core::u32 capacity = core::kInputHistory,
                    core::u32 predictionMaxFrames = core::kPredictionMaxFrames);

    /** @brief Records the frame of @p id.  Ids already consumed are ignored. */
    void store(core::InputId id, InputFrame frame, core::Tick tickEstimate = core::kNoTick);

    /** @brief Records every frame of @p batch. */
    void storeBatch(const InputBatch &batch);

    /**
     * @brief Builds a batch of at most @p count frames ending at @p newest.
     *
     * Stops at the first missing id going backwards.
     */
    [[nodiscard]] InputBatch makeBatch(core::InputId newest, core::u32 count) const;

    /** @brief Advances one step on the consuming side. */
    ConsumedInput consume();

    [[nodiscard]] const InputFrame *find(core::InputId id) const;

    /**
     * @brief Replace the client-owned blocks of an already stored frame.
     * @return false when @p id is no longer (or not yet) in the ring.
     */
    bool attachOwned(core::InputId id, std::vector<OwnedBlock> owned);

    [[nodiscard]] core::PeerId  peer()           const noexcept { return _peer; }
    [[nodiscard]] core::InputId lastInputId()    const noexcept { return _newestId; }
    [[nodiscard]] core::InputId lastConsumedId() const noexcept { return _consumedId; }
    [[nodiscard]] const InputFrame &current()    const noexcept { return _current; }
    [[nodiscard]] bool          stale()          const noexcept { return _stale; }
    [[nodiscard]] core::u32     replayCount()    const noexcept { return _replays; }

    /** @brief Number of received frames not yet consumed. */
    [[nodiscard]] core::usize backlog() const noexcept;

private:
    struct Entry
    {
        core::InputId id{core::kNoInputId};
        core::Tick    tickEstimate{core::kNoTick};
        InputFrame    frame;
    };

    [[nodiscard]] const Entry *entry(core::InputId id) const;
    [[nodiscard]] std::optional<core::InputId> oldestAfter(core::InputId id) const;

    ConsumedInput take(const Entry &e);

    const ActionTable &_table;
    core::PeerId       _peer;
    core::u32          _predictionMaxFrames;
    std::vector<Entry> _ring;
    core::InputId      _newestId{core::kNoInputId};
    core::InputId      _consumedId{core::kNoInputId};
    InputFrame         _current;
    core::u32          _replays{0};
    bool               _stale{false};
};

} // namespace tks::input

#endif // TKS_INPUT_PEERINPUTLEDGER_HPP
