/**
 * @file InputBatch.hpp
 * @brief Redundant batch of consecutive input frames sent client to server.
 *
 * Wire layout after the packet header:
 *
 *   [firstInputId:var][firstTickEstimate:var][frameCount:8]
 *   [actionCount:8][actionId:8 x actionCount]
 *   per frame, per listed action:
 *       [same:1]            (omitted on the first frame)
 *       [value:1 | value:32] when not same (bool | analog)
 *   per frame:
 *       [sameOwned:1]       (omitted on the first frame)
 *       [blockCount:8] { [entityKey:var][valueCount:8][tagged value]... }
 *
 * var fields use Bitstream varints. Only actions that are non-zero in at least one frame are listed; the
 * others decode as released.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_INPUTBATCH_HPP
    #define TKS_INPUT_INPUTBATCH_HPP

#include <tks/input/ActionTable.hpp>
#include <tks/input/InputFrame.hpp>
#include <tks/net/protocol/Bitstream.hpp>
#include <tks/core/Expected.hpp>

#include <vector>

namespace tks::input {

/**
 * @struct InputBatch
 * @brief Frames for input ids [firstInputId, firstInputId + frames.size()).
 *
 * firstTickEstimate is the tick the sampling client was presenting when
 * it sampled the first frame; later frames are one tick apart.
 */
struct InputBatch
{
    core::InputId           firstInputId{core::kNoInputId};
    core::Tick              firstTickEstimate{core::kNoTick};
    std::vector<InputFrame> frames;

    [[nodiscard]] bool operator==(const InputBatch &) const = default;

    [[nodiscard]] core::InputId lastInputId() const noexcept
    {
        return firstInputId + static_cast<core::InputId>(frames.size()) - 1;
    }
};

/** @brief Serializes @p batch with its packet header. */
[[nodiscard]] std::vector<core::byte> packInputBatch(const InputBatch &batch, const ActionTable &table);

/**
 * @brief Parses a batch body (header already consumed).
 *
 * Action ids are validated against @p table.
 */
[[nodiscard]] core::Expected<InputBatch> parseInputBatch(net::protocol::Bitstream &stream, const ActionTable &table);

} // namespace tks::input

#endif // TKS_INPUT_INPUTBATCH_HPP
