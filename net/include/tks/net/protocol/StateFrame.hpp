/**
 * @file StateFrame.hpp
 * @brief Server-to-client snapshot of one synchronized entity at one tick.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_PROTOCOL_STATE_FRAME_HPP
    #define TKS_NET_PROTOCOL_STATE_FRAME_HPP

#include <tks/net/protocol/Protocol.hpp>
#include <tks/net/protocol/Value.hpp>

#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace tks::net::protocol {

/**
 * @brief One property value addressed by its position in the entity's
 *        property ordering.
 */
struct IndexedValue
{
    core::u8 index;
    Value    value;

    [[nodiscard]] bool operator==(const IndexedValue &) const = default;
};

/**
 * @struct StateFrame
 * @brief Wire state frame.
 *
 * The first indices.size() values map to @c indices; any surplus
 * trailing value maps to the start of the property ordering, in order
 * (values[indices.size() + k] belongs to property k).  The encoder uses
 * this to drop the index list for the dense prefix of the ordering.
 */
struct StateFrame
{
    core::u32                     entityKey{0};
    core::Tick                    tick{core::kNoTick};
    std::optional<core::InputId>  lastConsumedInputId;
    core::u8                      flags{0};
    core::f32                     timeDepth{0.0f};
    std::vector<core::u8>         indices;
    std::vector<Value>            values;

    /**
     * @brief Fills indices/values from entries sorted by index.
     *
     * The longest run 0, 1, 2, ... at the start is moved to the trailing
     * dense block.
     */
    void assign(std::span<const IndexedValue> entries);

    /** @brief Expands indices/values back to (index, value) pairs. */
    [[nodiscard]] std::vector<IndexedValue> entries() const;

    [[nodiscard]] bool isEmpty() const noexcept { return values.empty(); }

    [[nodiscard]] bool has(FrameFlag flag) const noexcept { return hasFlag(flags, flag); }
    void set(FrameFlag flag, bool on) noexcept { flags = setFlag(flags, flag, on); }
};

/**
 * @brief Serializes a state frame with its packet header.
 */
[[nodiscard]] std::vector<core::byte> encodeStateFrame(const StateFrame &frame);

/**
 * @brief Parses a state frame body (header already consumed).
 */
[[nodiscard]] core::Expected<StateFrame> decodeStateFrame(Bitstream &stream);

} // namespace tks::net::protocol

#endif // TKS_NET_PROTOCOL_STATE_FRAME_HPP
