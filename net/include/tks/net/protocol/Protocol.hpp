/**
 * @file Protocol.hpp
 * @brief Wire protocol constants, packet types, and header layout.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_PROTOCOL_PROTOCOL_HPP
    #define TKS_NET_PROTOCOL_PROTOCOL_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Expected.hpp>

namespace tks::net::protocol {

class Bitstream;

/**
 * @brief Magic bytes identifying TickSync packets on the wire.
 */
static constexpr core::u32 kProtocolMagic = 0x544B5300;

/** @brief Current protocol version. Peers must share it exactly. */
static constexpr core::u8 kProtocolVersion = 1;

/**
 * @enum PacketType
 * @brief Exhaustive list of payloads exchanged by client and server.
 */
enum class PacketType : core::u8
{
    StateFrame = 0x11,
    InputBatch = 0x10
};

/**
 * @brief Header prepended to every payload.
 *
 * Layout (48 bits): [magic:32][version:8][type:8]
 */
struct PacketHeader
{
    core::u32  magic{kProtocolMagic};
    core::u8   version{kProtocolVersion};
    PacketType type{PacketType::StateFrame};
};

/**
 * @enum FrameFlag
 * @brief Bit-flags stored in a state frame.
 */
enum class FrameFlag : core::u8
{
    None               = 0x00,
    HasInputId         = 0x01, ///< lastConsumedInputId is present.
    Predicted          = 0x02, ///< The recipient predicts this entity.
    UnchangedElsewhere = 0x04, ///< Absent properties did not change: replicate them forward.
    HasTimeDepth       = 0x08, ///< A per-recipient time depth follows.
    HasSparseIndices   = 0x10  ///< A sparse property index list follows.
};

[[nodiscard]] inline constexpr core::u8 operator|(FrameFlag a, FrameFlag b) noexcept
{
    return static_cast<core::u8>(static_cast<core::u8>(a) | static_cast<core::u8>(b));
}

[[nodiscard]] inline constexpr bool hasFlag(core::u8 flags, FrameFlag f) noexcept
{
    return (flags & static_cast<core::u8>(f)) != 0;
}

[[nodiscard]] inline constexpr core::u8 setFlag(core::u8 flags, FrameFlag f, bool on) noexcept
{
    return on ? static_cast<core::u8>(flags | static_cast<core::u8>(f))
              : static_cast<core::u8>(flags & ~static_cast<core::u8>(f));
}

/** @brief Writes the packet header for @p type. */
void writeHeader(Bitstream &stream, PacketType type);

/**
 * @brief Reads and validates a packet header.
 * @return The packet type, or ProtocolViolation on magic/version mismatch.
 */
[[nodiscard]] core::Expected<PacketType> readHeader(Bitstream &stream);

} // namespace tks::net::protocol

#endif // TKS_NET_PROTOCOL_PROTOCOL_HPP
