/**
 * @file Protocol.cpp
 * @brief Packet header encoding and validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/net/protocol/Protocol.hpp>
#include <tks/net/protocol/Bitstream.hpp>

#include <format>

namespace tks::net::protocol {

void writeHeader(Bitstream &stream, PacketType type)
{
    stream.writeU32(kProtocolMagic);
    stream.writeU8(kProtocolVersion);
    stream.writeU8(static_cast<core::u8>(type));
}

core::Expected<PacketType> readHeader(Bitstream &stream)
{
    const core::u32 magic = TKS_TRY(stream.readU32());
    if (magic != kProtocolMagic)
    {
        return core::makeError(core::ErrorCode::ProtocolViolation,
                               std::format("bad magic 0x{:08X}", magic));
    }

    const core::u8 version = TKS_TRY(stream.readU8());
    if (version != kProtocolVersion)
    {
        return core::makeError(core::ErrorCode::ProtocolViolation,
                               std::format("protocol version {} (expected {})", version, kProtocolVersion));
    }

    const core::u8 type = TKS_TRY(stream.readU8());
    switch (static_cast<PacketType>(type))
    {
        case PacketType::StateFrame:
        case PacketType::InputBatch:
            return static_cast<PacketType>(type);
    }
    return core::makeError(core::ErrorCode::ProtocolViolation,
                           std::format("unknown packet type 0x{:02X}", type));
}

} // namespace tks::net::protocol
