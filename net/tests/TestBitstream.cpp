/**
 * @file TestBitstream.cpp
 * @brief Unit tests for net::protocol::Bitstream and the packet header.
 */

#include <catch2/catch.hpp>

#include "tks/net/protocol/Bitstream.hpp"
#include "tks/net/protocol/Protocol.hpp"

namespace tks::net::protocol {

TEST_CASE("Bitstream packs fields at bit granularity", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeBool(true);
    writer.writeBits(5, 3);
    writer.writeU8(0xBE);
    writer.writeI32(-12345);
    writer.writeF32(3.25f);

    REQUIRE(writer.bitsWritten() == 1 + 3 + 8 + 32 + 32);
    REQUIRE(writer.data().size() == 10);

    Bitstream reader{writer.data()};
    REQUIRE(reader.readBool().value());
    REQUIRE(reader.readBits(3).value() == 5u);
    REQUIRE(reader.readU8().value() == 0xBE);
    REQUIRE(reader.readI32().value() == -12345);
    REQUIRE(reader.readF32().value() == 3.25f);
}

TEST_CASE("Varints keep ticks and entity keys short", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeVarI64(core::kNoTick);
    REQUIRE(writer.bitsWritten() == 8);
    writer.writeVarI64(63);
    REQUIRE(writer.bitsWritten() == 16);
    writer.writeVarI64(64);
    REQUIRE(writer.bitsWritten() == 32);
    writer.writeVarI64(-(core::i64{1} << 40));
    writer.writeVarU32(0xFFFF'FFFFu);
    writer.writeVarU32(7);

    Bitstream reader{writer.data()};
    REQUIRE(reader.readVarI64().value() == core::kNoTick);
    REQUIRE(reader.readVarI64().value() == 63);
    REQUIRE(reader.readVarI64().value() == 64);
    REQUIRE(reader.readVarI64().value() == -(core::i64{1} << 40));
    REQUIRE(reader.readVarU32().value() == 0xFFFF'FFFFu);
    REQUIRE(reader.readVarU32().value() == 7u);
}

TEST_CASE("Overlong varints are rejected as corrupted", "[net][bitstream]")
{
    Bitstream writer;
    for (int i = 0; i < 6; ++i)
    {
        writer.writeBits(0x7F, 7);
        writer.writeBool(true);
    }
    writer.writeBits(0, 8);

    Bitstream reader{writer.data()};
    auto result = reader.readVarU32();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::CorruptedData);

    Bitstream truncated{std::span{writer.data().data(), 2}};
    REQUIRE(truncated.readVarI64().error().code() == core::ErrorCode::BufferUnderflow);
}

TEST_CASE("Bitstream reports underflow instead of reading past the end", "[net][bitstream]")
{
    Bitstream writer;
    writer.writeU8(7);

    Bitstream reader{writer.data()};
    REQUIRE(reader.readU8().value() == 7);

    auto result = reader.readU32();
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == core::ErrorCode::BufferUnderflow);
}

TEST_CASE("Packet header rejects foreign or mismatched payloads", "[net][protocol]")
{
    SECTION("valid header")
    {
        Bitstream writer;
        writeHeader(writer, PacketType::InputBatch);
        Bitstream reader{writer.data()};
        auto type = readHeader(reader);
        REQUIRE(type.has_value());
        REQUIRE(*type == PacketType::InputBatch);
    }

    SECTION("bad magic")
    {
        Bitstream writer;
        writer.writeU32(0xDEADBEEF);
        writer.writeU8(kProtocolVersion);
        writer.writeU8(static_cast<core::u8>(PacketType::StateFrame));
        Bitstream reader{writer.data()};
        auto type = readHeader(reader);
        REQUIRE_FALSE(type.has_value());
        REQUIRE(type.error().code() == core::ErrorCode::ProtocolViolation);
    }

    SECTION("bad version")
    {
        Bitstream writer;
        writer.writeU32(kProtocolMagic);
        writer.writeU8(kProtocolVersion + 1);
        writer.writeU8(static_cast<core::u8>(PacketType::StateFrame));
        Bitstream reader{writer.data()};
        REQUIRE(readHeader(reader).error().code() == core::ErrorCode::ProtocolViolation);
    }

    SECTION("unknown type")
    {
        Bitstream writer;
        writer.writeU32(kProtocolMagic);
        writer.writeU8(kProtocolVersion);
        writer.writeU8(0x7F);
        Bitstream reader{writer.data()};
        REQUIRE(readHeader(reader).error().code() == core::ErrorCode::ProtocolViolation);
    }
}

} // namespace tks::net::protocol
