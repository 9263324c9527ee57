/**
 * @file Bitstream.cpp
 * @brief Bitstream implementation: MSB-first bit packing and varints.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/net/protocol/Bitstream.hpp>
#include <tks/core/Assert.hpp>

#include <bit>
#include <format>

namespace tks::net::protocol {

namespace {

constexpr core::u32 kVarGroupBits = 7;
constexpr core::u32 kVarGroupMask = (1u << kVarGroupBits) - 1;

[[nodiscard]] constexpr core::u64 zigZag(core::i64 v) noexcept
{
    return (static_cast<core::u64>(v) << 1) ^ static_cast<core::u64>(v >> 63);
}

[[nodiscard]] constexpr core::i64 unZigZag(core::u64 v) noexcept
{
    return static_cast<core::i64>(v >> 1) ^ -static_cast<core::i64>(v & 1u);
}

} // anonymous namespace

Bitstream::Bitstream() noexcept = default;

Bitstream::Bitstream(std::span<const core::byte> data)
    : _buffer{data.begin(), data.end()}
    , _writeBit{static_cast<core::u32>(data.size() * 8)}
    , _totalBits{static_cast<core::u32>(data.size() * 8)}
    , _readOnly{true}
{}

Bitstream::~Bitstream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    TKS_ASSERT(!_readOnly);
    TKS_ASSERT(bitCount > 0 && bitCount <= 32);

    _buffer.resize((_writeBit + bitCount + 7) / 8, core::byte{0});

    for (core::u32 remaining = bitCount; remaining > 0; --remaining, ++_writeBit)
    {
        if ((value >> (remaining - 1)) & 1u)
        {
            _buffer[_writeBit / 8] |= static_cast<core::byte>(0x80u >> (_writeBit % 8));
        }
    }
    _totalBits = _writeBit;
}

void Bitstream::writeBool(bool value)     { writeBits(value ? 1u : 0u, 1); }
void Bitstream::writeU8(core::u8 value)   { writeBits(value, 8); }
void Bitstream::writeU32(core::u32 value) { writeBits(value, 32); }
void Bitstream::writeI32(core::i32 value) { writeBits(static_cast<core::u32>(value), 32); }
void Bitstream::writeF32(core::f32 value) { writeBits(std::bit_cast<core::u32>(value), 32); }

void Bitstream::writeVarint(core::u64 raw)
{
    do
    {
        writeBits(static_cast<core::u32>(raw & kVarGroupMask), kVarGroupBits);
        raw >>= kVarGroupBits;
        writeBool(raw != 0);
    } while (raw != 0);
}

void Bitstream::writeVarU32(core::u32 value) { writeVarint(value); }
void Bitstream::writeVarI64(core::i64 value) { writeVarint(zigZag(value)); }

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    TKS_ASSERT(bitCount > 0 && bitCount <= 32);

    if (bitCount > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::BufferUnderflow,
                               std::format("read of {} bits at bit {} with {} left", bitCount, _readBit, bitsRemaining()));
    }

    core::u32 result = 0;
    for (core::u32 i = 0; i < bitCount; ++i, ++_readBit)
    {
        const auto byte = static_cast<core::u8>(_buffer[_readBit / 8]);
        result = (result << 1) | ((byte >> (7 - _readBit % 8)) & 1u);
    }
    return result;
}

core::Expected<bool> Bitstream::readBool()
{
    return readBits(1).transform([](core::u32 v) { return v != 0; });
}

core::Expected<core::u8> Bitstream::readU8()
{
    return readBits(8).transform([](core::u32 v) { return static_cast<core::u8>(v); });
}

core::Expected<core::u32> Bitstream::readU32() { return readBits(32); }

core::Expected<core::i32> Bitstream::readI32()
{
    return readBits(32).transform([](core::u32 v) { return static_cast<core::i32>(v); });
}

core::Expected<core::f32> Bitstream::readF32()
{
    return readBits(32).transform([](core::u32 v) { return std::bit_cast<core::f32>(v); });
}

core::Expected<core::u64> Bitstream::readVarint(core::u32 maxBits)
{
    core::u64 raw = 0;
    for (core::u32 shift = 0;; shift += kVarGroupBits)
    {
        if (shift >= maxBits)
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("varint longer than {} bits", maxBits));
        }
        const core::u64 group = TKS_TRY(readBits(kVarGroupBits));
        raw |= group << shift;
        if (!TKS_TRY(readBool()))
            break;
    }
    if (maxBits < 64 && (raw >> maxBits) != 0)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("varint value exceeds {} bits", maxBits));
    }
    return raw;
}

core::Expected<core::u32> Bitstream::readVarU32()
{
    return readVarint(32).transform([](core::u64 v) { return static_cast<core::u32>(v); });
}

core::Expected<core::i64> Bitstream::readVarI64()
{
    return readVarint(64).transform(unZigZag);
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::u32 Bitstream::bitsWritten() const noexcept { return _writeBit; }

core::u32 Bitstream::bitsRemaining() const noexcept
{
    return (_totalBits > _readBit) ? _totalBits - _readBit : 0;
}

std::span<const core::byte> Bitstream::data() const noexcept { return _buffer; }

std::vector<core::byte> Bitstream::release() noexcept
{
    _writeBit = 0;
    _readBit = 0;
    _totalBits = 0;
    return std::move(_buffer);
}

void Bitstream::reset() noexcept
{
    _readBit = 0;
    if (!_readOnly)
    {
        _writeBit = 0;
        _totalBits = 0;
        _buffer.clear();
    }
}

} // namespace tks::net::protocol
