/**
 * @file Bitstream.hpp
 * @brief Bit-level serialization stream for deterministic networking.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_PROTOCOL_BITSTREAM_HPP
    #define TKS_NET_PROTOCOL_BITSTREAM_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Expected.hpp>
#include <tks/core/NonCopyable.hpp>

#include <span>
#include <vector>

namespace tks::net::protocol {

/**
 * @class Bitstream
 * @brief Compact bit-level read/write stream.
 *
 * Packs fields at arbitrary bit widths for minimal bandwidth.  Values are
 * stored big-endian in the bit buffer, floats by their IEEE-754 bit
 * pattern, so the encoding is identical on every peer.  Every read is
 * bounds-checked and reports BufferUnderflow instead of reading past the
 * end.
 */
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /** @brief Constructs an empty writable bitstream. */
    Bitstream() noexcept;

    /**
     * @brief Constructs a read-only bitstream over received bytes.
     * @param data Raw bytes; every bit is considered valid.
     */
    explicit Bitstream(std::span<const core::byte> data);

    ~Bitstream();

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /**
     * @brief Writes @p bitCount bits from @p value.
     * @param value    Value to write (only lower @p bitCount bits are used).
     * @param bitCount Number of bits to write (1-32).
     */
    void writeBits(core::u32 value, core::u32 bitCount);

    void writeBool(bool value);
    void writeU8(core::u8 value);
    void writeU32(core::u32 value);
    void writeI32(core::i32 value);
    void writeF32(core::f32 value);

    /**
     * @brief Writes @p value in 7-bit groups, low group first, each group
     *        followed by a continuation bit.
     *
     * Entity keys are small, so most take a single byte.
     */
    void writeVarU32(core::u32 value);

    /**
     * @brief Zig-zag then varint encoding for ticks and input ids.
     *
     * kNoTick (-1) costs one byte, as does any value in [-64, 63].
     */
    void writeVarI64(core::i64 value);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    /** @brief Reads @p bitCount bits as an unsigned value. */
    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);

    [[nodiscard]] core::Expected<bool>      readBool();
    [[nodiscard]] core::Expected<core::u8>  readU8();
    [[nodiscard]] core::Expected<core::u32> readU32();
    [[nodiscard]] core::Expected<core::i32> readI32();
    [[nodiscard]] core::Expected<core::f32> readF32();

    /** @brief CorruptedData when the encoding runs past 32 bits. */
    [[nodiscard]] core::Expected<core::u32> readVarU32();

    /** @brief CorruptedData when the encoding runs past 64 bits. */
    [[nodiscard]] core::Expected<core::i64> readVarI64();

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /** @brief Returns the total number of written bits. */
    [[nodiscard]] core::u32 bitsWritten() const noexcept;

    /** @brief Returns the number of bits remaining for reading. */
    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

    /** @brief Returns the underlying byte buffer, padded to a whole byte. */
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

    /** @brief Moves the written bytes out of the stream. */
    [[nodiscard]] std::vector<core::byte> release() noexcept;

    /** @brief Resets read/write cursors to the beginning. */
    void reset() noexcept;

private:
    void writeVarint(core::u64 raw);
    [[nodiscard]] core::Expected<core::u64> readVarint(core::u32 maxBits);

    std::vector<core::byte> _buffer;
    core::u32               _writeBit{0};
    core::u32               _readBit{0};
    core::u32               _totalBits{0};
    bool                    _readOnly{false};
};

} // namespace tks::net::protocol

#endif // TKS_NET_PROTOCOL_BITSTREAM_HPP
