/**
 * @file StateFrame.cpp
 * @brief StateFrame wire codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/net/protocol/StateFrame.hpp>
#include <tks/net/protocol/Bitstream.hpp>

#include <algorithm>
#include <format>

namespace tks::net::protocol {

void StateFrame::assign(std::span<const IndexedValue> entries)
{
    indices.clear();
    values.clear();

    core::usize dense = 0;
    while (dense < entries.size() && entries[dense].index == dense)
    {
        ++dense;
    }

    for (core::usize i = dense; i < entries.size(); ++i)
    {
        indices.push_back(entries[i].index);
        values.push_back(entries[i].value);
    }
    for (core::usize i = 0; i < dense; ++i)
    {
        values.push_back(entries[i].value);
    }
}

std::vector<IndexedValue> StateFrame::entries() const
{
    std::vector<IndexedValue> out;
    out.reserve(values.size());

    const core::usize sparse = std::min(indices.size(), values.size());
    for (core::usize i = 0; i < sparse; ++i)
    {
        out.push_back({indices[i], values[i]});
    }
    for (core::usize i = sparse; i < values.size(); ++i)
    {
        out.push_back({static_cast<core::u8>(i - sparse), values[i]});
    }
    return out;
}

std::vector<core::byte> encodeStateFrame(const StateFrame &frame)
{
    Bitstream stream;
    writeHeader(stream, PacketType::StateFrame);

    core::u8 flags = frame.flags;
    flags = setFlag(flags, FrameFlag::HasInputId, frame.lastConsumedInputId.has_value());
    flags = setFlag(flags, FrameFlag::HasSparseIndices, !frame.indices.empty());
    flags = setFlag(flags, FrameFlag::HasTimeDepth, frame.timeDepth != 0.0f);

    stream.writeVarU32(frame.entityKey);
    stream.writeVarI64(frame.tick);
    stream.writeU8(flags);

    if (frame.lastConsumedInputId)
    {
        stream.writeVarI64(*frame.lastConsumedInputId);
    }
    if (hasFlag(flags, FrameFlag::HasTimeDepth))
    {
        stream.writeF32(frame.timeDepth);
    }
    if (!frame.indices.empty())
    {
        stream.writeU8(static_cast<core::u8>(frame.indices.size()));
        for (auto index : frame.indices)
        {
            stream.writeU8(index);
        }
    }

    stream.writeU8(static_cast<core::u8>(frame.values.size()));
    for (const auto &value : frame.values)
    {
        writeValue(stream, value);
    }

    return stream.release();
}

core::Expected<StateFrame> decodeStateFrame(Bitstream &stream)
{
    StateFrame frame;
    frame.entityKey = TKS_TRY(stream.readVarU32());
    frame.tick      = TKS_TRY(stream.readVarI64());
    frame.flags     = TKS_TRY(stream.readU8());

    if (frame.tick < 0 || frame.tick >= core::kMaxWireCounter)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("frame tick {} out of range", frame.tick));
    }

    if (frame.has(FrameFlag::HasInputId))
    {
        const core::InputId id = TKS_TRY(stream.readVarI64());
        if (id < 0 || id >= core::kMaxWireCounter)
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("consumed input id {} out of range", id));
        }
        frame.lastConsumedInputId = id;
    }
    if (frame.has(FrameFlag::HasTimeDepth))
    {
        frame.timeDepth = TKS_TRY(stream.readF32());
    }
    if (frame.has(FrameFlag::HasSparseIndices))
    {
        const core::u8 count = TKS_TRY(stream.readU8());
        frame.indices.reserve(count);
        for (core::u8 i = 0; i < count; ++i)
        {
            frame.indices.push_back(TKS_TRY(stream.readU8()));
        }
    }

    const core::u8 valueCount = TKS_TRY(stream.readU8());
    if (valueCount < frame.indices.size())
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("{} values for {} sparse indices", valueCount, frame.indices.size()));
    }

    frame.values.reserve(valueCount);
    for (core::u8 i = 0; i < valueCount; ++i)
    {
        frame.values.push_back(TKS_TRY(readValue(stream)));
    }

    return frame;
}

} // namespace tks::net::protocol
