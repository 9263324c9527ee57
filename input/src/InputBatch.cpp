/**
 * @file InputBatch.cpp
 * @brief Input batch wire codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/input/InputBatch.hpp>
#include <tks/net/protocol/Protocol.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Constants.hpp>

#include <format>

namespace tks::input {

using net::protocol::Bitstream;

namespace {

void writeAction(Bitstream &stream, ActionKind kind, core::f32 value)
{
    if (kind == ActionKind::Bool)
    {
        stream.writeBool(value != 0.0f);
    }
    else
    {
        stream.writeF32(value);
    }
}

core::Expected<core::f32> readAction(Bitstream &stream, ActionKind kind)
{
    if (kind == ActionKind::Bool)
    {
        const bool pressed = TKS_TRY(stream.readBool());
        return pressed ? 1.0f : 0.0f;
    }
    return stream.readF32();
}

void writeOwned(Bitstream &stream, const std::vector<OwnedBlock> &owned)
{
    stream.writeU8(static_cast<core::u8>(owned.size()));
    for (const auto &block : owned)
    {
        stream.writeVarU32(block.entityKey);
        stream.writeU8(static_cast<core::u8>(block.values.size()));
        for (const auto &value : block.values)
        {
            net::protocol::writeValue(stream, value);
        }
    }
}

core::Expected<std::vector<OwnedBlock>> readOwned(Bitstream &stream)
{
    const core::u8 blockCount = TKS_TRY(stream.readU8());

    std::vector<OwnedBlock> owned;
    owned.reserve(blockCount);
    for (core::u8 b = 0; b < blockCount; ++b)
    {
        OwnedBlock block;
        block.entityKey = TKS_TRY(stream.readVarU32());
        const core::u8 valueCount = TKS_TRY(stream.readU8());
        block.values.reserve(valueCount);
        for (core::u8 v = 0; v < valueCount; ++v)
        {
            block.values.push_back(TKS_TRY(net::protocol::readValue(stream)));
        }
        owned.push_back(std::move(block));
    }
    return owned;
}

} // namespace

std::vector<core::byte> packInputBatch(const InputBatch &batch, const ActionTable &table)
{
    TKS_VERIFY(batch.frames.size() <= core::kMaxBatchFrames);

    std::vector<core::u8> sparse;
    for (core::usize a = 0; a < table.size(); ++a)
    {
        for (const auto &frame : batch.frames)
        {
            if (frame.action(a) != 0.0f)
            {
                sparse.push_back(static_cast<core::u8>(a));
                break;
            }
        }
    }

    Bitstream stream;
    net::protocol::writeHeader(stream, net::protocol::PacketType::InputBatch);
    stream.writeVarI64(batch.firstInputId);
    stream.writeVarI64(batch.firstTickEstimate);
    stream.writeU8(static_cast<core::u8>(batch.frames.size()));
    stream.writeU8(static_cast<core::u8>(sparse.size()));
    for (auto id : sparse)
    {
        stream.writeU8(id);
    }

    for (core::usize f = 0; f < batch.frames.size(); ++f)
    {
        const auto &frame = batch.frames[f];
        for (auto id : sparse)
        {
            const core::f32 value = frame.action(id);
            if (f > 0)
            {
                const bool same = (batch.frames[f - 1].action(id) == value);
                stream.writeBool(same);
                if (same)
                {
                    continue;
                }
            }
            writeAction(stream, table[id].kind, value);
        }

        if (f > 0)
        {
            const bool same = (batch.frames[f - 1].owned == frame.owned);
            stream.writeBool(same);
            if (same)
            {
                continue;
            }
        }
        writeOwned(stream, frame.owned);
    }

    return stream.release();
}

core::Expected<InputBatch> parseInputBatch(Bitstream &stream, const ActionTable &table)
{
    InputBatch batch;
    batch.firstInputId      = TKS_TRY(stream.readVarI64());
    batch.firstTickEstimate = TKS_TRY(stream.readVarI64());
    const core::u8 frameCount = TKS_TRY(stream.readU8());
    const core::u8 sparseCount = TKS_TRY(stream.readU8());

    if (batch.firstInputId < 0 && frameCount > 0)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("negative input id {}", batch.firstInputId));
    }
    if (batch.firstInputId >= core::kMaxWireCounter)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("input id {} out of range", batch.firstInputId));
    }
    if (batch.firstTickEstimate < core::kNoTick || batch.firstTickEstimate >= core::kMaxWireCounter)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("tick estimate {} out of range", batch.firstTickEstimate));
    }

    std::vector<core::u8> sparse;
    sparse.reserve(sparseCount);
    for (core::u8 i = 0; i < sparseCount; ++i)
    {
        const core::u8 id = TKS_TRY(stream.readU8());
        if (id >= table.size())
        {
            return core::makeError(core::ErrorCode::CorruptedData,
                                   std::format("action id {} outside a table of {}", id, table.size()));
        }
        sparse.push_back(id);
    }

    batch.frames.reserve(frameCount);
    for (core::u8 f = 0; f < frameCount; ++f)
    {
        InputFrame frame = table.neutral();
        for (auto id : sparse)
        {
            if (f > 0 && TKS_TRY(stream.readBool()))
            {
                frame.actions[id] = batch.frames.back().actions[id];
                continue;
            }
            frame.actions[id] = TKS_TRY(readAction(stream, table[id].kind));
        }

        if (f > 0 && TKS_TRY(stream.readBool()))
        {
            frame.owned = batch.frames.back().owned;
        }
        else
        {
            frame.owned = TKS_TRY(readOwned(stream));
        }
        batch.frames.push_back(std::move(frame));
    }

    return batch;
}

} // namespace tks::input
