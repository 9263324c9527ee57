/**
 * @file Value.cpp
 * @brief Value wire codec.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/net/protocol/Value.hpp>
#include <tks/net/protocol/Bitstream.hpp>

#include <format>
#include <type_traits>

namespace tks::net::protocol {

void writeValueBody(Bitstream &stream, const Value &value)
{
    std::visit([&stream](const auto &v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>)
        {
            stream.writeBool(v);
        }
        else if constexpr (std::is_same_v<T, core::i32>)
        {
            stream.writeI32(v);
        }
        else if constexpr (std::is_same_v<T, core::f32>)
        {
            stream.writeF32(v);
        }
        else if constexpr (std::is_same_v<T, math::Vec3f>)
        {
            stream.writeF32(v.x);
            stream.writeF32(v.y);
            stream.writeF32(v.z);
        }
        else
        {
            stream.writeF32(v.w);
            stream.writeF32(v.x);
            stream.writeF32(v.y);
            stream.writeF32(v.z);
        }
    }, value);
}

core::Expected<Value> readValueBody(Bitstream &stream, ValueType type)
{
    switch (type)
    {
        case ValueType::Bool:
            return Value{TKS_TRY(stream.readBool())};
        case ValueType::Int:
            return Value{TKS_TRY(stream.readI32())};
        case ValueType::Float:
            return Value{TKS_TRY(stream.readF32())};
        case ValueType::Vec3:
        {
            math::Vec3f v;
            v.x = TKS_TRY(stream.readF32());
            v.y = TKS_TRY(stream.readF32());
            v.z = TKS_TRY(stream.readF32());
            return Value{v};
        }
        case ValueType::Quat:
        {
            math::Quatf q;
            q.w = TKS_TRY(stream.readF32());
            q.x = TKS_TRY(stream.readF32());
            q.y = TKS_TRY(stream.readF32());
            q.z = TKS_TRY(stream.readF32());
            return Value{q};
        }
    }
    return core::makeError(core::ErrorCode::CorruptedData,
                           std::format("unknown value type {}", static_cast<core::u32>(type)));
}

void writeValue(Bitstream &stream, const Value &value)
{
    stream.writeBits(static_cast<core::u32>(value.index()), kValueTypeBits);
    writeValueBody(stream, value);
}

core::Expected<Value> readValue(Bitstream &stream)
{
    const core::u32 tag = TKS_TRY(stream.readBits(kValueTypeBits));
    if (tag >= std::variant_size_v<Value>)
    {
        return core::makeError(core::ErrorCode::CorruptedData,
                               std::format("unknown value tag {}", tag));
    }
    return readValueBody(stream, static_cast<ValueType>(tag));
}

} // namespace tks::net::protocol
