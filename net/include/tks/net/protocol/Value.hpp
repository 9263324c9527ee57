/**
 * @file Value.hpp
 * @brief Type-tagged property value exchanged on the wire.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_NET_PROTOCOL_VALUE_HPP
    #define TKS_NET_PROTOCOL_VALUE_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Expected.hpp>
#include <tks/math/Quat.hpp>
#include <tks/math/Vec3.hpp>

#include <variant>

namespace tks::net::protocol {

class Bitstream;

/**
 * @brief Any value a synchronized property can hold.
 */
using Value = std::variant<bool, core::i32, core::f32, math::Vec3f, math::Quatf>;

/**
 * @enum ValueType
 * @brief Wire tag of a Value, matching the variant index.
 */
enum class ValueType : core::u8
{
    Bool  = 0,
    Int   = 1,
    Float = 2,
    Vec3  = 3,
    Quat  = 4
};

/** @brief Number of bits used by a ValueType tag on the wire. */
static constexpr core::u32 kValueTypeBits = 3;

template <typename T>
struct ValueTypeOf;

template <> struct ValueTypeOf<bool>        { static constexpr ValueType value = ValueType::Bool; };
template <> struct ValueTypeOf<core::i32>   { static constexpr ValueType value = ValueType::Int; };
template <> struct ValueTypeOf<core::f32>   { static constexpr ValueType value = ValueType::Float; };
template <> struct ValueTypeOf<math::Vec3f> { static constexpr ValueType value = ValueType::Vec3; };
template <> struct ValueTypeOf<math::Quatf> { static constexpr ValueType value = ValueType::Quat; };

[[nodiscard]] inline ValueType typeOf(const Value &value) noexcept
{
    return static_cast<ValueType>(value.index());
}

/** @brief Writes the payload of @p value without its tag. */
void writeValueBody(Bitstream &stream, const Value &value);

/** @brief Reads an untagged payload of a known type. */
[[nodiscard]] core::Expected<Value> readValueBody(Bitstream &stream, ValueType type);

/** @brief Writes @p value preceded by its type tag. */
void writeValue(Bitstream &stream, const Value &value);

/** @brief Reads a tagged value. */
[[nodiscard]] core::Expected<Value> readValue(Bitstream &stream);

} // namespace tks::net::protocol

#endif // TKS_NET_PROTOCOL_VALUE_HPP
