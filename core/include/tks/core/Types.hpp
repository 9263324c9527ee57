/**
 * @file Types.hpp
 * @brief Primitive type aliases and the tick / input / peer identifiers.
 *
 * Provides fixed-width integer aliases, floating-point aliases and the
 * integer identifiers shared by every synchronization module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_CORE_TYPES_HPP
    #define TKS_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace tks::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;

using byte = std::byte;

/** @brief One discrete step of the authoritative simulation clock (state id). */
using Tick = i64;

/** @brief One discrete step of a peer's local input sampling clock. */
using InputId = i64;

/** @brief Network peer identifier. Peer 0 is the synthetic local peer. */
using PeerId = u32;

/** @brief Sentinel meaning "no tick" / "no input". */
inline constexpr Tick    kNoTick    = -1;
inline constexpr InputId kNoInputId = -1;

/** @brief Ticks and input ids read off the wire stay below this bound. */
inline constexpr i64     kMaxWireCounter = i64{1} << 62;

/** @brief The synthetic local peer, always present. */
inline constexpr PeerId kLocalPeer     = 0;

/** @brief The authoritative server as seen from a client. */
inline constexpr PeerId kServerPeer    = 1;

/** @brief Addresses every connected peer at once. */
inline constexpr PeerId kBroadcastPeer = 0xFFFF'FFFFu;

} // namespace tks::core

#endif // TKS_CORE_TYPES_HPP
