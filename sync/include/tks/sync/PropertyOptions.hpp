/**
 * @file PropertyOptions.hpp
 * @brief Per-property synchronization options and typed handles.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_PROPERTY_OPTIONS_HPP
    #define TKS_SYNC_PROPERTY_OPTIONS_HPP

#include <tks/container/HistoryBuffer.hpp>
#include <tks/core/Constants.hpp>
#include <tks/core/Types.hpp>

#include <limits>
#include <optional>

namespace tks::sync {

/**
 * @enum SyncStrategy
 * @brief Transport strategy of a property.
 *
 * The enumerator order is the wire ordering class: properties are
 * indexed unreliable first, then auto, reliable, no-sync and finally
 * client-owned, declaration order within a class.
 */
enum class SyncStrategy : core::u8
{
    Unreliable = 0, ///< Sent every cycle on the unreliable channel.
    Auto,           ///< Unreliable while changing, one reliable send once stable.
    Reliable,       ///< Sent reliably whenever it changed since the last reliable send.
    NoSync,         ///< Historized locally, never sent.
    ClientOwned     ///< Written by the owning client through its input batches.
};

[[nodiscard]] const char *toString(SyncStrategy strategy) noexcept;

struct PropertyOptions
{
    SyncStrategy                 strategy{SyncStrategy::Auto};
    container::InterpolationMode intraTick{container::InterpolationMode::kLinear};
    container::InterpolationMode gapFill{container::InterpolationMode::kLinear};
    std::optional<core::u32>     maxExtrapolation;  ///< Unset: the world's Config::maxExtrapolation().
    bool                         predicted{false}; ///< The server confirms prediction to the owner.
};

/**
 * @brief Typed reference to a property, returned by SyncedEntity::Builder::add().
 *
 * Holds the declaration index, which stays stable whatever the wire
 * ordering becomes.
 */
template <typename T>
struct PropertyHandle
{
    static constexpr core::u16 kInvalid = std::numeric_limits<core::u16>::max();

    core::u16 index{kInvalid};

    [[nodiscard]] constexpr bool isValid() const noexcept { return index != kInvalid; }
    [[nodiscard]] constexpr bool operator==(const PropertyHandle &) const noexcept = default;
};

} // namespace tks::sync

#endif // TKS_SYNC_PROPERTY_OPTIONS_HPP
