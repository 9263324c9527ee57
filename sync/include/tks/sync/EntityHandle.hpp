/**
 * @file EntityHandle.hpp
 * @brief Synced entity handle: packed generation + slot index.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_ENTITY_HANDLE_HPP
    #define TKS_SYNC_ENTITY_HANDLE_HPP

#include <tks/core/Types.hpp>
#include <tks/core/Constants.hpp>

#include <functional>
#include <limits>

namespace tks::sync {

/**
 * @class EntityHandle
 * @brief Packed 32-bit reference to a SyncedEntity inside a SyncWorld.
 *
 * Layout (MSB → LSB):
 *   [generation : kGenerationBits] [slot : kSlotBits]
 *
 * The generation counter detects stale handles after an entity is
 * destroyed and its slot is recycled, so peer registries can hold
 * handles without dangling.
 */
class EntityHandle final
{
public:
    static constexpr core::u32 kGenerationBits = core::kGenerationBits;
    static constexpr core::u32 kSlotBits       = core::kSlotBits;
    static constexpr core::u32 kSlotMask       = (1u << kSlotBits) - 1u;
    static constexpr core::u32 kGenerationMask = (1u << kGenerationBits) - 1u;

    /** @brief Null sentinel. */
    static constexpr core::u32 kNull = std::numeric_limits<core::u32>::max();

    constexpr EntityHandle() noexcept = default;

    constexpr explicit EntityHandle(core::u32 raw) noexcept
        : _raw{raw}
    {}

    constexpr EntityHandle(core::u32 generation, core::u32 slot) noexcept
        : _raw{((generation & kGenerationMask) << kSlotBits) | (slot & kSlotMask)}
    {}

    [[nodiscard]] constexpr core::u32 slot() const noexcept
    {
        return _raw & kSlotMask;
    }

    [[nodiscard]] constexpr core::u32 generation() const noexcept
    {
        return (_raw >> kSlotBits) & kGenerationMask;
    }

    [[nodiscard]] constexpr core::u32 raw() const noexcept { return _raw; }

    [[nodiscard]] constexpr bool isValid() const noexcept
    {
        return _raw != kNull;
    }

    [[nodiscard]] constexpr bool operator==(EntityHandle other) const noexcept
    {
        return _raw == other._raw;
    }

    [[nodiscard]] constexpr auto operator<=>(EntityHandle other) const noexcept
    {
        return _raw <=> other._raw;
    }

private:
    core::u32 _raw{kNull};
};

} // namespace tks::sync

// -------------------------------------------------------------------------- //
//  std::hash specialisation                                                  //
// -------------------------------------------------------------------------- //
template <>
struct std::hash<tks::sync::EntityHandle>
{
    [[nodiscard]] std::size_t operator()(tks::sync::EntityHandle handle) const noexcept
    {
        return std::hash<tks::core::u32>{}(handle.raw());
    }
};

#endif // TKS_SYNC_ENTITY_HANDLE_HPP
