/**
 * @file IInputSource.hpp
 * @brief Where the local player's actions come from (device, bot, replay).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_IINPUTSOURCE_HPP
    #define TKS_INPUT_IINPUTSOURCE_HPP

#include <tks/core/Types.hpp>

#include <cmath>
#include <string_view>

namespace tks::input {

/**
 * @class IInputSource
 * @brief Queried by ActionTable::sample once per fixed step.
 *
 * Only the resulting InputFrame is stored, batched and replayed, so a
 * source never needs to remember past steps.
 */
class IInputSource
{
public:
    /** @brief Strength from which a digital action counts as held. */
    static constexpr core::f32 kPressThreshold = 0.5f;

    virtual ~IInputSource() = default;

    /** @brief Analog value of @p action, 0 when released or unknown. */
    [[nodiscard]] virtual core::f32 actionStrength(std::string_view action) const = 0;

    /** @brief Digital read of a ActionKind::Bool action. */
    [[nodiscard]] virtual bool isActionPressed(std::string_view action) const
    {
        return std::abs(actionStrength(action)) >= kPressThreshold;
    }

    /** @brief Name written to the log when the source is attached. */
    [[nodiscard]] virtual const char* name() const noexcept { return "input"; }
};

} // namespace tks::input

#endif // TKS_INPUT_IINPUTSOURCE_HPP
