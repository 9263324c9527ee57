/**
 * @file InputFrame.hpp
 * @brief Input sampled by one peer during one fixed step.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_INPUTFRAME_HPP
    #define TKS_INPUT_INPUTFRAME_HPP

#include <tks/net/protocol/Value.hpp>
#include <tks/core/Types.hpp>

#include <algorithm>
#include <vector>

namespace tks::input {

/**
 * @struct OwnedBlock
 * @brief Values of the client-owned properties of one entity, in the
 *        entity's client-owned property order.
 */
struct OwnedBlock
{
    core::u32                         entityKey{0};
    std::vector<net::protocol::Value> values;

    [[nodiscard]] bool operator==(const OwnedBlock &) const = default;
};

/**
 * @struct InputFrame
 * @brief One action value per entry of the ActionTable, plus the
 *        client-owned blocks written by the sampling peer that step.
 *
 * Boolean actions are stored as 0 or 1.
 */
struct InputFrame
{
    std::vector<core::f32>  actions;
    std::vector<OwnedBlock> owned;

    [[nodiscard]] bool operator==(const InputFrame &) const = default;

    [[nodiscard]] bool isNeutral() const noexcept
    {
        return owned.empty()
            && std::all_of(actions.begin(), actions.end(), [](core::f32 v) { return v == 0.0f; });
    }

    [[nodiscard]] core::f32 action(core::usize index) const noexcept
    {
        return index < actions.size() ? actions[index] : 0.0f;
    }
};

} // namespace tks::input

#endif // TKS_INPUT_INPUTFRAME_HPP
