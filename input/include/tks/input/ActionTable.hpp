/**
 * @file ActionTable.hpp
 * @brief Ordered list of the input actions shared by every peer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_INPUT_ACTIONTABLE_HPP
    #define TKS_INPUT_ACTIONTABLE_HPP

#include <tks/input/IInputSource.hpp>
#include <tks/input/InputFrame.hpp>
#include <tks/core/Types.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tks::input {

/**
 * @enum ActionKind
 * @brief How an action is sampled and encoded.
 */
enum class ActionKind : core::u8
{
    Bool,   ///< Pressed or not, one bit on the wire.
    Analog  ///< Strength, one float on the wire.
};

/**
 * @struct ActionDesc
 * @brief One entry of the table.
 */
struct ActionDesc
{
    std::string name;
    ActionKind  kind;
};

/**
 * @class ActionTable
 * @brief Send table of actions; its order is the wire order.
 *
 * Every peer must build the same table.
 */
class ActionTable final
{
public:
    ActionTable() = default;

    /**
     * @brief Appends an action.
     * @return *this for chaining.
     */
    ActionTable &add(std::string name, ActionKind kind);

    [[nodiscard]] core::usize size() const noexcept { return _actions.size(); }
    [[nodiscard]] const ActionDesc &operator[](core::usize index) const { return _actions[index]; }

    [[nodiscard]] std::optional<core::usize> indexOf(std::string_view name) const;

    /** @brief Queries @p source for every action. */
    [[nodiscard]] InputFrame sample(const IInputSource &source) const;

    /** @brief A frame with every action released. */
    [[nodiscard]] InputFrame neutral() const;

private:
    std::vector<ActionDesc> _actions;
};

} // namespace tks::input

#endif // TKS_INPUT_ACTIONTABLE_HPP
