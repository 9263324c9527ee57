/**
 * @file ActionTable.cpp
 * @brief ActionTable implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/input/ActionTable.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Constants.hpp>

namespace tks::input {

ActionTable &ActionTable::add(std::string name, ActionKind kind)
{
    TKS_VERIFY(_actions.size() < core::kMaxActions);
    TKS_VERIFY(!indexOf(name).has_value());

    _actions.push_back({std::move(name), kind});
    return *this;
}

std::optional<core::usize> ActionTable::indexOf(std::string_view name) const
{
    for (core::usize i = 0; i < _actions.size(); ++i)
    {
        if (_actions[i].name == name)
        {
            return i;
        }
    }
    return std::nullopt;
}

InputFrame ActionTable::sample(const IInputSource &source) const
{
    InputFrame frame;
    frame.actions.reserve(_actions.size());

    for (const auto &action : _actions)
    {
        if (action.kind == ActionKind::Bool)
        {
            frame.actions.push_back(source.isActionPressed(action.name) ? 1.0f : 0.0f);
        }
        else
        {
            frame.actions.push_back(source.actionStrength(action.name));
        }
    }
    return frame;
}

InputFrame ActionTable::neutral() const
{
    InputFrame frame;
    frame.actions.assign(_actions.size(), 0.0f);
    return frame;
}

} // namespace tks::input
