/**
 * @file Property.inl
 * @brief Property<T> template implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#include <format>
#include <variant>

namespace tks::sync {

template <typename T>
Property<T>::Property(std::string name, PropertyOptions options)
    : IProperty{std::move(name), options}
{
    _history.setIntraTickMode(options.intraTick);
    _history.setGapFillMode(options.gapFill);
    _history.setMaxExtrapolation(options.maxExtrapolation.value_or(core::kMaxExtrapolation));
}

template <typename T>
void Property<T>::setDefaultMaxExtrapolation(core::u32 ticks)
{
    if (!_options.maxExtrapolation)
    {
        _history.setMaxExtrapolation(ticks);
    }
}

template <typename T>
void Property<T>::bind(Getter getter, Setter setter)
{
    _getter = std::move(getter);
    _setter = std::move(setter);
}

template <typename T>
net::protocol::ValueType Property<T>::type() const noexcept
{
    return net::protocol::ValueTypeOf<T>::value;
}

template <typename T>
bool Property<T>::changed(core::Tick oldTick, core::Tick newTick) const
{
    if (_history.empty())
    {
        return false;
    }
    if (oldTick == core::kNoTick)
    {
        return true;
    }
    return _history.changed(oldTick, newTick);
}

template <typename T>
net::protocol::Value Property<T>::valueAt(core::Tick tick) const
{
    return net::protocol::Value{_history.at(tick)};
}

template <typename T>
core::Expected<T> Property<T>::unwrap(const net::protocol::Value &value) const
{
    const T *typed = std::get_if<T>(&value);
    if (!typed)
    {
        return core::makeError(core::ErrorCode::InvalidArgument,
                               std::format("property '{}' received a value of the wrong type", _name));
    }
    return *typed;
}

template <typename T>
core::ExpectedVoid Property<T>::writeValue(core::Tick tick, const net::protocol::Value &value)
{
    const T typed = TKS_TRY(unwrap(value));
    _history.write(tick, typed);
    return {};
}

template <typename T>
core::ExpectedVoid Property<T>::reconcile(core::Tick tick, const net::protocol::Value &authoritative)
{
    const T auth = TKS_TRY(unwrap(authoritative));

    if (_lastCorrected != core::kNoTick && tick <= _lastCorrected)
    {
        return {};
    }
    _lastCorrected = tick;

    if (_history.empty() || tick > _history.lastTick())
    {
        _history.write(tick, auth);
        return {};
    }

    if (math::Interpolation<T>::kCorrectable)
    {
        if (!(_history.at(tick) == auth))
        {
            _history.applyCorrection(tick, auth);
        }
    }
    else
    {
        _history.write(tick, auth);
    }
    return {};
}

template <typename T>
void Property<T>::replicateForward(core::Tick tick)
{
    if (_history.empty() || tick <= _history.lastTick())
    {
        return;
    }
    const T last = _history.at(_history.lastTick());
    _history.write(tick, last);
}

template <typename T>
bool Property<T>::pull(core::Tick tick, bool always)
{
    if (!_getter)
    {
        return false;
    }
    const T value = _getter();
    const bool localWrite = _lastPushed.has_value() && !(*_lastPushed == value);
    if (always || localWrite)
    {
        _history.write(tick, value);
    }
    _lastPushed = value;
    return localWrite;
}

template <typename T>
void Property<T>::push(core::f64 tick)
{
    if (!_setter || _history.empty())
    {
        return;
    }
    const T value = _history.read(tick);
    _setter(value);
    _lastPushed = value;
}

} // namespace tks::sync
