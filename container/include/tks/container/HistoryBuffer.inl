/**
 * @file HistoryBuffer.inl
 * @brief Template implementation of the tick-indexed history buffer.
 * @see   HistoryBuffer.hpp
 */

#ifndef TKS_CONTAINER_HISTORY_BUFFER_INL
    #define TKS_CONTAINER_HISTORY_BUFFER_INL

    #include <algorithm>
    #include <cmath>

namespace tks::container {

template <Historizable T>
HistoryBuffer<T>::HistoryBuffer(core::usize capacity)
{
    resize(capacity);
}

template <Historizable T>
void HistoryBuffer<T>::resize(core::usize capacity)
{
    TKS_VERIFY(!_written);
    TKS_VERIFY(capacity > 0);

    _values.assign(capacity, T{});
    _synthesized.assign(capacity, 1);
}

template <Historizable T>
core::Tick HistoryBuffer<T>::oldestTick() const
{
    const auto cap = static_cast<core::Tick>(_values.size());
    return std::max(_lastTick - cap + 1, std::min<core::Tick>(1, _lastTick));
}

template <Historizable T>
core::usize HistoryBuffer<T>::slot(core::Tick tick) const
{
    const auto cap = static_cast<core::Tick>(_values.size());
    return static_cast<core::usize>(((tick % cap) + cap) % cap);
}

template <Historizable T>
T HistoryBuffer<T>::blend(const T &a, const T &b, core::f64 t, InterpolationMode mode) const
{
    if (mode == InterpolationMode::kNone)
        return (t < 1.0) ? a : b;
    return Traits::lerp(a, b, t);
}

template <Historizable T>
void HistoryBuffer<T>::fillGap(core::Tick left, const T &a, core::Tick right, const T &b)
{
    const auto span = static_cast<core::f64>(right - left);
    for (core::Tick t = std::max(left + 1, oldestTick()); t < right; ++t)
    {
        const auto idx = slot(t);
        _values[idx] = blend(a, b, static_cast<core::f64>(t - left) / span, _gapFill);
        _synthesized[idx] = 1;
    }
}

template <Historizable T>
void HistoryBuffer<T>::fillPlateau(core::Tick from, core::Tick to, const T &value)
{
    for (core::Tick t = std::max(from, oldestTick()); t <= to; ++t)
    {
        const auto idx = slot(t);
        _values[idx] = value;
        _synthesized[idx] = 1;
    }
}

template <Historizable T>
void HistoryBuffer<T>::recomputeLastChanged()
{
    const core::Tick oldest = oldestTick();
    for (core::Tick t = _lastTick; t > oldest; --t)
    {
        if (!(_values[slot(t)] == _values[slot(t - 1)]))
        {
            _lastChangedTick = t;
            return;
        }
    }
    _lastChangedTick = std::min(_lastChangedTick, oldest);
}

template <Historizable T>
void HistoryBuffer<T>::write(core::Tick tick, const T &value)
{
    TKS_VERIFY(!_values.empty());

    if (!_written)
    {
        std::fill(_values.begin(), _values.end(), value);
        std::fill(_synthesized.begin(), _synthesized.end(), core::u8{1});
        _synthesized[slot(tick)] = 0;
        _lastTick = tick;
        _lastChangedTick = tick;
        _written = true;
        return;
    }

    if (tick < oldestTick())
        return;

    if (tick > _lastTick)
    {
        const T boundary = _values[slot(_lastTick)];
        const core::Tick previous = _lastTick;

        _lastTick = tick;
        fillGap(previous, boundary, tick, value);

        const auto idx = slot(tick);
        _values[idx] = value;
        _synthesized[idx] = 0;

        if (!(value == boundary))
            _lastChangedTick = tick;
        return;
    }

    const auto idx = slot(tick);
    _values[idx] = value;
    _synthesized[idx] = 0;

    const core::Tick oldest = oldestTick();

    core::Tick left = tick - 1;
    while (left >= oldest && _synthesized[slot(left)])
        --left;
    if (left >= oldest)
        fillGap(left, _values[slot(left)], tick, value);
    else
        fillPlateau(oldest, tick - 1, value);

    core::Tick right = tick + 1;
    while (right <= _lastTick && _synthesized[slot(right)])
        ++right;
    if (right <= _lastTick)
        fillGap(tick, value, right, _values[slot(right)]);
    else
        fillPlateau(tick + 1, _lastTick, value);

    recomputeLastChanged();
}

template <Historizable T>
T HistoryBuffer<T>::at(core::Tick tick) const
{
    TKS_VERIFY(_written);

    return _values[slot(std::clamp(tick, oldestTick(), _lastTick))];
}

template <Historizable T>
T HistoryBuffer<T>::read(core::f64 tick) const
{
    TKS_VERIFY(_written);

    const auto last = static_cast<core::f64>(_lastTick);
    if (tick > last)
    {
        const core::f64 t = std::min(tick, last + static_cast<core::f64>(_maxExtrapolation));
        const T b = _values[slot(_lastTick)];
        const T a = (_lastTick - 1 >= oldestTick()) ? T(_values[slot(_lastTick - 1)]) : b;
        return blend(a, b, t - last + 1.0, _gapFill);
    }

    const core::Tick oldest = oldestTick();
    if (tick <= static_cast<core::f64>(oldest))
        return _values[slot(oldest)];

    const core::f64 lo = std::floor(tick);
    const auto loTick = static_cast<core::Tick>(lo);
    const core::f64 frac = tick - lo;
    if (frac == 0.0)
        return _values[slot(loTick)];

    return blend(_values[slot(loTick)], _values[slot(loTick + 1)], frac, _intraTick);
}

template <Historizable T>
void HistoryBuffer<T>::rollback(core::Tick toTick)
{
    if (!_written || toTick >= _lastTick)
        return;
    if (_rollbackFrom == _lastTick && _rollbackTo == toTick)
        return;

    const core::Tick anchor = std::max(toTick, oldestTick());
    const T plateau = _values[slot(anchor)];
    fillPlateau(anchor + 1, _lastTick, plateau);

    _rollbackFrom = _lastTick;
    _rollbackTo = toTick;
    recomputeLastChanged();
}

template <Historizable T>
void HistoryBuffer<T>::applyCorrection(core::Tick tick, const T &authoritative)
{
    if (!_written || tick < oldestTick() || tick > _lastTick)
        return;

    const auto idx = slot(tick);
    const T error = Traits::error(_values[idx], authoritative);
    _values[idx] = authoritative;
    _synthesized[idx] = 0;

    if constexpr (Traits::kCorrectable)
    {
        for (core::Tick t = tick + 1; t <= _lastTick; ++t)
        {
            auto &v = _values[slot(t)];
            v = Traits::correct(v, error);
        }
    }
    recomputeLastChanged();
}

template <Historizable T>
bool HistoryBuffer<T>::changed(core::Tick oldTick, core::Tick newTick) const
{
    if (!_written || _lastChangedTick <= oldTick)
        return false;
    return !(read(static_cast<core::f64>(oldTick)) == read(static_cast<core::f64>(newTick)));
}

template <Historizable T>
bool HistoryBuffer<T>::isSynthesized(core::Tick tick) const
{
    TKS_VERIFY(_written);

    if (tick < oldestTick() || tick > _lastTick)
        return true;
    return _synthesized[slot(tick)] != 0;
}

} // namespace tks::container

#endif // TKS_CONTAINER_HISTORY_BUFFER_INL
