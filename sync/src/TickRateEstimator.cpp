/**
 * @file TickRateEstimator.cpp
 * @brief TickRateEstimator implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/TickRateEstimator.hpp>
#include <tks/math/Statistics.hpp>
#include <tks/core/Assert.hpp>

#include <vector>

namespace tks::sync {

TickRateEstimator::TickRateEstimator(core::usize window)
    : _window{window}
{
    TKS_VERIFY(window >= 2);
}

void TickRateEstimator::addSample(core::f64 time, core::Tick tick)
{
    if (_samples.size() == _window)
    {
        _samples.pop_front();
    }
    _samples.push_back({time, static_cast<core::f64>(tick)});
    _rate = fit();
}

void TickRateEstimator::clear() noexcept
{
    _samples.clear();
    _rate.reset();
}

std::optional<core::f64> TickRateEstimator::fit()
{
    if (_samples.size() < 2)
    {
        return std::nullopt;
    }

    _times.clear();
    _ticks.clear();
    for (const auto &s : _samples)
    {
        _times.push_back(s.time);
        _ticks.push_back(s.tick);
    }

    const core::f64 slope = math::Statistics::linearSlope(_times, _ticks);
    if (slope <= 0.0)
    {
        return std::nullopt;
    }
    return slope;
}

std::optional<core::f64> TickRateEstimator::estimateTick(core::f64 now) const
{
    if (!_rate)
    {
        return std::nullopt;
    }
    const Sample &newest = _samples.back();
    return newest.tick + *_rate * (now - newest.time);
}

} // namespace tks::sync
