/**
 * @file ClockSequencer.cpp
 * @brief ClockSequencer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tks/sync/ClockSequencer.hpp>
#include <tks/core/Assert.hpp>
#include <tks/core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace tks::sync {

ClockSequencer::ClockSequencer(ClockRole role, const engine::Config &config)
    : _role{role}
    , _interpolationLag{config.interpolationLag()}
    , _maxOfflineExtrapolation{config.maxOfflineExtrapolation()}
    , _offlineSteps{std::max<core::u32>(1, 2 * config.tickRate() / std::max<core::u32>(1, config.serverSendRate()))}
    , _lookback(config.inputTickLookback())
{
    TKS_VERIFY(!_lookback.empty());
}

void ClockSequencer::step(core::f64 now)
{
    ++_tick;
    ++_inputId;

    if (_role == ClockRole::Client && synchronized())
    {
        ++_stepsSinceReport;
        correct(now);
    }

    remember(_inputId, _tick);
}

void ClockSequencer::correct(core::f64 now)
{
    const auto projected = _estimator.estimateTick(now);
    const core::f64 estimate = projected
        ? *projected
        : static_cast<core::f64>(_lastServerTick + _stepsSinceReport);

    const core::Tick ceiling = _lastServerTick + _maxOfflineExtrapolation;
    const core::Tick upper = offline() ? ceiling : _lastServerTick + _interpolationLag;
    const core::Tick target = std::clamp(static_cast<core::Tick>(std::llround(estimate)), _lastServerTick, upper);

    const core::Tick gap = target - _tick;
    if (std::abs(gap) > static_cast<core::Tick>(_interpolationLag + _maxOfflineExtrapolation))
    {
        core::Log::info("CLOCK", std::format("snap {} -> {} (server {})", _tick, target, _lastServerTick));
        _tick = target;
        ++_snaps;
    }
    else
    {
        _tick += std::clamp<core::Tick>(gap, -1, 1);
    }

    _tick = std::min(_tick, ceiling);
}

void ClockSequencer::onServerTick(core::Tick serverTick, core::f64 now)
{
    if (_role != ClockRole::Client || serverTick <= _lastServerTick)
    {
        return;
    }

    if (!synchronized())
    {
        core::Log::info("CLOCK", std::format("synchronized on server tick {}", serverTick));
        _tick = serverTick;
    }

    _lastServerTick = serverTick;
    _stepsSinceReport = 0;
    _estimator.addSample(now, serverTick);
}

void ClockSequencer::setFraction(core::f64 alpha) noexcept
{
    _fraction = std::clamp(alpha, 0.0, 1.0);
}

bool ClockSequencer::offline() const noexcept
{
    return _role == ClockRole::Client && synchronized() && _stepsSinceReport > _offlineSteps;
}

core::f64 ClockSequencer::fractionalTick() const noexcept
{
    return static_cast<core::f64>(_tick) + _fraction;
}

core::f64 ClockSequencer::renderTick() const noexcept
{
    if (_role == ClockRole::Server)
    {
        return fractionalTick();
    }
    return fractionalTick() - static_cast<core::f64>(_interpolationLag);
}

void ClockSequencer::remember(core::InputId id, core::Tick tick)
{
    auto &entry = _lookback[static_cast<core::usize>(id) % _lookback.size()];
    entry.id = id;
    entry.tick = tick;
}

std::optional<core::Tick> ClockSequencer::tickForInput(core::InputId id) const
{
    if (id < 0)
    {
        return std::nullopt;
    }
    const auto &entry = _lookback[static_cast<core::usize>(id) % _lookback.size()];
    if (entry.id != id)
    {
        return std::nullopt;
    }
    return entry.tick;
}

TimeDepth ClockSequencer::timeDepth(const math::Vec3f &point, std::span<const PeerPresence> peers)
{
    if (peers.size() < 2)
    {
        return {};
    }

    const PeerPresence *nearest = nullptr;
    const PeerPresence *second = nullptr;
    core::f32 d1 = 0.0f;
    core::f32 d2 = 0.0f;

    for (const auto &p : peers)
    {
        const core::f32 d = point.distanceSquared(p.position);
        if (!nearest || d < d1)
        {
            second = nearest;
            d2 = d1;
            nearest = &p;
            d1 = d;
        }
        else if (!second || d < d2)
        {
            second = &p;
            d2 = d;
        }
    }

    if (d2 <= 0.0f)
    {
        return {};
    }

    const core::f64 ratio = static_cast<core::f64>(d1) / static_cast<core::f64>(d2);
    return TimeDepth{nearest->latencyTicks * (1.0 - ratio), nearest->peer};
}

} // namespace tks::sync
