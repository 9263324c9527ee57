/**
 * @file TickRateEstimator.hpp
 * @brief Windowed estimate of the server tick rate from tick reports.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TKS_SYNC_TICK_RATE_ESTIMATOR_HPP
    #define TKS_SYNC_TICK_RATE_ESTIMATOR_HPP

#include <tks/core/Constants.hpp>
#include <tks/core/Types.hpp>

#include <deque>
#include <optional>
#include <vector>

namespace tks::sync {

/**
 * @class TickRateEstimator
 * @brief Least-squares fit of reported server ticks against local time.
 *
 * Keeps at most @c window samples; the oldest sample is dropped when
 * the window is full.
 */
class TickRateEstimator final
{
public:
    explicit TickRateEstimator(core::usize window = core::kTickRateWindow);

    /** @brief Record that the server was at @p tick when we were at @p time seconds. */
    void addSample(core::f64 time, core::Tick tick);

    /** @brief Fitted rate, or nullopt with fewer than two distinct samples. */
    [[nodiscard]] std::optional<core::f64> ticksPerSecond() const noexcept { return _rate; }

    /** @brief Projected server tick at @p now from the newest sample and the fitted rate. */
    [[nodiscard]] std::optional<core::f64> estimateTick(core::f64 now) const;

    [[nodiscard]] core::usize size()   const noexcept { return _samples.size(); }
    [[nodiscard]] core::usize window() const noexcept { return _window; }

    void clear() noexcept;

private:
    struct Sample
    {
        core::f64 time;
        core::f64 tick;
    };

    [[nodiscard]] std::optional<core::f64> fit();

    core::usize        _window;
    std::deque<Sample>       _samples;
    std::optional<core::f64> _rate; ///< Refitted on every sample.
    std::vector<core::f64>   _times;
    std::vector<core::f64>   _ticks;
};

} // namespace tks::sync

#endif // TKS_SYNC_TICK_RATE_ESTIMATOR_HPP
