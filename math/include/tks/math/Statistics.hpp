/**
 * @file Statistics.hpp
 * @brief Statistical utilities for clock and latency estimation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_MATH_STATISTICS_HPP
    #define TKS_MATH_STATISTICS_HPP

    #include <tks/core/Types.hpp>

    #include <span>

namespace tks::math {

/**
 * @brief Utility functions used by the tick-rate estimator and the
 *        latency smoothing of sessions.
 */
class Statistics final {
public:
    Statistics() = delete;

    /**
     * @brief Arithmetic mean of a sample set.
     * @return 0 for an empty set.
     */
    [[nodiscard]] static double mean(std::span<const double> samples);

    /**
     * @brief Least-squares slope of @p ys against @p xs.
     *
     * Both spans must have the same length.
     *
     * @return 0 when fewer than two samples are given or when every
     *         @p xs value is identical.
     */
    [[nodiscard]] static double linearSlope(
        std::span<const double> xs,
        std::span<const double> ys
    );

    /**
     * @brief Exponential moving average step.
     * @param current Previous smoothed value.
     * @param sample  New measurement.
     * @param alpha   Weight of the new measurement in [0, 1].
     */
    [[nodiscard]] static double smooth(double current, double sample, double alpha);
};

} // namespace tks::math

#endif // TKS_MATH_STATISTICS_HPP
