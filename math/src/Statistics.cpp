/**
 * @file Statistics.cpp
 * @brief Implementation of statistical utilities.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "tks/math/Statistics.hpp"

#include <cmath>

namespace tks::math {

double Statistics::mean(std::span<const double> samples)
{
    if (samples.empty())
        return 0.0;

    double sum = 0.0;
    for (auto s : samples)
        sum += s;
    return sum / static_cast<double>(samples.size());
}

double Statistics::linearSlope(std::span<const double> xs, std::span<const double> ys)
{
    const core::usize n = (xs.size() < ys.size()) ? xs.size() : ys.size();
    if (n < 2)
        return 0.0;

    const double mx = mean(xs.first(n));
    const double my = mean(ys.first(n));

    double num = 0.0;
    double den = 0.0;
    for (core::usize i = 0; i < n; ++i) {
        const double dx = xs[i] - mx;
        num += dx * (ys[i] - my);
        den += dx * dx;
    }

    if (std::abs(den) < 1e-12)
        return 0.0;
    return num / den;
}

double Statistics::smooth(double current, double sample, double alpha)
{
    return current * (1.0 - alpha) + sample * alpha;
}

} // namespace tks::math
