/**
 * @file Interpolation.hpp
 * @brief Per-type interpolation and prediction-error traits.
 *
 * Every type a history buffer can store specialises Interpolation<T>:
 *   - lerp(a, b, t): affine blend, t may leave [0, 1] when extrapolating;
 *   - kCorrectable: whether a prediction error can be expressed as an
 *     offset and subtracted from later samples;
 *   - error(predicted, authoritative) / correct(value, error).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_MATH_INTERPOLATION_HPP
    #define TKS_MATH_INTERPOLATION_HPP

    #include "Quat.hpp"
    #include "Vec3.hpp"

    #include <tks/core/Types.hpp>

    #include <cmath>

namespace tks::math {

template <typename T>
struct Interpolation;

template <>
struct Interpolation<float> {
    static constexpr bool kCorrectable = true;

    [[nodiscard]] static constexpr float lerp(float a, float b, double t)
    {
        return a + (b - a) * static_cast<float>(t);
    }
    [[nodiscard]] static constexpr float error(float predicted, float authoritative) { return predicted - authoritative; }
    [[nodiscard]] static constexpr float correct(float value, float err) { return value - err; }
};

template <>
struct Interpolation<core::i32> {
    static constexpr bool kCorrectable = true;

    [[nodiscard]] static core::i32 lerp(core::i32 a, core::i32 b, double t)
    {
        return static_cast<core::i32>(std::lround(a + (static_cast<double>(b) - a) * t));
    }
    [[nodiscard]] static constexpr core::i32 error(core::i32 predicted, core::i32 authoritative) { return predicted - authoritative; }
    [[nodiscard]] static constexpr core::i32 correct(core::i32 value, core::i32 err) { return value - err; }
};

/// Booleans have no meaningful blend: the left sample holds until the right one is reached.
template <>
struct Interpolation<bool> {
    static constexpr bool kCorrectable = false;

    [[nodiscard]] static constexpr bool lerp(bool a, bool b, double t) { return t < 1.0 ? a : b; }
    [[nodiscard]] static constexpr bool error(bool, bool) { return false; }
    [[nodiscard]] static constexpr bool correct(bool value, bool) { return value; }
};

template <>
struct Interpolation<Vec3f> {
    static constexpr bool kCorrectable = true;

    [[nodiscard]] static constexpr Vec3f lerp(Vec3f a, Vec3f b, double t)
    {
        return a + (b - a) * static_cast<float>(t);
    }
    [[nodiscard]] static constexpr Vec3f error(Vec3f predicted, Vec3f authoritative) { return predicted - authoritative; }
    [[nodiscard]] static constexpr Vec3f correct(Vec3f value, Vec3f err) { return value - err; }
};

/// The rotation error is the delta rotation taking the authoritative
/// orientation to the predicted one; correcting pre-multiplies its inverse.
template <>
struct Interpolation<Quatf> {
    static constexpr bool kCorrectable = true;

    [[nodiscard]] static Quatf lerp(Quatf a, Quatf b, double t)
    {
        return Quatf::nlerp(a, b, static_cast<float>(t));
    }
    [[nodiscard]] static Quatf error(Quatf predicted, Quatf authoritative)
    {
        return (predicted * authoritative.conjugate()).normalize();
    }
    [[nodiscard]] static Quatf correct(Quatf value, Quatf err)
    {
        return (err.conjugate() * value).normalize();
    }
};

} // namespace tks::math

#endif // TKS_MATH_INTERPOLATION_HPP
