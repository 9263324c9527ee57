/**
 * @file Quat.hpp
 * @brief Unit quaternion for synchronized rotations.
 *
 * Default construction yields the identity rotation, which is also the
 * neutral value of a rotation property.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_MATH_QUAT_HPP
    #define TKS_MATH_QUAT_HPP

    #include "Vec3.hpp"

    #include <cmath>

namespace tks::math {

template <std::floating_point T>
struct Quat final {
    T w{1};
    T x{};
    T y{};
    T z{};

    constexpr Quat() = default;
    constexpr Quat(T w_, T x_, T y_, T z_) : w(w_), x(x_), y(y_), z(z_) {}

    /// Hamilton product: applies @p rhs first, then this rotation.
    [[nodiscard]] constexpr Quat operator*(Quat rhs) const
    {
        return {
            w * rhs.w - x * rhs.x - y * rhs.y - z * rhs.z,
            w * rhs.x + x * rhs.w + y * rhs.z - z * rhs.y,
            w * rhs.y - x * rhs.z + y * rhs.w + z * rhs.x,
            w * rhs.z + x * rhs.y - y * rhs.x + z * rhs.w
        };
    }

    [[nodiscard]] constexpr bool operator==(const Quat &rhs) const = default;

    [[nodiscard]] constexpr Vec3<T> rotate(Vec3<T> v) const
    {
        const Vec3<T> axis{x, y, z};
        const Vec3<T> t = axis.cross(v) * T{2};
        return v + t * w + axis.cross(t);
    }

    /// Inverse of a unit quaternion.
    [[nodiscard]] constexpr Quat conjugate() const { return {w, -x, -y, -z}; }

    [[nodiscard]] constexpr T dot(Quat rhs) const { return w * rhs.w + x * rhs.x + y * rhs.y + z * rhs.z; }

    /// Degenerate (zero length) input falls back to the identity.
    [[nodiscard]] Quat normalize() const
    {
        const T lenSq = dot(*this);
        if (lenSq <= T{})
            return {};
        const T inv = T{1} / std::sqrt(lenSq);
        return {w * inv, x * inv, y * inv, z * inv};
    }

    [[nodiscard]] static constexpr Quat identity() { return {}; }

    /// @p axis is expected to be unit length.
    [[nodiscard]] static Quat fromAxisAngle(Vec3<T> axis, T angleRad)
    {
        const T s = std::sin(angleRad * T{0.5});
        return Quat{std::cos(angleRad * T{0.5}), axis.x * s, axis.y * s, axis.z * s}.normalize();
    }

    /**
     * @brief Normalised linear blend along the shortest arc.
     *
     * Accepts @p t outside [0, 1] so the same call extrapolates a
     * rotation past its last known sample.
     */
    [[nodiscard]] static Quat nlerp(Quat a, Quat b, T t)
    {
        if (a.dot(b) < T{})
            b = {-b.w, -b.x, -b.y, -b.z};
        return Quat{a.w + (b.w - a.w) * t, a.x + (b.x - a.x) * t,
                    a.y + (b.y - a.y) * t, a.z + (b.z - a.z) * t}.normalize();
    }
};

using Quatf = Quat<float>;

} // namespace tks::math

#endif // TKS_MATH_QUAT_HPP
