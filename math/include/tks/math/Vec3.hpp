/**
 * @file Vec3.hpp
 * @brief 3-component vector used for synchronized positions, offsets and
 *        the lag-compensation peer distance.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TKS_MATH_VEC3_HPP
    #define TKS_MATH_VEC3_HPP

    #include <concepts>

namespace tks::math {

template <std::floating_point T>
struct Vec3 final {
    T x{};
    T y{};
    T z{};

    constexpr Vec3() = default;
    constexpr Vec3(T x_, T y_, T z_) : x(x_), y(y_), z(z_) {}

    [[nodiscard]] friend constexpr Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
    [[nodiscard]] friend constexpr Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
    [[nodiscard]] friend constexpr Vec3 operator*(Vec3 v, T s)    { return {v.x * s, v.y * s, v.z * s}; }
    [[nodiscard]] friend constexpr Vec3 operator*(T s, Vec3 v)    { return v * s; }
    [[nodiscard]] constexpr Vec3 operator-() const                { return {-x, -y, -z}; }

    constexpr Vec3 &operator+=(Vec3 rhs) { return *this = *this + rhs; }
    constexpr Vec3 &operator-=(Vec3 rhs) { return *this = *this - rhs; }

    [[nodiscard]] constexpr bool operator==(const Vec3 &rhs) const = default;

    [[nodiscard]] constexpr T dot(Vec3 rhs) const { return x * rhs.x + y * rhs.y + z * rhs.z; }

    [[nodiscard]] constexpr Vec3 cross(Vec3 rhs) const
    {
        return {y * rhs.z - z * rhs.y, z * rhs.x - x * rhs.z, x * rhs.y - y * rhs.x};
    }

    [[nodiscard]] constexpr T lengthSquared() const { return dot(*this); }

    /// Squared distance; peers are ranked by it, so no square root is taken.
    [[nodiscard]] constexpr T distanceSquared(Vec3 rhs) const { return (*this - rhs).lengthSquared(); }

    [[nodiscard]] static constexpr Vec3 zero() { return {}; }
};

using Vec3f = Vec3<float>;

} // namespace tks::math

#endif // TKS_MATH_VEC3_HPP
