/**
 * @file Vec2.hpp
 * @brief 2D vector type and the small helpers the engine needs on top of it.
 *
 * Vec2 is glm::vec2; every module exchanges positions, velocities and
 * extents through this alias.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_MATH_VEC2_HPP
    #define EMBER_MATH_VEC2_HPP

    #include "ember/core/Types.hpp"

    #include <glm/geometric.hpp>
    #include <glm/vec2.hpp>

    #include <algorithm>
    #include <cmath>

namespace ember::math {

using Vec2 = glm::vec2;

[[nodiscard]] inline core::f32 lengthSquared(Vec2 v) noexcept
{
    return glm::dot(v, v);
}

/** @brief Normalises @p v, or returns zero for a (near) zero vector. */
[[nodiscard]] inline Vec2 safeNormalize(Vec2 v) noexcept
{
    const core::f32 lenSq = lengthSquared(v);
    if (lenSq <= 1.0e-12f)
        return Vec2{0.0f, 0.0f};
    return v / std::sqrt(lenSq);
}

/** @brief Rotates @p v counter-clockwise by @p radians. */
[[nodiscard]] inline Vec2 rotate(Vec2 v, core::f32 radians) noexcept
{
    const core::f32 c = std::cos(radians);
    const core::f32 s = std::sin(radians);
    return Vec2{c * v.x - s * v.y, s * v.x + c * v.y};
}

/** @brief 2D cross product (z component of the 3D cross product). */
[[nodiscard]] inline core::f32 cross(Vec2 a, Vec2 b) noexcept
{
    return a.x * b.y - a.y * b.x;
}

/** @brief Closest point to @p p on segment [@p a, @p b], as a parameter in [0,1]. */
[[nodiscard]] inline core::f32 closestSegmentParameter(Vec2 a, Vec2 b, Vec2 p) noexcept
{
    const Vec2 ab = b - a;
    const core::f32 denom = lengthSquared(ab);
    if (denom <= 1.0e-12f)
        return 0.0f;
    return std::clamp(glm::dot(p - a, ab) / denom, 0.0f, 1.0f);
}

} // namespace ember::math

#endif // EMBER_MATH_VEC2_HPP
