/**
 * @file Rect.hpp
 * @brief Axis-aligned rectangle in screen or design space.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_MATH_RECT_HPP
    #define EMBER_MATH_RECT_HPP

    #include "ember/math/Vec2.hpp"

namespace ember::math {

struct Rect
{
    core::f32 x{0.0f};
    core::f32 y{0.0f};
    core::f32 width{0.0f};
    core::f32 height{0.0f};

    [[nodiscard]] Vec2 position() const noexcept { return Vec2{x, y}; }
    [[nodiscard]] Vec2 size() const noexcept { return Vec2{width, height}; }

    [[nodiscard]] bool contains(Vec2 p) const noexcept
    {
        return p.x >= x && p.y >= y && p.x <= x + width && p.y <= y + height;
    }
};

} // namespace ember::math

#endif // EMBER_MATH_RECT_HPP
