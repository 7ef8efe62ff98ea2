/**
 * @file Coordinates.hpp
 * @brief Screen (Y-down) <-> physics (Y-up) conversion.
 *
 * These two functions are the only place the flip happens.  Every value
 * crossing the backend boundary goes through exactly one of them once.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_PHYSICS_COORDINATES_HPP
    #define EMBER_PHYSICS_COORDINATES_HPP

#include "ember/math/Vec2.hpp"

namespace ember::physics {

[[nodiscard]] inline math::Vec2 screenToPhysics(math::Vec2 screen) noexcept
{
    return math::Vec2{screen.x, -screen.y};
}

[[nodiscard]] inline math::Vec2 physicsToScreen(math::Vec2 physics) noexcept
{
    return math::Vec2{physics.x, -physics.y};
}

} // namespace ember::physics

#endif // EMBER_PHYSICS_COORDINATES_HPP
