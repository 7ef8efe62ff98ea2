/**
 * @file CharacterMover.hpp
 * @brief Capsule slide loop of the kinematic character controller.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_WORLD_CHARACTERMOVER_HPP
    #define EMBER_WORLD_CHARACTERMOVER_HPP

#include "ember/world/Components.hpp"
#include "ember/physics/PhysicsTypes.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <span>

namespace ember::physics { class IPhysicsBackend; }

namespace ember::world {

/**
 * @brief Builds a vertical capsule (physics space, centred on the origin)
 *        fitting a @p width x @p height box.
 *
 * The radius is half the width; a height smaller than the width collapses
 * the capsule to a circle.
 */
[[nodiscard]] physics::Capsule buildCapsule(core::f32 width, core::f32 height) noexcept;

struct ContactFlags
{
    bool onFloor{false};
    bool onWall{false};
    bool onCeiling{false};
};

/**
 * @brief Classifies contact planes (physics space normals) into floor,
 *        wall and ceiling using a 45 degree threshold.
 */
[[nodiscard]] ContactFlags classifyContacts(std::span<const physics::CollisionPlane> planes) noexcept;

/**
 * @brief Moves one character for @p dt seconds.
 *
 * Applies gravity while airborne, then iterates
 * collide -> solve planes -> cast -> advance up to four times, clips the
 * velocity against the planes that pushed, and refreshes the contact flags.
 *
 * @param gravity Screen-space gravity.
 */
void moveCharacter(physics::IPhysicsBackend& backend, CharacterBody& character, Transform& transform,
                   math::Vec2 gravity, core::f32 dt);

} // namespace ember::world

#endif // EMBER_WORLD_CHARACTERMOVER_HPP
