/**
 * @file PhysicsInit.hpp
 * @brief Pure planning of the auto physics initialization.
 *
 * The planner only reads the registry; World::tryInitPhysics executes the
 * plan against the backend.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_WORLD_PHYSICSINIT_HPP
    #define EMBER_WORLD_PHYSICSINIT_HPP

#include "ember/ecs/Entity.hpp"
#include "ember/core/Types.hpp"

namespace ember::ecs { class Registry; }

namespace ember::world {

enum class BodyCreation : core::u8
{
    None,           ///< Preconditions unmet, or a body already exists.
    FromRigidbody,  ///< Create the Rigidbody's body, then attach the shape.
    ImplicitStatic  ///< No Rigidbody: create a static body owned by the Collider.
};

struct PhysicsInitPlan
{
    BodyCreation creation{BodyCreation::None};

    [[nodiscard]] bool isNoop() const noexcept { return creation == BodyCreation::None; }
};

/**
 * @brief Decides what tryInitPhysics must do for @p entity.
 *
 * Needs a Collider and a Transform.  An initialized Collider, or a sibling
 * Rigidbody that is already initialized, yields None so a shape is never
 * attached twice.
 */
[[nodiscard]] PhysicsInitPlan planPhysicsInit(const ecs::Registry& registry, ecs::EntityId entity);

/** @brief True when @p entity has a Transform and an uninitialized CharacterBody. */
[[nodiscard]] bool shouldInitCharacterBody(const ecs::Registry& registry, ecs::EntityId entity);

} // namespace ember::world

#endif // EMBER_WORLD_PHYSICSINIT_HPP
