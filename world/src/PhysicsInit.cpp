/**
 * @file PhysicsInit.cpp
 * @brief Auto physics initialization planner.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/world/PhysicsInit.hpp"
#include "ember/world/Components.hpp"
#include "ember/ecs/Registry.hpp"

namespace ember::world {

PhysicsInitPlan planPhysicsInit(const ecs::Registry& registry, ecs::EntityId entity)
{
    const auto* collider  = registry.get<Collider>(entity);
    const auto* transform = registry.get<Transform>(entity);
    if (!collider || !transform || collider->initialized)
    {
        return PhysicsInitPlan{};
    }

    if (const auto* rigidbody = registry.get<Rigidbody>(entity))
    {
        if (rigidbody->initialized)
        {
            return PhysicsInitPlan{};
        }
        return PhysicsInitPlan{BodyCreation::FromRigidbody};
    }

    return PhysicsInitPlan{BodyCreation::ImplicitStatic};
}

bool shouldInitCharacterBody(const ecs::Registry& registry, ecs::EntityId entity)
{
    const auto* character = registry.get<CharacterBody>(entity);
    return character && !character->initialized && registry.has<Transform>(entity);
}

} // namespace ember::world
