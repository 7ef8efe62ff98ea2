/**
 * @file CharacterMover.cpp
 * @brief Kinematic capsule controller built on the backend mover queries.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/world/CharacterMover.hpp"
#include "ember/physics/Coordinates.hpp"
#include "ember/physics/IPhysicsBackend.hpp"
#include "ember/core/Constants.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace ember::world {

namespace {

[[nodiscard]] physics::Capsule translated(const physics::Capsule& capsule, math::Vec2 position) noexcept
{
    return physics::Capsule{capsule.center1 + position, capsule.center2 + position, capsule.radius};
}

[[nodiscard]] core::f32 floorCosine() noexcept
{
    return std::cos(core::kMoverFloorAngleDegrees * std::numbers::pi_v<core::f32> / 180.0f);
}

} // namespace

physics::Capsule buildCapsule(core::f32 width, core::f32 height) noexcept
{
    const core::f32 radius      = std::max(width, 0.0f) * 0.5f;
    const core::f32 halfSegment = std::max(height * 0.5f - radius, 0.0f);
    return physics::Capsule{math::Vec2{0.0f, -halfSegment}, math::Vec2{0.0f, halfSegment}, radius};
}

ContactFlags classifyContacts(std::span<const physics::CollisionPlane> planes) noexcept
{
    const core::f32 threshold = floorCosine();
    ContactFlags flags;
    for (const auto& plane : planes)
    {
        if (plane.normal.y >= threshold)
            flags.onFloor = true;
        else if (plane.normal.y <= -threshold)
            flags.onCeiling = true;
        else
            flags.onWall = true;
    }
    return flags;
}

void moveCharacter(physics::IPhysicsBackend& backend, CharacterBody& character, Transform& transform,
                   math::Vec2 gravity, core::f32 dt)
{
    if (character.builtWidth != character.width || character.builtHeight != character.height)
    {
        character.capsule     = buildCapsule(character.width, character.height);
        character.builtWidth  = character.width;
        character.builtHeight = character.height;
    }

    if (!character.onFloor)
    {
        character.velocity += gravity * character.gravityScale * dt;
    }

    math::Vec2 position = physics::screenToPhysics(transform.position);
    math::Vec2 velocity = physics::screenToPhysics(character.velocity);
    const math::Vec2 target = position + velocity * dt;

    std::vector<physics::CollisionPlane> planes;
    for (core::u32 iteration = 0; iteration < core::kMoverMaxIterations; ++iteration)
    {
        const physics::Capsule mover = translated(character.capsule, position);
        planes = backend.collideMover(mover);

        const physics::PlaneSolverResult solved = backend.solvePlanes(target - position, planes);
        const core::f32 fraction = backend.castMover(mover, solved.translation);
        const math::Vec2 delta = solved.translation * fraction;
        position += delta;

        if (math::lengthSquared(delta) < core::kMoverMinTranslationSq)
            break;
    }

    velocity = backend.clipVector(velocity, planes);

    const std::vector<physics::CollisionPlane> contacts = backend.collideMover(translated(character.capsule, position));
    const ContactFlags flags = classifyContacts(contacts);
    character.onFloor   = flags.onFloor;
    character.onWall    = flags.onWall;
    character.onCeiling = flags.onCeiling;

    transform.position = physics::physicsToScreen(position);
    character.velocity = physics::physicsToScreen(velocity);
}

} // namespace ember::world
