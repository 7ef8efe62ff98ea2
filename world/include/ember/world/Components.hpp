/**
 * @file Components.hpp
 * @brief Built-in components understood by the World.
 *
 * Values are in screen space (Y-down, pixels, clockwise-positive radians).
 * Handles and flags marked "engine-owned" are written by the World; game
 * code leaves them alone.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_WORLD_COMPONENTS_HPP
    #define EMBER_WORLD_COMPONENTS_HPP

#include "ember/physics/PhysicsTypes.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <optional>
#include <variant>

namespace ember::world {

struct Transform
{
    math::Vec2 position{0.0f, 0.0f};
    core::f32  rotation{0.0f};
    math::Vec2 scale{1.0f, 1.0f};
};

struct Rigidbody
{
    physics::BodyType type{physics::BodyType::Dynamic};
    core::f32         gravityScale{1.0f};
    bool              fixedRotation{false};

    // engine-owned
    physics::BodyHandle body{};
    bool                initialized{false};
};

// ---- Body ownership --------------------------------------------------------

struct NoBodyOwner {};

/** @brief The sibling Rigidbody owns the body; the Collider only owns its shape. */
struct OwnedByRigidbody
{
    physics::BodyHandle body{};
};

/** @brief Implicit static body created for, and owned by, the Collider. */
struct OwnedByCollider
{
    physics::BodyHandle body{};
};

using BodyOwner = std::variant<NoBodyOwner, OwnedByRigidbody, OwnedByCollider>;

/** @brief Body a shape is attached to, whoever owns it. */
[[nodiscard]] inline physics::BodyHandle attachedBody(const BodyOwner& owner) noexcept
{
    if (const auto* rb = std::get_if<OwnedByRigidbody>(&owner))
        return rb->body;
    if (const auto* implicit = std::get_if<OwnedByCollider>(&owner))
        return implicit->body;
    return physics::BodyHandle{};
}

// ---- Collider --------------------------------------------------------------

struct BoxShape
{
    core::f32 width{1.0f};
    core::f32 height{1.0f};
};

struct CircleShape
{
    core::f32 radius{0.5f};
};

using ColliderShape = std::variant<BoxShape, CircleShape>;

struct Collider
{
    ColliderShape shape{BoxShape{}};
    math::Vec2    offset{0.0f, 0.0f};
    core::f32     density{1.0f};
    core::f32     friction{0.6f};
    core::f32     restitution{0.0f};
    bool          isSensor{false};

    // engine-owned
    physics::ShapeHandle shapeHandle{};
    BodyOwner            owner{NoBodyOwner{}};
    bool                 initialized{false};

    /** @brief The implicit static body, set only when the Collider owns one. */
    [[nodiscard]] std::optional<physics::BodyHandle> implicitBody() const noexcept
    {
        if (const auto* implicit = std::get_if<OwnedByCollider>(&owner))
            return implicit->body;
        return std::nullopt;
    }

    [[nodiscard]] physics::ShapeMaterial material() const noexcept
    {
        return physics::ShapeMaterial{density, friction, restitution, isSensor};
    }
};

// ---- Character body --------------------------------------------------------

/**
 * @brief Kinematic capsule controller.  Owns no backend body; the capsule
 *        is value data rebuilt whenever width or height change.
 */
struct CharacterBody
{
    core::f32  width{32.0f};
    core::f32  height{64.0f};
    math::Vec2 velocity{0.0f, 0.0f};
    core::f32  gravityScale{1.0f};

    // engine-owned
    bool             onFloor{false};
    bool             onWall{false};
    bool             onCeiling{false};
    physics::Capsule capsule{};
    core::f32        builtWidth{0.0f};
    core::f32        builtHeight{0.0f};
    bool             initialized{false};
};

} // namespace ember::world

#endif // EMBER_WORLD_COMPONENTS_HPP
