/**
 * @file PhysicsTypes.hpp
 * @brief Handles and value types exchanged with a physics backend.
 *
 * Everything here lives in physics space (Y-up); see Coordinates.hpp for
 * the conversion from screen space.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_PHYSICS_PHYSICSTYPES_HPP
    #define EMBER_PHYSICS_PHYSICSTYPES_HPP

#include "ember/core/Constants.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <limits>

namespace ember::physics {

/**
 * @brief Strongly-typed opaque handle.  The tag keeps body and shape
 *        handles from being mixed up.
 *
 * Backends that recycle storage pack a slot index (low 20 bits) and a
 * generation (high 12 bits) into the value, so a handle to a destroyed
 * object never matches the object reusing its slot.
 */
template <typename Tag>
struct Handle
{
    static constexpr core::u32 kInvalid       = std::numeric_limits<core::u32>::max();
    static constexpr core::u32 kIndexBits     = core::kSlotBits;
    static constexpr core::u32 kIndexMask     = (1u << kIndexBits) - 1u;
    static constexpr core::u32 kMaxIndex      = kIndexMask;
    // The all-ones generation is skipped so no packed value equals kInvalid.
    static constexpr core::u32 kMaxGeneration = (kInvalid >> kIndexBits) - 1u;

    core::u32 value{kInvalid};

    [[nodiscard]] static constexpr Handle make(core::u32 index, core::u32 generation) noexcept
    {
        return Handle{(generation << kIndexBits) | (index & kIndexMask)};
    }

    [[nodiscard]] static constexpr core::u32 nextGeneration(core::u32 generation) noexcept
    {
        return generation >= kMaxGeneration ? 0u : generation + 1u;
    }

    [[nodiscard]] constexpr bool isValid() const noexcept { return value != kInvalid; }
    [[nodiscard]] constexpr core::u32 index() const noexcept { return value & kIndexMask; }
    [[nodiscard]] constexpr core::u32 generation() const noexcept { return value >> kIndexBits; }

    constexpr bool operator==(const Handle&) const noexcept = default;
};

struct BodyTag;
struct ShapeTag;

using BodyHandle  = Handle<BodyTag>;
using ShapeHandle = Handle<ShapeTag>;

enum class BodyType : core::u8
{
    Static,
    Kinematic,
    Dynamic
};

struct ShapeMaterial
{
    core::f32 density{1.0f};
    core::f32 friction{0.6f};
    core::f32 restitution{0.0f};
    bool      isSensor{false};
};

struct PhysicsSettings
{
    math::Vec2 gravity{0.0f, -core::kDefaultGravityY};
    core::f32  lengthUnitsPerMeter{core::kDefaultPixelsPerMeter};
};

struct RaycastHit
{
    math::Vec2 point{0.0f, 0.0f};
    math::Vec2 normal{0.0f, 0.0f};
    core::f32  fraction{0.0f};
    BodyHandle body{};
};

/** @brief Segment [center1, center2] inflated by radius. */
struct Capsule
{
    math::Vec2 center1{0.0f, 0.0f};
    math::Vec2 center2{0.0f, 0.0f};
    core::f32  radius{0.0f};
};

/**
 * @brief One contact plane reported against a mover.
 *
 * The normal points towards the mover; offset is the current separation
 * (negative while penetrating), so moving the mover by @c d changes the
 * separation to @c dot(normal, d) + offset.
 */
struct CollisionPlane
{
    math::Vec2 normal{0.0f, 0.0f};
    core::f32  offset{0.0f};
    core::f32  pushLimit{std::numeric_limits<core::f32>::max()};
    core::f32  push{0.0f};
    bool       clipVelocity{true};
};

struct PlaneSolverResult
{
    math::Vec2 translation{0.0f, 0.0f};
    core::u32  iterationCount{0};
};

} // namespace ember::physics

#endif // EMBER_PHYSICS_PHYSICSTYPES_HPP
