/**
 * @file IPhysicsBackend.hpp
 * @brief Abstract physics backend interface (Strategy pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_PHYSICS_IPHYSICSBACKEND_HPP
    #define EMBER_PHYSICS_IPHYSICSBACKEND_HPP

#include "ember/physics/PhysicsTypes.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <optional>
#include <span>
#include <vector>

namespace ember::physics {

/**
 * @class IPhysicsBackend
 * @brief Strategy interface over a rigid-body engine.
 *
 * All positions, offsets, velocities and forces are in physics space
 * (Y-up).  Operations on an invalid or destroyed handle are no-ops and
 * getters return zero; callers guard with their own initialized flags.
 *
 * Concrete backends:
 *   - @c CpuPhysicsBackend  single-threaded CPU reference.
 */
class IPhysicsBackend
{
public:
    virtual ~IPhysicsBackend() = default;

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    [[nodiscard]] virtual core::Expected<void> init(const PhysicsSettings& settings) = 0;

    /** @brief Advances the simulation by @p dt split into @p substeps. */
    [[nodiscard]] virtual core::Expected<void> step(core::f32 dt, core::u32 substeps) = 0;

    virtual void shutdown() = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    virtual void setGravity(math::Vec2 gravity) = 0;

    // --------------------------------------------------------------------- //
    //  Bodies & shapes                                                       //
    // --------------------------------------------------------------------- //

    [[nodiscard]] virtual BodyHandle createDynamicBody(math::Vec2 position, core::f32 gravityScale) = 0;
    [[nodiscard]] virtual BodyHandle createStaticBody(math::Vec2 position) = 0;
    [[nodiscard]] virtual BodyHandle createKinematicBody(math::Vec2 position) = 0;

    /** @brief Destroys a body and every shape attached to it. */
    virtual void destroyBody(BodyHandle body) = 0;

    [[nodiscard]] virtual ShapeHandle addBoxShape(BodyHandle body, core::f32 halfWidth, core::f32 halfHeight,
                                                  math::Vec2 offset, const ShapeMaterial& material) = 0;

    [[nodiscard]] virtual ShapeHandle addCircleShape(BodyHandle body, core::f32 radius, math::Vec2 offset,
                                                     const ShapeMaterial& material) = 0;

    virtual void destroyShape(ShapeHandle shape) = 0;

    // --------------------------------------------------------------------- //
    //  Body state                                                            //
    // --------------------------------------------------------------------- //

    [[nodiscard]] virtual math::Vec2 position(BodyHandle body) const = 0;
    virtual void setPosition(BodyHandle body, math::Vec2 position) = 0;

    [[nodiscard]] virtual core::f32 rotation(BodyHandle body) const = 0;
    virtual void setTransform(BodyHandle body, math::Vec2 position, core::f32 rotation) = 0;

    [[nodiscard]] virtual math::Vec2 linearVelocity(BodyHandle body) const = 0;
    virtual void setLinearVelocity(BodyHandle body, math::Vec2 velocity) = 0;

    [[nodiscard]] virtual core::f32 angularVelocity(BodyHandle body) const = 0;
    virtual void setAngularVelocity(BodyHandle body, core::f32 velocity) = 0;

    virtual void applyForce(BodyHandle body, math::Vec2 force) = 0;
    virtual void applyImpulse(BodyHandle body, math::Vec2 impulse) = 0;

    virtual void setGravityScale(BodyHandle body, core::f32 scale) = 0;
    virtual void setFixedRotation(BodyHandle body, bool fixed) = 0;

    // --------------------------------------------------------------------- //
    //  Queries                                                               //
    // --------------------------------------------------------------------- //

    /** @brief Closest non-sensor hit along [origin, origin + translation]. */
    [[nodiscard]] virtual std::optional<RaycastHit> raycast(math::Vec2 origin, math::Vec2 translation) const = 0;

    /**
     * @brief Sweeps @p mover along @p translation.
     * @return Fraction of the translation that can be travelled without
     *         deepening any existing contact.
     */
    [[nodiscard]] virtual core::f32 castMover(const Capsule& mover, math::Vec2 translation) const = 0;

    /** @brief Contact planes of every non-sensor shape touching @p mover. */
    [[nodiscard]] virtual std::vector<CollisionPlane> collideMover(const Capsule& mover) const = 0;

    /** @brief Resolves @p targetDelta against @p planes, accumulating their push. */
    [[nodiscard]] virtual PlaneSolverResult solvePlanes(math::Vec2 targetDelta, std::span<CollisionPlane> planes) const = 0;

    /** @brief Removes from @p vector the components pushing into @p planes. */
    [[nodiscard]] virtual math::Vec2 clipVector(math::Vec2 vector, std::span<const CollisionPlane> planes) const = 0;
};

} // namespace ember::physics

#endif // EMBER_PHYSICS_IPHYSICSBACKEND_HPP
