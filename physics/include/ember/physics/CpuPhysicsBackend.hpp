/**
 * @file CpuPhysicsBackend.hpp
 * @brief CPU-only reference physics backend.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_PHYSICS_CPUPHYSICSBACKEND_HPP
    #define EMBER_PHYSICS_CPUPHYSICSBACKEND_HPP

#include "ember/physics/IPhysicsBackend.hpp"
#include "ember/core/NonCopyable.hpp"

#include <memory>

namespace ember::core { class Logger; }

namespace ember::physics {

/**
 * @class CpuPhysicsBackend
 * @brief Small, single-threaded rigid-body simulation.
 *
 * Pipeline (per substep): integrate -> collide (N^2) -> solve.
 * Shapes are axis-aligned boxes and circles; body rotation is integrated
 * and reported but ignored for collision.  The mover queries treat every
 * non-sensor shape as solid.  Destroyed body and shape slots are reused
 * by later creations under a new generation.
 */
class CpuPhysicsBackend final : public IPhysicsBackend,
                                public core::NonCopyable<CpuPhysicsBackend>
{
public:
    explicit CpuPhysicsBackend(core::Logger& logger);
    ~CpuPhysicsBackend() override;

    [[nodiscard]] core::Expected<void> init(const PhysicsSettings& settings) override;
    [[nodiscard]] core::Expected<void> step(core::f32 dt, core::u32 substeps) override;
    void shutdown() override;
    [[nodiscard]] const char* name() const noexcept override;
    void setGravity(math::Vec2 gravity) override;

    [[nodiscard]] BodyHandle createDynamicBody(math::Vec2 position, core::f32 gravityScale) override;
    [[nodiscard]] BodyHandle createStaticBody(math::Vec2 position) override;
    [[nodiscard]] BodyHandle createKinematicBody(math::Vec2 position) override;
    void destroyBody(BodyHandle body) override;

    [[nodiscard]] ShapeHandle addBoxShape(BodyHandle body, core::f32 halfWidth, core::f32 halfHeight,
                                          math::Vec2 offset, const ShapeMaterial& material) override;
    [[nodiscard]] ShapeHandle addCircleShape(BodyHandle body, core::f32 radius, math::Vec2 offset,
                                             const ShapeMaterial& material) override;
    void destroyShape(ShapeHandle shape) override;

    [[nodiscard]] math::Vec2 position(BodyHandle body) const override;
    void setPosition(BodyHandle body, math::Vec2 position) override;
    [[nodiscard]] core::f32 rotation(BodyHandle body) const override;
    void setTransform(BodyHandle body, math::Vec2 position, core::f32 rotation) override;
    [[nodiscard]] math::Vec2 linearVelocity(BodyHandle body) const override;
    void setLinearVelocity(BodyHandle body, math::Vec2 velocity) override;
    [[nodiscard]] core::f32 angularVelocity(BodyHandle body) const override;
    void setAngularVelocity(BodyHandle body, core::f32 velocity) override;
    void applyForce(BodyHandle body, math::Vec2 force) override;
    void applyImpulse(BodyHandle body, math::Vec2 impulse) override;
    void setGravityScale(BodyHandle body, core::f32 scale) override;
    void setFixedRotation(BodyHandle body, bool fixed) override;

    [[nodiscard]] std::optional<RaycastHit> raycast(math::Vec2 origin, math::Vec2 translation) const override;
    [[nodiscard]] core::f32 castMover(const Capsule& mover, math::Vec2 translation) const override;
    [[nodiscard]] std::vector<CollisionPlane> collideMover(const Capsule& mover) const override;
    [[nodiscard]] PlaneSolverResult solvePlanes(math::Vec2 targetDelta, std::span<CollisionPlane> planes) const override;
    [[nodiscard]] math::Vec2 clipVector(math::Vec2 vector, std::span<const CollisionPlane> planes) const override;

    /** @brief Number of live bodies (diagnostics and tests). */
    [[nodiscard]] core::u32 bodyCount() const noexcept;

    /** @brief Number of live shapes (diagnostics and tests). */
    [[nodiscard]] core::u32 shapeCount() const noexcept;

    /** @brief Allocated body slots, live or waiting for reuse. */
    [[nodiscard]] core::usize bodyCapacity() const noexcept;
    [[nodiscard]] core::usize shapeCapacity() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace ember::physics

#endif // EMBER_PHYSICS_CPUPHYSICSBACKEND_HPP
