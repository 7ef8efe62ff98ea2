/**
 * @file MockPhysicsBackend.hpp
 * @brief Call-counting IPhysicsBackend for World tests.
 */
#pragma once

#include "ember/physics/IPhysicsBackend.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace ember::testing {

class MockPhysicsBackend final : public physics::IPhysicsBackend {
public:
    struct BodyState
    {
        physics::BodyType type{physics::BodyType::Static};
        math::Vec2        position{0.0f, 0.0f};
        core::f32         rotation{0.0f};
        math::Vec2        velocity{0.0f, 0.0f};
        core::f32         angularVelocity{0.0f};
        math::Vec2        force{0.0f, 0.0f};
        math::Vec2        impulse{0.0f, 0.0f};
        core::f32         gravityScale{1.0f};
        bool              fixedRotation{false};
    };

    struct ShapeRecord
    {
        physics::BodyHandle body{};
        bool                circle{false};
        core::f32           halfWidth{0.0f};
        core::f32           halfHeight{0.0f};
        core::f32           radius{0.0f};
        math::Vec2          offset{0.0f, 0.0f};
        physics::ShapeMaterial material{};
    };

    // ---- counters ----
    int initCalls{0};
    int shutdownCalls{0};
    int stepCalls{0};
    int createBodyCalls{0};
    int destroyBodyCalls{0};
    int addShapeCalls{0};
    int destroyShapeCalls{0};

    core::f32 lastStepDt{0.0f};
    core::u32 lastSubsteps{0};
    physics::PhysicsSettings settings{};

    std::unordered_map<core::u32, BodyState>   bodies;
    std::unordered_map<core::u32, ShapeRecord> shapes;
    std::vector<physics::BodyHandle>           destroyedBodies;

    std::optional<physics::RaycastHit> nextRaycast;

    [[nodiscard]] core::Expected<void> init(const physics::PhysicsSettings &s) override
    {
        ++initCalls;
        settings = s;
        return {};
    }

    [[nodiscard]] core::Expected<void> step(core::f32 dt, core::u32 substeps) override
    {
        ++stepCalls;
        lastStepDt   = dt;
        lastSubsteps = substeps;
        return {};
    }

    void shutdown() override { ++shutdownCalls; }

    [[nodiscard]] const char *name() const noexcept override { return "MockPhysicsBackend"; }

    void setGravity(math::Vec2 gravity) override { settings.gravity = gravity; }

    [[nodiscard]] physics::BodyHandle createDynamicBody(math::Vec2 position, core::f32 gravityScale) override
    {
        auto handle = create(physics::BodyType::Dynamic, position);
        bodies[handle.value].gravityScale = gravityScale;
        return handle;
    }

    [[nodiscard]] physics::BodyHandle createStaticBody(math::Vec2 position) override
    {
        return create(physics::BodyType::Static, position);
    }

    [[nodiscard]] physics::BodyHandle createKinematicBody(math::Vec2 position) override
    {
        return create(physics::BodyType::Kinematic, position);
    }

    void destroyBody(physics::BodyHandle body) override
    {
        ++destroyBodyCalls;
        destroyedBodies.push_back(body);
        bodies.erase(body.value);
        std::erase_if(shapes, [body](const auto &entry) { return entry.second.body == body; });
    }

    [[nodiscard]] physics::ShapeHandle addBoxShape(physics::BodyHandle body, core::f32 halfWidth, core::f32 halfHeight,
                                                   math::Vec2 offset, const physics::ShapeMaterial &material) override
    {
        ShapeRecord record;
        record.body       = body;
        record.halfWidth  = halfWidth;
        record.halfHeight = halfHeight;
        record.offset     = offset;
        record.material   = material;
        return addShape(record);
    }

    [[nodiscard]] physics::ShapeHandle addCircleShape(physics::BodyHandle body, core::f32 radius, math::Vec2 offset,
                                                      const physics::ShapeMaterial &material) override
    {
        ShapeRecord record;
        record.body     = body;
        record.circle   = true;
        record.radius   = radius;
        record.offset   = offset;
        record.material = material;
        return addShape(record);
    }

    void destroyShape(physics::ShapeHandle shape) override
    {
        ++destroyShapeCalls;
        shapes.erase(shape.value);
    }

    [[nodiscard]] math::Vec2 position(physics::BodyHandle body) const override { return state(body).position; }
    void setPosition(physics::BodyHandle body, math::Vec2 p) override { bodies[body.value].position = p; }

    [[nodiscard]] core::f32 rotation(physics::BodyHandle body) const override { return state(body).rotation; }
    void setTransform(physics::BodyHandle body, math::Vec2 p, core::f32 r) override
    {
        bodies[body.value].position = p;
        bodies[body.value].rotation = r;
    }

    [[nodiscard]] math::Vec2 linearVelocity(physics::BodyHandle body) const override { return state(body).velocity; }
    void setLinearVelocity(physics::BodyHandle body, math::Vec2 v) override { bodies[body.value].velocity = v; }

    [[nodiscard]] core::f32 angularVelocity(physics::BodyHandle body) const override { return state(body).angularVelocity; }
    void setAngularVelocity(physics::BodyHandle body, core::f32 w) override { bodies[body.value].angularVelocity = w; }

    void applyForce(physics::BodyHandle body, math::Vec2 f) override { bodies[body.value].force += f; }
    void applyImpulse(physics::BodyHandle body, math::Vec2 i) override { bodies[body.value].impulse += i; }
    void setGravityScale(physics::BodyHandle body, core::f32 s) override { bodies[body.value].gravityScale = s; }
    void setFixedRotation(physics::BodyHandle body, bool fixed) override { bodies[body.value].fixedRotation = fixed; }

    [[nodiscard]] std::optional<physics::RaycastHit> raycast(math::Vec2, math::Vec2) const override { return nextRaycast; }

    [[nodiscard]] core::f32 castMover(const physics::Capsule &, math::Vec2) const override { return 1.0f; }

    [[nodiscard]] std::vector<physics::CollisionPlane> collideMover(const physics::Capsule &) const override { return {}; }

    [[nodiscard]] physics::PlaneSolverResult solvePlanes(math::Vec2 targetDelta,
                                                         std::span<physics::CollisionPlane>) const override
    {
        return physics::PlaneSolverResult{targetDelta, 0};
    }

    [[nodiscard]] math::Vec2 clipVector(math::Vec2 vector, std::span<const physics::CollisionPlane>) const override
    {
        return vector;
    }

    [[nodiscard]] const BodyState &state(physics::BodyHandle body) const
    {
        static const BodyState kEmpty{};
        const auto it = bodies.find(body.value);
        return it == bodies.end() ? kEmpty : it->second;
    }

    [[nodiscard]] bool hasBody(physics::BodyHandle body) const { return bodies.contains(body.value); }

private:
    physics::BodyHandle create(physics::BodyType type, math::Vec2 position)
    {
        ++createBodyCalls;
        const physics::BodyHandle handle{_nextBody++};
        BodyState s;
        s.type     = type;
        s.position = position;
        bodies.emplace(handle.value, s);
        return handle;
    }

    physics::ShapeHandle addShape(const ShapeRecord &record)
    {
        ++addShapeCalls;
        const physics::ShapeHandle handle{_nextShape++};
        shapes.emplace(handle.value, record);
        return handle;
    }

    core::u32 _nextBody{0};
    core::u32 _nextShape{0};
};

} // namespace ember::testing
