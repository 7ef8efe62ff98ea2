/**
 * @file BuiltinSystems.cpp
 * @brief Physics stepping, transform sync and debug overlays.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/BuiltinSystems.hpp"
#include "ember/engine/Engine.hpp"
#include "ember/ecs/SystemScheduler.hpp"
#include "ember/render/IPresentationBackend.hpp"
#include "ember/world/Components.hpp"
#include "ember/world/World.hpp"

#include <format>
#include <string>
#include <type_traits>
#include <variant>

namespace ember::engine {

namespace {

void drawColliders(render::IPresentationBackend& backend, const render::Camera2D& camera, world::World& world)
{
    backend.beginCamera(camera);

    world.registry().each<world::Transform, world::Collider>(
        [&backend](ecs::EntityId, world::Transform& transform, world::Collider& collider) {
            const math::Vec2    center = transform.position + collider.offset;
            const render::Color color  = collider.isSensor ? render::colors::kYellow : render::colors::kGreen;

            std::visit(
                [&](const auto& shape) {
                    using Shape = std::decay_t<decltype(shape)>;
                    if constexpr (std::is_same_v<Shape, world::BoxShape>)
                    {
                        const math::Rect rect{center.x - shape.width * 0.5f, center.y - shape.height * 0.5f,
                                              shape.width, shape.height};
                        backend.drawRectLines(rect, 1.0f, color);
                    }
                    else
                    {
                        backend.drawCircleLines(center, shape.radius, color);
                    }
                },
                collider.shape);
        });

    world.registry().each<world::Transform, world::CharacterBody>(
        [&backend](ecs::EntityId, world::Transform& transform, world::CharacterBody& character) {
            const math::Rect rect{transform.position.x - character.width * 0.5f,
                                  transform.position.y - character.height * 0.5f, character.width,
                                  character.height};
            backend.drawRectLines(rect, 1.0f, character.onFloor ? render::colors::kGreen : render::colors::kRed);
        });

    backend.endCamera();
}

} // namespace

void registerBuiltinSystems(Engine& engine)
{
    ecs::SystemScheduler& scheduler = engine.scheduler();
    const core::u32 substeps = engine.config().physicsSubsteps();

    scheduler.addSystem(
        std::string{kPhysicsStepSystem}, ecs::SchedulePhase::FixedUpdate,
        [substeps](world::World& world, core::f32 dt) {
            if (auto res = world.stepPhysics(dt, substeps); !res)
                world.logger().error("Engine", "physics step failed: {}", res.error().message());
        },
        kPhysicsStepPriority);

    scheduler.addSystem(
        std::string{kPhysicsCharactersSystem}, ecs::SchedulePhase::FixedUpdate,
        [](world::World& world, core::f32 dt) { world.moveCharacters(dt); }, kPhysicsCharactersPriority);

    scheduler.addSystem(
        std::string{kPhysicsSyncSystem}, ecs::SchedulePhase::FixedUpdate,
        [](world::World& world, core::f32) { world.syncTransforms(); }, kPhysicsSyncPriority);

    scheduler.addRenderSystem(
        std::string{kDebugCollidersSystem},
        [&engine](world::World& world) { drawColliders(engine.presentation(), engine.camera(), world); },
        kDebugPriority);

    scheduler.addRenderSystem(
        std::string{kDebugFpsSystem},
        [&engine](world::World&) {
            engine.presentation().drawText(std::format("FPS: {:.0f}", engine.time().fps()), math::Vec2{10.0f, 10.0f},
                                           20.0f, render::colors::kGreen);
        },
        kDebugPriority);

    scheduler.disableSystem(kDebugCollidersSystem);
    scheduler.disableSystem(kDebugFpsSystem);
}

} // namespace ember::engine
