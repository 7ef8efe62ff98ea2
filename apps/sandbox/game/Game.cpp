/**
 * @file Game.cpp
 * @brief Sandbox game module: a falling crate, a floor and a walking character.
 *
 * Rebuild while the sandbox runs and the host swaps it in on its next poll;
 * everything that must survive lives in SandboxState.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/Engine.hpp"
#include "ember/input/InputManager.hpp"
#include "ember/render/IPresentationBackend.hpp"
#include "ember/world/Components.hpp"
#include "ember/world/World.hpp"
#include "ember/core/Platform.hpp"

#include <cstddef>
#include <format>

using namespace ember;

namespace {

struct SandboxState
{
    ecs::EntityId floor;
    ecs::EntityId crate;
    ecs::EntityId player;
    core::f32     elapsed;
    core::u32     reloads;
};

constexpr core::f32 kWalkSpeed = 180.0f;
constexpr core::f32 kJumpSpeed = 420.0f;

SandboxState& stateOf(void* state)
{
    return *static_cast<SandboxState*>(state);
}

} // namespace

EMBER_MODULE_EXPORT std::size_t game_state_size()
{
    return sizeof(SandboxState);
}

EMBER_MODULE_EXPORT void game_init(void* state, engine::Engine* engine)
{
    SandboxState& s = stateOf(state);
    world::World& w = engine->world();

    s.floor = w.spawn()
        .with(world::Transform{math::Vec2{320.0f, 340.0f}})
        .with(world::Collider{world::BoxShape{640.0f, 40.0f}})
        .id();

    s.crate = w.spawn()
        .with(world::Transform{math::Vec2{360.0f, 40.0f}})
        .with(world::Rigidbody{})
        .with(world::Collider{world::BoxShape{32.0f, 32.0f}, math::Vec2{0.0f, 0.0f}, 1.0f, 0.6f, 0.2f})
        .id();

    s.player = w.spawn()
        .with(world::Transform{math::Vec2{200.0f, 200.0f}})
        .with(world::CharacterBody{})
        .id();

    engine->debug().drawColliders = true;
    engine->logger().info("Game", "sandbox ready: floor {}, crate {}, player {}", s.floor.raw(), s.crate.raw(),
                          s.player.raw());
}

EMBER_MODULE_EXPORT void game_update(void* state, engine::Engine* engine, core::f32 dt)
{
    SandboxState& s = stateOf(state);
    s.elapsed += dt;

    auto* character = engine->world().getComponent<world::CharacterBody>(s.player);
    if (!character)
        return;

    const input::InputManager& in = engine->input();
    core::f32 direction = 0.0f;
    if (in.isKeyDown(input::Key::Left) || in.isKeyDown(input::Key::A))
        direction -= 1.0f;
    if (in.isKeyDown(input::Key::Right) || in.isKeyDown(input::Key::D))
        direction += 1.0f;
    character->velocity.x = direction * kWalkSpeed;

    if (character->onFloor && in.isKeyPressed(input::Key::Space))
        character->velocity.y = -kJumpSpeed;

    if (in.isKeyPressed(input::Key::F1))
        engine->debug().drawFps = !engine->debug().drawFps;
}

EMBER_MODULE_EXPORT void game_render(void* state, engine::Engine* engine)
{
    const SandboxState& s = stateOf(state);
    world::World& w = engine->world();
    render::IPresentationBackend& gfx = engine->presentation();

    gfx.beginCamera(engine->camera());
    if (const auto* crate = w.getComponent<world::Transform>(s.crate))
    {
        gfx.drawRectEx(math::Rect{crate->position.x, crate->position.y, 32.0f, 32.0f}, math::Vec2{16.0f, 16.0f},
                       crate->rotation, render::colors::kRed);
    }
    gfx.endCamera();

    gfx.drawText(std::format("t = {:.1f}s  reloads = {}", s.elapsed, s.reloads), math::Vec2{10.0f, 340.0f}, 16.0f,
                 render::colors::kWhite);
}

EMBER_MODULE_EXPORT void game_shutdown(void* state, engine::Engine* engine)
{
    engine->logger().info("Game", "module unloading after {:.1f}s", stateOf(state).elapsed);
}

EMBER_MODULE_EXPORT void game_on_reload(void* state, engine::Engine* engine)
{
    SandboxState& s = stateOf(state);
    ++s.reloads;
    engine->logger().info("Game", "module reloaded ({} so far)", s.reloads);
}
