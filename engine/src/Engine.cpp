/**
 * @file Engine.cpp
 * @brief Engine façade implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/Engine.hpp"
#include "ember/engine/BuiltinSystems.hpp"
#include "ember/ecs/SystemScheduler.hpp"
#include "ember/input/InputManager.hpp"
#include "ember/physics/CpuPhysicsBackend.hpp"
#include "ember/render/Camera2D.hpp"
#include "ember/render/IPresentationBackend.hpp"
#include "ember/world/World.hpp"

#include <utility>

namespace ember::engine {

namespace {

constexpr std::string_view kTag = "Engine";

std::unique_ptr<physics::IPhysicsBackend> orDefaultPhysics(std::unique_ptr<physics::IPhysicsBackend> physics,
                                                           core::Logger& logger)
{
    if (physics)
        return physics;
    return std::make_unique<physics::CpuPhysicsBackend>(logger);
}

} // namespace

struct Engine::Impl
{
    Config config;
    core::Logger logger;
    std::unique_ptr<render::IPresentationBackend> presentation;
    world::World world;
    ecs::SystemScheduler scheduler;
    TimeState time;
    input::InputManager input;
    Debug debug;
    Viewport viewport;
    render::Camera2D camera;

    bool initialised{false};
    bool shutdownRequested{false};
    bool builtinsRegistered{false};

    Impl(Config cfg, std::unique_ptr<render::IPresentationBackend> present,
         std::unique_ptr<physics::IPhysicsBackend> physics, core::ILogger* sink)
        : config{std::move(cfg)}
        , logger{sink, config.logLevel()}
        , presentation{std::move(present)}
        , world{orDefaultPhysics(std::move(physics), logger), logger}
        , scheduler{}
        , time{config.fixedTimestep()}
        , input{}
        , debug{false, false, config.profileSystems()}
        , viewport{config.designWidth(), config.designHeight()}
        , camera{}
    {
    }

    void applyDebugFlags()
    {
        scheduler.setSystemEnabled(kDebugCollidersSystem, debug.drawColliders);
        scheduler.setSystemEnabled(kDebugFpsSystem, debug.drawFps);
        scheduler.setProfilingEnabled(debug.profileSystems);
    }
};

Engine::Engine(Config config, std::unique_ptr<render::IPresentationBackend> presentation,
               std::unique_ptr<physics::IPhysicsBackend> physics, core::ILogger* sink)
    : _impl{std::make_unique<Impl>(std::move(config), std::move(presentation), std::move(physics), sink)}
{
}

Engine::~Engine()
{
    if (_impl && _impl->initialised)
    {
        shutdown();
    }
}

core::Expected<void> Engine::init()
{
    if (_impl->initialised)
        return core::makeError(core::ErrorCode::kInvalidState, "engine already initialised");

    const Config& cfg = _impl->config;
    if (auto valid = cfg.validate(); !valid)
    {
        _impl->logger.error(kTag, "invalid configuration: {}", valid.error().message());
        return valid;
    }
    if (!_impl->presentation)
        return core::makeError(core::ErrorCode::kInvalidArgument, "no presentation backend");

    _impl->logger.info(kTag, "init: {}x{} '{}' on {}", cfg.windowWidth(), cfg.windowHeight(), cfg.windowTitle(),
                       _impl->presentation->name());

    const render::PresentationOptions options{cfg.displayMode(), cfg.vsync(), true};
    if (auto res = _impl->presentation->init(cfg.windowWidth(), cfg.windowHeight(), cfg.windowTitle(), options); !res)
    {
        _impl->logger.error(kTag, "presentation backend failed: {}", res.error().message());
        return res;
    }

    if (auto res = _impl->world.init(cfg.gravity(), cfg.pixelsPerMeter()); !res)
    {
        _impl->presentation->shutdown();
        return res;
    }

    // Scheduler entries outlive shutdown, so a re-init must not add them twice.
    if (!_impl->builtinsRegistered)
    {
        registerBuiltinSystems(*this);
        _impl->builtinsRegistered = true;
    }
    _impl->viewport.update(_impl->presentation->windowSize());

    _impl->initialised       = true;
    _impl->shutdownRequested = false;
    _impl->logger.info(kTag, "init done ({} systems)", _impl->scheduler.systemCount());
    return {};
}

bool Engine::frame()
{
    Impl& impl = *_impl;
    if (!impl.initialised || impl.shutdownRequested)
        return false;

    if (!impl.presentation->update())
    {
        impl.logger.info(kTag, "presentation backend requested close");
        return false;
    }

    impl.time.update(impl.presentation->frameTime());
    impl.viewport.update(impl.presentation->windowSize());

    input::InputState state;
    impl.presentation->pollInput(state);
    impl.input.update(state);

    impl.applyDebugFlags();

    const auto dt      = static_cast<core::f32>(impl.time.delta());
    const auto fixedDt = static_cast<core::f32>(impl.time.fixedTimestep());

    impl.scheduler.runPhase(impl.world, dt, ecs::SchedulePhase::PreUpdate);
    impl.scheduler.runPhase(impl.world, dt, ecs::SchedulePhase::Update);
    while (impl.time.shouldFixedUpdate())
    {
        impl.scheduler.runPhase(impl.world, fixedDt, ecs::SchedulePhase::FixedUpdate);
        impl.time.consumeFixedStep();
    }
    impl.scheduler.runPhase(impl.world, dt, ecs::SchedulePhase::PostUpdate);

    impl.presentation->clear(impl.config.clearColor());
    // Update-style Render entries come before the draw callbacks.
    impl.scheduler.runPhase(impl.world, dt, ecs::SchedulePhase::Render);
    impl.scheduler.runRender(impl.world);
    impl.presentation->present();
    return true;
}

void Engine::run(const FrameCallback& onFrame)
{
    while (frame())
    {
        if (onFrame)
            onFrame(*this);
    }
    _impl->logger.info(kTag, "loop stopped after {} frames", _impl->time.frameCount());
}

void Engine::requestShutdown() noexcept
{
    _impl->shutdownRequested = true;
}

void Engine::shutdown()
{
    if (!_impl->initialised)
    {
        return;
    }

    _impl->logger.info(kTag, "shutdown");
    _impl->world.shutdown();
    _impl->presentation->shutdown();
    _impl->initialised = false;
}

bool Engine::isInitialized() const noexcept { return _impl->initialised; }

const Config& Engine::config() const noexcept { return _impl->config; }
world::World& Engine::world() noexcept { return _impl->world; }
ecs::SystemScheduler& Engine::scheduler() noexcept { return _impl->scheduler; }
TimeState& Engine::time() noexcept { return _impl->time; }
const TimeState& Engine::time() const noexcept { return _impl->time; }
input::InputManager& Engine::input() noexcept { return _impl->input; }
Debug& Engine::debug() noexcept { return _impl->debug; }
core::Logger& Engine::logger() noexcept { return _impl->logger; }
const Viewport& Engine::viewport() const noexcept { return _impl->viewport; }
render::Camera2D& Engine::camera() noexcept { return _impl->camera; }
render::IPresentationBackend& Engine::presentation() noexcept { return *_impl->presentation; }

} // namespace ember::engine
