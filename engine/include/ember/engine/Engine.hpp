/**
 * @file Engine.hpp
 * @brief Top-level engine façade (Façade pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_ENGINE_HPP
    #define EMBER_ENGINE_ENGINE_HPP

#include "ember/engine/Config.hpp"
#include "ember/engine/Debug.hpp"
#include "ember/engine/TimeState.hpp"
#include "ember/engine/Viewport.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/Log.hpp"
#include "ember/core/Types.hpp"

#include <functional>
#include <memory>

namespace ember::ecs { class SystemScheduler; }
namespace ember::input { class InputManager; }
namespace ember::physics { class IPhysicsBackend; }
namespace ember::render { class Camera2D; class IPresentationBackend; }
namespace ember::world { class World; }

namespace ember::engine {

/**
 * @brief Top-level engine façade.
 *
 * Owns the World, the SystemScheduler, the TimeState, the InputManager and
 * the Debug switches, and drives one frame as
 * poll → Pre_Update → Update → Fixed_Update × N → Post_Update → Render.
 */
class Engine
{
public:
    using FrameCallback = std::function<void(Engine&)>;

    /**
     * @param config        Immutable engine configuration.
     * @param presentation  Window/render/input backend (required).
     * @param physics       Physics backend; a CpuPhysicsBackend when null.
     * @param sink          Log sink; stderr when null.
     */
    Engine(Config config, std::unique_ptr<render::IPresentationBackend> presentation,
           std::unique_ptr<physics::IPhysicsBackend> physics = nullptr, core::ILogger* sink = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /**
     * @brief Validates the configuration, opens the window, initialises the
     *        physics world and registers the built-in systems.
     * @return Success or the first error encountered.
     */
    [[nodiscard]] core::Expected<void> init();

    /**
     * @brief Runs a single frame.
     * @return False when the engine should stop (window closed, shutdown
     *         requested or not initialised).
     */
    bool frame();

    /** @brief Calls frame() until it returns false, then @p onFrame after each frame. */
    void run(const FrameCallback& onFrame = {});

    /** @brief Request graceful shutdown; the current frame completes. */
    void requestShutdown() noexcept;

    /** @brief Tears the World down, then the presentation backend. */
    void shutdown();

    [[nodiscard]] bool isInitialized() const noexcept;

    [[nodiscard]] const Config&                 config() const noexcept;
    [[nodiscard]] world::World&                 world() noexcept;
    [[nodiscard]] ecs::SystemScheduler&         scheduler() noexcept;
    [[nodiscard]] TimeState&                    time() noexcept;
    [[nodiscard]] const TimeState&              time() const noexcept;
    [[nodiscard]] input::InputManager&          input() noexcept;
    [[nodiscard]] Debug&                        debug() noexcept;
    [[nodiscard]] core::Logger&                 logger() noexcept;
    [[nodiscard]] const Viewport&               viewport() const noexcept;
    [[nodiscard]] render::Camera2D&             camera() noexcept;
    [[nodiscard]] render::IPresentationBackend& presentation() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace ember::engine

#endif // EMBER_ENGINE_ENGINE_HPP
