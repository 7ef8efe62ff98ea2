/**
 * @file main.cpp
 * @brief Ember2D sandbox: headless engine driving a hot-reloaded game module.
 *
 * Usage: ember_sandbox [frames] [module path]
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/Config.hpp"
#include "ember/engine/Engine.hpp"
#include "ember/ecs/SystemScheduler.hpp"
#include "ember/hotreload/HotReloadHost.hpp"
#include "ember/render/HeadlessBackend.hpp"
#include "ember/core/Log.hpp"
#include "ember/core/Types.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <string_view>

namespace {

constexpr ember::core::u64 kDefaultFrames = 600;

ember::core::u64 parseFrames(std::string_view arg)
{
    ember::core::u64 frames = 0;
    const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), frames);
    if (ec != std::errc{} || ptr != arg.data() + arg.size())
        return kDefaultFrames;
    return frames;
}

} // namespace

int main(int argc, char* argv[])
{
    using namespace ember;

    const core::u64 frames = argc > 1 ? parseFrames(argv[1]) : kDefaultFrames;
    const std::filesystem::path modulePath = argc > 2 ? argv[2] : EMBER_SANDBOX_GAME_MODULE;

    auto config = engine::Config::Builder{}
        .windowTitle("Ember2D Sandbox")
        .designSize(640, 360)
        .logLevel(core::LogLevel::kInfo)
        .build();

    engine::Engine engine{config,
                          std::make_unique<render::HeadlessBackend>(render::HeadlessBackend::Settings{1.0f / 60.0f, frames})};

    if (auto result = engine.init(); !result)
    {
        engine.logger().fatal("Sandbox", "engine init failed: {}", result.error().message());
        return EXIT_FAILURE;
    }

    hotreload::HotReloadHost host{modulePath, engine.logger()};
    if (auto result = host.load(); !result)
    {
        engine.logger().fatal("Sandbox", "cannot load game module: {}", result.error().message());
        return EXIT_FAILURE;
    }
    host.callInit(&engine);

    auto& scheduler = engine.scheduler();
    scheduler.addSystem("game.hot_reload", ecs::SchedulePhase::PreUpdate,
        [&](world::World&, core::f32) {
            const auto polled = host.poll(engine.time().unscaledDelta(), &engine);
            if (!polled)
            {
                engine.logger().fatal("Sandbox", "hot reload failed: {}", polled.error().message());
                engine.requestShutdown();
            }
        },
        -100);
    scheduler.addSystem("game.update", ecs::SchedulePhase::Update,
        [&](world::World&, core::f32 dt) { host.callUpdate(&engine, dt); });
    scheduler.addRenderSystem("game.render",
        [&](world::World&) { host.callRender(&engine); });

    engine.run();

    host.callShutdown(&engine);
    host.destroy();
    engine.shutdown();

    return EXIT_SUCCESS;
}
