/**
 * @file GameModule.hpp
 * @brief Entry points a hot-reloadable game module exports.
 *
 * A module is a shared library exporting, with C linkage:
 *
 *   game_state_size() -> size      optional, 0 when absent
 *   game_init(state, engine)       mandatory
 *   game_update(state, engine, dt) mandatory
 *   game_render(state, engine)     optional
 *   game_shutdown(state, engine)   optional
 *   game_on_reload(state, engine)  optional
 *
 * @c state is the host-owned block of game_state_size() bytes. It survives
 * reloads; globals inside the module do not.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_HOTRELOAD_GAMEMODULE_HPP
    #define EMBER_HOTRELOAD_GAMEMODULE_HPP

#include "ember/core/Platform.hpp"
#include "ember/core/Types.hpp"

#include <optional>

namespace ember::engine { class Engine; }

namespace ember::hotreload {

using GameStateSizeFn = core::usize (*)();
using GameInitFn      = void (*)(void* state, engine::Engine* engine);
using GameUpdateFn    = void (*)(void* state, engine::Engine* engine, core::f32 dt);
using GameRenderFn    = void (*)(void* state, engine::Engine* engine);
using GameShutdownFn  = void (*)(void* state, engine::Engine* engine);
using GameOnReloadFn  = void (*)(void* state, engine::Engine* engine);

inline constexpr const char* kGameStateSizeSymbol = "game_state_size";
inline constexpr const char* kGameInitSymbol      = "game_init";
inline constexpr const char* kGameUpdateSymbol    = "game_update";
inline constexpr const char* kGameRenderSymbol    = "game_render";
inline constexpr const char* kGameShutdownSymbol  = "game_shutdown";
inline constexpr const char* kGameOnReloadSymbol  = "game_on_reload";

/** @brief Entry points resolved from one loaded module generation. */
struct GameModuleApi
{
    GameInitFn   init{nullptr};
    GameUpdateFn update{nullptr};

    std::optional<GameStateSizeFn> stateSize;
    std::optional<GameRenderFn>    render;
    std::optional<GameShutdownFn>  shutdown;
    std::optional<GameOnReloadFn>  onReload;
};

} // namespace ember::hotreload

#endif // EMBER_HOTRELOAD_GAMEMODULE_HPP
