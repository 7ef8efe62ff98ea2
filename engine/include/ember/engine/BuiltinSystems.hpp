/**
 * @file BuiltinSystems.hpp
 * @brief Physics and debug systems every Engine registers at init.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_BUILTINSYSTEMS_HPP
    #define EMBER_ENGINE_BUILTINSYSTEMS_HPP

#include "ember/core/Types.hpp"

#include <string_view>

namespace ember::engine {

class Engine;

inline constexpr std::string_view kPhysicsStepSystem       = "physics.step";
inline constexpr std::string_view kPhysicsCharactersSystem = "physics.characters";
inline constexpr std::string_view kPhysicsSyncSystem       = "physics.sync_transforms";
inline constexpr std::string_view kDebugCollidersSystem    = "debug.colliders";
inline constexpr std::string_view kDebugFpsSystem          = "debug.fps";

inline constexpr core::i32 kPhysicsStepPriority       = 100;
inline constexpr core::i32 kPhysicsCharactersPriority = 110;
inline constexpr core::i32 kPhysicsSyncPriority       = 120;
inline constexpr core::i32 kDebugPriority             = 1000;

/**
 * @brief Registers the built-in systems on @p engine's scheduler.
 *
 * Fixed_Update: physics.step, physics.characters, physics.sync_transforms.
 * Render: debug.colliders, debug.fps (both start disabled).
 */
void registerBuiltinSystems(Engine& engine);

} // namespace ember::engine

#endif // EMBER_ENGINE_BUILTINSYSTEMS_HPP
