/**
 * @file Constants.hpp
 * @brief Engine-wide compile-time constants.
 *
 * Tunable parameters of the frame clock, the scheduler profiler, the ECS
 * id space, the character mover and the hot-reload host are centralised
 * here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_CORE_CONSTANTS_HPP
    #define EMBER_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace ember::core {

// ---- Frame clock ---------------------------------------------------------

inline constexpr f64   kDefaultFixedTimestep     = 1.0 / 60.0;
inline constexpr f64   kMaxFrameDelta            = 0.25;
inline constexpr usize kFpsSampleCount           = 60;
inline constexpr f64   kFpsRefreshInterval       = 0.5;

// ---- Scheduler profiling -------------------------------------------------

inline constexpr f64   kProfileSmoothing         = 0.1;

// ---- ECS -----------------------------------------------------------------

inline constexpr u32   kGenerationBits           = 12;
inline constexpr u32   kSlotBits                 = 20;
inline constexpr usize kMaxComponentTypes        = 64;

// ---- Physics -------------------------------------------------------------

inline constexpr u32   kDefaultPhysicsSubsteps   = 4;
inline constexpr f32   kDefaultPixelsPerMeter    = 40.0f;
inline constexpr f32   kDefaultGravityY          = 900.0f;

// ---- Character mover -----------------------------------------------------

inline constexpr u32   kMoverMaxIterations       = 4;
inline constexpr f32   kMoverFloorAngleDegrees   = 45.0f;
inline constexpr f32   kMoverMinTranslationSq    = 1.0e-6f;

// ---- Hot reload ----------------------------------------------------------

inline constexpr f64   kHotReloadPollInterval    = 0.5;

} // namespace ember::core

#endif // EMBER_CORE_CONSTANTS_HPP
