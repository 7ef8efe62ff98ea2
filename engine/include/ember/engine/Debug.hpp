/**
 * @file Debug.hpp
 * @brief Runtime debug switches read by the Engine every frame.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_DEBUG_HPP
    #define EMBER_ENGINE_DEBUG_HPP

namespace ember::engine {

struct Debug
{
    /** @brief Enables the debug.colliders render system. */
    bool drawColliders{false};
    /** @brief Enables the debug.fps render system. */
    bool drawFps{false};
    /** @brief Forwarded to SystemScheduler::setProfilingEnabled. */
    bool profileSystems{false};
};

} // namespace ember::engine

#endif // EMBER_ENGINE_DEBUG_HPP
