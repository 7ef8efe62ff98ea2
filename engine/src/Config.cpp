/**
 * @file Config.cpp
 * @brief Config::Builder implementation and option validation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/Config.hpp"

#include <utility>

namespace ember::engine {

Config::Builder& Config::Builder::windowSize(core::u32 width, core::u32 height) noexcept
{
    _windowWidth  = width;
    _windowHeight = height;
    return *this;
}

Config::Builder& Config::Builder::windowTitle(std::string title)
{
    _windowTitle = std::move(title);
    return *this;
}

Config::Builder& Config::Builder::fixedTimestep(core::f64 seconds) noexcept
{
    _fixedTimestep = seconds;
    return *this;
}

Config::Builder& Config::Builder::physicsSubsteps(core::u32 substeps) noexcept
{
    _physicsSubsteps = substeps;
    return *this;
}

Config::Builder& Config::Builder::gravity(math::Vec2 gravity) noexcept
{
    _gravity = gravity;
    return *this;
}

Config::Builder& Config::Builder::pixelsPerMeter(core::f32 ppm) noexcept
{
    _pixelsPerMeter = ppm;
    return *this;
}

Config::Builder& Config::Builder::clearColor(render::Color color) noexcept
{
    _clearColor = color;
    return *this;
}

Config::Builder& Config::Builder::designSize(core::u32 width, core::u32 height) noexcept
{
    _designWidth  = width;
    _designHeight = height;
    return *this;
}

Config::Builder& Config::Builder::displayMode(render::DisplayMode mode) noexcept
{
    _displayMode = mode;
    return *this;
}

Config::Builder& Config::Builder::vsync(bool enabled) noexcept
{
    _vsync = enabled;
    return *this;
}

Config::Builder& Config::Builder::logLevel(core::LogLevel level) noexcept
{
    _logLevel = level;
    return *this;
}

Config::Builder& Config::Builder::profileSystems(bool enabled) noexcept
{
    _profileSystems = enabled;
    return *this;
}

Config Config::Builder::build() const
{
    Config cfg;
    cfg._windowWidth     = _windowWidth;
    cfg._windowHeight    = _windowHeight;
    cfg._windowTitle     = _windowTitle;
    cfg._fixedTimestep   = _fixedTimestep;
    cfg._physicsSubsteps = _physicsSubsteps;
    cfg._gravity         = _gravity;
    cfg._pixelsPerMeter  = _pixelsPerMeter;
    cfg._clearColor      = _clearColor;
    cfg._designWidth     = _designWidth;
    cfg._designHeight    = _designHeight;
    cfg._displayMode     = _displayMode;
    cfg._vsync           = _vsync;
    cfg._logLevel        = _logLevel;
    cfg._profileSystems  = _profileSystems;
    return cfg;
}

core::Expected<void> Config::validate() const
{
    if (_windowWidth == 0 || _windowHeight == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "window size must be positive");
    if (!(_fixedTimestep > 0.0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "fixedTimestep must be positive");
    if (_physicsSubsteps < 1)
        return core::makeError(core::ErrorCode::kInvalidArgument, "physicsSubsteps must be at least 1");
    if (!(_pixelsPerMeter > 0.0f))
        return core::makeError(core::ErrorCode::kInvalidArgument, "pixelsPerMeter must be positive");
    if ((_designWidth == 0) != (_designHeight == 0))
        return core::makeError(core::ErrorCode::kInvalidArgument, "design size needs both width and height");
    return {};
}

} // namespace ember::engine
