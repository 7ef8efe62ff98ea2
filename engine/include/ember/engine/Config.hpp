/**
 * @file Config.hpp
 * @brief Engine configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_CONFIG_HPP
    #define EMBER_ENGINE_CONFIG_HPP

#include "ember/render/Color.hpp"
#include "ember/render/IPresentationBackend.hpp"
#include "ember/core/Constants.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/Log.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <string>

namespace ember::engine {

/** @brief Immutable engine configuration. */
class Config
{
public:
    /** @brief Fluent builder for Config. */
    class Builder
    {
    public:
        Builder& windowSize(core::u32 width, core::u32 height) noexcept;
        Builder& windowTitle(std::string title);
        Builder& fixedTimestep(core::f64 seconds) noexcept;
        Builder& physicsSubsteps(core::u32 substeps) noexcept;
        Builder& gravity(math::Vec2 gravity) noexcept;
        Builder& pixelsPerMeter(core::f32 ppm) noexcept;
        Builder& clearColor(render::Color color) noexcept;
        Builder& designSize(core::u32 width, core::u32 height) noexcept;
        Builder& displayMode(render::DisplayMode mode) noexcept;
        Builder& vsync(bool enabled) noexcept;
        Builder& logLevel(core::LogLevel level) noexcept;
        Builder& profileSystems(bool enabled) noexcept;

        [[nodiscard]] Config build() const;

    private:
        core::u32           _windowWidth{1280};
        core::u32           _windowHeight{720};
        std::string         _windowTitle{"Ember2D"};
        core::f64           _fixedTimestep{core::kDefaultFixedTimestep};
        core::u32           _physicsSubsteps{core::kDefaultPhysicsSubsteps};
        math::Vec2          _gravity{0.0f, core::kDefaultGravityY};
        core::f32           _pixelsPerMeter{core::kDefaultPixelsPerMeter};
        render::Color       _clearColor{render::colors::kDarkGrey};
        core::u32           _designWidth{0};
        core::u32           _designHeight{0};
        render::DisplayMode _displayMode{render::DisplayMode::Windowed};
        bool                _vsync{true};
        core::LogLevel      _logLevel{core::LogLevel::kInfo};
        bool                _profileSystems{false};
    };

    /** @brief Configuration with every option at its default. */
    Config() = default;

    [[nodiscard]] core::u32           windowWidth()     const noexcept { return _windowWidth; }
    [[nodiscard]] core::u32           windowHeight()    const noexcept { return _windowHeight; }
    [[nodiscard]] const std::string&  windowTitle()     const noexcept { return _windowTitle; }
    [[nodiscard]] core::f64           fixedTimestep()   const noexcept { return _fixedTimestep; }
    [[nodiscard]] core::u32           physicsSubsteps() const noexcept { return _physicsSubsteps; }
    [[nodiscard]] math::Vec2          gravity()         const noexcept { return _gravity; }
    [[nodiscard]] core::f32           pixelsPerMeter()  const noexcept { return _pixelsPerMeter; }
    [[nodiscard]] render::Color       clearColor()      const noexcept { return _clearColor; }
    [[nodiscard]] core::u32           designWidth()     const noexcept { return _designWidth; }
    [[nodiscard]] core::u32           designHeight()    const noexcept { return _designHeight; }
    [[nodiscard]] bool                hasDesignSize()   const noexcept { return _designWidth > 0 && _designHeight > 0; }
    [[nodiscard]] render::DisplayMode displayMode()     const noexcept { return _displayMode; }
    [[nodiscard]] bool                vsync()           const noexcept { return _vsync; }
    [[nodiscard]] core::LogLevel      logLevel()        const noexcept { return _logLevel; }
    [[nodiscard]] bool                profileSystems()  const noexcept { return _profileSystems; }

    /**
     * @brief Checks the option ranges.
     * @return kInvalidArgument naming the first offending option.
     */
    [[nodiscard]] core::Expected<void> validate() const;

private:
    friend class Builder;

    core::u32           _windowWidth{1280};
    core::u32           _windowHeight{720};
    std::string         _windowTitle{"Ember2D"};
    core::f64           _fixedTimestep{core::kDefaultFixedTimestep};
    core::u32           _physicsSubsteps{core::kDefaultPhysicsSubsteps};
    math::Vec2          _gravity{0.0f, core::kDefaultGravityY};
    core::f32           _pixelsPerMeter{core::kDefaultPixelsPerMeter};
    render::Color       _clearColor{render::colors::kDarkGrey};
    core::u32           _designWidth{0};
    core::u32           _designHeight{0};
    render::DisplayMode _displayMode{render::DisplayMode::Windowed};
    bool                _vsync{true};
    core::LogLevel      _logLevel{core::LogLevel::kInfo};
    bool                _profileSystems{false};
};

} // namespace ember::engine

#endif // EMBER_ENGINE_CONFIG_HPP
