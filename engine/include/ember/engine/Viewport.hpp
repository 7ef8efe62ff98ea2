/**
 * @file Viewport.hpp
 * @brief Letterboxed mapping between a fixed design resolution and the window.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef EMBER_ENGINE_VIEWPORT_HPP
    #define EMBER_ENGINE_VIEWPORT_HPP

#include "ember/core/Types.hpp"
#include "ember/math/Rect.hpp"
#include "ember/math/Vec2.hpp"

namespace ember::engine {

/**
 * @class Viewport
 * @brief Uniform scale plus centring offset from design space to window space.
 *
 * Without a design size the mapping is the identity.
 */
class Viewport
{
public:
    Viewport() = default;
    Viewport(core::u32 designWidth, core::u32 designHeight) noexcept;

    /** @brief Recomputes scale and offset for a window of @p windowSize pixels. */
    void update(math::Vec2 windowSize) noexcept;

    [[nodiscard]] bool       enabled() const noexcept { return _design.x > 0.0f && _design.y > 0.0f; }
    [[nodiscard]] core::f32  scale() const noexcept { return _scale; }
    [[nodiscard]] math::Vec2 offset() const noexcept { return _offset; }
    [[nodiscard]] math::Vec2 designSize() const noexcept { return _design; }

    /** @brief Area of the window the design space is drawn into. */
    [[nodiscard]] math::Rect area() const noexcept;

    [[nodiscard]] math::Vec2 windowToDesign(math::Vec2 point) const noexcept;
    [[nodiscard]] math::Vec2 designToWindow(math::Vec2 point) const noexcept;

private:
    math::Vec2 _design{0.0f, 0.0f};
    math::Vec2 _window{0.0f, 0.0f};
    core::f32  _scale{1.0f};
    math::Vec2 _offset{0.0f, 0.0f};
};

} // namespace ember::engine

#endif // EMBER_ENGINE_VIEWPORT_HPP
