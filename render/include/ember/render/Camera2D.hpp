/**
 * @file Camera2D.hpp
 * @brief 2D camera: target, screen offset, rotation and zoom.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_RENDER_CAMERA2D_HPP
    #define EMBER_RENDER_CAMERA2D_HPP

#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

namespace ember::render {

/**
 * @class Camera2D
 * @brief Maps world space to screen space.
 *
 * The world point @c target is drawn at the screen point @c offset; the
 * view is then rotated by @c rotation radians and scaled by @c zoom.
 */
class Camera2D
{
public:
    Camera2D() noexcept = default;

    void setTarget(math::Vec2 target) noexcept { _target = target; }
    void setOffset(math::Vec2 offset) noexcept { _offset = offset; }
    void setRotation(core::f32 radians) noexcept { _rotation = radians; }

    /** @brief Sets the zoom; non-positive values are ignored. */
    void setZoom(core::f32 zoom) noexcept;

    [[nodiscard]] math::Vec2 target() const noexcept { return _target; }
    [[nodiscard]] math::Vec2 offset() const noexcept { return _offset; }
    [[nodiscard]] core::f32  rotation() const noexcept { return _rotation; }
    [[nodiscard]] core::f32  zoom() const noexcept { return _zoom; }

    [[nodiscard]] math::Vec2 worldToScreen(math::Vec2 world) const noexcept;
    [[nodiscard]] math::Vec2 screenToWorld(math::Vec2 screen) const noexcept;

private:
    math::Vec2 _target{0.0f, 0.0f};
    math::Vec2 _offset{0.0f, 0.0f};
    core::f32  _rotation{0.0f};
    core::f32  _zoom{1.0f};
};

} // namespace ember::render

#endif // EMBER_RENDER_CAMERA2D_HPP
