/**
 * @file Camera2D.cpp
 * @brief Camera2D implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/render/Camera2D.hpp"

namespace ember::render {

void Camera2D::setZoom(core::f32 zoom) noexcept
{
    if (zoom > 0.0f)
        _zoom = zoom;
}

math::Vec2 Camera2D::worldToScreen(math::Vec2 world) const noexcept
{
    return math::rotate((world - _target) * _zoom, _rotation) + _offset;
}

math::Vec2 Camera2D::screenToWorld(math::Vec2 screen) const noexcept
{
    return math::rotate(screen - _offset, -_rotation) / _zoom + _target;
}

} // namespace ember::render
