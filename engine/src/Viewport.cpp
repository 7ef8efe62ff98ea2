/**
 * @file Viewport.cpp
 * @brief Viewport implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/engine/Viewport.hpp"

#include <algorithm>

namespace ember::engine {

Viewport::Viewport(core::u32 designWidth, core::u32 designHeight) noexcept
    : _design{static_cast<core::f32>(designWidth), static_cast<core::f32>(designHeight)}
{
}

void Viewport::update(math::Vec2 windowSize) noexcept
{
    _window = windowSize;
    if (!enabled() || windowSize.x <= 0.0f || windowSize.y <= 0.0f)
    {
        _scale  = 1.0f;
        _offset = math::Vec2{0.0f, 0.0f};
        return;
    }

    _scale  = std::min(windowSize.x / _design.x, windowSize.y / _design.y);
    _offset = (windowSize - _design * _scale) * 0.5f;
}

math::Rect Viewport::area() const noexcept
{
    if (!enabled())
        return math::Rect{0.0f, 0.0f, _window.x, _window.y};
    return math::Rect{_offset.x, _offset.y, _design.x * _scale, _design.y * _scale};
}

math::Vec2 Viewport::windowToDesign(math::Vec2 point) const noexcept
{
    return (point - _offset) / _scale;
}

math::Vec2 Viewport::designToWindow(math::Vec2 point) const noexcept
{
    return point * _scale + _offset;
}

} // namespace ember::engine
