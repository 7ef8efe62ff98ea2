/**
 * @file HeadlessBackend.cpp
 * @brief Scripted, window-less presentation backend.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/render/HeadlessBackend.hpp"

#include <iterator>
#include <utility>

namespace ember::render {

// ========================================================================== //
//  Scripting                                                                 //
// ========================================================================== //

void HeadlessBackend::scriptFrameTimes(std::vector<core::f32> frameTimes)
{
    _scriptedFrameTimes.insert(_scriptedFrameTimes.end(), frameTimes.begin(), frameTimes.end());
}

void HeadlessBackend::scriptInput(core::u64 frame, const input::InputState& state)
{
    _scriptedInput[frame] = state;
}

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

core::Expected<void> HeadlessBackend::init(core::u32 width, core::u32 height, std::string_view title,
                                           const PresentationOptions& options)
{
    if (width == 0 || height == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "window size must be positive");
    }

    _windowSize  = math::Vec2{static_cast<core::f32>(width), static_cast<core::f32>(height)};
    _title       = std::string{title};
    _options     = options;
    _initialized = true;
    return {};
}

void HeadlessBackend::shutdown()
{
    _initialized = false;
    _textures.clear();
}

bool HeadlessBackend::update()
{
    if (!_initialized || _closeRequested)
        return false;
    if (_settings.frameLimit != 0 && _frame >= _settings.frameLimit)
        return false;

    ++_frame;
    _drawCalls.clear();

    if (!_scriptedFrameTimes.empty())
    {
        _frameTime = _scriptedFrameTimes.front();
        _scriptedFrameTimes.pop_front();
    }
    else
    {
        _frameTime = _settings.frameTime;
    }
    return true;
}

void HeadlessBackend::pollInput(input::InputState& state)
{
    // Latest scripted state at or before the current frame.
    auto it = _scriptedInput.upper_bound(_frame);
    if (it == _scriptedInput.begin())
    {
        state = input::InputState{};
        return;
    }
    state = std::prev(it)->second;
}

// ========================================================================== //
//  Frame                                                                     //
// ========================================================================== //

void HeadlessBackend::clear(Color color)
{
    ++_clearCount;
    _lastClear = color;
}

void HeadlessBackend::present()
{
    ++_presentCount;
}

void HeadlessBackend::beginCamera(const Camera2D&)
{
    _inCamera = true;
}

void HeadlessBackend::endCamera()
{
    _inCamera = false;
}

// ========================================================================== //
//  Primitives                                                                //
// ========================================================================== //

void HeadlessBackend::record(DrawCall call)
{
    call.inCamera = _inCamera;
    _drawCalls.push_back(std::move(call));
}

void HeadlessBackend::drawRect(const math::Rect& rect, Color color)
{
    record(DrawCall{DrawKind::Rect, rect, {}, {}, 0.0f, color, {}, false});
}

void HeadlessBackend::drawRectEx(const math::Rect& rect, math::Vec2 origin, core::f32 rotation, Color color)
{
    record(DrawCall{DrawKind::RectEx, rect, origin, {}, rotation, color, {}, false});
}

void HeadlessBackend::drawRectLines(const math::Rect& rect, core::f32 thickness, Color color)
{
    record(DrawCall{DrawKind::RectLines, rect, {}, {}, thickness, color, {}, false});
}

void HeadlessBackend::drawCircle(math::Vec2 center, core::f32 radius, Color color)
{
    record(DrawCall{DrawKind::Circle, {}, center, {}, radius, color, {}, false});
}

void HeadlessBackend::drawCircleLines(math::Vec2 center, core::f32 radius, Color color)
{
    record(DrawCall{DrawKind::CircleLines, {}, center, {}, radius, color, {}, false});
}

void HeadlessBackend::drawLine(math::Vec2 from, math::Vec2 to, core::f32 thickness, Color color)
{
    record(DrawCall{DrawKind::Line, {}, from, to, thickness, color, {}, false});
}

void HeadlessBackend::drawText(std::string_view text, math::Vec2 position, core::f32 size, Color color)
{
    record(DrawCall{DrawKind::Text, {}, position, {}, size, color, std::string{text}, false});
}

core::Expected<TextureHandle> HeadlessBackend::loadTexture(std::string_view path)
{
    if (path.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "empty texture path");
    }
    const core::u32 id = _nextTexture++;
    _textures.emplace(id, std::string{path});
    return TextureHandle{id};
}

void HeadlessBackend::unloadTexture(TextureHandle texture)
{
    _textures.erase(texture.id);
}

void HeadlessBackend::drawTexture(TextureHandle texture, const math::Rect& source, const math::Rect& dest,
                                  core::f32 rotation, Color tint)
{
    const auto it = _textures.find(texture.id);
    std::string path = it == _textures.end() ? std::string{} : it->second;
    record(DrawCall{DrawKind::Texture, dest, source.position(), source.size(), rotation, tint, std::move(path), false});
}

} // namespace ember::render
