/**
 * @file HeadlessBackend.hpp
 * @brief Window-less presentation backend for tests and batch runs.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_RENDER_HEADLESSBACKEND_HPP
    #define EMBER_RENDER_HEADLESSBACKEND_HPP

#include "ember/render/IPresentationBackend.hpp"
#include "ember/core/NonCopyable.hpp"

#include <deque>
#include <map>
#include <string>
#include <vector>

namespace ember::render {

/**
 * @class HeadlessBackend
 * @brief Drives the engine without a window.
 *
 * - Time: each update() consumes one scripted frame time, falling back to
 *   the default frame time once the script is empty.
 * - Input: a state scripted for frame N is reported from frame N on, until
 *   the next scripted state.
 * - Draws: every call of the last frame is recorded; counters cover the
 *   whole run.
 * - Termination: update() returns false after @c frameLimit frames (0 for
 *   no limit) or once requestClose() was called.
 */
class HeadlessBackend final : public IPresentationBackend,
                              public core::NonCopyable<HeadlessBackend>
{
public:
    enum class DrawKind : core::u8
    {
        Rect,
        RectEx,
        RectLines,
        Circle,
        CircleLines,
        Line,
        Text,
        Texture
    };

    struct DrawCall
    {
        DrawKind    kind{DrawKind::Rect};
        math::Rect  rect{};
        math::Vec2  a{0.0f, 0.0f};
        math::Vec2  b{0.0f, 0.0f};
        core::f32   scalar{0.0f};
        Color       color{};
        std::string text;
        bool        inCamera{false};
    };

    struct Settings
    {
        core::f32 frameTime{1.0f / 60.0f};
        core::u64 frameLimit{0};
    };

    HeadlessBackend() = default;
    explicit HeadlessBackend(Settings settings) noexcept : _settings{settings} {}

    // ---- scripting ---------------------------------------------------------

    void scriptFrameTimes(std::vector<core::f32> frameTimes);
    void scriptInput(core::u64 frame, const input::InputState& state);
    void requestClose() noexcept { _closeRequested = true; }

    // ---- inspection --------------------------------------------------------

    [[nodiscard]] bool                         initialized() const noexcept { return _initialized; }
    [[nodiscard]] core::u64                    frameCount() const noexcept { return _frame; }
    [[nodiscard]] core::u64                    presentCount() const noexcept { return _presentCount; }
    [[nodiscard]] core::u64                    clearCount() const noexcept { return _clearCount; }
    [[nodiscard]] Color                        lastClearColor() const noexcept { return _lastClear; }
    [[nodiscard]] const std::vector<DrawCall>& drawCalls() const noexcept { return _drawCalls; }
    [[nodiscard]] const std::string&           title() const noexcept { return _title; }
    [[nodiscard]] const PresentationOptions&   options() const noexcept { return _options; }

    // ---- IPresentationBackend ----------------------------------------------

    [[nodiscard]] core::Expected<void> init(core::u32 width, core::u32 height, std::string_view title,
                                            const PresentationOptions& options) override;
    void shutdown() override;
    [[nodiscard]] const char* name() const noexcept override { return "HeadlessBackend"; }

    [[nodiscard]] bool update() override;
    [[nodiscard]] core::f32 frameTime() const override { return _frameTime; }
    [[nodiscard]] math::Vec2 windowSize() const override { return _windowSize; }
    void pollInput(input::InputState& state) override;

    void clear(Color color) override;
    void present() override;
    void beginCamera(const Camera2D& camera) override;
    void endCamera() override;

    void drawRect(const math::Rect& rect, Color color) override;
    void drawRectEx(const math::Rect& rect, math::Vec2 origin, core::f32 rotation, Color color) override;
    void drawRectLines(const math::Rect& rect, core::f32 thickness, Color color) override;
    void drawCircle(math::Vec2 center, core::f32 radius, Color color) override;
    void drawCircleLines(math::Vec2 center, core::f32 radius, Color color) override;
    void drawLine(math::Vec2 from, math::Vec2 to, core::f32 thickness, Color color) override;
    void drawText(std::string_view text, math::Vec2 position, core::f32 size, Color color) override;

    [[nodiscard]] core::Expected<TextureHandle> loadTexture(std::string_view path) override;
    void unloadTexture(TextureHandle texture) override;
    void drawTexture(TextureHandle texture, const math::Rect& source, const math::Rect& dest,
                     core::f32 rotation, Color tint) override;

private:
    void record(DrawCall call);

    Settings                                 _settings{};
    bool                                     _initialized{false};
    bool                                     _closeRequested{false};
    bool                                     _inCamera{false};
    std::string                              _title;
    PresentationOptions                      _options{};
    math::Vec2                               _windowSize{0.0f, 0.0f};
    core::u64                                _frame{0};
    core::f32                                _frameTime{0.0f};
    std::deque<core::f32>                    _scriptedFrameTimes;
    std::map<core::u64, input::InputState>   _scriptedInput;
    std::vector<DrawCall>                    _drawCalls;
    core::u64                                _presentCount{0};
    core::u64                                _clearCount{0};
    Color                                    _lastClear{};
    core::u32                                _nextTexture{1};
    std::map<core::u32, std::string>         _textures;
};

} // namespace ember::render

#endif // EMBER_RENDER_HEADLESSBACKEND_HPP
