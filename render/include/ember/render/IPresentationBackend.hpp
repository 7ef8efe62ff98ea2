/**
 * @file IPresentationBackend.hpp
 * @brief Abstract window / draw / input backend (Strategy pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_RENDER_IPRESENTATIONBACKEND_HPP
    #define EMBER_RENDER_IPRESENTATIONBACKEND_HPP

#include "ember/render/Camera2D.hpp"
#include "ember/render/Color.hpp"
#include "ember/input/InputState.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Rect.hpp"
#include "ember/math/Vec2.hpp"

#include <string_view>

namespace ember::render {

enum class DisplayMode : core::u8
{
    Windowed,
    Fullscreen,
    Borderless
};

struct PresentationOptions
{
    DisplayMode displayMode{DisplayMode::Windowed};
    bool        vsync{true};
    bool        resizable{true};
};

/** @brief Opaque texture id handed out by a backend. */
struct TextureHandle
{
    core::u32 id{0};

    [[nodiscard]] constexpr bool isValid() const noexcept { return id != 0; }
    constexpr bool operator==(const TextureHandle&) const noexcept = default;
};

/**
 * @class IPresentationBackend
 * @brief Everything the engine needs from a windowing/rendering library.
 *
 * Concrete backends:
 *   - @c HeadlessBackend  no window; scripted time and input, recorded draws.
 *
 * Draw calls are in screen space unless issued between beginCamera() and
 * endCamera().
 */
class IPresentationBackend
{
public:
    virtual ~IPresentationBackend() = default;

    // --------------------------------------------------------------------- //
    //  Lifecycle                                                             //
    // --------------------------------------------------------------------- //

    [[nodiscard]] virtual core::Expected<void> init(core::u32 width, core::u32 height, std::string_view title,
                                                    const PresentationOptions& options) = 0;
    virtual void shutdown() = 0;

    [[nodiscard]] virtual const char* name() const noexcept = 0;

    /**
     * @brief Pumps window events.
     * @return False once the window was asked to close.
     */
    [[nodiscard]] virtual bool update() = 0;

    /** @brief Seconds elapsed during the previous frame. */
    [[nodiscard]] virtual core::f32 frameTime() const = 0;

    [[nodiscard]] virtual math::Vec2 windowSize() const = 0;

    /** @brief Writes this frame's device state into @p state. */
    virtual void pollInput(input::InputState& state) = 0;

    // --------------------------------------------------------------------- //
    //  Frame                                                                 //
    // --------------------------------------------------------------------- //

    virtual void clear(Color color) = 0;
    virtual void present() = 0;

    virtual void beginCamera(const Camera2D& camera) = 0;
    virtual void endCamera() = 0;

    // --------------------------------------------------------------------- //
    //  Primitives                                                            //
    // --------------------------------------------------------------------- //

    virtual void drawRect(const math::Rect& rect, Color color) = 0;

    /** @brief Rectangle rotated by @p rotation radians around @p origin (relative to the rect). */
    virtual void drawRectEx(const math::Rect& rect, math::Vec2 origin, core::f32 rotation, Color color) = 0;

    virtual void drawRectLines(const math::Rect& rect, core::f32 thickness, Color color) = 0;
    virtual void drawCircle(math::Vec2 center, core::f32 radius, Color color) = 0;
    virtual void drawCircleLines(math::Vec2 center, core::f32 radius, Color color) = 0;
    virtual void drawLine(math::Vec2 from, math::Vec2 to, core::f32 thickness, Color color) = 0;
    virtual void drawText(std::string_view text, math::Vec2 position, core::f32 size, Color color) = 0;

    [[nodiscard]] virtual core::Expected<TextureHandle> loadTexture(std::string_view path) = 0;
    virtual void unloadTexture(TextureHandle texture) = 0;
    virtual void drawTexture(TextureHandle texture, const math::Rect& source, const math::Rect& dest,
                             core::f32 rotation, Color tint) = 0;

    /** @brief Maps a screen point through @p camera. */
    [[nodiscard]] virtual math::Vec2 screenToWorld(math::Vec2 point, const Camera2D& camera) const
    {
        return camera.screenToWorld(point);
    }
};

} // namespace ember::render

#endif // EMBER_RENDER_IPRESENTATIONBACKEND_HPP
