/**
 * @file InputState.hpp
 * @brief Snapshot of keyboard, mouse and gamepad state at a single frame.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_INPUT_INPUTSTATE_HPP
    #define EMBER_INPUT_INPUTSTATE_HPP

#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <array>
#include <bitset>

namespace ember::input {

/**
 * @enum Key
 * @brief Keyboard keys known to the engine.
 */
enum class Key : core::u16
{
    Unknown = 0,

    A, B, C, D, E, F, G, H, I, J, K, L, M,
    N, O, P, Q, R, S, T, U, V, W, X, Y, Z,

    Num0, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9,

    Space,
    Enter,
    Escape,
    Tab,
    Backspace,
    LeftShift,
    RightShift,
    LeftControl,
    RightControl,
    LeftAlt,
    RightAlt,

    Left,
    Right,
    Up,
    Down,

    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,

    Count
};

enum class MouseButton : core::u8
{
    Left = 0,
    Right,
    Middle,

    Count
};

enum class GamepadButton : core::u8
{
    South = 0, ///< A / Cross
    East,      ///< B / Circle
    West,      ///< X / Square
    North,     ///< Y / Triangle
    LeftBumper,
    RightBumper,
    Back,
    Start,
    LeftThumb,
    RightThumb,
    DpadUp,
    DpadRight,
    DpadDown,
    DpadLeft,

    Count
};

enum class GamepadAxis : core::u8
{
    LeftX = 0,
    LeftY,
    RightX,
    RightY,
    LeftTrigger,
    RightTrigger,

    Count
};

inline constexpr core::usize kKeyCount           = static_cast<core::usize>(Key::Count);
inline constexpr core::usize kMouseButtonCount   = static_cast<core::usize>(MouseButton::Count);
inline constexpr core::usize kGamepadButtonCount = static_cast<core::usize>(GamepadButton::Count);
inline constexpr core::usize kGamepadAxisCount   = static_cast<core::usize>(GamepadAxis::Count);

/**
 * @struct InputState
 * @brief Level state of every device for one frame.  Edges are derived by
 *        InputManager from two consecutive snapshots.
 */
struct InputState
{
    std::bitset<kKeyCount>                       keys{};
    std::bitset<kMouseButtonCount>               mouseButtons{};
    math::Vec2                                   mousePosition{0.0f, 0.0f};
    core::f32                                    mouseWheel{0.0f};
    bool                                         gamepadConnected{false};
    std::bitset<kGamepadButtonCount>             gamepadButtons{};
    std::array<core::f32, kGamepadAxisCount>     gamepadAxes{};

    void setKey(Key key, bool down) noexcept { keys.set(static_cast<core::usize>(key), down); }
    void setMouseButton(MouseButton button, bool down) noexcept
    {
        mouseButtons.set(static_cast<core::usize>(button), down);
    }
    void setGamepadButton(GamepadButton button, bool down) noexcept
    {
        gamepadButtons.set(static_cast<core::usize>(button), down);
    }
    void setGamepadAxis(GamepadAxis axis, core::f32 value) noexcept
    {
        gamepadAxes[static_cast<core::usize>(axis)] = value;
    }
};

} // namespace ember::input

#endif // EMBER_INPUT_INPUTSTATE_HPP
