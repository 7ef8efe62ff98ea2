/**
 * @file InputManager.hpp
 * @brief Frame-to-frame input edges on top of polled snapshots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_INPUT_INPUTMANAGER_HPP
    #define EMBER_INPUT_INPUTMANAGER_HPP

#include "ember/input/InputState.hpp"
#include "ember/core/NonCopyable.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

namespace ember::input {

/**
 * @class InputManager
 * @brief Keeps the current and previous InputState.
 *
 * "Down" is level state; "Pressed" is the rising edge (up last frame, down
 * this frame) and "Released" the falling edge.  Edges last exactly one
 * frame.
 */
class InputManager final : public core::NonCopyable<InputManager>
{
public:
    InputManager() = default;

    /** @brief Rotates snapshots: the current becomes previous, @p next becomes current. */
    void update(const InputState& next) noexcept;

    /** @brief Forgets both snapshots (e.g. on focus loss). */
    void reset() noexcept;

    [[nodiscard]] bool isKeyDown(Key key) const noexcept;
    [[nodiscard]] bool isKeyPressed(Key key) const noexcept;
    [[nodiscard]] bool isKeyReleased(Key key) const noexcept;

    [[nodiscard]] bool isMouseDown(MouseButton button) const noexcept;
    [[nodiscard]] bool isMousePressed(MouseButton button) const noexcept;
    [[nodiscard]] bool isMouseReleased(MouseButton button) const noexcept;

    [[nodiscard]] math::Vec2 mousePosition() const noexcept { return _current.mousePosition; }
    [[nodiscard]] math::Vec2 mouseDelta() const noexcept { return _current.mousePosition - _previous.mousePosition; }
    [[nodiscard]] core::f32  mouseWheel() const noexcept { return _current.mouseWheel; }

    [[nodiscard]] bool      isGamepadConnected() const noexcept { return _current.gamepadConnected; }
    [[nodiscard]] bool      isGamepadDown(GamepadButton button) const noexcept;
    [[nodiscard]] bool      isGamepadPressed(GamepadButton button) const noexcept;
    [[nodiscard]] bool      isGamepadReleased(GamepadButton button) const noexcept;
    [[nodiscard]] core::f32 gamepadAxis(GamepadAxis axis) const noexcept;

    [[nodiscard]] const InputState& current() const noexcept { return _current; }
    [[nodiscard]] const InputState& previous() const noexcept { return _previous; }

private:
    InputState _current{};
    InputState _previous{};
};

} // namespace ember::input

#endif // EMBER_INPUT_INPUTMANAGER_HPP
