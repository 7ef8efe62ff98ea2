/**
 * @file InputManager.cpp
 * @brief Edge detection over consecutive input snapshots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/input/InputManager.hpp"

namespace ember::input {

namespace {

template <typename Bits, typename Enum>
[[nodiscard]] bool test(const Bits& bits, Enum value) noexcept
{
    const auto index = static_cast<core::usize>(value);
    return index < bits.size() && bits.test(index);
}

} // namespace

void InputManager::update(const InputState& next) noexcept
{
    _previous = _current;
    _current  = next;
}

void InputManager::reset() noexcept
{
    _previous = InputState{};
    _current  = InputState{};
}

// ---- Keyboard ----------------------------------------------------------------

bool InputManager::isKeyDown(Key key) const noexcept
{
    return test(_current.keys, key);
}

bool InputManager::isKeyPressed(Key key) const noexcept
{
    return test(_current.keys, key) && !test(_previous.keys, key);
}

bool InputManager::isKeyReleased(Key key) const noexcept
{
    return !test(_current.keys, key) && test(_previous.keys, key);
}

// ---- Mouse -------------------------------------------------------------------

bool InputManager::isMouseDown(MouseButton button) const noexcept
{
    return test(_current.mouseButtons, button);
}

bool InputManager::isMousePressed(MouseButton button) const noexcept
{
    return test(_current.mouseButtons, button) && !test(_previous.mouseButtons, button);
}

bool InputManager::isMouseReleased(MouseButton button) const noexcept
{
    return !test(_current.mouseButtons, button) && test(_previous.mouseButtons, button);
}

// ---- Gamepad -----------------------------------------------------------------

bool InputManager::isGamepadDown(GamepadButton button) const noexcept
{
    return _current.gamepadConnected && test(_current.gamepadButtons, button);
}

bool InputManager::isGamepadPressed(GamepadButton button) const noexcept
{
    return isGamepadDown(button) && !test(_previous.gamepadButtons, button);
}

bool InputManager::isGamepadReleased(GamepadButton button) const noexcept
{
    return !isGamepadDown(button) && test(_previous.gamepadButtons, button);
}

core::f32 InputManager::gamepadAxis(GamepadAxis axis) const noexcept
{
    const auto index = static_cast<core::usize>(axis);
    if (!_current.gamepadConnected || index >= _current.gamepadAxes.size())
        return 0.0f;
    return _current.gamepadAxes[index];
}

} // namespace ember::input
