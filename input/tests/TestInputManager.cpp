/**
 * @file TestInputManager.cpp
 * @brief Level and edge queries of input::InputManager.
 */

#include <catch2/catch_test_macros.hpp>

#include "ember/input/InputManager.hpp"

namespace ember::input {

TEST_CASE("Key edges last a single frame", "[input]")
{
    InputManager input;
    InputState frame;

    frame.setKey(Key::Space, true);
    input.update(frame);
    REQUIRE(input.isKeyDown(Key::Space));
    REQUIRE(input.isKeyPressed(Key::Space));
    REQUIRE_FALSE(input.isKeyReleased(Key::Space));

    input.update(frame);
    REQUIRE(input.isKeyDown(Key::Space));
    REQUIRE_FALSE(input.isKeyPressed(Key::Space));

    frame.setKey(Key::Space, false);
    input.update(frame);
    REQUIRE_FALSE(input.isKeyDown(Key::Space));
    REQUIRE(input.isKeyReleased(Key::Space));

    input.update(frame);
    REQUIRE_FALSE(input.isKeyReleased(Key::Space));
}

TEST_CASE("Mouse state tracks buttons, motion and wheel", "[input]")
{
    InputManager input;
    InputState frame;
    frame.mousePosition = math::Vec2{10.0f, 20.0f};
    input.update(frame);

    frame.mousePosition = math::Vec2{15.0f, 18.0f};
    frame.mouseWheel = -1.0f;
    frame.setMouseButton(MouseButton::Left, true);
    input.update(frame);

    REQUIRE(input.mousePosition() == math::Vec2{15.0f, 18.0f});
    REQUIRE(input.mouseDelta() == math::Vec2{5.0f, -2.0f});
    REQUIRE(input.mouseWheel() == -1.0f);
    REQUIRE(input.isMousePressed(MouseButton::Left));
    REQUIRE_FALSE(input.isMouseDown(MouseButton::Right));
}

TEST_CASE("Gamepad queries read nothing while disconnected", "[input]")
{
    InputManager input;
    InputState frame;
    frame.setGamepadButton(GamepadButton::South, true);
    frame.setGamepadAxis(GamepadAxis::LeftX, 0.75f);
    input.update(frame);

    REQUIRE_FALSE(input.isGamepadConnected());
    REQUIRE_FALSE(input.isGamepadDown(GamepadButton::South));
    REQUIRE(input.gamepadAxis(GamepadAxis::LeftX) == 0.0f);

    frame.gamepadConnected = true;
    input.update(frame);
    REQUIRE(input.isGamepadDown(GamepadButton::South));
    REQUIRE(input.gamepadAxis(GamepadAxis::LeftX) == 0.75f);
}

TEST_CASE("reset clears both snapshots", "[input]")
{
    InputManager input;
    InputState frame;
    frame.setKey(Key::A, true);
    input.update(frame);
    input.reset();

    REQUIRE_FALSE(input.isKeyDown(Key::A));
    REQUIRE_FALSE(input.isKeyReleased(Key::A));
}

} // namespace ember::input
