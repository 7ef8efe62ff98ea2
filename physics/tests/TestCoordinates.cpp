/**
 * @file TestCoordinates.cpp
 * @brief Screen/physics coordinate conversion tests.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include "ember/physics/Coordinates.hpp"

namespace ember::physics {

TEST_CASE("screenToPhysics flips the vertical axis only", "[physics][coordinates]")
{
    const math::Vec2 p = screenToPhysics(math::Vec2{12.5f, 40.0f});
    REQUIRE(p.x == 12.5f);
    REQUIRE(p.y == -40.0f);
}

TEST_CASE("Coordinate conversion round-trips exactly", "[physics][coordinates]")
{
    const auto x = GENERATE(-1.0e6f, -3.25f, 0.0f, 0.1f, 640.0f);
    const auto y = GENERATE(-720.0f, -0.5f, 0.0f, 1.0e-7f, 900.0f);
    const math::Vec2 screen{x, y};

    const math::Vec2 back = physicsToScreen(screenToPhysics(screen));
    REQUIRE(back.x == screen.x);
    REQUIRE(back.y == screen.y);

    const math::Vec2 forth = screenToPhysics(physicsToScreen(screen));
    REQUIRE(forth == screen);
}

} // namespace ember::physics
