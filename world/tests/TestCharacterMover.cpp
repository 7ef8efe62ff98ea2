/**
 * @file TestCharacterMover.cpp
 * @brief Character capsule controller against the CPU backend.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "RecordingLogger.hpp"
#include "WorldFixture.hpp"
#include "ember/physics/CpuPhysicsBackend.hpp"
#include "ember/world/CharacterMover.hpp"

#include <memory>

namespace ember::world {

using Catch::Matchers::WithinAbs;

TEST_CASE("buildCapsule fits the character box", "[world][mover]")
{
    const physics::Capsule tall = buildCapsule(20.0f, 60.0f);
    REQUIRE(tall.radius == 10.0f);
    REQUIRE(tall.center1 == math::Vec2{0.0f, -20.0f});
    REQUIRE(tall.center2 == math::Vec2{0.0f, 20.0f});

    const physics::Capsule squat = buildCapsule(40.0f, 10.0f);
    REQUIRE(squat.radius == 20.0f);
    REQUIRE(squat.center1 == squat.center2);
}

TEST_CASE("classifyContacts splits floor, wall and ceiling at 45 degrees", "[world][mover]")
{
    physics::CollisionPlane floor;
    floor.normal = math::Vec2{0.0f, 1.0f};
    physics::CollisionPlane slope;
    slope.normal = math::safeNormalize(math::Vec2{1.0f, 1.2f});
    physics::CollisionPlane wall;
    wall.normal = math::Vec2{-1.0f, 0.0f};
    physics::CollisionPlane ceiling;
    ceiling.normal = math::Vec2{0.0f, -1.0f};

    const physics::CollisionPlane onlyWall[] = {wall};
    ContactFlags flags = classifyContacts(onlyWall);
    REQUIRE(flags.onWall);
    REQUIRE_FALSE(flags.onFloor);
    REQUIRE_FALSE(flags.onCeiling);

    const physics::CollisionPlane mixed[] = {slope, ceiling};
    flags = classifyContacts(mixed);
    REQUIRE(flags.onFloor);
    REQUIRE(flags.onCeiling);
    REQUIRE_FALSE(flags.onWall);

    const physics::CollisionPlane flat[] = {floor};
    REQUIRE(classifyContacts(flat).onFloor);
}

TEST_CASE_METHOD(testing::WorldFixture, "Characters move by velocity and rebuild a resized capsule",
                 "[world][mover]")
{
    const ecs::EntityId id = world.spawn()
        .with(Transform{math::Vec2{100.0f, 100.0f}})
        .with(CharacterBody{20.0f, 40.0f, math::Vec2{60.0f, 0.0f}, 0.0f})
        .id();

    world.getComponent<CharacterBody>(id)->width = 30.0f;
    world.moveCharacters(0.5f);

    const auto* character = world.getComponent<CharacterBody>(id);
    REQUIRE(character->capsule.radius == 15.0f);
    REQUIRE(character->builtWidth == 30.0f);
    REQUIRE_THAT(world.getComponent<Transform>(id)->position.x, WithinAbs(130.0, 1e-4));
    REQUIRE_THAT(world.getComponent<Transform>(id)->position.y, WithinAbs(100.0, 1e-4));
}

TEST_CASE_METHOD(testing::WorldFixture, "Airborne characters accelerate with gravity", "[world][mover]")
{
    const ecs::EntityId id = world.spawn()
        .with(Transform{})
        .with(CharacterBody{})
        .id();

    world.moveCharacters(0.1f);

    const auto* character = world.getComponent<CharacterBody>(id);
    REQUIRE_THAT(character->velocity.y, WithinAbs(90.0, 1e-4));
    REQUIRE(world.getComponent<Transform>(id)->position.y > 0.0f);
    REQUIRE_FALSE(character->onFloor);
}

namespace {

struct CpuWorldFixture
{
    testing::RecordingLogger sink;
    core::Logger             logger{&sink};
    World                    world{std::make_unique<physics::CpuPhysicsBackend>(logger), logger};

    CpuWorldFixture()
    {
        REQUIRE(world.init(math::Vec2{0.0f, 900.0f}, 40.0f).has_value());
        // Floor top at y = 90.
        world.spawn().with(Transform{math::Vec2{0.0f, 100.0f}}).with(Collider{BoxShape{1000.0f, 20.0f}});
    }

    void run(core::u32 frames)
    {
        for (core::u32 i = 0; i < frames; ++i)
            world.moveCharacters(1.0f / 60.0f);
    }
};

} // namespace

TEST_CASE_METHOD(CpuWorldFixture, "A falling character lands on the floor", "[world][mover][cpu]")
{
    const ecs::EntityId id = world.spawn()
        .with(Transform{math::Vec2{0.0f, 0.0f}})
        .with(CharacterBody{20.0f, 40.0f})
        .id();

    run(120);

    const auto* character = world.getComponent<CharacterBody>(id);
    REQUIRE(character->onFloor);
    REQUIRE_FALSE(character->onCeiling);
    REQUIRE_THAT(character->velocity.y, WithinAbs(0.0, 1e-3));
    REQUIRE_THAT(world.getComponent<Transform>(id)->position.y, WithinAbs(69.8, 0.3));

    SECTION("and stops against a wall")
    {
        // Wall face at x = 90.
        world.spawn().with(Transform{math::Vec2{100.0f, 0.0f}}).with(Collider{BoxShape{20.0f, 400.0f}});

        world.getComponent<CharacterBody>(id)->velocity = math::Vec2{300.0f, 0.0f};
        run(60);

        const auto* pushed = world.getComponent<CharacterBody>(id);
        REQUIRE(pushed->onWall);
        REQUIRE(pushed->onFloor);
        REQUIRE_THAT(pushed->velocity.x, WithinAbs(0.0, 1e-3));
        REQUIRE_THAT(world.getComponent<Transform>(id)->position.x, WithinAbs(79.8, 0.3));
    }
}

} // namespace ember::world
