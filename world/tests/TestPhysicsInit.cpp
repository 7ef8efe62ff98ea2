/**
 * @file TestPhysicsInit.cpp
 * @brief Auto physics initialization: planning, idempotence, ownership, cleanup.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "WorldFixture.hpp"
#include "ember/world/PhysicsInit.hpp"

namespace ember::world {

using Catch::Matchers::WithinAbs;
using testing::WorldFixture;

TEST_CASE("planPhysicsInit waits for a Collider and a Transform", "[world][physics-init]")
{
    ecs::Registry registry;
    const ecs::EntityId id = registry.create();

    REQUIRE(planPhysicsInit(registry, id).isNoop());

    registry.add(id, Collider{});
    REQUIRE(planPhysicsInit(registry, id).isNoop());

    registry.add(id, Transform{});
    REQUIRE(planPhysicsInit(registry, id).creation == BodyCreation::ImplicitStatic);

    registry.add(id, Rigidbody{});
    REQUIRE(planPhysicsInit(registry, id).creation == BodyCreation::FromRigidbody);

    SECTION("an initialized Collider is left alone")
    {
        registry.get<Collider>(id)->initialized = true;
        REQUIRE(planPhysicsInit(registry, id).isNoop());
    }

    SECTION("an initialized Rigidbody is left alone")
    {
        registry.get<Rigidbody>(id)->initialized = true;
        REQUIRE(planPhysicsInit(registry, id).isNoop());
    }
}

TEST_CASE("shouldInitCharacterBody needs a Transform", "[world][physics-init]")
{
    ecs::Registry registry;
    const ecs::EntityId id = registry.create();
    registry.add(id, CharacterBody{});
    REQUIRE_FALSE(shouldInitCharacterBody(registry, id));

    registry.add(id, Transform{});
    REQUIRE(shouldInitCharacterBody(registry, id));

    registry.get<CharacterBody>(id)->initialized = true;
    REQUIRE_FALSE(shouldInitCharacterBody(registry, id));
}

TEST_CASE_METHOD(WorldFixture, "Physics init creates one body and one shape whatever the add order",
                 "[world][physics-init]")
{
    const ecs::EntityId id = world.createEntity();

    SECTION("Rigidbody, Collider, Transform")
    {
        world.addComponent(id, Rigidbody{});
        world.addComponent(id, Collider{});
        world.addComponent(id, Transform{});
    }
    SECTION("Transform, Collider, Rigidbody")
    {
        world.addComponent(id, Transform{});
        world.addComponent(id, Collider{});
        world.addComponent(id, Rigidbody{});
    }
    SECTION("Collider, Transform, Rigidbody")
    {
        world.addComponent(id, Collider{});
        world.addComponent(id, Transform{});
        world.addComponent(id, Rigidbody{});
    }

    world.tryInitPhysics(id);
    world.tryInitPhysics(id);

    REQUIRE(mock->createBodyCalls == 1);
    REQUIRE(mock->addShapeCalls == 1);
    REQUIRE(world.getComponent<Collider>(id)->initialized);
}

TEST_CASE_METHOD(WorldFixture, "The builder path initializes exactly once", "[world][physics-init]")
{
    const ecs::EntityId id = world.spawn()
        .with(Transform{math::Vec2{10.0f, 20.0f}})
        .with(Rigidbody{})
        .with(Collider{BoxShape{32.0f, 16.0f}})
        .id();

    world.tryInitPhysics(id);

    REQUIRE(mock->createBodyCalls == 1);
    REQUIRE(mock->addShapeCalls == 1);
    REQUIRE(world.getComponent<Rigidbody>(id)->initialized);
}

TEST_CASE_METHOD(WorldFixture, "A Collider with a Rigidbody never owns a body", "[world][physics-init]")
{
    const ecs::EntityId id = world.spawn()
        .with(Rigidbody{physics::BodyType::Dynamic, 0.5f, true})
        .with(Collider{BoxShape{32.0f, 16.0f}, math::Vec2{4.0f, 6.0f}})
        .with(Transform{math::Vec2{100.0f, 50.0f}})
        .id();

    const auto* rigidbody = world.getComponent<Rigidbody>(id);
    const auto* collider  = world.getComponent<Collider>(id);

    REQUIRE(rigidbody->initialized);
    REQUIRE_FALSE(collider->implicitBody().has_value());
    REQUIRE(std::holds_alternative<OwnedByRigidbody>(collider->owner));
    REQUIRE(attachedBody(collider->owner) == rigidbody->body);

    const auto& body = mock->state(rigidbody->body);
    REQUIRE(body.type == physics::BodyType::Dynamic);
    REQUIRE(body.position == math::Vec2{100.0f, -50.0f});
    REQUIRE(body.gravityScale == 0.5f);
    REQUIRE(body.fixedRotation);

    const auto& shape = mock->shapes.at(collider->shapeHandle.value);
    REQUIRE(shape.body == rigidbody->body);
    REQUIRE(shape.halfWidth == 16.0f);
    REQUIRE(shape.halfHeight == 8.0f);
    REQUIRE(shape.offset == math::Vec2{4.0f, -6.0f});
}

TEST_CASE_METHOD(WorldFixture, "A lone Collider owns an implicit static body", "[world][physics-init]")
{
    Collider collider{CircleShape{12.0f}};
    collider.friction = 0.25f;
    collider.isSensor = true;

    const ecs::EntityId id = world.spawn()
        .with(Transform{math::Vec2{0.0f, 300.0f}})
        .with(collider)
        .id();

    const auto* stored = world.getComponent<Collider>(id);
    REQUIRE(stored->initialized);
    REQUIRE(stored->implicitBody().has_value());

    const physics::BodyHandle body = *stored->implicitBody();
    REQUIRE(mock->state(body).type == physics::BodyType::Static);
    REQUIRE(mock->state(body).position == math::Vec2{0.0f, -300.0f});

    const auto& shape = mock->shapes.at(stored->shapeHandle.value);
    REQUIRE(shape.body == body);
    REQUIRE(shape.circle);
    REQUIRE(shape.radius == 12.0f);
    REQUIRE(shape.material.friction == 0.25f);
    REQUIRE(shape.material.isSensor);
}

TEST_CASE_METHOD(WorldFixture, "Removing components releases backend resources", "[world][physics-init]")
{
    SECTION("Rigidbody removal destroys the body and resets the Collider")
    {
        const ecs::EntityId id = world.spawn().with(Transform{}).with(Rigidbody{}).with(Collider{}).id();
        const physics::BodyHandle body = world.getComponent<Rigidbody>(id)->body;

        REQUIRE(world.removeComponent<Rigidbody>(id));
        REQUIRE(mock->destroyBodyCalls == 1);
        REQUIRE_FALSE(mock->hasBody(body));

        const auto* collider = world.getComponent<Collider>(id);
        REQUIRE_FALSE(collider->initialized);
        REQUIRE(std::holds_alternative<NoBodyOwner>(collider->owner));
        REQUIRE_FALSE(collider->shapeHandle.isValid());

        // The entity no longer resolves a body.
        REQUIRE(world.getVelocity(id) == math::Vec2{0.0f, 0.0f});
    }

    SECTION("Collider removal with a Rigidbody destroys the shape only")
    {
        const ecs::EntityId id = world.spawn().with(Transform{}).with(Rigidbody{}).with(Collider{}).id();
        const physics::BodyHandle body = world.getComponent<Rigidbody>(id)->body;

        REQUIRE(world.removeComponent<Collider>(id));
        REQUIRE(mock->destroyShapeCalls == 1);
        REQUIRE(mock->destroyBodyCalls == 0);
        REQUIRE(mock->hasBody(body));
    }

    SECTION("Collider removal destroys its implicit body")
    {
        const ecs::EntityId id = world.spawn().with(Transform{}).with(Collider{}).id();
        const physics::BodyHandle body = *world.getComponent<Collider>(id)->implicitBody();

        REQUIRE(world.removeComponent<Collider>(id));
        REQUIRE(mock->destroyBodyCalls == 1);
        REQUIRE(mock->destroyedBodies.front() == body);
    }

    SECTION("Destroying the entity destroys its body once")
    {
        const ecs::EntityId id = world.spawn().with(Transform{}).with(Rigidbody{}).with(Collider{}).id();
        REQUIRE(world.destroyEntity(id).has_value());
        REQUIRE(mock->destroyBodyCalls == 1);
        REQUIRE(mock->bodies.empty());
    }

    SECTION("An uninitialized Rigidbody has nothing to release")
    {
        const ecs::EntityId id = world.spawn().with(Rigidbody{}).id();
        REQUIRE(world.removeComponent<Rigidbody>(id));
        REQUIRE(mock->destroyBodyCalls == 0);
    }
}

TEST_CASE_METHOD(WorldFixture, "Replacing a Collider swaps its shape", "[world][physics-init]")
{
    const ecs::EntityId id = world.spawn().with(Transform{}).with(Collider{BoxShape{10.0f, 10.0f}}).id();
    REQUIRE(mock->createBodyCalls == 1);

    world.addComponent(id, Collider{CircleShape{4.0f}});

    REQUIRE(mock->destroyBodyCalls == 1);
    REQUIRE(mock->createBodyCalls == 2);
    REQUIRE(mock->shapes.size() == 1);
    REQUIRE(mock->shapes.begin()->second.circle);
}

TEST_CASE_METHOD(WorldFixture, "CharacterBody builds its capsule once a Transform exists", "[world][physics-init]")
{
    const ecs::EntityId id = world.spawn().with(CharacterBody{20.0f, 60.0f}).id();
    REQUIRE_FALSE(world.getComponent<CharacterBody>(id)->initialized);

    world.addComponent(id, Transform{math::Vec2{5.0f, 5.0f}});

    const auto* character = world.getComponent<CharacterBody>(id);
    REQUIRE(character->initialized);
    REQUIRE(character->capsule.radius == 10.0f);
    REQUIRE_THAT(character->capsule.center2.y - character->capsule.center1.y, WithinAbs(40.0, 1e-5));
    REQUIRE(mock->createBodyCalls == 0);
}

TEST_CASE_METHOD(WorldFixture, "World shutdown releases bodies before the backend", "[world][physics-init]")
{
    world.spawn().with(Transform{}).with(Collider{});
    world.spawn().with(Transform{}).with(Rigidbody{}).with(Collider{});
    REQUIRE(mock->bodies.size() == 2);

    world.shutdown();
    REQUIRE(mock->bodies.empty());
    REQUIRE(mock->shutdownCalls == 1);

    world.shutdown();
    REQUIRE(mock->shutdownCalls == 1);
}

} // namespace ember::world
