/**
 * @file TestRegistry.cpp
 * @brief Unit tests for ecs::Registry entity and component storage.
 */

#include <catch2/catch_test_macros.hpp>

#include "ember/ecs/Registry.hpp"

#include <string>
#include <vector>

namespace ember::ecs {

namespace {

struct Position
{
    float x{0.0f};
    float y{0.0f};
};

struct Health
{
    int value{100};
};

struct Tag
{
    std::string label;
};

} // namespace

TEST_CASE("Registry creates distinct live entities", "[ecs][registry]")
{
    Registry registry;
    const EntityId a = registry.create();
    const EntityId b = registry.create();

    REQUIRE(a != b);
    REQUIRE(registry.isAlive(a));
    REQUIRE(registry.isAlive(b));
    REQUIRE(registry.liveCount() == 2);
    REQUIRE_FALSE(registry.isAlive(kNullEntity));
}

TEST_CASE("Registry invalidates ids when a slot is recycled", "[ecs][registry]")
{
    Registry registry;
    const EntityId first = registry.create();
    REQUIRE(registry.destroy(first).has_value());
    REQUIRE_FALSE(registry.isAlive(first));

    const EntityId second = registry.create();
    REQUIRE(second.slot() == first.slot());
    REQUIRE(second.generation() != first.generation());
    REQUIRE(registry.isAlive(second));
    REQUIRE_FALSE(registry.isAlive(first));
}

TEST_CASE("Registry refuses to destroy a dead entity", "[ecs][registry]")
{
    Registry registry;
    const EntityId id = registry.create();
    REQUIRE(registry.destroy(id).has_value());

    const auto again = registry.destroy(id);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Registry stores, replaces and removes components", "[ecs][registry]")
{
    Registry registry;
    const EntityId id = registry.create();

    REQUIRE(registry.add(id, Position{1.0f, 2.0f}) != nullptr);
    REQUIRE(registry.has<Position>(id));
    REQUIRE_FALSE(registry.has<Health>(id));
    REQUIRE(registry.get<Position>(id)->y == 2.0f);

    registry.add(id, Position{5.0f, 6.0f});
    REQUIRE(registry.count<Position>() == 1);
    REQUIRE(registry.get<Position>(id)->x == 5.0f);

    REQUIRE(registry.remove<Position>(id));
    REQUIRE_FALSE(registry.has<Position>(id));
    REQUIRE_FALSE(registry.remove<Position>(id));
}

TEST_CASE("Registry ignores component access on dead entities", "[ecs][registry]")
{
    Registry registry;
    const EntityId id = registry.create();
    registry.add(id, Health{});
    REQUIRE(registry.destroy(id).has_value());

    REQUIRE(registry.get<Health>(id) == nullptr);
    REQUIRE(registry.add(id, Health{5}) == nullptr);
    REQUIRE_FALSE(registry.remove<Health>(id));
    REQUIRE(registry.count<Health>() == 0);
}

TEST_CASE("Registry tracks the archetype of an entity", "[ecs][registry]")
{
    Registry registry;
    const EntityId id = registry.create();
    REQUIRE(registry.archetype(id).empty());

    registry.add(id, Position{});
    registry.add(id, Health{});
    REQUIRE(registry.archetype(id).count() == 2);

    registry.remove<Position>(id);
    REQUIRE(registry.archetype(id).count() == 1);
}

TEST_CASE("Registry fires removal callbacks on remove, replace and destroy", "[ecs][registry]")
{
    Registry registry;
    std::vector<std::string> removed;
    registry.onRemove<Tag>([&](EntityId, Tag& tag) { removed.push_back(tag.label); });

    const EntityId id = registry.create();
    registry.add(id, Tag{"a"});
    registry.add(id, Tag{"b"});
    REQUIRE(removed == std::vector<std::string>{"a"});

    registry.remove<Tag>(id);
    REQUIRE(removed == std::vector<std::string>{"a", "b"});

    registry.add(id, Tag{"c"});
    REQUIRE(registry.destroy(id).has_value());
    REQUIRE(removed == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("Removal callbacks may touch sibling components", "[ecs][registry]")
{
    Registry registry;
    registry.onRemove<Tag>([&](EntityId owner, Tag&) {
        if (auto* health = registry.get<Health>(owner))
            health->value = 0;
    });

    const EntityId id = registry.create();
    registry.add(id, Tag{"x"});
    registry.add(id, Health{50});

    registry.remove<Tag>(id);
    REQUIRE(registry.get<Health>(id)->value == 0);
}

TEST_CASE("Registry each visits only entities holding every type", "[ecs][registry]")
{
    Registry registry;
    const EntityId both  = registry.create();
    const EntityId onlyP = registry.create();
    registry.add(both, Position{1.0f, 0.0f});
    registry.add(both, Health{10});
    registry.add(onlyP, Position{2.0f, 0.0f});

    int visits = 0;
    registry.each<Position, Health>([&](EntityId id, Position& p, Health& h) {
        REQUIRE(id == both);
        p.x += static_cast<float>(h.value);
        ++visits;
    });

    REQUIRE(visits == 1);
    REQUIRE(registry.get<Position>(both)->x == 11.0f);
}

TEST_CASE("Registry each tolerates destruction during the walk", "[ecs][registry]")
{
    Registry registry;
    std::vector<EntityId> ids;
    for (int i = 0; i < 4; ++i)
    {
        ids.push_back(registry.create());
        registry.add(ids.back(), Health{i});
    }

    int visits = 0;
    registry.each<Health>([&](EntityId id, Health&) {
        ++visits;
        for (const EntityId other : ids)
        {
            if (other != id && registry.isAlive(other))
            {
                REQUIRE(registry.destroy(other).has_value());
            }
        }
    });

    REQUIRE(visits == 1);
    REQUIRE(registry.liveCount() == 1);
}

TEST_CASE("Registry clear destroys everything", "[ecs][registry]")
{
    Registry registry;
    int removals = 0;
    registry.onRemove<Health>([&](EntityId, Health&) { ++removals; });

    for (int i = 0; i < 3; ++i)
    {
        const EntityId id = registry.create();
        registry.add(id, Health{});
    }

    registry.clear();
    REQUIRE(registry.liveCount() == 0);
    REQUIRE(registry.entities().empty());
    REQUIRE(removals == 3);
}

} // namespace ember::ecs
