/**
 * @file World.inl
 * @brief Template members of World and EntityBuilder.
 * @see   World.hpp
 */

#ifndef EMBER_WORLD_WORLD_INL
    #define EMBER_WORLD_WORLD_INL

#include <type_traits>
#include <utility>

namespace ember::world {

template <typename T>
T* World::addComponent(ecs::EntityId id, T value)
{
    T* stored = _registry.add<T>(id, std::move(value));
    if (!stored)
        return nullptr;

    // Post-add hook: only the physics-relevant components can complete a
    // precondition.
    if constexpr (std::is_same_v<T, Transform> || std::is_same_v<T, Rigidbody> ||
                  std::is_same_v<T, Collider>)
    {
        tryInitPhysics(id);
    }
    if constexpr (std::is_same_v<T, Transform> || std::is_same_v<T, CharacterBody>)
    {
        tryInitCharacterBody(id);
    }
    return _registry.get<T>(id);
}

template <typename T>
EntityBuilder& EntityBuilder::with(T value)
{
    _world.addComponent<T>(_id, std::move(value));
    return *this;
}

} // namespace ember::world

#endif // EMBER_WORLD_WORLD_INL
