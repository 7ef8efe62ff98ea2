/**
 * @file Registry.inl
 * @brief Template members of Registry.
 * @see   Registry.hpp
 */

#ifndef EMBER_ECS_REGISTRY_INL
    #define EMBER_ECS_REGISTRY_INL

#include <tuple>
#include <utility>

namespace ember::ecs {

template <typename T>
ComponentPool<T>* Registry::findPool() const noexcept
{
    const core::u32 index = findPoolIndex(std::type_index(typeid(T)));
    if (index == kNoPool)
        return nullptr;
    return static_cast<ComponentPool<T>*>(_pools[index].get());
}

template <typename T>
core::u32 Registry::assurePool()
{
    const std::type_index type{typeid(T)};
    const core::u32 index = findPoolIndex(type);
    if (index != kNoPool)
        return index;
    return registerPool(type, std::make_unique<ComponentPool<T>>());
}

template <typename T>
T* Registry::add(EntityId id, T value)
{
    if (!isAlive(id))
        return nullptr;

    const core::u32 index = assurePool<T>();
    if (index == kNoPool)
        return nullptr;

    auto* pool = static_cast<ComponentPool<T>*>(_pools[index].get());
    if (pool->contains(id.slot()))
        pool->remove(id);

    T* stored = pool->insert(id, std::move(value));
    if (stored)
        _slots[id.slot()].archetype.add(index);
    return stored;
}

template <typename T>
T* Registry::get(EntityId id)
{
    if (!isAlive(id))
        return nullptr;
    auto* pool = findPool<T>();
    return pool ? pool->find(id.slot()) : nullptr;
}

template <typename T>
const T* Registry::get(EntityId id) const
{
    if (!isAlive(id))
        return nullptr;
    const auto* pool = findPool<T>();
    return pool ? pool->find(id.slot()) : nullptr;
}

template <typename T>
bool Registry::has(EntityId id) const
{
    return get<T>(id) != nullptr;
}

template <typename T>
bool Registry::remove(EntityId id)
{
    if (!isAlive(id))
        return false;

    const core::u32 index = findPoolIndex(std::type_index(typeid(T)));
    if (index == kNoPool)
        return false;

    if (!_pools[index]->remove(id))
        return false;
    _slots[id.slot()].archetype.remove(index);
    return true;
}

template <typename T>
void Registry::onRemove(std::function<void(EntityId, T&)> callback)
{
    const core::u32 index = assurePool<T>();
    if (index == kNoPool)
        return;
    static_cast<ComponentPool<T>*>(_pools[index].get())->addRemoveCallback(std::move(callback));
}

template <typename... Ts, typename Fn>
void Registry::each(Fn&& fn)
{
    static_assert(sizeof...(Ts) > 0, "each<> needs at least one component type");

    using First = std::tuple_element_t<0, std::tuple<Ts...>>;
    const auto* driver = findPool<First>();
    if (!driver)
        return;

    const std::vector<core::u32> slots(driver->slots().begin(), driver->slots().end());
    for (const core::u32 slot : slots)
    {
        const SlotInfo& info = _slots[slot];
        if (!info.alive)
            continue;

        const EntityId id{info.generation, slot};
        if ((has<Ts>(id) && ...))
            fn(id, *get<Ts>(id)...);
    }
}

template <typename T>
core::u32 Registry::count() const
{
    const auto* pool = findPool<T>();
    return pool ? pool->size() : 0;
}

} // namespace ember::ecs

#endif // EMBER_ECS_REGISTRY_INL
