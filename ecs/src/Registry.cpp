/**
 * @file Registry.cpp
 * @brief Entity registry: slot free-list, generations and pool table.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/ecs/Registry.hpp"
#include "ember/core/Assert.hpp"

namespace ember::ecs {

Registry::Registry() = default;

Registry::~Registry()
{
    clear();
}

EntityId Registry::create()
{
    core::u32 slot = 0;
    if (!_freeSlots.empty())
    {
        slot = _freeSlots.back();
        _freeSlots.pop_back();
    }
    else
    {
        slot = static_cast<core::u32>(_slots.size());
        EMBER_ASSERT(slot < EntityId::kMaxSlots);
        _slots.emplace_back();
    }

    auto& info = _slots[slot];
    info.alive = true;
    info.archetype.clear();
    ++_liveCount;

    return EntityId{info.generation, slot};
}

core::Expected<void> Registry::destroy(EntityId id)
{
    if (!isAlive(id))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "Entity is not alive");
    }

    // Strip components first so removal callbacks see a live entity.
    for (core::u32 index = 0; index < static_cast<core::u32>(_pools.size()); ++index)
    {
        if (_slots[id.slot()].archetype.has(index))
        {
            _pools[index]->remove(id);
            _slots[id.slot()].archetype.remove(index);
        }
    }

    auto& info = _slots[id.slot()];
    info.alive = false;
    info.archetype.clear();
    // Bump generation (prevents stale EntityId from matching after recycle)
    info.generation = (info.generation + 1) & EntityId::kGenerationMask;
    _freeSlots.push_back(id.slot());
    --_liveCount;

    return {};
}

bool Registry::isAlive(EntityId id) const noexcept
{
    if (!id.isValid() || id.slot() >= _slots.size())
    {
        return false;
    }
    const auto& info = _slots[id.slot()];
    return info.alive && info.generation == id.generation();
}

std::vector<EntityId> Registry::entities() const
{
    std::vector<EntityId> result;
    result.reserve(_liveCount);
    for (core::u32 slot = 0; slot < static_cast<core::u32>(_slots.size()); ++slot)
    {
        if (_slots[slot].alive)
        {
            result.emplace_back(_slots[slot].generation, slot);
        }
    }
    return result;
}

void Registry::clear()
{
    for (const EntityId id : entities())
    {
        // Every id comes from the live snapshot; a callback may already have
        // destroyed it, which is the only way this can fail.
        if (isAlive(id))
        {
            [[maybe_unused]] const auto result = destroy(id);
        }
    }
}

Archetype Registry::archetype(EntityId id) const noexcept
{
    if (!isAlive(id))
    {
        return {};
    }
    return _slots[id.slot()].archetype;
}

core::u32 Registry::findPoolIndex(std::type_index type) const noexcept
{
    const auto it = _poolIndices.find(type);
    return it == _poolIndices.end() ? kNoPool : it->second;
}

core::u32 Registry::registerPool(std::type_index type, std::unique_ptr<IComponentPool> pool)
{
    if (_pools.size() >= Archetype::kMaxComponents)
    {
        return kNoPool;
    }
    const auto index = static_cast<core::u32>(_pools.size());
    _pools.push_back(std::move(pool));
    _poolIndices.emplace(type, index);
    return index;
}

} // namespace ember::ecs
