/**
 * @file ComponentPool.hpp
 * @brief Typed component storage with removal callbacks.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_COMPONENTPOOL_HPP
    #define EMBER_ECS_COMPONENTPOOL_HPP

#include "ember/ecs/Entity.hpp"
#include "ember/container/SparseSet.hpp"
#include "ember/core/Types.hpp"

#include <functional>
#include <utility>
#include <vector>

namespace ember::ecs {

/**
 * @class IComponentPool
 * @brief Type-erased view of a pool, used by the Registry to strip every
 *        component of an entity on destruction.
 */
class IComponentPool
{
public:
    virtual ~IComponentPool() = default;

    /** @brief Fires removal callbacks then erases the component of @p id. */
    virtual bool remove(EntityId id) = 0;

    [[nodiscard]] virtual bool contains(core::u32 slot) const noexcept = 0;
    [[nodiscard]] virtual core::u32 size() const noexcept = 0;
};

template <typename T>
class ComponentPool final : public IComponentPool
{
public:
    using RemoveCallback = std::function<void(EntityId, T&)>;

    T* insert(EntityId id, T value)
    {
        return _storage.insert(id.slot(), std::move(value));
    }

    bool remove(EntityId id) override
    {
        T* component = _storage.find(id.slot());
        if (!component)
            return false;

        for (const auto& callback : _removeCallbacks)
        {
            callback(id, *component);
            // A callback may have touched this pool; look the slot up again.
            component = _storage.find(id.slot());
            if (!component)
                return true;
        }
        return _storage.remove(id.slot());
    }

    [[nodiscard]] T*       find(core::u32 slot)       { return _storage.find(slot); }
    [[nodiscard]] const T* find(core::u32 slot) const { return _storage.find(slot); }

    [[nodiscard]] bool contains(core::u32 slot) const noexcept override { return _storage.contains(slot); }
    [[nodiscard]] core::u32 size() const noexcept override { return _storage.size(); }

    [[nodiscard]] std::span<const core::u32> slots() const noexcept { return _storage.slots(); }

    void addRemoveCallback(RemoveCallback callback)
    {
        _removeCallbacks.push_back(std::move(callback));
    }

private:
    container::SparseSet<T>     _storage;
    std::vector<RemoveCallback> _removeCallbacks;
};

} // namespace ember::ecs

#endif // EMBER_ECS_COMPONENTPOOL_HPP
