/**
 * @file Registry.hpp
 * @brief Central entity registry: creates, destroys and stores components.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_ECS_REGISTRY_HPP
    #define EMBER_ECS_REGISTRY_HPP

#include "ember/ecs/Archetype.hpp"
#include "ember/ecs/ComponentPool.hpp"
#include "ember/ecs/Entity.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/NonCopyable.hpp"
#include "ember/core/Types.hpp"

#include <functional>
#include <memory>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace ember::ecs {

/**
 * @class Registry
 * @brief Owns the entity free-list, the generation table and one
 *        ComponentPool per component type.
 *
 * Entities are created with a unique slot + generation.  On destruction
 * every component is removed (firing removal callbacks), the slot is
 * recycled and the generation is bumped, invalidating stale EntityIds.
 *
 * Component types are keyed by std::type_index rather than a per-binary
 * counter so that code living in a hot-reloaded game module resolves the
 * same pools as the host.
 *
 * Not thread-safe; the engine runs every system on one thread.
 */
class Registry final : public core::NonCopyable<Registry>
{
public:
    Registry();
    ~Registry();

    // --------------------------------------------------------------------- //
    //  Entity lifecycle                                                      //
    // --------------------------------------------------------------------- //

    /** @brief Creates an empty entity. */
    [[nodiscard]] EntityId create();

    /**
     * @brief Removes every component of @p id, then recycles its slot.
     * @return OK on success, or error if the entity is already dead.
     */
    [[nodiscard]] core::Expected<void> destroy(EntityId id);

    /** @brief Tests whether an entity is alive (generation matches). */
    [[nodiscard]] bool isAlive(EntityId id) const noexcept;

    /** @brief Returns the total number of live entities. */
    [[nodiscard]] core::u32 liveCount() const noexcept { return _liveCount; }

    /** @brief Snapshot of every live entity, in slot order. */
    [[nodiscard]] std::vector<EntityId> entities() const;

    /** @brief Destroys every live entity. */
    void clear();

    // --------------------------------------------------------------------- //
    //  Components                                                            //
    // --------------------------------------------------------------------- //

    /**
     * @brief Attaches @p value to @p id, replacing (and firing the removal
     *        callbacks of) any component of the same type.
     * @return The stored component, or nullptr if the entity is dead.
     */
    template <typename T>
    T* add(EntityId id, T value);

    template <typename T>
    [[nodiscard]] T* get(EntityId id);

    template <typename T>
    [[nodiscard]] const T* get(EntityId id) const;

    template <typename T>
    [[nodiscard]] bool has(EntityId id) const;

    /**
     * @brief Detaches the @p T component of @p id.
     * @return False if the entity is dead or has no such component.
     */
    template <typename T>
    bool remove(EntityId id);

    /**
     * @brief Registers a callback invoked before a @p T component is erased,
     *        whether through remove(), replacement by add(), or destroy().
     *
     * The callback may read and write other components of the entity but
     * must not add or remove components of type @p T.
     */
    template <typename T>
    void onRemove(std::function<void(EntityId, T&)> callback);

    /**
     * @brief Calls @p fn(EntityId, Ts&...) for every live entity holding all
     *        of @p Ts.
     *
     * Iterates over a snapshot of the first type's pool; entities destroyed
     * or stripped by @p fn during the walk are skipped.
     */
    template <typename... Ts, typename Fn>
    void each(Fn&& fn);

    /** @brief Number of entities holding a @p T component. */
    template <typename T>
    [[nodiscard]] core::u32 count() const;

    /** @brief Component composition of @p id (empty for dead entities). */
    [[nodiscard]] Archetype archetype(EntityId id) const noexcept;

private:
    struct SlotInfo
    {
        core::u32 generation{0};
        Archetype archetype{};
        bool      alive{false};
    };

    static constexpr core::u32 kNoPool = ~core::u32{0};

    [[nodiscard]] core::u32 findPoolIndex(std::type_index type) const noexcept;
    [[nodiscard]] core::u32 registerPool(std::type_index type, std::unique_ptr<IComponentPool> pool);

    template <typename T>
    [[nodiscard]] ComponentPool<T>* findPool() const noexcept;

    template <typename T>
    [[nodiscard]] core::u32 assurePool();

    std::vector<SlotInfo>                        _slots;
    std::vector<core::u32>                       _freeSlots;
    core::u32                                    _liveCount{0};
    std::vector<std::unique_ptr<IComponentPool>> _pools;
    std::unordered_map<std::type_index, core::u32> _poolIndices;
};

} // namespace ember::ecs

#include "Registry.inl"

#endif // EMBER_ECS_REGISTRY_HPP
