/**
 * @file World.hpp
 * @brief ECS store + physics backend, glued by the auto physics init.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef EMBER_WORLD_WORLD_HPP
    #define EMBER_WORLD_WORLD_HPP

#include "ember/world/Components.hpp"
#include "ember/ecs/Registry.hpp"
#include "ember/physics/IPhysicsBackend.hpp"
#include "ember/core/Expected.hpp"
#include "ember/core/NonCopyable.hpp"
#include "ember/core/Types.hpp"
#include "ember/math/Vec2.hpp"

#include <memory>
#include <optional>
#include <unordered_map>

namespace ember::core { class Logger; }

namespace ember::world {

class World;

/**
 * @brief Raycast result in screen space.  @c entity is null when the hit
 *        body belongs to no entity (e.g. created directly on the backend).
 */
struct WorldRaycastHit
{
    math::Vec2    point{0.0f, 0.0f};
    math::Vec2    normal{0.0f, 0.0f};
    core::f32     fraction{0.0f};
    ecs::EntityId entity{};
};

/**
 * @class EntityBuilder
 * @brief Fluent helper returned by World::spawn().
 *
 * @code
 *   auto player = world.spawn()
 *       .with(Transform{{100.0f, 50.0f}})
 *       .with(Rigidbody{})
 *       .with(Collider{BoxShape{32.0f, 32.0f}})
 *       .id();
 * @endcode
 */
class EntityBuilder
{
public:
    EntityBuilder(World& world, ecs::EntityId id) noexcept : _world{world}, _id{id} {}

    template <typename T>
    EntityBuilder& with(T value);

    [[nodiscard]] ecs::EntityId id() const noexcept { return _id; }

private:
    World&        _world;
    ecs::EntityId _id;
};

/**
 * @class World
 * @brief Owns one Registry and one physics backend.
 *
 * Component adds go through addComponent(), which runs the post-add hook:
 * tryInitPhysics() and tryInitCharacterBody().  Both are idempotent and do
 * nothing until their preconditions hold for the first time, so components
 * may be added in any order.
 *
 * Removal hooks installed on the registry release backend resources when a
 * Rigidbody or a Collider goes away, including on entity destruction.
 *
 * The public API speaks screen space (Y-down); conversion to the backend's
 * Y-up space happens inside the World only.
 */
class World final : public core::NonCopyable<World>
{
public:
    World(std::unique_ptr<physics::IPhysicsBackend> backend, core::Logger& logger);
    ~World();

    /**
     * @brief Initializes the backend.
     * @param gravity             Screen-space gravity (pixels / s^2, Y-down).
     * @param lengthUnitsPerMeter Pixels per meter.
     */
    [[nodiscard]] core::Expected<void> init(math::Vec2 gravity, core::f32 lengthUnitsPerMeter);

    /** @brief Destroys every entity, then shuts the backend down.  Idempotent. */
    void shutdown();

    // --------------------------------------------------------------------- //
    //  Entities & components                                                 //
    // --------------------------------------------------------------------- //

    [[nodiscard]] ecs::EntityId createEntity() { return _registry.create(); }
    [[nodiscard]] core::Expected<void> destroyEntity(ecs::EntityId id) { return _registry.destroy(id); }
    [[nodiscard]] bool isAlive(ecs::EntityId id) const noexcept { return _registry.isAlive(id); }

    [[nodiscard]] EntityBuilder spawn() { return EntityBuilder{*this, _registry.create()}; }

    /** @brief Adds (or replaces) a component, then runs the post-add hook. */
    template <typename T>
    T* addComponent(ecs::EntityId id, T value);

    template <typename T>
    [[nodiscard]] T* getComponent(ecs::EntityId id) { return _registry.get<T>(id); }

    template <typename T>
    [[nodiscard]] const T* getComponent(ecs::EntityId id) const { return _registry.get<T>(id); }

    template <typename T>
    [[nodiscard]] bool hasComponent(ecs::EntityId id) const { return _registry.has<T>(id); }

    template <typename T>
    bool removeComponent(ecs::EntityId id) { return _registry.remove<T>(id); }

    // --------------------------------------------------------------------- //
    //  Auto physics init                                                     //
    // --------------------------------------------------------------------- //

    /** @brief Creates the body and attaches the Collider shape once both are possible. */
    void tryInitPhysics(ecs::EntityId id);

    /** @brief Builds the capsule of a CharacterBody once a Transform exists. */
    void tryInitCharacterBody(ecs::EntityId id);

    // --------------------------------------------------------------------- //
    //  Entity-level physics (silent no-op without a body)                    //
    // --------------------------------------------------------------------- //

    void setVelocity(ecs::EntityId id, math::Vec2 velocity);
    [[nodiscard]] math::Vec2 getVelocity(ecs::EntityId id) const;
    void applyForce(ecs::EntityId id, math::Vec2 force);
    void applyImpulse(ecs::EntityId id, math::Vec2 impulse);

    /** @brief Teleports the body; the Transform follows. */
    void setPosition(ecs::EntityId id, math::Vec2 position);
    [[nodiscard]] math::Vec2 getPosition(ecs::EntityId id) const;

    [[nodiscard]] std::optional<WorldRaycastHit> raycast(math::Vec2 origin, math::Vec2 translation) const;

    // --------------------------------------------------------------------- //
    //  Per-tick work (driven by the built-in systems)                        //
    // --------------------------------------------------------------------- //

    [[nodiscard]] core::Expected<void> stepPhysics(core::f32 dt, core::u32 substeps);

    /** @brief Copies every initialized Rigidbody's body pose into its Transform. */
    void syncTransforms();

    /** @brief Runs the capsule slide loop of every CharacterBody. */
    void moveCharacters(core::f32 dt);

    // --------------------------------------------------------------------- //
    //  Accessors                                                             //
    // --------------------------------------------------------------------- //

    void setGravity(math::Vec2 gravity);
    [[nodiscard]] math::Vec2 gravity() const noexcept { return _gravity; }

    [[nodiscard]] ecs::Registry& registry() noexcept { return _registry; }
    [[nodiscard]] const ecs::Registry& registry() const noexcept { return _registry; }

    [[nodiscard]] physics::IPhysicsBackend& physics() noexcept { return *_physics; }
    [[nodiscard]] const physics::IPhysicsBackend& physics() const noexcept { return *_physics; }

    [[nodiscard]] core::Logger& logger() noexcept { return _logger; }

private:
    void installRemovalHooks();
    void onRigidbodyRemoved(ecs::EntityId id, Rigidbody& rigidbody);
    void onColliderRemoved(ecs::EntityId id, Collider& collider);

    [[nodiscard]] physics::BodyHandle createBodyFor(const Rigidbody& rigidbody, const Transform& transform);
    [[nodiscard]] physics::ShapeHandle attachShape(physics::BodyHandle body, const Collider& collider);
    [[nodiscard]] std::optional<physics::BodyHandle> resolveBody(ecs::EntityId id) const;

    core::Logger&                             _logger;
    std::unique_ptr<physics::IPhysicsBackend> _physics;
    ecs::Registry                             _registry;
    std::unordered_map<core::u32, ecs::EntityId> _bodyEntities;
    math::Vec2                                _gravity{0.0f, 0.0f};
    bool                                      _initialized{false};
};

} // namespace ember::world

#include "World.inl"

#endif // EMBER_WORLD_WORLD_HPP
