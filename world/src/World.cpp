/**
 * @file World.cpp
 * @brief World: auto physics init, removal cleanup, entity physics wrappers.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/world/World.hpp"
#include "ember/world/CharacterMover.hpp"
#include "ember/world/PhysicsInit.hpp"
#include "ember/physics/Coordinates.hpp"
#include "ember/core/Log.hpp"

#include <utility>
#include <variant>

namespace ember::world {

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

World::World(std::unique_ptr<physics::IPhysicsBackend> backend, core::Logger& logger)
    : _logger{logger}
    , _physics{std::move(backend)}
{
    installRemovalHooks();
}

World::~World()
{
    shutdown();
}

core::Expected<void> World::init(math::Vec2 gravity, core::f32 lengthUnitsPerMeter)
{
    if (!_physics)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "World has no physics backend");
    }

    physics::PhysicsSettings settings;
    settings.gravity             = physics::screenToPhysics(gravity);
    settings.lengthUnitsPerMeter = lengthUnitsPerMeter;

    if (auto result = _physics->init(settings); !result)
    {
        _logger.error("World", "physics backend '{}' failed to init: {}", _physics->name(), result.error().message());
        return core::makeError(core::ErrorCode::kBackendInitFailed, result.error().message());
    }

    _gravity     = gravity;
    _initialized = true;
    _logger.info("World", "physics backend '{}' ready", _physics->name());
    return {};
}

void World::shutdown()
{
    // Bodies die with their components, before the backend goes away.
    _registry.clear();
    _bodyEntities.clear();

    if (_initialized)
    {
        _physics->shutdown();
        _initialized = false;
    }
}

void World::installRemovalHooks()
{
    _registry.onRemove<Rigidbody>([this](ecs::EntityId id, Rigidbody& rb) { onRigidbodyRemoved(id, rb); });
    _registry.onRemove<Collider>([this](ecs::EntityId id, Collider& c) { onColliderRemoved(id, c); });
}

// ========================================================================== //
//  Auto physics init                                                         //
// ========================================================================== //

physics::BodyHandle World::createBodyFor(const Rigidbody& rigidbody, const Transform& transform)
{
    const math::Vec2 position = physics::screenToPhysics(transform.position);

    physics::BodyHandle body{};
    switch (rigidbody.type)
    {
        case physics::BodyType::Dynamic:
            body = _physics->createDynamicBody(position, rigidbody.gravityScale);
            break;
        case physics::BodyType::Kinematic:
            body = _physics->createKinematicBody(position);
            break;
        case physics::BodyType::Static:
            body = _physics->createStaticBody(position);
            break;
    }

    if (body.isValid())
    {
        if (transform.rotation != 0.0f)
            _physics->setTransform(body, position, transform.rotation);
        if (rigidbody.fixedRotation)
            _physics->setFixedRotation(body, true);
    }
    return body;
}

physics::ShapeHandle World::attachShape(physics::BodyHandle body, const Collider& collider)
{
    const math::Vec2 offset = physics::screenToPhysics(collider.offset);
    const physics::ShapeMaterial material = collider.material();

    if (const auto* box = std::get_if<BoxShape>(&collider.shape))
    {
        return _physics->addBoxShape(body, box->width * 0.5f, box->height * 0.5f, offset, material);
    }
    const auto& circle = std::get<CircleShape>(collider.shape);
    return _physics->addCircleShape(body, circle.radius, offset, material);
}

void World::tryInitPhysics(ecs::EntityId id)
{
    const PhysicsInitPlan plan = planPhysicsInit(_registry, id);
    if (plan.isNoop())
        return;

    auto* collider  = _registry.get<Collider>(id);
    auto* transform = _registry.get<Transform>(id);

    physics::BodyHandle body{};
    BodyOwner owner{};

    if (plan.creation == BodyCreation::FromRigidbody)
    {
        auto* rigidbody = _registry.get<Rigidbody>(id);
        body = createBodyFor(*rigidbody, *transform);
        if (!body.isValid())
        {
            _logger.error("World", "backend refused to create a body for entity {}", id.raw());
            return;
        }
        rigidbody->body        = body;
        rigidbody->initialized = true;
        owner = OwnedByRigidbody{body};
    }
    else
    {
        body = _physics->createStaticBody(physics::screenToPhysics(transform->position));
        if (!body.isValid())
        {
            _logger.error("World", "backend refused to create an implicit body for entity {}", id.raw());
            return;
        }
        owner = OwnedByCollider{body};
    }

    _bodyEntities[body.value] = id;

    collider->shapeHandle = attachShape(body, *collider);
    collider->owner       = owner;
    collider->initialized = true;

    _logger.debug("World", "entity {} physics ready (body {}, {})", id.raw(), body.value,
                  plan.creation == BodyCreation::FromRigidbody ? "rigidbody" : "implicit static");
}

void World::tryInitCharacterBody(ecs::EntityId id)
{
    if (!shouldInitCharacterBody(_registry, id))
        return;

    auto* character = _registry.get<CharacterBody>(id);
    character->capsule     = buildCapsule(character->width, character->height);
    character->builtWidth  = character->width;
    character->builtHeight = character->height;
    character->initialized = true;
}

// ========================================================================== //
//  Removal cleanup                                                           //
// ========================================================================== //

void World::onRigidbodyRemoved(ecs::EntityId id, Rigidbody& rigidbody)
{
    if (!rigidbody.initialized)
        return;

    // The body takes the Collider's shape with it.
    if (auto* collider = _registry.get<Collider>(id))
    {
        if (std::holds_alternative<OwnedByRigidbody>(collider->owner))
        {
            collider->shapeHandle = physics::ShapeHandle{};
            collider->owner       = NoBodyOwner{};
            collider->initialized = false;
        }
    }

    _bodyEntities.erase(rigidbody.body.value);
    _physics->destroyBody(rigidbody.body);
    rigidbody.body        = physics::BodyHandle{};
    rigidbody.initialized = false;
}

void World::onColliderRemoved(ecs::EntityId, Collider& collider)
{
    if (!collider.initialized)
        return;

    if (const auto body = collider.implicitBody())
    {
        _bodyEntities.erase(body->value);
        _physics->destroyBody(*body);
    }
    else
    {
        _physics->destroyShape(collider.shapeHandle);
    }

    collider.shapeHandle = physics::ShapeHandle{};
    collider.owner       = NoBodyOwner{};
    collider.initialized = false;
}

// ========================================================================== //
//  Entity-level physics                                                      //
// ========================================================================== //

std::optional<physics::BodyHandle> World::resolveBody(ecs::EntityId id) const
{
    if (const auto* rigidbody = _registry.get<Rigidbody>(id); rigidbody && rigidbody->initialized)
        return rigidbody->body;
    if (const auto* collider = _registry.get<Collider>(id); collider && collider->initialized)
        return collider->implicitBody();
    return std::nullopt;
}

void World::setVelocity(ecs::EntityId id, math::Vec2 velocity)
{
    if (const auto body = resolveBody(id))
        _physics->setLinearVelocity(*body, physics::screenToPhysics(velocity));
}

math::Vec2 World::getVelocity(ecs::EntityId id) const
{
    if (const auto body = resolveBody(id))
        return physics::physicsToScreen(_physics->linearVelocity(*body));
    return math::Vec2{0.0f, 0.0f};
}

void World::applyForce(ecs::EntityId id, math::Vec2 force)
{
    if (const auto body = resolveBody(id))
        _physics->applyForce(*body, physics::screenToPhysics(force));
}

void World::applyImpulse(ecs::EntityId id, math::Vec2 impulse)
{
    if (const auto body = resolveBody(id))
        _physics->applyImpulse(*body, physics::screenToPhysics(impulse));
}

void World::setPosition(ecs::EntityId id, math::Vec2 position)
{
    const auto body = resolveBody(id);
    if (!body)
        return;

    _physics->setPosition(*body, physics::screenToPhysics(position));
    if (auto* transform = _registry.get<Transform>(id))
        transform->position = position;
}

math::Vec2 World::getPosition(ecs::EntityId id) const
{
    if (const auto body = resolveBody(id))
        return physics::physicsToScreen(_physics->position(*body));
    return math::Vec2{0.0f, 0.0f};
}

std::optional<WorldRaycastHit> World::raycast(math::Vec2 origin, math::Vec2 translation) const
{
    const auto hit = _physics->raycast(physics::screenToPhysics(origin), physics::screenToPhysics(translation));
    if (!hit)
        return std::nullopt;

    WorldRaycastHit result;
    result.point    = physics::physicsToScreen(hit->point);
    result.normal   = physics::physicsToScreen(hit->normal);
    result.fraction = hit->fraction;
    if (const auto it = _bodyEntities.find(hit->body.value); it != _bodyEntities.end())
        result.entity = it->second;
    return result;
}

// ========================================================================== //
//  Per-tick work                                                             //
// ========================================================================== //

core::Expected<void> World::stepPhysics(core::f32 dt, core::u32 substeps)
{
    return _physics->step(dt, substeps);
}

void World::syncTransforms()
{
    _registry.each<Rigidbody, Transform>([this](ecs::EntityId, Rigidbody& rigidbody, Transform& transform) {
        if (!rigidbody.initialized || rigidbody.type == physics::BodyType::Static)
            return;
        transform.position = physics::physicsToScreen(_physics->position(rigidbody.body));
        transform.rotation = _physics->rotation(rigidbody.body);
    });
}

void World::moveCharacters(core::f32 dt)
{
    _registry.each<CharacterBody, Transform>([this, dt](ecs::EntityId, CharacterBody& character, Transform& transform) {
        if (!character.initialized)
            return;
        moveCharacter(*_physics, character, transform, _gravity, dt);
    });
}

void World::setGravity(math::Vec2 gravity)
{
    _gravity = gravity;
    _physics->setGravity(physics::screenToPhysics(gravity));
}

} // namespace ember::world
