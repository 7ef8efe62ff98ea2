/**
 * @file CpuPhysicsBackend.cpp
 * @brief CPU physics backend: bodies, shapes, contacts, raycasts, mover.
 *
 * Pipeline per substep: integrate -> collide (N^2) -> solve.
 *
 * Constants:
 * - Linear slop: 0.005 m, scaled by lengthUnitsPerMeter
 * - Positional correction: 80% of the penetration past the slop
 * - Mover contact margin: 2 slops
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include "ember/physics/CpuPhysicsBackend.hpp"
#include "ember/core/Log.hpp"

#include <glm/common.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace ember::physics {

// ========================================================================== //
//  Constants                                                                 //
// ========================================================================== //

static constexpr core::f32 kLinearSlopMeters          = 0.005f;
static constexpr core::f32 kPositionCorrection        = 0.8f;
static constexpr core::f32 kMassEpsilon               = 1.0e-6f;
static constexpr core::f32 kContactMarginSlops        = 2.0f;
static constexpr core::u32 kPlaneSolverMaxIterations  = 20;
static constexpr core::u32 kSegmentSearchIterations   = 40;
static constexpr core::u32 kCastBisectIterations      = 24;
static constexpr core::f32 kPi                        = 3.14159265358979f;

namespace {

enum class ShapeKind : core::u8
{
    Box,
    Circle
};

struct Body
{
    BodyType               type{BodyType::Static};
    math::Vec2             position{0.0f, 0.0f};
    core::f32              rotation{0.0f};
    math::Vec2             linearVelocity{0.0f, 0.0f};
    core::f32              angularVelocity{0.0f};
    math::Vec2             force{0.0f, 0.0f};
    core::f32              gravityScale{1.0f};
    core::f32              invMass{0.0f};
    bool                   fixedRotation{false};
    bool                   alive{false};
    core::u32              generation{0};
    std::vector<core::u32> shapes;
};

struct Shape
{
    core::u32     body{0};
    ShapeKind     kind{ShapeKind::Box};
    math::Vec2    halfExtents{0.0f, 0.0f};
    core::f32     radius{0.0f};
    math::Vec2    offset{0.0f, 0.0f};
    ShapeMaterial material{};
    bool          alive{false};
    core::u32     generation{0};
};

/** @brief Contact between two shapes; the normal points from A to B. */
struct Contact
{
    math::Vec2 normal{0.0f, 1.0f};
    core::f32  penetration{0.0f};
};

/**
 * @brief Signed distance from @p p to an axis-aligned box, with the
 *        outward normal at the closest feature.
 */
core::f32 signedDistanceBox(math::Vec2 p, math::Vec2 center, math::Vec2 half, math::Vec2& normal)
{
    const math::Vec2 d = p - center;
    const math::Vec2 q = glm::abs(d) - half;
    const math::Vec2 outside = glm::max(q, math::Vec2{0.0f, 0.0f});
    const core::f32 outsideLength = glm::length(outside);

    if (outsideLength > 0.0f)
    {
        normal = math::Vec2{d.x < 0.0f ? -outside.x : outside.x,
                            d.y < 0.0f ? -outside.y : outside.y} / outsideLength;
        return outsideLength;
    }

    if (q.x > q.y)
    {
        normal = math::Vec2{d.x < 0.0f ? -1.0f : 1.0f, 0.0f};
        return q.x;
    }
    normal = math::Vec2{0.0f, d.y < 0.0f ? -1.0f : 1.0f};
    return q.y;
}

bool collideCircles(math::Vec2 ca, core::f32 ra, math::Vec2 cb, core::f32 rb, Contact& out)
{
    const math::Vec2 d = cb - ca;
    const core::f32 dist = glm::length(d);
    const core::f32 penetration = ra + rb - dist;
    if (penetration <= 0.0f)
        return false;
    out.normal      = dist > kMassEpsilon ? d / dist : math::Vec2{0.0f, 1.0f};
    out.penetration = penetration;
    return true;
}

bool collideBoxes(math::Vec2 ca, math::Vec2 ha, math::Vec2 cb, math::Vec2 hb, Contact& out)
{
    const math::Vec2 d = cb - ca;
    const core::f32 overlapX = (ha.x + hb.x) - std::fabs(d.x);
    const core::f32 overlapY = (ha.y + hb.y) - std::fabs(d.y);
    if (overlapX <= 0.0f || overlapY <= 0.0f)
        return false;

    // Minimum penetration axis
    if (overlapX < overlapY)
    {
        out.normal      = math::Vec2{d.x >= 0.0f ? 1.0f : -1.0f, 0.0f};
        out.penetration = overlapX;
    }
    else
    {
        out.normal      = math::Vec2{0.0f, d.y >= 0.0f ? 1.0f : -1.0f};
        out.penetration = overlapY;
    }
    return true;
}

bool collideBoxCircle(math::Vec2 boxCenter, math::Vec2 half, math::Vec2 circleCenter, core::f32 radius, Contact& out)
{
    math::Vec2 normal{0.0f, 1.0f};
    const core::f32 distance = signedDistanceBox(circleCenter, boxCenter, half, normal);
    const core::f32 penetration = radius - distance;
    if (penetration <= 0.0f)
        return false;
    out.normal      = normal;
    out.penetration = penetration;
    return true;
}

} // namespace

// ========================================================================== //
//  Impl                                                                      //
// ========================================================================== //

struct CpuPhysicsBackend::Impl
{
    core::Logger&      logger;
    PhysicsSettings    settings{};
    bool               initialized{false};
    std::vector<Body>      bodies;
    std::vector<Shape>     shapes;
    std::vector<core::u32> freeBodies;
    std::vector<core::u32> freeShapes;

    explicit Impl(core::Logger& l) : logger{l} {}

    [[nodiscard]] core::f32 slop() const noexcept
    {
        return kLinearSlopMeters * settings.lengthUnitsPerMeter;
    }

    /** @brief Live slot named by @p handle, or nullptr for a stale or foreign handle. */
    template <typename Slots, typename H>
    [[nodiscard]] static auto lookup(Slots& slots, H handle) noexcept -> decltype(slots.data())
    {
        if (!handle.isValid() || handle.index() >= slots.size())
            return nullptr;
        auto* slot = &slots[handle.index()];
        return slot->alive && slot->generation == handle.generation() ? slot : nullptr;
    }

    [[nodiscard]] Body* body(BodyHandle handle) noexcept { return lookup(bodies, handle); }
    [[nodiscard]] const Body* body(BodyHandle handle) const noexcept { return lookup(bodies, handle); }
    [[nodiscard]] Shape* shape(ShapeHandle handle) noexcept { return lookup(shapes, handle); }

    [[nodiscard]] BodyHandle bodyHandle(core::u32 index) const noexcept
    {
        return BodyHandle::make(index, bodies[index].generation);
    }

    /** @brief Index of a free slot in @p slots, reused first; kInvalid when full. */
    template <typename Slot>
    [[nodiscard]] static core::u32 acquire(std::vector<Slot>& slots, std::vector<core::u32>& freeList)
    {
        if (!freeList.empty())
        {
            const core::u32 index = freeList.back();
            freeList.pop_back();
            return index;
        }
        if (slots.size() > BodyHandle::kMaxIndex)
            return BodyHandle::kInvalid;
        slots.emplace_back();
        return static_cast<core::u32>(slots.size() - 1);
    }

    template <typename Slot>
    static void release(std::vector<Slot>& slots, std::vector<core::u32>& freeList, core::u32 index)
    {
        Slot& slot = slots[index];
        slot.alive      = false;
        slot.generation = BodyHandle::nextGeneration(slot.generation);
        freeList.push_back(index);
    }

    [[nodiscard]] math::Vec2 shapeCenter(const Shape& shape) const noexcept
    {
        return bodies[shape.body].position + shape.offset;
    }

    BodyHandle createBody(BodyType type, math::Vec2 position, core::f32 gravityScale)
    {
        const core::u32 index = acquire(bodies, freeBodies);
        if (index == BodyHandle::kInvalid)
        {
            logger.error("Physics", "CpuPhysicsBackend: body storage full ({} slots)", bodies.size());
            return BodyHandle{};
        }

        Body& b = bodies[index];
        const core::u32 generation = b.generation;
        b = Body{};
        b.type         = type;
        b.position     = position;
        b.gravityScale = gravityScale;
        b.invMass      = type == BodyType::Dynamic ? 1.0f : 0.0f;
        b.alive        = true;
        b.generation   = generation;
        return BodyHandle::make(index, generation);
    }

    ShapeHandle addShape(BodyHandle handle, Shape shape)
    {
        if (!body(handle))
            return ShapeHandle{};

        const core::u32 index = acquire(shapes, freeShapes);
        if (index == ShapeHandle::kInvalid)
        {
            logger.error("Physics", "CpuPhysicsBackend: shape storage full ({} slots)", shapes.size());
            return ShapeHandle{};
        }

        shape.body       = handle.index();
        shape.alive      = true;
        shape.generation = shapes[index].generation;
        shapes[index]    = shape;

        Body& b = bodies[handle.index()];
        b.shapes.push_back(index);
        recomputeMass(b);
        return ShapeHandle::make(index, shape.generation);
    }

    void recomputeMass(Body& b) const noexcept
    {
        if (b.type != BodyType::Dynamic)
        {
            b.invMass = 0.0f;
            return;
        }

        core::f32 mass = 0.0f;
        for (const core::u32 index : b.shapes)
        {
            const Shape& s = shapes[index];
            if (!s.alive || s.material.isSensor)
                continue;
            const core::f32 area = s.kind == ShapeKind::Box
                ? 4.0f * s.halfExtents.x * s.halfExtents.y
                : kPi * s.radius * s.radius;
            mass += s.material.density * area;
        }
        b.invMass = mass > kMassEpsilon ? 1.0f / mass : 1.0f;
    }

    bool collide(const Shape& a, const Shape& b, Contact& out) const
    {
        const math::Vec2 ca = shapeCenter(a);
        const math::Vec2 cb = shapeCenter(b);

        if (a.kind == ShapeKind::Circle && b.kind == ShapeKind::Circle)
            return collideCircles(ca, a.radius, cb, b.radius, out);
        if (a.kind == ShapeKind::Box && b.kind == ShapeKind::Box)
            return collideBoxes(ca, a.halfExtents, cb, b.halfExtents, out);
        if (a.kind == ShapeKind::Box)
            return collideBoxCircle(ca, a.halfExtents, cb, b.radius, out);

        if (!collideBoxCircle(cb, b.halfExtents, ca, a.radius, out))
            return false;
        out.normal = -out.normal;
        return true;
    }

    void resolve(const Shape& sa, const Shape& sb, const Contact& contact)
    {
        Body& a = bodies[sa.body];
        Body& b = bodies[sb.body];
        const core::f32 invMassSum = a.invMass + b.invMass;
        if (invMassSum < kMassEpsilon)
            return;

        // Positional correction
        const core::f32 depth = std::max(contact.penetration - slop(), 0.0f);
        const math::Vec2 correction = contact.normal * (kPositionCorrection * depth / invMassSum);
        a.position -= correction * a.invMass;
        b.position += correction * b.invMass;

        // Normal impulse
        math::Vec2 relative = b.linearVelocity - a.linearVelocity;
        const core::f32 normalSpeed = glm::dot(relative, contact.normal);
        if (normalSpeed >= 0.0f)
            return;

        const core::f32 restitution = std::max(sa.material.restitution, sb.material.restitution);
        const core::f32 j = -(1.0f + restitution) * normalSpeed / invMassSum;
        const math::Vec2 impulse = contact.normal * j;
        a.linearVelocity -= impulse * a.invMass;
        b.linearVelocity += impulse * b.invMass;

        // Coulomb friction
        relative = b.linearVelocity - a.linearVelocity;
        const math::Vec2 tangent = math::safeNormalize(relative - contact.normal * glm::dot(relative, contact.normal));
        if (math::lengthSquared(tangent) == 0.0f)
            return;

        const core::f32 mu = std::sqrt(sa.material.friction * sb.material.friction);
        const core::f32 jt = std::clamp(-glm::dot(relative, tangent) / invMassSum, -mu * j, mu * j);
        const math::Vec2 frictionImpulse = tangent * jt;
        a.linearVelocity -= frictionImpulse * a.invMass;
        b.linearVelocity += frictionImpulse * b.invMass;
    }

    void integrate(core::f32 h)
    {
        for (auto& b : bodies)
        {
            if (!b.alive || b.type == BodyType::Static)
                continue;

            if (b.type == BodyType::Dynamic)
            {
                b.linearVelocity += (settings.gravity * b.gravityScale + b.force * b.invMass) * h;
            }
            b.position += b.linearVelocity * h;
            if (!b.fixedRotation)
            {
                b.rotation += b.angularVelocity * h;
            }
        }
    }

    void solveContacts()
    {
        for (core::usize i = 0; i < shapes.size(); ++i)
        {
            const Shape& a = shapes[i];
            if (!a.alive || a.material.isSensor)
                continue;

            for (core::usize j = i + 1; j < shapes.size(); ++j)
            {
                const Shape& b = shapes[j];
                if (!b.alive || b.material.isSensor || a.body == b.body)
                    continue;
                if (bodies[a.body].invMass == 0.0f && bodies[b.body].invMass == 0.0f)
                    continue;

                Contact contact;
                if (collide(a, b, contact))
                {
                    resolve(a, b, contact);
                }
            }
        }
    }

    /** @brief Separation between a capsule and a shape, normal towards the capsule. */
    core::f32 capsuleSeparation(const Capsule& capsule, const Shape& shape, math::Vec2& normal) const
    {
        const math::Vec2 center = shapeCenter(shape);

        if (shape.kind == ShapeKind::Circle)
        {
            const core::f32 t = math::closestSegmentParameter(capsule.center1, capsule.center2, center);
            const math::Vec2 p = capsule.center1 + (capsule.center2 - capsule.center1) * t;
            const math::Vec2 d = p - center;
            const core::f32 dist = glm::length(d);
            normal = dist > kMassEpsilon ? d / dist : math::Vec2{0.0f, 1.0f};
            return dist - shape.radius - capsule.radius;
        }

        // The box distance is convex along the segment: ternary search.
        const math::Vec2 axis = capsule.center2 - capsule.center1;
        core::f32 lo = 0.0f;
        core::f32 hi = 1.0f;
        math::Vec2 scratch{0.0f, 0.0f};
        for (core::u32 i = 0; i < kSegmentSearchIterations; ++i)
        {
            const core::f32 m1 = lo + (hi - lo) / 3.0f;
            const core::f32 m2 = hi - (hi - lo) / 3.0f;
            const core::f32 d1 = signedDistanceBox(capsule.center1 + axis * m1, center, shape.halfExtents, scratch);
            const core::f32 d2 = signedDistanceBox(capsule.center1 + axis * m2, center, shape.halfExtents, scratch);
            if (d1 <= d2)
                hi = m2;
            else
                lo = m1;
        }
        const math::Vec2 p = capsule.center1 + axis * (0.5f * (lo + hi));
        return signedDistanceBox(p, center, shape.halfExtents, normal) - capsule.radius;
    }
};

// ========================================================================== //
//  Lifecycle                                                                 //
// ========================================================================== //

CpuPhysicsBackend::CpuPhysicsBackend(core::Logger& logger)
    : _impl{std::make_unique<Impl>(logger)}
{}

CpuPhysicsBackend::~CpuPhysicsBackend() = default;

core::Expected<void> CpuPhysicsBackend::init(const PhysicsSettings& settings)
{
    if (settings.lengthUnitsPerMeter <= 0.0f)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "lengthUnitsPerMeter must be positive");
    }

    _impl->settings    = settings;
    _impl->initialized = true;
    _impl->logger.info("Physics", "CpuPhysicsBackend::init gravity=({}, {}) unitsPerMeter={}",
                       settings.gravity.x, settings.gravity.y, settings.lengthUnitsPerMeter);
    return {};
}

core::Expected<void> CpuPhysicsBackend::step(core::f32 dt, core::u32 substeps)
{
    if (!_impl->initialized)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "CpuPhysicsBackend::step before init");
    }
    if (substeps == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "substeps must be at least 1");
    }
    if (dt <= 0.0f)
    {
        return {};
    }

    const core::f32 h = dt / static_cast<core::f32>(substeps);
    for (core::u32 i = 0; i < substeps; ++i)
    {
        _impl->integrate(h);
        _impl->solveContacts();
    }

    for (auto& b : _impl->bodies)
    {
        b.force = math::Vec2{0.0f, 0.0f};
    }
    return {};
}

void CpuPhysicsBackend::shutdown()
{
    _impl->logger.info("Physics", "CpuPhysicsBackend::shutdown ({} bodies left)", bodyCount());
    _impl->bodies.clear();
    _impl->shapes.clear();
    _impl->freeBodies.clear();
    _impl->freeShapes.clear();
    _impl->initialized = false;
}

const char* CpuPhysicsBackend::name() const noexcept
{
    return "CpuPhysicsBackend";
}

void CpuPhysicsBackend::setGravity(math::Vec2 gravity)
{
    _impl->settings.gravity = gravity;
}

// ========================================================================== //
//  Bodies & shapes                                                           //
// ========================================================================== //

BodyHandle CpuPhysicsBackend::createDynamicBody(math::Vec2 position, core::f32 gravityScale)
{
    return _impl->createBody(BodyType::Dynamic, position, gravityScale);
}

BodyHandle CpuPhysicsBackend::createStaticBody(math::Vec2 position)
{
    return _impl->createBody(BodyType::Static, position, 0.0f);
}

BodyHandle CpuPhysicsBackend::createKinematicBody(math::Vec2 position)
{
    return _impl->createBody(BodyType::Kinematic, position, 0.0f);
}

void CpuPhysicsBackend::destroyBody(BodyHandle body)
{
    Body* b = _impl->body(body);
    if (!b)
        return;

    for (const core::u32 index : b->shapes)
    {
        Impl::release(_impl->shapes, _impl->freeShapes, index);
    }
    b->shapes.clear();
    Impl::release(_impl->bodies, _impl->freeBodies, body.index());
}

ShapeHandle CpuPhysicsBackend::addBoxShape(BodyHandle body, core::f32 halfWidth, core::f32 halfHeight,
                                           math::Vec2 offset, const ShapeMaterial& material)
{
    Shape shape;
    shape.kind        = ShapeKind::Box;
    shape.halfExtents = math::Vec2{halfWidth, halfHeight};
    shape.offset      = offset;
    shape.material    = material;
    return _impl->addShape(body, shape);
}

ShapeHandle CpuPhysicsBackend::addCircleShape(BodyHandle body, core::f32 radius, math::Vec2 offset,
                                              const ShapeMaterial& material)
{
    Shape shape;
    shape.kind     = ShapeKind::Circle;
    shape.radius   = radius;
    shape.offset   = offset;
    shape.material = material;
    return _impl->addShape(body, shape);
}

void CpuPhysicsBackend::destroyShape(ShapeHandle shape)
{
    Shape* s = _impl->shape(shape);
    if (!s)
        return;

    Body& owner = _impl->bodies[s->body];
    Impl::release(_impl->shapes, _impl->freeShapes, shape.index());
    std::erase(owner.shapes, shape.index());
    _impl->recomputeMass(owner);
}

core::u32 CpuPhysicsBackend::bodyCount() const noexcept
{
    return static_cast<core::u32>(std::count_if(_impl->bodies.begin(), _impl->bodies.end(),
                                                [](const Body& b) { return b.alive; }));
}

core::u32 CpuPhysicsBackend::shapeCount() const noexcept
{
    return static_cast<core::u32>(std::count_if(_impl->shapes.begin(), _impl->shapes.end(),
                                                [](const Shape& s) { return s.alive; }));
}

core::usize CpuPhysicsBackend::bodyCapacity() const noexcept { return _impl->bodies.size(); }
core::usize CpuPhysicsBackend::shapeCapacity() const noexcept { return _impl->shapes.size(); }

// ========================================================================== //
//  Body state                                                                //
// ========================================================================== //

math::Vec2 CpuPhysicsBackend::position(BodyHandle body) const
{
    const Body* b = _impl->body(body);
    return b ? b->position : math::Vec2{0.0f, 0.0f};
}

void CpuPhysicsBackend::setPosition(BodyHandle body, math::Vec2 position)
{
    if (Body* b = _impl->body(body))
        b->position = position;
}

core::f32 CpuPhysicsBackend::rotation(BodyHandle body) const
{
    const Body* b = _impl->body(body);
    return b ? b->rotation : 0.0f;
}

void CpuPhysicsBackend::setTransform(BodyHandle body, math::Vec2 position, core::f32 rotation)
{
    if (Body* b = _impl->body(body))
    {
        b->position = position;
        b->rotation = rotation;
    }
}

math::Vec2 CpuPhysicsBackend::linearVelocity(BodyHandle body) const
{
    const Body* b = _impl->body(body);
    return b ? b->linearVelocity : math::Vec2{0.0f, 0.0f};
}

void CpuPhysicsBackend::setLinearVelocity(BodyHandle body, math::Vec2 velocity)
{
    Body* b = _impl->body(body);
    if (b && b->type != BodyType::Static)
        b->linearVelocity = velocity;
}

core::f32 CpuPhysicsBackend::angularVelocity(BodyHandle body) const
{
    const Body* b = _impl->body(body);
    return b ? b->angularVelocity : 0.0f;
}

void CpuPhysicsBackend::setAngularVelocity(BodyHandle body, core::f32 velocity)
{
    Body* b = _impl->body(body);
    if (b && b->type != BodyType::Static && !b->fixedRotation)
        b->angularVelocity = velocity;
}

void CpuPhysicsBackend::applyForce(BodyHandle body, math::Vec2 force)
{
    Body* b = _impl->body(body);
    if (b && b->type == BodyType::Dynamic)
        b->force += force;
}

void CpuPhysicsBackend::applyImpulse(BodyHandle body, math::Vec2 impulse)
{
    Body* b = _impl->body(body);
    if (b && b->type == BodyType::Dynamic)
        b->linearVelocity += impulse * b->invMass;
}

void CpuPhysicsBackend::setGravityScale(BodyHandle body, core::f32 scale)
{
    if (Body* b = _impl->body(body))
        b->gravityScale = scale;
}

void CpuPhysicsBackend::setFixedRotation(BodyHandle body, bool fixed)
{
    if (Body* b = _impl->body(body))
    {
        b->fixedRotation = fixed;
        if (fixed)
            b->angularVelocity = 0.0f;
    }
}

// ========================================================================== //
//  Queries                                                                   //
// ========================================================================== //

std::optional<RaycastHit> CpuPhysicsBackend::raycast(math::Vec2 origin, math::Vec2 translation) const
{
    std::optional<RaycastHit> best;

    for (const Shape& shape : _impl->shapes)
    {
        if (!shape.alive || shape.material.isSensor)
            continue;

        const math::Vec2 center = _impl->shapeCenter(shape);
        core::f32  fraction = 0.0f;
        math::Vec2 normal{0.0f, 0.0f};

        if (shape.kind == ShapeKind::Circle)
        {
            const math::Vec2 f = origin - center;
            const core::f32 a = glm::dot(translation, translation);
            const core::f32 b = 2.0f * glm::dot(f, translation);
            const core::f32 c = glm::dot(f, f) - shape.radius * shape.radius;
            // Rays starting inside a shape do not report it.
            if (a <= kMassEpsilon || c < 0.0f)
                continue;
            const core::f32 disc = b * b - 4.0f * a * c;
            if (disc < 0.0f)
                continue;
            fraction = (-b - std::sqrt(disc)) / (2.0f * a);
            if (fraction < 0.0f || fraction > 1.0f)
                continue;
            normal = math::safeNormalize(origin + translation * fraction - center);
        }
        else
        {
            const math::Vec2 lower = center - shape.halfExtents;
            const math::Vec2 upper = center + shape.halfExtents;
            core::f32 tMin = 0.0f;
            core::f32 tMax = 1.0f;
            bool entered = false;
            bool missed  = false;

            for (int axis = 0; axis < 2 && !missed; ++axis)
            {
                const core::f32 o = origin[axis];
                const core::f32 d = translation[axis];
                if (std::fabs(d) <= kMassEpsilon)
                {
                    missed = o < lower[axis] || o > upper[axis];
                    continue;
                }

                core::f32 t1 = (lower[axis] - o) / d;
                core::f32 t2 = (upper[axis] - o) / d;
                if (t1 > t2)
                    std::swap(t1, t2);

                if (t1 > tMin)
                {
                    tMin    = t1;
                    entered = true;
                    normal  = math::Vec2{0.0f, 0.0f};
                    normal[axis] = d > 0.0f ? -1.0f : 1.0f;
                }
                tMax   = std::min(tMax, t2);
                missed = tMin > tMax;
            }

            if (missed || !entered)
                continue;
            fraction = tMin;
        }

        if (!best || fraction < best->fraction)
        {
            best = RaycastHit{origin + translation * fraction, normal, fraction, _impl->bodyHandle(shape.body)};
        }
    }

    return best;
}

core::f32 CpuPhysicsBackend::castMover(const Capsule& mover, math::Vec2 translation) const
{
    core::f32 fraction = 1.0f;
    const core::f32 slop = _impl->slop();

    for (const Shape& shape : _impl->shapes)
    {
        if (!shape.alive || shape.material.isSensor)
            continue;

        math::Vec2 normal{0.0f, 0.0f};
        const core::f32 initial   = _impl->capsuleSeparation(mover, shape, normal);
        const core::f32 threshold = std::min(initial, 0.0f) - slop;

        auto separationAt = [&](core::f32 t) {
            Capsule moved = mover;
            moved.center1 += translation * t;
            moved.center2 += translation * t;
            return _impl->capsuleSeparation(moved, shape, normal);
        };

        if (separationAt(1.0f) >= threshold)
            continue;

        core::f32 lo = 0.0f;
        core::f32 hi = 1.0f;
        for (core::u32 i = 0; i < kCastBisectIterations; ++i)
        {
            const core::f32 mid = 0.5f * (lo + hi);
            if (separationAt(mid) >= threshold)
                lo = mid;
            else
                hi = mid;
        }
        fraction = std::min(fraction, lo);
    }

    return fraction;
}

std::vector<CollisionPlane> CpuPhysicsBackend::collideMover(const Capsule& mover) const
{
    std::vector<CollisionPlane> planes;
    const core::f32 margin = kContactMarginSlops * _impl->slop();

    for (const Shape& shape : _impl->shapes)
    {
        if (!shape.alive || shape.material.isSensor)
            continue;

        math::Vec2 normal{0.0f, 0.0f};
        const core::f32 separation = _impl->capsuleSeparation(mover, shape, normal);
        if (separation < margin)
        {
            CollisionPlane plane;
            plane.normal = normal;
            plane.offset = separation;
            planes.push_back(plane);
        }
    }
    return planes;
}

PlaneSolverResult CpuPhysicsBackend::solvePlanes(math::Vec2 targetDelta, std::span<CollisionPlane> planes) const
{
    for (auto& plane : planes)
    {
        plane.push = 0.0f;
    }

    const core::f32 slop = _impl->slop();
    math::Vec2 delta = targetDelta;
    core::u32 iteration = 0;

    for (; iteration < kPlaneSolverMaxIterations; ++iteration)
    {
        core::f32 totalPush = 0.0f;
        for (auto& plane : planes)
        {
            // Keep one slop of clearance so resting contacts stay reported.
            const core::f32 separation = glm::dot(plane.normal, delta) + plane.offset - slop;
            const core::f32 previous   = plane.push;
            plane.push = std::clamp(plane.push - separation, 0.0f, plane.pushLimit);
            const core::f32 push = plane.push - previous;
            delta += plane.normal * push;
            totalPush += std::fabs(push);
        }
        if (totalPush < slop)
            break;
    }

    return PlaneSolverResult{delta, iteration};
}

math::Vec2 CpuPhysicsBackend::clipVector(math::Vec2 vector, std::span<const CollisionPlane> planes) const
{
    math::Vec2 v = vector;
    for (const auto& plane : planes)
    {
        if (plane.push == 0.0f || !plane.clipVelocity)
            continue;
        v -= plane.normal * std::min(0.0f, glm::dot(v, plane.normal));
    }
    return v;
}

} // namespace ember::physics
