#include "dropcatch/physics_world.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace dropcatch
{

std::atomic<int> PhysicsWorld::s_activeWorlds{0};

PhysicsWorld::~PhysicsWorld()
{
    if (IsInitialized())
    {
        Teardown();
    }
}

void PhysicsWorld::Initialize(float gravityY)
{
    if (IsInitialized())
    {
        throw std::logic_error("PhysicsWorld::Initialize called on an active world");
    }
    int expected = 0;
    if (!s_activeWorlds.compare_exchange_strong(expected, 1))
    {
        throw std::logic_error("PhysicsWorld::Initialize: another physics world is already active");
    }

    b2WorldDef worldDef = b2DefaultWorldDef();
    worldDef.gravity = {0.0f, gravityY};
    worldDef.enableSleep = true;
    worldDef.enableContinuous = true;
    m_worldId = b2CreateWorld(&worldDef);
    if (!b2World_IsValid(m_worldId))
    {
        m_worldId = b2_nullWorldId;
        s_activeWorlds.store(0);
        throw std::runtime_error("Box2D failed to create the physics world");
    }

    m_gravityY = gravityY;
    m_enabled = true;
    spdlog::info("Box2D physics world created (gravity {:.2f} m/s^2)", gravityY);
}

void PhysicsWorld::Teardown()
{
    if (!IsInitialized()) return;

    b2DestroyWorld(m_worldId);
    m_worldId = b2_nullWorldId;
    m_registry.Clear();
    s_activeWorlds.fetch_sub(1);
    spdlog::info("Physics world disposed");
}

void PhysicsWorld::Step(float dt, int subSteps)
{
    RequireInitialized("Step");
    if (!m_enabled || dt <= 0.0f) return;

    b2World_Step(m_worldId, dt, std::max(1, subSteps));

    // Box2D buffers begin-touch events during the step; nothing is destroyed
    // while they are being dispatched.
    b2ContactEvents events = b2World_GetContactEvents(m_worldId);
    m_dispatcher.DispatchBeginEvents(m_registry, events);
}

void PhysicsWorld::SetGravity(float gravityY)
{
    RequireInitialized("SetGravity");
    b2World_SetGravity(m_worldId, {0.0f, gravityY});
    m_gravityY = gravityY;
    spdlog::info("Gravity set to {:.2f}", gravityY);
}

void PhysicsWorld::SetEnabled(bool enabled)
{
    m_enabled = enabled;
    spdlog::info("Physics {}", m_enabled ? "enabled" : "disabled");
}

b2BodyId PhysicsWorld::CreateBody(BodyRole role, b2BodyType type, b2Vec2 positionPx)
{
    RequireInitialized("CreateBody");

    b2BodyDef bodyDef = b2DefaultBodyDef();
    bodyDef.type = type;
    bodyDef.position = ToMeters(positionPx);
    b2BodyId body = b2CreateBody(m_worldId, &bodyDef);
    m_registry.Add(body, role);
    return body;
}

void PhysicsWorld::DestroyBody(b2BodyId body)
{
    RequireInitialized("DestroyBody");
    if (b2Body_IsValid(body))
    {
        b2DestroyBody(body);
    }
    m_registry.Remove(body);
}

void PhysicsWorld::SetBodyPosition(b2BodyId body, b2Vec2 positionPx)
{
    RequireBody(body, "SetBodyPosition");
    b2Body_SetTransform(body, ToMeters(positionPx), b2Body_GetRotation(body));
}

b2Vec2 PhysicsWorld::BodyPosition(b2BodyId body) const
{
    RequireBody(body, "BodyPosition");
    return ToPixels(b2Body_GetPosition(body));
}

void PhysicsWorld::SetBodyVelocity(b2BodyId body, b2Vec2 velocityPx)
{
    RequireBody(body, "SetBodyVelocity");
    b2Body_SetLinearVelocity(body, ToMeters(velocityPx));
}

b2Vec2 PhysicsWorld::BodyVelocity(b2BodyId body) const
{
    RequireBody(body, "BodyVelocity");
    return ToPixels(b2Body_GetLinearVelocity(body));
}

bool PhysicsWorld::IsMarkedForRemoval(b2BodyId body) const
{
    const BodyRecord* record = m_registry.Find(body);
    return record && record->markedForRemoval;
}

void PhysicsWorld::MarkForRemoval(b2BodyId body)
{
    BodyRecord* record = m_registry.Find(body);
    if (!record)
    {
        throw std::logic_error("PhysicsWorld::MarkForRemoval: body is not registered");
    }
    record->markedForRemoval = true;
}

void PhysicsWorld::ApplyWind(float forceX)
{
    RequireInitialized("ApplyWind");
    m_registry.ForEach([forceX](const BodyRecord& record) {
        if (record.role != BodyRole::Droplet || record.markedForRemoval) return;
        if (!b2Body_IsValid(record.bodyId)) return;
        b2Body_ApplyForceToCenter(record.bodyId, {forceX, 0.0f}, true);
    });
}

void PhysicsWorld::RequireInitialized(const char* operation) const
{
    if (!IsInitialized())
    {
        throw std::logic_error(std::string("PhysicsWorld::") + operation + ": world is not initialized");
    }
}

void PhysicsWorld::RequireBody(b2BodyId body, const char* operation) const
{
    RequireInitialized(operation);
    if (!b2Body_IsValid(body))
    {
        throw std::logic_error(std::string("PhysicsWorld::") + operation + ": invalid body handle");
    }
}

} // namespace dropcatch
