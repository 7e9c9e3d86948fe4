#pragma once

#include "dropcatch/body_registry.hpp"
#include "dropcatch/contact_dispatcher.hpp"

#include <atomic>
#include <cstddef>
#include <optional>

namespace dropcatch
{

// Owns the Box2D world and the role registry of every body in it. Only one
// PhysicsWorld may be initialized per process at a time.
//
// Positions crossing this interface are display units (pixels, y-up).
class PhysicsWorld
{
public:
    PhysicsWorld() = default;
    ~PhysicsWorld();

    PhysicsWorld(const PhysicsWorld&) = delete;
    PhysicsWorld& operator=(const PhysicsWorld&) = delete;

    // Throws std::logic_error if this or another world is already active and
    // std::runtime_error if Box2D refuses to create the world.
    void Initialize(float gravityY);
    void Teardown();

    bool IsInitialized() const
    {
        return b2World_IsValid(m_worldId);
    }

    // Advances by exactly dt, then dispatches the begin-touch contacts of the
    // step before returning. No-op while disabled.
    void Step(float dt, int subSteps);

    void SetGravity(float gravityY);
    float Gravity() const
    {
        return m_gravityY;
    }

    void SetEnabled(bool enabled);
    bool Enabled() const
    {
        return m_enabled;
    }

    void SetContactHandler(ContactHandler* handler)
    {
        m_dispatcher.SetHandler(handler);
    }

    b2BodyId CreateBody(BodyRole role, b2BodyType type, b2Vec2 positionPx);
    void DestroyBody(b2BodyId body);

    void SetBodyPosition(b2BodyId body, b2Vec2 positionPx);
    b2Vec2 BodyPosition(b2BodyId body) const;
    void SetBodyVelocity(b2BodyId body, b2Vec2 velocityPx);
    b2Vec2 BodyVelocity(b2BodyId body) const;

    std::optional<BodyRole> Role(b2BodyId body) const
    {
        return m_registry.RoleOf(body);
    }

    bool IsMarkedForRemoval(b2BodyId body) const;
    void MarkForRemoval(b2BodyId body);

    // Horizontal push (newtons) on every droplet still in play.
    void ApplyWind(float forceX);

    size_t BodyCount() const
    {
        return m_registry.Size();
    }

    b2WorldId Id() const
    {
        return m_worldId;
    }

    const BodyRegistry& Registry() const
    {
        return m_registry;
    }

    static int ActiveWorldCount()
    {
        return s_activeWorlds.load();
    }

private:
    void RequireInitialized(const char* operation) const;
    void RequireBody(b2BodyId body, const char* operation) const;

    b2WorldId m_worldId = b2_nullWorldId;
    BodyRegistry m_registry;
    ContactDispatcher m_dispatcher;
    float m_gravityY = kDefaultGravityY;
    bool m_enabled = true;

    static std::atomic<int> s_activeWorlds;
};

} // namespace dropcatch
