#pragma once

#include "dropcatch/physics_world.hpp"

#include <cstddef>
#include <vector>

namespace dropcatch
{

static constexpr float kDropletInitialSpeed = 2.0f; // m/s, downward

struct DropletView
{
    b2BodyId bodyId = b2_nullBodyId;
    b2Vec2 positionPx{0.0f, 0.0f};
    float radiusPx = 0.0f;
};

struct BoxView
{
    b2Vec2 centerPx{0.0f, 0.0f};
    float halfWidthPx = 0.0f;
    float halfHeightPx = 0.0f;
    BodyRole role = BodyRole::Wall;
};

// Creates and destroys the bucket, boundary and droplet bodies of a world.
// Destruction only happens in ReapRemoved / ClearDroplets, which callers
// invoke after PhysicsWorld::Step has returned.
class BodyLifecycle
{
public:
    explicit BodyLifecycle(PhysicsWorld& world)
        : m_world(world)
    {
    }

    b2BodyId SpawnDroplet(float x, float y, float radius);

    // Ground strip below y=0 and walls outside [0, worldWidth]. Once per world.
    void CreateBoundaries(float worldWidth, float worldHeight, float thickness);

    // Kinematic box centred on (x, y). Once per world.
    b2BodyId CreateBucket(float x, float y, float width, float height);
    void MoveBucket(float x, float y);
    b2Vec2 BucketPosition() const;

    bool HasBucket() const
    {
        return b2Body_IsValid(m_bucket);
    }

    float BucketWidth() const
    {
        return m_bucketSizePx.x;
    }

    float BucketHeight() const
    {
        return m_bucketSizePx.y;
    }

    // Destroys every droplet flagged for removal. Returns how many went.
    int ReapRemoved();

    // Destroys all droplets regardless of their flags.
    void ClearDroplets();

    std::vector<DropletView> DropletPositions() const;

    const std::vector<BoxView>& Boundaries() const
    {
        return m_boundaries;
    }

    size_t DropletCount() const
    {
        return m_droplets.size();
    }

    std::vector<b2BodyId> DropletIds() const;

    // Forgets handles after the world has been torn down.
    void Reset();

private:
    struct DropletEntry
    {
        b2BodyId bodyId = b2_nullBodyId;
        float radiusPx = 0.0f;
    };

    b2BodyId CreateStaticBox(BodyRole role, uint64_t categoryBits, b2Vec2 centerPx, float halfWidthPx, float halfHeightPx);

    PhysicsWorld& m_world;
    b2BodyId m_bucket = b2_nullBodyId;
    b2Vec2 m_bucketSizePx{0.0f, 0.0f};
    std::vector<DropletEntry> m_droplets;
    std::vector<BoxView> m_boundaries;
};

} // namespace dropcatch
