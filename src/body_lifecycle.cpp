#include "dropcatch/body_lifecycle.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace dropcatch
{

b2BodyId BodyLifecycle::SpawnDroplet(float x, float y, float radius)
{
    b2BodyId body = m_world.CreateBody(BodyRole::Droplet, b2_dynamicBody, {x, y});

    b2ShapeDef shapeDef = b2DefaultShapeDef();
    shapeDef.density = 1.0f;
    shapeDef.material.friction = 0.3f;
    shapeDef.material.restitution = 0.4f;
    shapeDef.filter.categoryBits = category::kDroplet;
    shapeDef.filter.maskBits = category::kBucket | category::kWall | category::kGround;
    shapeDef.enableContactEvents = true;

    b2Circle circle{};
    circle.center = {0.0f, 0.0f};
    circle.radius = ToMeters(radius);
    b2CreateCircleShape(body, &shapeDef, &circle);

    // Small initial fall so fresh drops do not hang at the top.
    b2Body_SetLinearVelocity(body, {0.0f, -kDropletInitialSpeed});

    DropletEntry entry;
    entry.bodyId = body;
    entry.radiusPx = radius;
    m_droplets.push_back(entry);
    return body;
}

b2BodyId BodyLifecycle::CreateStaticBox(BodyRole role, uint64_t categoryBits, b2Vec2 centerPx, float halfWidthPx, float halfHeightPx)
{
    b2BodyId body = m_world.CreateBody(role, b2_staticBody, centerPx);

    b2ShapeDef shapeDef = b2DefaultShapeDef();
    shapeDef.filter.categoryBits = categoryBits;
    shapeDef.filter.maskBits = category::kDroplet;
    shapeDef.enableContactEvents = true;

    b2Polygon box = b2MakeBox(ToMeters(halfWidthPx), ToMeters(halfHeightPx));
    b2CreatePolygonShape(body, &shapeDef, &box);

    BoxView view;
    view.centerPx = centerPx;
    view.halfWidthPx = halfWidthPx;
    view.halfHeightPx = halfHeightPx;
    view.role = role;
    m_boundaries.push_back(view);
    return body;
}

void BodyLifecycle::CreateBoundaries(float worldWidth, float worldHeight, float thickness)
{
    if (!m_boundaries.empty())
    {
        throw std::logic_error("BodyLifecycle::CreateBoundaries called twice");
    }

    const float halfW = worldWidth * 0.5f;
    const float halfH = worldHeight * 0.5f;

    CreateStaticBox(BodyRole::Ground, category::kGround, {halfW, -thickness}, halfW, thickness);
    CreateStaticBox(BodyRole::Wall, category::kWall, {-thickness, halfH}, thickness, halfH);
    CreateStaticBox(BodyRole::Wall, category::kWall, {worldWidth + thickness, halfH}, thickness, halfH);

    spdlog::info("World boundaries created ({:.0f}x{:.0f} px)", worldWidth, worldHeight);
}

b2BodyId BodyLifecycle::CreateBucket(float x, float y, float width, float height)
{
    if (HasBucket())
    {
        throw std::logic_error("BodyLifecycle::CreateBucket called twice");
    }

    b2BodyId body = m_world.CreateBody(BodyRole::Bucket, b2_kinematicBody, {x, y});

    b2ShapeDef shapeDef = b2DefaultShapeDef();
    shapeDef.density = 1.0f;
    shapeDef.material.friction = 0.5f;
    shapeDef.material.restitution = 0.1f;
    shapeDef.filter.categoryBits = category::kBucket;
    shapeDef.filter.maskBits = category::kDroplet;
    shapeDef.enableContactEvents = true;

    b2Polygon box = b2MakeBox(ToMeters(width * 0.5f), ToMeters(height * 0.5f));
    b2CreatePolygonShape(body, &shapeDef, &box);

    m_bucket = body;
    m_bucketSizePx = {width, height};
    spdlog::info("Bucket physics body created at ({:.0f}, {:.0f})", x, y);
    return body;
}

void BodyLifecycle::MoveBucket(float x, float y)
{
    m_world.SetBodyPosition(m_bucket, {x, y});
}

b2Vec2 BodyLifecycle::BucketPosition() const
{
    return m_world.BodyPosition(m_bucket);
}

int BodyLifecycle::ReapRemoved()
{
    int reaped = 0;
    for (const DropletEntry& e : m_droplets)
    {
        if (!m_world.IsMarkedForRemoval(e.bodyId)) continue;
        m_world.DestroyBody(e.bodyId);
        ++reaped;
    }
    if (reaped == 0) return 0;

    m_droplets.erase(std::remove_if(m_droplets.begin(), m_droplets.end(), [](const DropletEntry& e) {
        return !b2Body_IsValid(e.bodyId);
    }), m_droplets.end());

    spdlog::debug("Reaped {} droplet bodies, {} live", reaped, m_droplets.size());
    return reaped;
}

void BodyLifecycle::ClearDroplets()
{
    for (const DropletEntry& e : m_droplets)
    {
        m_world.DestroyBody(e.bodyId);
    }
    m_droplets.clear();
}

std::vector<DropletView> BodyLifecycle::DropletPositions() const
{
    std::vector<DropletView> out;
    out.reserve(m_droplets.size());
    for (const DropletEntry& e : m_droplets)
    {
        if (!b2Body_IsValid(e.bodyId)) continue;
        DropletView view;
        view.bodyId = e.bodyId;
        view.positionPx = m_world.BodyPosition(e.bodyId);
        view.radiusPx = e.radiusPx;
        out.push_back(view);
    }
    return out;
}

std::vector<b2BodyId> BodyLifecycle::DropletIds() const
{
    std::vector<b2BodyId> out;
    out.reserve(m_droplets.size());
    for (const DropletEntry& e : m_droplets)
    {
        out.push_back(e.bodyId);
    }
    return out;
}

void BodyLifecycle::Reset()
{
    m_bucket = b2_nullBodyId;
    m_bucketSizePx = {0.0f, 0.0f};
    m_droplets.clear();
    m_boundaries.clear();
}

} // namespace dropcatch
