#pragma once

#include <box2d/box2d.h>

#include <cstdint>

namespace dropcatch
{

// Display space is pixels, y-up. Simulation space is metres.
static constexpr float kPixelsPerMeter = 100.0f;
static constexpr float kInvPixelsPerMeter = 1.0f / kPixelsPerMeter;

static constexpr float kDefaultGravityY = -9.8f;
static constexpr int kDefaultSubSteps = 4;

enum class BodyRole
{
    Bucket,
    Droplet,
    Wall,
    Ground
};

namespace category
{
static constexpr uint64_t kBucket = 0x0001;
static constexpr uint64_t kDroplet = 0x0002;
static constexpr uint64_t kWall = 0x0004;
static constexpr uint64_t kGround = 0x0008;
} // namespace category

inline float ToMeters(float px)
{
    return px * kInvPixelsPerMeter;
}

inline float ToPixels(float m)
{
    return m * kPixelsPerMeter;
}

inline b2Vec2 ToMeters(b2Vec2 p)
{
    return {p.x * kInvPixelsPerMeter, p.y * kInvPixelsPerMeter};
}

inline b2Vec2 ToPixels(b2Vec2 p)
{
    return {p.x * kPixelsPerMeter, p.y * kPixelsPerMeter};
}

inline uint64_t BodyKey(b2BodyId id)
{
    return b2StoreBodyId(id);
}

const char* ToString(BodyRole role);

} // namespace dropcatch
