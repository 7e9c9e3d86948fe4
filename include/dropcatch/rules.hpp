#pragma once

#include <cstdint>
#include <random>
#include <vector>

// Engine-independent reference rules for the drop game. Every function here
// is pure: the same input state always yields the same output state.
namespace dropcatch::rules
{

static constexpr float kScreenWidth = 800.0f;
static constexpr float kScreenHeight = 480.0f;
static constexpr float kBucketWidth = 64.0f;
static constexpr float kBucketHeight = 64.0f;
static constexpr float kBucketY = 20.0f;
static constexpr float kDropletWidth = 64.0f;
static constexpr float kDropletHeight = 64.0f;
static constexpr float kBucketSpeed = 200.0f;
static constexpr float kDropletSpeed = 200.0f;
static constexpr int64_t kOneSecondNanos = 1000000000;

static constexpr float kSimulationDt = 0.016f;
static constexpr int64_t kSimulationFrameNanos = 16666667;

struct Rect
{
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const Rect& o) const
    {
        return x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

struct PureGameState
{
    float bucketX = (kScreenWidth - kBucketWidth) * 0.5f;
    float bucketY = kBucketY;
    std::vector<Rect> droplets;
    int64_t lastSpawnNanos = 0;
    int score = 0;
    std::mt19937 rng;

    bool operator==(const PureGameState& o) const
    {
        return bucketX == o.bucketX && bucketY == o.bucketY && droplets == o.droplets &&
               lastSpawnNanos == o.lastSpawnNanos && score == o.score && rng == o.rng;
    }
};

enum class DropResult
{
    Caught,
    Missed
};

// Catches and misses resolved by AdvanceDroplets. `results` lists them in
// droplet order, so reducers can replay a miss-then-catch faithfully.
struct StepOutcome
{
    int caught = 0;
    int missed = 0;
    std::vector<DropResult> results;
};

PureGameState CreateGameState(uint32_t seed);

Rect MakeDroplet(float x);

Rect BucketRect(const PureGameState& state);

// Strict on all four sides: rectangles that only share an edge do not overlap.
bool Overlaps(const Rect& a, const Rect& b);

// direction is -1 (left), 0 or 1 (right). Result is clamped to
// [0, kScreenWidth - kBucketWidth].
PureGameState MoveBucket(const PureGameState& state, int direction, float dt);

// Moves every droplet down, removes caught ones (+1 score each) and ones that
// fell fully below y=0 (no penalty).
PureGameState AdvanceDroplets(const PureGameState& state, float dt);
PureGameState AdvanceDroplets(const PureGameState& state, float dt, StepOutcome& outcome);

// Adds one droplet at the top when more than a second has passed since the
// previous spawn.
PureGameState MaybeSpawn(const PureGameState& state, int64_t nowNanos);

PureGameState Step(const PureGameState& state, float dt, int64_t nowNanos, int direction);
PureGameState Step(const PureGameState& state, float dt, int64_t nowNanos, int direction, StepOutcome& outcome);

// Runs `steps` frames at ~60 FPS with seeded random bucket directions.
PureGameState RunSimulation(int steps, uint32_t seed);

} // namespace dropcatch::rules
