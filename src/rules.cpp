#include "dropcatch/rules.hpp"

#include <algorithm>

namespace dropcatch::rules
{

PureGameState CreateGameState(uint32_t seed)
{
    PureGameState state;
    state.rng.seed(seed);
    return state;
}

Rect MakeDroplet(float x)
{
    return Rect{x, kScreenHeight, kDropletWidth, kDropletHeight};
}

Rect BucketRect(const PureGameState& state)
{
    return Rect{state.bucketX, state.bucketY, kBucketWidth, kBucketHeight};
}

bool Overlaps(const Rect& a, const Rect& b)
{
    return a.x < b.x + b.width &&
           b.x < a.x + a.width &&
           a.y < b.y + b.height &&
           b.y < a.y + a.height;
}

PureGameState MoveBucket(const PureGameState& state, int direction, float dt)
{
    PureGameState next = state;
    float moved = state.bucketX + static_cast<float>(direction) * kBucketSpeed * dt;
    next.bucketX = std::clamp(moved, 0.0f, kScreenWidth - kBucketWidth);
    return next;
}

PureGameState AdvanceDroplets(const PureGameState& state, float dt)
{
    StepOutcome ignored;
    return AdvanceDroplets(state, dt, ignored);
}

PureGameState AdvanceDroplets(const PureGameState& state, float dt, StepOutcome& outcome)
{
    PureGameState next = state;
    next.droplets.clear();
    next.droplets.reserve(state.droplets.size());

    const Rect bucket = BucketRect(state);
    int caught = 0;
    for (Rect drop : state.droplets)
    {
        drop.y -= kDropletSpeed * dt;
        if (Overlaps(drop, bucket))
        {
            ++caught;
            outcome.results.push_back(DropResult::Caught);
            continue;
        }
        if (drop.y + drop.height <= 0.0f)
        {
            ++outcome.missed;
            outcome.results.push_back(DropResult::Missed);
            continue;
        }
        next.droplets.push_back(drop);
    }

    outcome.caught += caught;
    next.score += caught;
    return next;
}

PureGameState MaybeSpawn(const PureGameState& state, int64_t nowNanos)
{
    if (nowNanos - state.lastSpawnNanos <= kOneSecondNanos)
    {
        return state;
    }

    PureGameState next = state;
    std::uniform_int_distribution<int> spawnX(0, static_cast<int>(kScreenWidth - kDropletWidth));
    next.droplets.push_back(MakeDroplet(static_cast<float>(spawnX(next.rng))));
    next.lastSpawnNanos = nowNanos;
    return next;
}

PureGameState Step(const PureGameState& state, float dt, int64_t nowNanos, int direction)
{
    StepOutcome ignored;
    return Step(state, dt, nowNanos, direction, ignored);
}

PureGameState Step(const PureGameState& state, float dt, int64_t nowNanos, int direction, StepOutcome& outcome)
{
    PureGameState next = MoveBucket(state, direction, dt);
    next = AdvanceDroplets(next, dt, outcome);
    return MaybeSpawn(next, nowNanos);
}

PureGameState RunSimulation(int steps, uint32_t seed)
{
    PureGameState state = CreateGameState(seed);
    std::mt19937 directions(seed + 1u);
    std::uniform_int_distribution<int> pick(-1, 1);

    for (int i = 0; i < steps; ++i)
    {
        int64_t now = static_cast<int64_t>(i) * kSimulationFrameNanos;
        state = Step(state, kSimulationDt, now, pick(directions));
    }
    return state;
}

} // namespace dropcatch::rules
