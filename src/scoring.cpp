#include "dropcatch/scoring.hpp"

#include <algorithm>

namespace dropcatch
{

namespace
{

void SpeedUp(ScoreState& state)
{
    state.gameSpeed += kSpeedPerCatch;
}

void LoseLife(ScoreState& state)
{
    if (state.lives == kUnlimitedLives || state.gameOver) return;
    state.lives = std::max(0, state.lives - 1);
    if (state.lives == 0) state.gameOver = true;
}

} // namespace

ScoreState InitialScore(int highScore, int startingLives)
{
    ScoreState state;
    state.highScore = std::max(0, highScore);
    state.startingLives = (startingLives > 0) ? startingLives : kUnlimitedLives;
    state.lives = state.startingLives;
    return state;
}

ScoreState OnCaught(const ScoreState& state)
{
    ScoreState next = state;
    next.score += kPointsPerCatch * state.multiplier;
    next.dropsCaught += 1;
    next.comboCount += 1;
    next.lastScoreTime = state.gameTime;

    if (next.comboCount >= kComboBannerThreshold)
    {
        next.showCombo = true;
        next.comboTimer = kComboBannerSeconds;
    }
    if (next.comboCount % kCombosPerMultiplierStep == 0)
    {
        next.multiplier += 1;
    }
    SpeedUp(next);

    next.highScore = std::max(next.highScore, next.score);
    return next;
}

ScoreState OnMissed(const ScoreState& state)
{
    ScoreState next = state;
    next.dropsMissed += 1;
    next.comboCount = 0;
    next.multiplier = 1;
    next.showCombo = false;
    next.comboTimer = 0.0f;
    LoseLife(next);
    return next;
}

ScoreState OnReferenceCatch(const ScoreState& state)
{
    ScoreState next = state;
    next.score += 1;
    next.dropsCaught += 1;
    next.lastScoreTime = state.gameTime;
    SpeedUp(next);
    next.highScore = std::max(next.highScore, next.score);
    return next;
}

ScoreState OnReferenceMiss(const ScoreState& state)
{
    ScoreState next = state;
    next.dropsMissed += 1;
    LoseLife(next);
    return next;
}

ScoreState Tick(const ScoreState& state, float dt)
{
    ScoreState next = state;
    dt = std::max(0.0f, dt);
    next.gameTime += dt;

    if (next.showCombo)
    {
        next.comboTimer -= dt;
        if (next.comboTimer <= 0.0f)
        {
            next.showCombo = false;
            next.comboTimer = 0.0f;
        }
    }
    return next;
}

ScoreState Restart(const ScoreState& state)
{
    return InitialScore(state.highScore, state.startingLives);
}

std::optional<float> Accuracy(const ScoreState& state)
{
    int resolved = state.dropsCaught + state.dropsMissed;
    if (resolved <= 0) return std::nullopt;
    return 100.0f * static_cast<float>(state.dropsCaught) / static_cast<float>(resolved);
}

ScoreSnapshot Snapshot(const ScoreState& state)
{
    ScoreSnapshot snap;
    snap.score = state.score;
    snap.highScore = state.highScore;
    snap.comboCount = state.comboCount;
    snap.multiplier = state.multiplier;
    snap.lives = state.lives;
    snap.gameSpeed = state.gameSpeed;
    snap.gameOver = state.gameOver;
    snap.accuracy = Accuracy(state);
    return snap;
}

Celebration CelebrationFor(const ScoreState& state)
{
    if (state.comboCount >= 10) return Celebration::AmazingCombo;
    if (state.comboCount >= 5) return Celebration::GreatCombo;
    if (state.score > 0 && state.score % 100 == 0) return Celebration::Milestone;
    return Celebration::None;
}

} // namespace dropcatch
