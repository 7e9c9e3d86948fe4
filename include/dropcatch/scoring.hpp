#pragma once

#include <optional>

namespace dropcatch
{

static constexpr int kPointsPerCatch = 10;
static constexpr int kCombosPerMultiplierStep = 5;
static constexpr int kComboBannerThreshold = 3;
static constexpr float kComboBannerSeconds = 2.0f;

static constexpr int kDefaultLives = 3;
static constexpr int kUnlimitedLives = -1;
static constexpr float kSpeedPerCatch = 0.01f;

struct ScoreState
{
    int score = 0;
    int highScore = 0;
    int dropsCaught = 0;
    int dropsMissed = 0;
    int comboCount = 0;
    int multiplier = 1;
    float gameTime = 0.0f;
    float lastScoreTime = 0.0f;

    // kUnlimitedLives disables the life counter and game over.
    int lives = kUnlimitedLives;
    int startingLives = kUnlimitedLives;
    bool gameOver = false;

    // Grows with every catch; spawn intervals are divided by it.
    float gameSpeed = 1.0f;

    // Display only.
    bool showCombo = false;
    float comboTimer = 0.0f;
};

enum class Celebration
{
    None,
    Milestone,
    GreatCombo,
    AmazingCombo
};

struct ScoreSnapshot
{
    int score = 0;
    int highScore = 0;
    int comboCount = 0;
    int multiplier = 1;
    int lives = kUnlimitedLives;
    float gameSpeed = 1.0f;
    bool gameOver = false;
    std::optional<float> accuracy;
};

// Fresh session state; highScore carries a previously reached value.
ScoreState InitialScore(int highScore = 0, int startingLives = kUnlimitedLives);

// Production rules: 10 x multiplier per catch, combo/multiplier reset on miss.
// Under both rule sets a catch speeds the game up and a miss costs a life;
// the last life lost sets gameOver.
ScoreState OnCaught(const ScoreState& state);
ScoreState OnMissed(const ScoreState& state);

// Reference rules used by the engine-independent model: +1 per catch, a miss
// is only counted.
ScoreState OnReferenceCatch(const ScoreState& state);
ScoreState OnReferenceMiss(const ScoreState& state);

// Game clock and combo banner countdown.
ScoreState Tick(const ScoreState& state, float dt);

// Back to InitialScore with the same high score and starting lives.
ScoreState Restart(const ScoreState& state);

// 100 * caught / (caught + missed); empty before any drop resolved.
std::optional<float> Accuracy(const ScoreState& state);

ScoreSnapshot Snapshot(const ScoreState& state);

// What a catch that produced `state` is worth shouting about.
Celebration CelebrationFor(const ScoreState& state);

} // namespace dropcatch
