#pragma once

#include "dropcatch/body_lifecycle.hpp"
#include "dropcatch/physics_world.hpp"
#include "dropcatch/rules.hpp"
#include "dropcatch/scoring.hpp"

#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace dropcatch
{

// Per-frame input, already translated to display units by the front end.
struct FrameInput
{
    bool moveLeft = false;
    bool moveRight = false;
    std::optional<b2Vec2> pointerPx;
    bool windLeft = false;
    bool windRight = false;
};

struct SessionSettings
{
    float worldWidthPx = 800.0f;
    float worldHeightPx = 500.0f;
    float gravity = kDefaultGravityY;
    int subSteps = kDefaultSubSteps;
    float spawnInterval = 1.0f;
    int startingLives = kDefaultLives;

    float bucketWidthPx = 64.0f;
    float bucketHeightPx = 64.0f;
    float bucketYPx = 50.0f;
    float bucketSpeedPx = 400.0f;

    float dropletRadiusPx = 32.0f;
    float boundaryThicknessPx = 10.0f;
    float windForce = 1.0f;

    uint32_t seed = 0;
};

// Engine-backed game minus rendering: input -> step -> score -> reap -> spawn.
// Play stops once the last life is lost; Restart starts over.
class PhysicsSession : public ContactHandler
{
public:
    explicit PhysicsSession(const SessionSettings& settings);
    ~PhysicsSession() override;

    PhysicsSession(const PhysicsSession&) = delete;
    PhysicsSession& operator=(const PhysicsSession&) = delete;

    void Start();
    void Shutdown();

    void Frame(const FrameInput& input, float dt);

    void Restart();

    void SetPaused(bool paused);
    bool Paused() const
    {
        return m_paused;
    }

    bool GameOver() const
    {
        return m_score.gameOver;
    }

    void TogglePhysics();
    void SetGravity(float gravityY);

    // Seconds between spawns at the current game speed.
    float CurrentSpawnInterval() const;

    // Droplet at a random x across the top edge.
    b2BodyId SpawnDroplet();
    b2BodyId SpawnDropletAt(float x, float y);

    const ScoreState& Score() const
    {
        return m_score;
    }

    ScoreSnapshot Snapshot() const
    {
        return dropcatch::Snapshot(m_score);
    }

    b2Vec2 BucketPosition() const
    {
        return m_bodies.BucketPosition();
    }

    std::vector<DropletView> Droplets() const
    {
        return m_bodies.DropletPositions();
    }

    const PhysicsWorld& World() const
    {
        return m_world;
    }

    const BodyLifecycle& Bodies() const
    {
        return m_bodies;
    }

    const SessionSettings& Settings() const
    {
        return m_settings;
    }

    void OnContact(const ContactEvent& event) override;

    static constexpr float kFixedDt = 1.0f / 60.0f;
    static constexpr int kMaxPhysicsStepsPerFrame = 4;

private:
    void UpdateBucket(const FrameInput& input, float dt);
    void UpdateSimulation(float dt);
    void UpdateSpawner(float dt);

    SessionSettings m_settings;
    PhysicsWorld m_world;
    BodyLifecycle m_bodies;
    ScoreState m_score;
    std::mt19937 m_rng;

    float m_accumulator = 0.0f;
    float m_spawnTimer = 0.0f;
    float m_windDirection = 0.0f;
    bool m_paused = false;
};

enum class RuleSet
{
    Reference,
    Production
};

// Drives the pure rule engine and scores its outcome with either rule set.
// This is the rectangle-only "classic" game.
class ReferenceSession
{
public:
    ReferenceSession(uint32_t seed, RuleSet ruleSet, int startingLives = kUnlimitedLives);
    ReferenceSession(const rules::PureGameState& initial, RuleSet ruleSet, int startingLives = kUnlimitedLives);

    void Frame(float dt, int64_t nowNanos, int direction);

    // Clears droplets and score (high score kept); the spawn RNG carries on.
    void Restart();

    void SetPaused(bool paused);
    bool Paused() const
    {
        return m_paused;
    }

    bool GameOver() const
    {
        return m_score.gameOver;
    }

    const rules::PureGameState& State() const
    {
        return m_state;
    }

    const ScoreState& Score() const
    {
        return m_score;
    }

private:
    rules::PureGameState m_state;
    ScoreState m_score;
    RuleSet m_ruleSet;
    int64_t m_lastNanos = 0;
    bool m_paused = false;
};

} // namespace dropcatch
