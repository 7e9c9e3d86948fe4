#include "dropcatch/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace dropcatch
{

PhysicsSession::PhysicsSession(const SessionSettings& settings)
    : m_settings(settings), m_bodies(m_world), m_rng(settings.seed)
{
}

PhysicsSession::~PhysicsSession()
{
    Shutdown();
}

void PhysicsSession::Start()
{
    m_world.Initialize(m_settings.gravity);
    m_world.SetContactHandler(this);
    m_bodies.CreateBoundaries(m_settings.worldWidthPx, m_settings.worldHeightPx, m_settings.boundaryThicknessPx);
    m_bodies.CreateBucket(m_settings.worldWidthPx * 0.5f, m_settings.bucketYPx, m_settings.bucketWidthPx, m_settings.bucketHeightPx);

    m_score = InitialScore(0, m_settings.startingLives);
    m_accumulator = 0.0f;
    m_spawnTimer = 0.0f;
    m_paused = false;
}

void PhysicsSession::Shutdown()
{
    if (!m_world.IsInitialized()) return;
    m_world.SetContactHandler(nullptr);
    m_world.Teardown();
    m_bodies.Reset();
}

void PhysicsSession::Frame(const FrameInput& input, float dt)
{
    dt = std::max(0.0f, dt);

    // The clock and combo banner keep running while paused.
    m_score = Tick(m_score, dt);
    if (m_paused || m_score.gameOver) return;

    // Applied once per physics step, see UpdateSimulation.
    m_windDirection = 0.0f;
    if (input.windLeft) m_windDirection -= 1.0f;
    if (input.windRight) m_windDirection += 1.0f;

    UpdateBucket(input, dt);
    UpdateSimulation(dt);
    UpdateSpawner(dt);
}

void PhysicsSession::UpdateBucket(const FrameInput& input, float dt)
{
    b2Vec2 pos = m_bodies.BucketPosition();
    float x = pos.x;
    if (input.moveRight) x += m_settings.bucketSpeedPx * dt;
    if (input.moveLeft) x -= m_settings.bucketSpeedPx * dt;
    if (input.pointerPx) x = input.pointerPx->x;

    const float halfW = m_settings.bucketWidthPx * 0.5f;
    x = std::clamp(x, halfW, m_settings.worldWidthPx - halfW);
    if (x != pos.x)
    {
        m_bodies.MoveBucket(x, m_settings.bucketYPx);
    }
}

void PhysicsSession::UpdateSimulation(float dt)
{
    m_accumulator += dt;
    float maxAccum = kFixedDt * static_cast<float>(kMaxPhysicsStepsPerFrame);
    if (m_accumulator > maxAccum) m_accumulator = maxAccum;

    int steps = 0;
    while (m_accumulator >= kFixedDt && steps < kMaxPhysicsStepsPerFrame)
    {
        // Box2D clears accumulated forces at the end of every step.
        if (m_windDirection != 0.0f) m_world.ApplyWind(m_windDirection * m_settings.windForce);
        m_world.Step(kFixedDt, m_settings.subSteps);
        m_bodies.ReapRemoved();
        m_accumulator -= kFixedDt;
        ++steps;
    }
}

void PhysicsSession::UpdateSpawner(float dt)
{
    m_spawnTimer += dt;
    if (m_spawnTimer > CurrentSpawnInterval())
    {
        m_spawnTimer = 0.0f;
        SpawnDroplet();
    }
}

float PhysicsSession::CurrentSpawnInterval() const
{
    return m_settings.spawnInterval / std::max(1.0f, m_score.gameSpeed);
}

b2BodyId PhysicsSession::SpawnDroplet()
{
    const float r = m_settings.dropletRadiusPx;
    std::uniform_real_distribution<float> spawnX(r, std::max(r, m_settings.worldWidthPx - r));
    return SpawnDropletAt(spawnX(m_rng), m_settings.worldHeightPx);
}

b2BodyId PhysicsSession::SpawnDropletAt(float x, float y)
{
    return m_bodies.SpawnDroplet(x, y, m_settings.dropletRadiusPx);
}

void PhysicsSession::Restart()
{
    m_bodies.ClearDroplets();
    m_score = dropcatch::Restart(m_score);
    m_accumulator = 0.0f;
    m_spawnTimer = 0.0f;
    m_windDirection = 0.0f;
    m_paused = false;
    spdlog::info("Game restarted (high score {})", m_score.highScore);
}

void PhysicsSession::SetPaused(bool paused)
{
    if (m_paused == paused) return;
    m_paused = paused;
    spdlog::info(m_paused ? "Game paused" : "Game resumed");
}

void PhysicsSession::TogglePhysics()
{
    m_world.SetEnabled(!m_world.Enabled());
}

void PhysicsSession::SetGravity(float gravityY)
{
    m_world.SetGravity(gravityY);
    m_settings.gravity = gravityY;
}

void PhysicsSession::OnContact(const ContactEvent& event)
{
    if (event.kind == ContactKind::Missed)
    {
        m_score = OnMissed(m_score);
        if (m_score.gameOver)
        {
            spdlog::info("Game over! Final score: {}", m_score.score);
        }
        return;
    }

    m_score = OnCaught(m_score);
    switch (CelebrationFor(m_score))
    {
        case Celebration::AmazingCombo:
            spdlog::info("AMAZING COMBO x{}!", m_score.comboCount);
            break;
        case Celebration::GreatCombo:
            spdlog::info("GREAT COMBO x{}!", m_score.comboCount);
            break;
        case Celebration::Milestone:
            spdlog::info("Score milestone: {}", m_score.score);
            break;
        case Celebration::None:
            break;
    }
}

ReferenceSession::ReferenceSession(uint32_t seed, RuleSet ruleSet, int startingLives)
    : ReferenceSession(rules::CreateGameState(seed), ruleSet, startingLives)
{
}

ReferenceSession::ReferenceSession(const rules::PureGameState& initial, RuleSet ruleSet, int startingLives)
    : m_state(initial), m_score(InitialScore(0, startingLives)), m_ruleSet(ruleSet)
{
}

void ReferenceSession::Frame(float dt, int64_t nowNanos, int direction)
{
    m_score = Tick(m_score, dt);
    m_lastNanos = nowNanos;
    if (m_paused || m_score.gameOver) return;

    rules::StepOutcome outcome;
    m_state = rules::Step(m_state, dt, nowNanos, direction, outcome);

    const bool reference = (m_ruleSet == RuleSet::Reference);
    for (rules::DropResult result : outcome.results)
    {
        if (result == rules::DropResult::Caught)
        {
            m_score = reference ? OnReferenceCatch(m_score) : OnCaught(m_score);
        }
        else
        {
            m_score = reference ? OnReferenceMiss(m_score) : OnMissed(m_score);
        }
        if (m_score.gameOver)
        {
            spdlog::info("Game over! Final score: {}", m_score.score);
            break;
        }
    }
}

void ReferenceSession::Restart()
{
    rules::PureGameState fresh;
    fresh.rng = m_state.rng;
    fresh.lastSpawnNanos = m_lastNanos;
    m_state = std::move(fresh);
    m_score = dropcatch::Restart(m_score);
    m_paused = false;
    spdlog::info("Classic game restarted (high score {})", m_score.highScore);
}

void ReferenceSession::SetPaused(bool paused)
{
    if (m_paused == paused) return;
    m_paused = paused;
    spdlog::info(m_paused ? "Game paused" : "Game resumed");
}

} // namespace dropcatch
