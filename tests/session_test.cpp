#include "dropcatch/session.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dropcatch;

namespace
{

constexpr float kFrameDt = 1.0f / 60.0f;

SessionSettings QuietSettings()
{
    SessionSettings settings;
    settings.spawnInterval = 10.0f;
    settings.seed = 1234;
    return settings;
}

void RunFrames(PhysicsSession& session, int frames, const FrameInput& input = FrameInput())
{
    for (int i = 0; i < frames; ++i)
    {
        session.Frame(input, kFrameDt);
    }
}

} // namespace

TEST(PhysicsSession, StartBuildsWorld)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    EXPECT_TRUE(session.World().IsInitialized());
    EXPECT_EQ(session.Bodies().Boundaries().size(), 3u);
    EXPECT_TRUE(session.Bodies().HasBucket());
    EXPECT_NEAR(session.BucketPosition().x, 400.0f, 1e-3f);
    EXPECT_NEAR(session.BucketPosition().y, 50.0f, 1e-3f);
    EXPECT_EQ(session.Score().score, 0);

    session.Shutdown();
    EXPECT_FALSE(session.World().IsInitialized());
    EXPECT_EQ(PhysicsWorld::ActiveWorldCount(), 0);
}

TEST(PhysicsSession, SpawnsOnInterval)
{
    SessionSettings settings;
    settings.seed = 7;
    PhysicsSession session(settings);
    session.Start();

    RunFrames(session, 50);
    EXPECT_EQ(session.Bodies().DropletCount(), 0u);

    RunFrames(session, 20);
    ASSERT_EQ(session.Bodies().DropletCount(), 1u);
    auto drops = session.Droplets();
    ASSERT_EQ(drops.size(), 1u);
    EXPECT_GE(drops[0].positionPx.x, settings.dropletRadiusPx);
    EXPECT_LE(drops[0].positionPx.x, settings.worldWidthPx - settings.dropletRadiusPx);
}

TEST(PhysicsSession, CatchScoresAndRemovesDroplet)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    session.SpawnDropletAt(400.0f, 200.0f);

    RunFrames(session, 120);
    EXPECT_EQ(session.Score().score, 10);
    EXPECT_EQ(session.Score().dropsCaught, 1);
    EXPECT_EQ(session.Score().comboCount, 1);
    EXPECT_EQ(session.Bodies().DropletCount(), 0u);
}

TEST(PhysicsSession, MissResetsCombo)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    session.SpawnDropletAt(400.0f, 200.0f);
    RunFrames(session, 120);
    ASSERT_EQ(session.Score().comboCount, 1);

    session.SpawnDropletAt(100.0f, 200.0f);
    RunFrames(session, 120);
    EXPECT_EQ(session.Score().dropsMissed, 1);
    EXPECT_EQ(session.Score().comboCount, 0);
    EXPECT_EQ(session.Score().multiplier, 1);
    EXPECT_EQ(session.Score().score, 10);
    EXPECT_EQ(session.Bodies().DropletCount(), 0u);

    auto accuracy = session.Snapshot().accuracy;
    ASSERT_TRUE(accuracy.has_value());
    EXPECT_FLOAT_EQ(*accuracy, 50.0f);
}

TEST(PhysicsSession, BucketStaysInsideWorld)
{
    PhysicsSession session(QuietSettings());
    session.Start();

    FrameInput left;
    left.moveLeft = true;
    RunFrames(session, 120, left);
    EXPECT_NEAR(session.BucketPosition().x, 32.0f, 1e-3f);

    FrameInput pointer;
    pointer.pointerPx = b2Vec2{10000.0f, 0.0f};
    RunFrames(session, 1, pointer);
    EXPECT_NEAR(session.BucketPosition().x, 768.0f, 1e-3f);
    EXPECT_NEAR(session.BucketPosition().y, 50.0f, 1e-3f);

    FrameInput right;
    right.moveRight = true;
    RunFrames(session, 10, right);
    EXPECT_NEAR(session.BucketPosition().x, 768.0f, 1e-3f);
}

TEST(PhysicsSession, PauseFreezesPlayButNotClock)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    b2BodyId drop = session.SpawnDropletAt(200.0f, 300.0f);
    b2Vec2 before = session.World().BodyPosition(drop);

    session.SetPaused(true);
    EXPECT_TRUE(session.Paused());
    RunFrames(session, 30);

    b2Vec2 after = session.World().BodyPosition(drop);
    EXPECT_FLOAT_EQ(after.x, before.x);
    EXPECT_FLOAT_EQ(after.y, before.y);
    EXPECT_NEAR(session.Score().gameTime, 0.5f, 1e-3f);

    session.SetPaused(false);
    RunFrames(session, 5);
    EXPECT_LT(session.World().BodyPosition(drop).y, before.y);
}

TEST(PhysicsSession, RestartKeepsHighScore)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    session.SpawnDropletAt(400.0f, 200.0f);
    RunFrames(session, 120);
    ASSERT_EQ(session.Score().score, 10);

    session.SpawnDropletAt(600.0f, 400.0f);
    session.SetPaused(true);
    session.Restart();

    EXPECT_FALSE(session.Paused());
    EXPECT_EQ(session.Score().score, 0);
    EXPECT_EQ(session.Score().highScore, 10);
    EXPECT_FLOAT_EQ(session.Score().gameTime, 0.0f);
    EXPECT_EQ(session.Bodies().DropletCount(), 0u);
    EXPECT_TRUE(session.Bodies().HasBucket());
}

TEST(PhysicsSession, TogglePhysicsAndGravity)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    b2BodyId drop = session.SpawnDropletAt(200.0f, 300.0f);

    session.TogglePhysics();
    EXPECT_FALSE(session.World().Enabled());
    RunFrames(session, 10);
    EXPECT_FLOAT_EQ(session.World().BodyPosition(drop).y, 300.0f);

    session.TogglePhysics();
    EXPECT_TRUE(session.World().Enabled());

    session.SetGravity(-2.0f);
    EXPECT_FLOAT_EQ(session.World().Gravity(), -2.0f);
    EXPECT_FLOAT_EQ(session.Settings().gravity, -2.0f);
}

TEST(PhysicsSession, SecondSessionCannotStartWhileFirstRuns)
{
    PhysicsSession first(QuietSettings());
    first.Start();
    PhysicsSession second(QuietSettings());
    EXPECT_THROW(second.Start(), std::logic_error);
    first.Shutdown();
    EXPECT_NO_THROW(second.Start());
}

TEST(ReferenceSession, ReferenceRulesTrackPureScore)
{
    ReferenceSession session(42, RuleSet::Reference);
    const int directions[] = {1, 1, 1, 0, -1, -1, -1, 0};
    for (int i = 0; i < 1200; ++i)
    {
        int64_t now = static_cast<int64_t>(i) * rules::kSimulationFrameNanos;
        session.Frame(rules::kSimulationDt, now, directions[(i / 20) % 8]);
    }
    EXPECT_EQ(session.Score().score, session.State().score);
    EXPECT_EQ(session.Score().dropsCaught, session.State().score);
    EXPECT_EQ(session.Score().multiplier, 1);
}

TEST(ReferenceSession, ProductionRulesCountSameCatches)
{
    ReferenceSession reference(42, RuleSet::Reference);
    ReferenceSession production(42, RuleSet::Production);
    for (int i = 0; i < 1200; ++i)
    {
        int64_t now = static_cast<int64_t>(i) * rules::kSimulationFrameNanos;
        int dir = (i / 30) % 2 == 0 ? 1 : -1;
        reference.Frame(rules::kSimulationDt, now, dir);
        production.Frame(rules::kSimulationDt, now, dir);
    }
    EXPECT_EQ(production.Score().dropsCaught, reference.Score().dropsCaught);
    EXPECT_EQ(production.Score().dropsMissed, reference.Score().dropsMissed);
    EXPECT_GE(production.Score().score, 10 * production.Score().dropsCaught);
}

TEST(PhysicsSession, WindDoesNotDependOnFrameRate)
{
    auto windVelocity = [](float frameDt, int frames) {
        SessionSettings settings = QuietSettings();
        settings.gravity = 0.0f;
        PhysicsSession session(settings);
        session.Start();
        b2BodyId drop = session.SpawnDropletAt(200.0f, 300.0f);

        FrameInput wind;
        wind.windRight = true;
        for (int i = 0; i < frames; ++i)
        {
            session.Frame(wind, frameDt);
        }
        return session.World().BodyVelocity(drop).x;
    };

    // Half a second of wind either way.
    float slow = windVelocity(1.0f / 30.0f, 15);
    float fast = windVelocity(1.0f / 120.0f, 60);
    EXPECT_GT(slow, 0.0f);
    EXPECT_NEAR(slow, fast, 1e-3f);
}

TEST(PhysicsSession, LastMissEndsGameUntilRestart)
{
    SessionSettings settings = QuietSettings();
    settings.startingLives = 1;
    PhysicsSession session(settings);
    session.Start();
    EXPECT_EQ(session.Score().lives, 1);

    session.SpawnDropletAt(100.0f, 200.0f);
    RunFrames(session, 120);
    ASSERT_TRUE(session.GameOver());
    EXPECT_EQ(session.Score().lives, 0);

    b2BodyId frozen = session.SpawnDropletAt(600.0f, 300.0f);
    RunFrames(session, 30);
    EXPECT_FLOAT_EQ(session.World().BodyPosition(frozen).y, 300.0f);
    EXPECT_NEAR(session.Score().gameTime, 2.5f, 1e-2f);

    session.Restart();
    EXPECT_FALSE(session.GameOver());
    EXPECT_EQ(session.Score().lives, 1);
    EXPECT_EQ(session.Bodies().DropletCount(), 0u);
}

TEST(PhysicsSession, CatchesShortenSpawnInterval)
{
    PhysicsSession session(QuietSettings());
    session.Start();
    EXPECT_FLOAT_EQ(session.CurrentSpawnInterval(), 10.0f);

    session.SpawnDropletAt(400.0f, 200.0f);
    RunFrames(session, 120);
    ASSERT_EQ(session.Score().dropsCaught, 1);
    EXPECT_NEAR(session.CurrentSpawnInterval(), 10.0f / 1.01f, 1e-4f);
}

TEST(ReferenceSession, ReplaysMissThenCatchInOrder)
{
    rules::PureGameState initial = rules::CreateGameState(3);
    initial.droplets.push_back(rules::Rect{700.0f, -60.0f, rules::kDropletWidth, rules::kDropletHeight});
    initial.droplets.push_back(rules::Rect{initial.bucketX, 100.0f, rules::kDropletWidth, rules::kDropletHeight});

    ReferenceSession session(initial, RuleSet::Production);
    session.Frame(0.05f, 0, 0);

    EXPECT_EQ(session.Score().dropsMissed, 1);
    EXPECT_EQ(session.Score().dropsCaught, 1);
    EXPECT_EQ(session.Score().comboCount, 1);
    EXPECT_EQ(session.Score().score, 10);
}

TEST(ReferenceSession, LivesPauseAndRestart)
{
    rules::PureGameState initial = rules::CreateGameState(5);
    initial.droplets.push_back(rules::Rect{700.0f, -60.0f, rules::kDropletWidth, rules::kDropletHeight});
    initial.droplets.push_back(rules::Rect{0.0f, -62.0f, rules::kDropletWidth, rules::kDropletHeight});

    ReferenceSession session(initial, RuleSet::Production, 2);
    session.Frame(0.05f, 0, 0);
    ASSERT_TRUE(session.GameOver());
    EXPECT_EQ(session.Score().lives, 0);

    rules::PureGameState before = session.State();
    session.Frame(0.05f, 3 * rules::kOneSecondNanos, 1);
    EXPECT_TRUE(session.State() == before);

    session.Restart();
    EXPECT_FALSE(session.GameOver());
    EXPECT_EQ(session.Score().lives, 2);
    EXPECT_TRUE(session.State().droplets.empty());

    session.SetPaused(true);
    session.Frame(0.05f, 5 * rules::kOneSecondNanos, 1);
    EXPECT_FLOAT_EQ(session.State().bucketX, before.bucketX);
    EXPECT_TRUE(session.State().droplets.empty());

    session.SetPaused(false);
    session.Frame(0.05f, 6 * rules::kOneSecondNanos, 1);
    EXPECT_GT(session.State().bucketX, before.bucketX);
    EXPECT_EQ(session.State().droplets.size(), 1u);
}
