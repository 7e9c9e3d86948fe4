#include "dropcatch/body_lifecycle.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace dropcatch;

namespace
{

class BodyLifecycleTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        world.Initialize(kDefaultGravityY);
    }

    PhysicsWorld world;
    BodyLifecycle bodies{world};
};

} // namespace

TEST_F(BodyLifecycleTest, SpawnedDropletStartsWhereAsked)
{
    b2BodyId drop = bodies.SpawnDroplet(123.0f, 456.0f, 32.0f);
    b2Vec2 pos = world.BodyPosition(drop);
    EXPECT_NEAR(pos.x, 123.0f, 1e-3f);
    EXPECT_NEAR(pos.y, 456.0f, 1e-3f);

    b2Vec2 vel = world.BodyVelocity(drop);
    EXPECT_NEAR(vel.x, 0.0f, 1e-4f);
    EXPECT_NEAR(vel.y, -ToPixels(kDropletInitialSpeed), 1e-3f);

    ASSERT_TRUE(world.Role(drop).has_value());
    EXPECT_EQ(*world.Role(drop), BodyRole::Droplet);

    auto views = bodies.DropletPositions();
    ASSERT_EQ(views.size(), 1u);
    EXPECT_FLOAT_EQ(views[0].radiusPx, 32.0f);
}

TEST_F(BodyLifecycleTest, BoundariesAreGroundAndTwoWalls)
{
    bodies.CreateBoundaries(800.0f, 500.0f, 10.0f);
    const auto& boxes = bodies.Boundaries();
    ASSERT_EQ(boxes.size(), 3u);

    EXPECT_EQ(boxes[0].role, BodyRole::Ground);
    EXPECT_FLOAT_EQ(boxes[0].centerPx.y + boxes[0].halfHeightPx, 0.0f);
    EXPECT_FLOAT_EQ(boxes[0].halfWidthPx, 400.0f);

    EXPECT_EQ(boxes[1].role, BodyRole::Wall);
    EXPECT_FLOAT_EQ(boxes[1].centerPx.x + boxes[1].halfWidthPx, 0.0f);
    EXPECT_EQ(boxes[2].role, BodyRole::Wall);
    EXPECT_FLOAT_EQ(boxes[2].centerPx.x - boxes[2].halfWidthPx, 800.0f);

    EXPECT_EQ(world.BodyCount(), 3u);
    EXPECT_THROW(bodies.CreateBoundaries(800.0f, 500.0f, 10.0f), std::logic_error);
}

TEST_F(BodyLifecycleTest, BucketIsCreatedOnceAndMoves)
{
    EXPECT_FALSE(bodies.HasBucket());
    b2BodyId bucket = bodies.CreateBucket(400.0f, 50.0f, 64.0f, 64.0f);
    EXPECT_TRUE(bodies.HasBucket());
    EXPECT_EQ(b2Body_GetType(bucket), b2_kinematicBody);
    EXPECT_FLOAT_EQ(bodies.BucketWidth(), 64.0f);
    EXPECT_FLOAT_EQ(bodies.BucketHeight(), 64.0f);
    EXPECT_THROW(bodies.CreateBucket(100.0f, 50.0f, 64.0f, 64.0f), std::logic_error);

    bodies.MoveBucket(250.0f, 50.0f);
    b2Vec2 pos = bodies.BucketPosition();
    EXPECT_NEAR(pos.x, 250.0f, 1e-3f);
    EXPECT_NEAR(pos.y, 50.0f, 1e-3f);
}

TEST_F(BodyLifecycleTest, ReapOnlyRemovesMarkedDroplets)
{
    b2BodyId a = bodies.SpawnDroplet(100.0f, 300.0f, 32.0f);
    b2BodyId b = bodies.SpawnDroplet(300.0f, 300.0f, 32.0f);
    b2BodyId c = bodies.SpawnDroplet(500.0f, 300.0f, 32.0f);
    EXPECT_EQ(bodies.DropletCount(), 3u);

    world.MarkForRemoval(b);
    EXPECT_EQ(bodies.ReapRemoved(), 1);
    EXPECT_EQ(bodies.DropletCount(), 2u);
    EXPECT_TRUE(b2Body_IsValid(a));
    EXPECT_FALSE(b2Body_IsValid(b));
    EXPECT_TRUE(b2Body_IsValid(c));

    auto ids = bodies.DropletIds();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(BodyKey(ids[0]), BodyKey(a));
    EXPECT_EQ(BodyKey(ids[1]), BodyKey(c));
}

TEST_F(BodyLifecycleTest, ClearDropletsKeepsStaticBodies)
{
    bodies.CreateBoundaries(800.0f, 500.0f, 10.0f);
    bodies.CreateBucket(400.0f, 50.0f, 64.0f, 64.0f);
    for (int i = 0; i < 5; ++i)
    {
        bodies.SpawnDroplet(100.0f + 100.0f * static_cast<float>(i), 400.0f, 32.0f);
    }
    EXPECT_EQ(world.BodyCount(), 9u);

    bodies.ClearDroplets();
    EXPECT_EQ(bodies.DropletCount(), 0u);
    EXPECT_TRUE(bodies.DropletPositions().empty());
    EXPECT_EQ(world.BodyCount(), 4u);
    EXPECT_TRUE(bodies.HasBucket());
}

TEST_F(BodyLifecycleTest, SpawnOutsideTheWorldIsAccepted)
{
    bodies.CreateBoundaries(800.0f, 500.0f, 10.0f);
    b2BodyId drop = b2_nullBodyId;
    EXPECT_NO_THROW(drop = bodies.SpawnDroplet(-5000.0f, 9000.0f, 32.0f));
    ASSERT_TRUE(b2Body_IsValid(drop));
    EXPECT_NEAR(world.BodyPosition(drop).x, -5000.0f, 1e-1f);
    EXPECT_EQ(bodies.DropletCount(), 1u);
}
