#include <gtest/gtest.h>
#include <random>
#include <vector>

#include "balldrop/core/simulator.hpp"
#include "balldrop/core/spawn_queue.hpp"

class SpawnQueueTest : public ::testing::Test {
protected:
    DropSimulator simulator;
    SpawnQueue queue;

    void SetUp() override {
        simulator.loadLevel(LevelGeometry{});
    }

    static SpawnRequest at(double x, double y) {
        SpawnRequest r;
        r.position = Position(x, y);
        return r;
    }
};

TEST_F(SpawnQueueTest, DrainRespectsRateAndOrder) {
    for (int i = 0; i < 5; ++i) {
        queue.enqueue(at(static_cast<double>(i), 5.0));
    }

    DrainResult first = queue.drain(simulator, 2);
    EXPECT_EQ(first.spawned, 2u);
    EXPECT_EQ(queue.size(), 3u);
    ASSERT_EQ(first.handles.size(), 2u);
    EXPECT_DOUBLE_EQ(simulator.getBody(first.handles[0])->position.x, 0.0);
    EXPECT_DOUBLE_EQ(simulator.getBody(first.handles[1])->position.x, 1.0);

    DrainResult rest = queue.drain(simulator, 10);
    EXPECT_EQ(rest.spawned, 3u);
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(simulator.liveBodyCount(), 5u);
}

TEST_F(SpawnQueueTest, FailedRequestsAreConsumedAndCounted) {
    SpawnRequest bad = at(0.0, 5.0);
    bad.type = static_cast<Components::BallTypeId>(99);
    queue.enqueue(bad);
    queue.enqueue(at(0.0, 5.0));

    DrainResult result = queue.drain(simulator, 5);
    EXPECT_EQ(result.rejected, 1u);
    EXPECT_EQ(result.spawned, 1u);
    EXPECT_TRUE(queue.empty());
}

TEST_F(SpawnQueueTest, CeilingDropsAreTallied) {
    LevelSystemConfig config;
    config.sharedConfig.MaxBodies = 3;
    simulator.loadLevel(LevelGeometry{}, config);

    for (int i = 0; i < 5; ++i) {
        queue.enqueue(at(0.0, static_cast<double>(i)));
    }
    DrainResult result = queue.drain(simulator, 5);

    EXPECT_EQ(result.spawned, 3u);
    EXPECT_EQ(result.dropped, 2u);
    EXPECT_EQ(simulator.stats().droppedSpawns, 2u);
}

TEST_F(SpawnQueueTest, DropBatchJitterStaysNearOrigin) {
    std::mt19937 rng(3);
    std::vector<Components::BallTypeId> types = {
        Components::BallTypeId::Standard, Components::BallTypeId::Lucky,
        Components::BallTypeId::Harmful, Components::BallTypeId::BonusPoints};

    auto batch = makeDropBatch(Position(1.0, 9.0), types, 0.2, rng);

    ASSERT_EQ(batch.size(), types.size());
    for (std::size_t i = 0; i < batch.size(); ++i) {
        EXPECT_EQ(batch[i].type, types[i]);
        EXPECT_GE(batch[i].position.x, 1.0 - 0.6);
        EXPECT_LE(batch[i].position.x, 1.0 + 0.6);
        EXPECT_GE(batch[i].position.y, 9.0);
        EXPECT_LE(batch[i].position.y, 9.1);
        EXPECT_DOUBLE_EQ(batch[i].velocity.length(), 0.0);
    }
}
