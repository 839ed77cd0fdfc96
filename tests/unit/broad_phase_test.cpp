#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include "balldrop/components/basic.hpp"
#include "balldrop/components/sim.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/systems/collision/broad_phase_system.hpp"
#include "balldrop/systems/collision/spatial_hash.hpp"

using namespace Systems;

class BroadPhaseTest : public ::testing::Test {
protected:
    entt::registry registry;
    BroadPhaseSystem broadPhase;
    entt::entity stateEntity{};

    void SetUp() override {
        stateEntity = registry.create();
        registry.emplace<Components::SimulatorState>(stateEntity);
    }

    entt::entity createBall(const Position& pos, const Vector& vel = Vector(),
                            double radius = 0.17, bool asleep = false) {
        Body body = makeDefaultBody(pos, Components::BallTypeId::Standard, 0.0);
        body.velocity = vel;
        body.radius = radius;
        body.asleep = asleep;
        return emplaceBody(registry, body);
    }

    const Position& pos(entt::entity e) { return registry.get<Components::Position>(e); }
    const Vector& vel(entt::entity e) { return registry.get<Components::Velocity>(e); }

    double totalOverlap() {
        std::vector<std::pair<Position, double>> all;
        auto view = registry.view<Components::Position, Components::Radius>();
        for (auto [e, p, r] : view.each()) {
            all.emplace_back(p, r.value);
        }
        double sum = 0.0;
        for (std::size_t i = 0; i < all.size(); ++i) {
            for (std::size_t j = i + 1; j < all.size(); ++j) {
                double const gap = all[i].first.dist(all[j].first) - all[i].second - all[j].second;
                if (gap < 0.0) {
                    sum -= gap;
                }
            }
        }
        return sum;
    }
};

TEST(SpatialHashTest, NeighbourhoodCoversAdjacentCells) {
    SpatialHash grid(1.0);
    grid.insert(0, Position(0.5, 0.5));
    grid.insert(1, Position(1.5, -0.5));
    grid.insert(2, Position(3.5, 0.5));

    std::vector<std::size_t> found;
    grid.queryNeighbourhood(Position(0.9, 0.1), found);

    ASSERT_EQ(found.size(), 2u);
    EXPECT_NE(std::find(found.begin(), found.end(), 0u), found.end());
    EXPECT_NE(std::find(found.begin(), found.end(), 1u), found.end());
}

TEST(SpatialHashTest, NegativeCoordinatesGetDistinctCells) {
    SpatialHash grid(1.0);
    EXPECT_NE(grid.cellKey(Position(-0.5, 0.5)), grid.cellKey(Position(0.5, 0.5)));
    EXPECT_NE(grid.cellKey(Position(0.5, -0.5)), grid.cellKey(Position(0.5, 0.5)));
    EXPECT_EQ(grid.cellKey(Position(0.1, 0.9)), grid.cellKey(Position(0.9, 0.1)));
}

TEST_F(BroadPhaseTest, OverlappingPairIsPushedApartSymmetrically) {
    auto a = createBall(Position(0.0, 0.0));
    auto b = createBall(Position(0.3, 0.0));

    broadPhase.update(registry);

    double const push = 0.04 * 0.5 * 1.01;
    EXPECT_NEAR(pos(a).x, -push, 1e-12);
    EXPECT_NEAR(pos(b).x, 0.3 + push, 1e-12);
    EXPECT_DOUBLE_EQ(pos(a).y, 0.0);
    EXPECT_EQ(registry.get<Components::SimulatorState>(stateEntity).stats.pairContacts, 1u);
}

TEST_F(BroadPhaseTest, PushIsCappedByRadius) {
    auto a = createBall(Position(0.0, 0.0));
    auto b = createBall(Position(0.1, 0.0));

    broadPhase.update(registry);

    double const cap = 0.17 * 0.2 * 1.01;
    EXPECT_NEAR(pos(a).x, -cap, 1e-12);
    EXPECT_NEAR(pos(b).x, 0.1 + cap, 1e-12);
}

TEST_F(BroadPhaseTest, ApproachingVelocityIsSoftened) {
    auto a = createBall(Position(0.0, 0.0), Vector(1.0, 0.0));
    auto b = createBall(Position(0.3, 0.0), Vector(-1.0, 0.0));

    broadPhase.update(registry);

    EXPECT_NEAR(vel(a).x, 0.0, 1e-12);
    EXPECT_NEAR(vel(b).x, 0.0, 1e-12);
}

TEST_F(BroadPhaseTest, SeparatingVelocityIsKept) {
    auto a = createBall(Position(0.0, 0.0), Vector(-1.0, 0.0));
    auto b = createBall(Position(0.3, 0.0), Vector(1.0, 0.0));

    broadPhase.update(registry);

    EXPECT_DOUBLE_EQ(vel(a).x, -1.0);
    EXPECT_DOUBLE_EQ(vel(b).x, 1.0);
}

TEST_F(BroadPhaseTest, DistantBodiesAreUntouched) {
    auto a = createBall(Position(0.0, 0.0));
    auto b = createBall(Position(0.5, 0.0));

    broadPhase.update(registry);

    EXPECT_DOUBLE_EQ(pos(a).x, 0.0);
    EXPECT_DOUBLE_EQ(pos(b).x, 0.5);
}

TEST_F(BroadPhaseTest, PairAcrossCellBoundaryIsResolved) {
    auto a = createBall(Position(0.70, 0.74));
    auto b = createBall(Position(0.80, 0.76));

    broadPhase.update(registry);

    EXPECT_LT(pos(a).x, 0.70);
    EXPECT_GT(pos(b).x, 0.80);
}

TEST_F(BroadPhaseTest, SleepingBodyIsPushedAndWokenButPushesNothing) {
    auto awake = createBall(Position(0.0, 0.0));
    auto sleeper = createBall(Position(0.3, 0.0), Vector(), 0.17, true);

    broadPhase.update(registry);

    EXPECT_FALSE(registry.get<Components::Sleep>(sleeper).asleep);
    EXPECT_NEAR(pos(sleeper).x, 0.3 + 0.04 * 0.5 * 1.01, 1e-12);
    EXPECT_DOUBLE_EQ(pos(awake).x, 0.0);
    EXPECT_EQ(broadPhase.lastInsertedCount(), 1u);
}

TEST_F(BroadPhaseTest, SleepingPairStaysAsleep) {
    auto a = createBall(Position(0.0, 0.0), Vector(), 0.17, true);
    auto b = createBall(Position(0.1, 0.0), Vector(), 0.17, true);

    broadPhase.update(registry);

    EXPECT_TRUE(registry.get<Components::Sleep>(a).asleep);
    EXPECT_TRUE(registry.get<Components::Sleep>(b).asleep);
    EXPECT_DOUBLE_EQ(pos(a).x, 0.0);
    EXPECT_DOUBLE_EQ(pos(b).x, 0.1);
    EXPECT_EQ(broadPhase.lastInsertedCount(), 0u);
}

TEST_F(BroadPhaseTest, CellSizeGrowsWithLargestAwakeRadius) {
    createBall(Position(0.0, 0.0), Vector(), 0.17);
    broadPhase.update(registry);
    EXPECT_DOUBLE_EQ(broadPhase.lastCellSize(), 0.75);

    createBall(Position(5.0, 0.0), Vector(), 1.0);
    broadPhase.update(registry);
    EXPECT_DOUBLE_EQ(broadPhase.lastCellSize(), 2.0);
}

TEST_F(BroadPhaseTest, LargeBodiesInNonAdjacentMinimumCellsStillCollide) {
    auto a = createBall(Position(0.0, 0.0), Vector(), 1.0);
    auto b = createBall(Position(1.9, 0.0), Vector(), 1.0);

    broadPhase.update(registry);

    EXPECT_LT(pos(a).x, 0.0);
    EXPECT_GT(pos(b).x, 1.9);
}

TEST_F(BroadPhaseTest, CoincidentBodiesSeparateVertically) {
    auto a = createBall(Position(1.0, 1.0));
    auto b = createBall(Position(1.0, 1.0));

    broadPhase.update(registry);

    EXPECT_DOUBLE_EQ(pos(a).x, 1.0);
    EXPECT_DOUBLE_EQ(pos(b).x, 1.0);
    EXPECT_NE(pos(a).y, pos(b).y);
    EXPECT_NEAR(std::fabs(pos(a).y - pos(b).y), 2.0 * 0.17 * 0.2 * 1.01, 1e-12);
}

TEST_F(BroadPhaseTest, RepeatedPassesReduceCrowding) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> coord(-2.0, 2.0);
    for (int i = 0; i < 100; ++i) {
        createBall(Position(coord(rng), coord(rng)));
    }

    double const before = totalOverlap();
    for (int i = 0; i < 40; ++i) {
        broadPhase.update(registry);
    }
    double const after = totalOverlap();

    EXPECT_GT(before, 0.0);
    EXPECT_LT(after, before);

    auto view = registry.view<Components::Position>();
    for (auto e : view) {
        EXPECT_TRUE(view.get<Components::Position>(e).isFinite());
    }
}
