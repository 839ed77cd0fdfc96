#include <gtest/gtest.h>
#include <cmath>
#include <random>

#include "balldrop/components/basic.hpp"
#include "balldrop/components/sim.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/systems/collision/wall_collision_system.hpp"

using namespace Systems;

namespace {

ObstacleRecord makeBox(const Position& center, const Vector& half, double rollDegrees = 0.0,
                       double restitution = 0.3) {
    ObstacleRecord rec;
    rec.center = center;
    rec.halfExtents = half;
    rec.rotation = Quaternion::fromRollDegrees(rollDegrees);
    rec.restitution = restitution;
    return rec;
}

} // namespace

class WallCollisionTest : public ::testing::Test {
protected:
    entt::registry registry;
    entt::entity stateEntity{};

    void SetUp() override {
        stateEntity = registry.create();
        registry.emplace<Components::SimulatorState>(stateEntity);
    }

    entt::entity createBall(const Position& pos, const Vector& vel, double radius = 0.17) {
        Body body = makeDefaultBody(pos, Components::BallTypeId::Standard, 0.0);
        body.velocity = vel;
        body.radius = radius;
        return emplaceBody(registry, body);
    }
};

TEST_F(WallCollisionTest, SphereAboveFloorTouches) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallContact c = WallCollisionSystem::testSphere(cache.obstacles()[0], Position(0.0, 0.6), 0.17);

    EXPECT_TRUE(c.touching);
    EXPECT_NEAR(c.penetration, 0.07, 1e-12);
    EXPECT_NEAR(c.worldNormal.y, 1.0, 1e-12);
    EXPECT_NEAR(c.worldNormal.x, 0.0, 1e-12);
}

TEST_F(WallCollisionTest, SphereClearOfFloorDoesNotTouch) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallContact c = WallCollisionSystem::testSphere(cache.obstacles()[0], Position(0.0, 0.8), 0.17);

    EXPECT_FALSE(c.touching);
    EXPECT_NEAR(WallCollisionSystem::surfaceDistance(cache.obstacles()[0], Position(0.0, 0.8), 0.17),
                0.13, 1e-12);
}

TEST_F(WallCollisionTest, CenterInsideBoxUsesNearestFace) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(0.25, 5.0, 1.0))});
    const auto& wall = cache.obstacles()[0];

    WallContact c = WallCollisionSystem::testSphere(wall, Position(0.2, 1.0), 0.17);
    EXPECT_TRUE(c.touching);
    EXPECT_NEAR(c.worldNormal.x, 1.0, 1e-12);
    EXPECT_NEAR(WallCollisionSystem::surfaceDistance(wall, Position(0.2, 1.0), 0.17), -0.22, 1e-12);
}

TEST_F(WallCollisionTest, ShallowContactPushesOutAndReflects) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallCollisionSystem walls(cache);

    auto e = createBall(Position(0.0, 0.6), Vector(0.0, -2.0));
    walls.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_NEAR(pos.y, 0.6 + 0.07 * 1.1, 1e-12);
    EXPECT_NEAR(vel.y, 0.6, 1e-12);   // -2 reflected with restitution 0.3
    EXPECT_NEAR(vel.x, 0.0, 1e-12);
    EXPECT_EQ(registry.get<Components::SimulatorState>(stateEntity).stats.wallContacts, 1u);
}

TEST_F(WallCollisionTest, DeepContactIsCappedAndHalved) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallCollisionSystem walls(cache);

    auto e = createBall(Position(0.0, 0.52), Vector(0.0, -2.0));
    walls.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_NEAR(pos.y, 0.52 + 0.17 * 0.5 * 1.1, 1e-12);
    EXPECT_NEAR(vel.y, 0.3, 1e-12);
}

TEST_F(WallCollisionTest, TangentialVelocityLosesFrictionFraction) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallCollisionSystem walls(cache);

    auto e = createBall(Position(0.0, 0.6), Vector(1.0, -2.0));
    walls.update(registry);

    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_NEAR(vel.x, 1.0 - 0.02 * 0.1, 1e-12);
    EXPECT_NEAR(vel.y, 0.6, 1e-12);
}

TEST_F(WallCollisionTest, SeparatingBodyKeepsVelocity) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallCollisionSystem walls(cache);

    auto e = createBall(Position(0.0, 0.6), Vector(0.5, 1.0));
    walls.update(registry);

    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_DOUBLE_EQ(vel.x, 0.5);
    EXPECT_DOUBLE_EQ(vel.y, 1.0);
    EXPECT_GT(registry.get<Components::Position>(e).y, 0.6);
}

TEST_F(WallCollisionTest, RampPushesAlongRotatedNormal) {
    ObstacleCache cache({makeBox(Position(1.0, 2.0), Vector(3.0, 0.2, 1.0), 45.0)});
    WallCollisionSystem walls(cache);
    const auto& ramp = cache.obstacles()[0];

    Vector const normal(-std::sqrt(0.5), std::sqrt(0.5), 0.0);
    Position const start = Position(1.0, 2.0) + normal * (0.2 + 0.17 - 0.05);

    auto e = createBall(start, Vector(0.0, -3.0));
    walls.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    Vector const moved = pos - start;
    EXPECT_NEAR(moved.x, normal.x * 0.05 * 1.1, 1e-9);
    EXPECT_NEAR(moved.y, normal.y * 0.05 * 1.1, 1e-9);
    EXPECT_GE(WallCollisionSystem::surfaceDistance(ramp, pos, 0.17), -1e-9);

    // Reflected off the ramp: no longer moving into it
    EXPECT_GE(registry.get<Components::Velocity>(e).dotProduct(normal), 0.0);
}

TEST_F(WallCollisionTest, SleepingBodiesAreSkipped) {
    ObstacleCache cache({makeBox(Position(0.0, 0.0), Vector(5.0, 0.5, 1.0))});
    WallCollisionSystem walls(cache);

    auto e = createBall(Position(0.0, 0.6), Vector(0.0, 0.0));
    registry.get<Components::Sleep>(e).asleep = true;
    walls.update(registry);

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(e).y, 0.6);
    EXPECT_TRUE(registry.get<Components::Sleep>(e).asleep);
}

TEST_F(WallCollisionTest, NonPenetrationFuzzIncludingRamps) {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> angle(-45.0, 45.0);
    std::uniform_int_distribution<int> pick(0, 5);

    double const r = 0.17;

    for (int trial = 0; trial < 600; ++trial) {
        entt::registry local;
        local.emplace<Components::SimulatorState>(local.create());

        double roll = 0.0;
        switch (trial % 3) {
            case 0: roll = 45.0; break;
            case 1: roll = -45.0; break;
            default: roll = angle(rng); break;
        }

        Vector const half(0.5 + 2.5 * unit(rng), 0.1 + 0.4 * unit(rng), 1.0);
        ObstacleCache cache({makeBox(Position(unit(rng) * 4.0 - 2.0, unit(rng) * 4.0 - 2.0),
                                     half, roll)});
        const auto& box = cache.obstacles()[0];

        // Choose the closest point on the box and an outward direction from it
        Vector closest(half.x * (2.0 * unit(rng) - 1.0), half.y * (2.0 * unit(rng) - 1.0), 0.0);
        Vector outward;
        switch (pick(rng)) {
            case 0: closest.x = half.x;  outward = Vector(1.0, 0.0, 0.0); break;
            case 1: closest.x = -half.x; outward = Vector(-1.0, 0.0, 0.0); break;
            case 2: closest.y = half.y;  outward = Vector(0.0, 1.0, 0.0); break;
            case 3: closest.y = -half.y; outward = Vector(0.0, -1.0, 0.0); break;
            case 4:
                closest = Vector(half.x, half.y, 0.0);
                outward = Vector(1.0, 1.0, 0.0).normalized();
                break;
            default:
                closest = Vector(-half.x, half.y, 0.0);
                outward = Vector(-1.0 + 0.5 * unit(rng), 1.0, 0.0).normalized();
                break;
        }

        double const penetration = 0.5 * r * (0.01 + 0.99 * unit(rng));
        Vector const local_center = closest + outward * (r - penetration);
        Position const start = box.center + box.toWorld(local_center);

        Body body = makeDefaultBody(start, Components::BallTypeId::Standard, 0.0);
        body.velocity = Vector(4.0 * unit(rng) - 2.0, -6.0 * unit(rng), 0.0);
        auto e = emplaceBody(local, body);

        ASSERT_LT(WallCollisionSystem::surfaceDistance(box, start, r), 0.0) << "trial " << trial;

        WallCollisionSystem walls(cache);
        walls.update(local);

        const auto& pos = local.get<Components::Position>(e);
        EXPECT_GE(WallCollisionSystem::surfaceDistance(box, pos, r), -1e-9)
            << "trial " << trial << " roll " << roll;
    }
}
