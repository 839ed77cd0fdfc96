#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "balldrop/components/basic.hpp"
#include "balldrop/components/sim.hpp"
#include "balldrop/core/body.hpp"
#include "balldrop/systems/integrator.hpp"

using namespace Systems;

class IntegratorTest : public ::testing::Test {
protected:
    entt::registry registry;
    IntegratorSystem integrator;
    SystemConfig config;
    entt::entity stateEntity{};

    void SetUp() override {
        stateEntity = registry.create();
        registry.emplace<Components::SimulatorState>(stateEntity);
        integrator.setSystemConfig(config);
        setStep(1.0 / 60.0);
    }

    void setStep(double dt) {
        registry.get<Components::SimulatorState>(stateEntity).lastStep = dt;
    }

    void applyConfig() {
        integrator.setSystemConfig(config);
    }

    // Helper to create a ball
    entt::entity createBall(const Position& pos, const Vector& vel, double friction = 0.1) {
        Body body = makeDefaultBody(pos, Components::BallTypeId::Standard, 0.0);
        body.velocity = vel;
        body.friction = friction;
        return emplaceBody(registry, body);
    }

    const Components::SimulationStats& stats() {
        return registry.get<Components::SimulatorState>(stateEntity).stats;
    }
};

TEST_F(IntegratorTest, SingleStepAppliesGravityThenDrag) {
    auto e = createBall(Position(1.0, 5.0), Vector(0.0, 0.0));
    integrator.update(registry);

    double const dt = 1.0 / 60.0;
    double const vy = (-5.0 * dt) * (1.0 - 0.1 * dt);

    const auto& vel = registry.get<Components::Velocity>(e);
    const auto& pos = registry.get<Components::Position>(e);
    EXPECT_NEAR(vel.y, vy, 1e-12);
    EXPECT_NEAR(pos.y, 5.0 + vy * dt, 1e-12);
    EXPECT_DOUBLE_EQ(pos.x, 1.0);
    EXPECT_DOUBLE_EQ(vel.x, 0.0);
}

TEST_F(IntegratorTest, FreeFallOnlyChangesVerticalAxisAcrossStepSizes) {
    for (double dt : {1.0 / 240.0, 1.0 / 120.0, 1.0 / 60.0, 1.0 / 30.0}) {
        entt::registry local;
        auto state = local.create();
        local.emplace<Components::SimulatorState>(state).lastStep = dt;

        Body body = makeDefaultBody(Position(-2.0, 20.0, 0.25), Components::BallTypeId::Standard, 0.0);
        auto e = emplaceBody(local, body);

        double y = 20.0;
        double vy = 0.0;
        for (int i = 0; i < 30; ++i) {
            integrator.update(local);

            vy = (vy - 5.0 * dt) * (1.0 - body.friction * dt);
            y += vy * dt;
        }

        const auto& pos = local.get<Components::Position>(e);
        const auto& vel = local.get<Components::Velocity>(e);
        EXPECT_DOUBLE_EQ(pos.x, -2.0) << "dt=" << dt;
        EXPECT_DOUBLE_EQ(pos.z, 0.25) << "dt=" << dt;
        EXPECT_DOUBLE_EQ(vel.x, 0.0) << "dt=" << dt;
        EXPECT_DOUBLE_EQ(vel.z, 0.0) << "dt=" << dt;
        EXPECT_NEAR(vel.y, vy, 1e-9) << "dt=" << dt;
        EXPECT_NEAR(pos.y, y, 1e-9) << "dt=" << dt;
    }
}

TEST_F(IntegratorTest, StepIsClampedToMaxTimeStep) {
    auto e = createBall(Position(0.0, 5.0), Vector(0.0, 0.0), 0.0);
    setStep(0.5);
    integrator.update(registry);

    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_NEAR(vel.y, -5.0 / 30.0, 1e-12);
}

TEST_F(IntegratorTest, TerminalVelocityClamp) {
    auto e = createBall(Position(0.0, 5.0), Vector(3.0, -100.0), 0.0);
    integrator.update(registry);

    EXPECT_LE(registry.get<Components::Velocity>(e).length(), 15.0 + 1e-9);
}

TEST_F(IntegratorTest, NonFiniteBodyIsResetToFallback) {
    double const nan = std::numeric_limits<double>::quiet_NaN();
    auto e = createBall(Position(nan, 5.0), Vector(1.0, 1.0));
    integrator.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_DOUBLE_EQ(pos.x, 0.0);
    EXPECT_DOUBLE_EQ(pos.y, 10.0);
    EXPECT_DOUBLE_EQ(vel.length(), 0.0);
    EXPECT_EQ(stats().corruptionResets, 1u);
}

TEST_F(IntegratorTest, FarOutOfBoundsBodyIsResetToFallback) {
    auto e = createBall(Position(100.0, 5.0), Vector(0.0, 0.0));
    integrator.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    EXPECT_DOUBLE_EQ(pos.x, 0.0);
    EXPECT_DOUBLE_EQ(pos.y, 10.0);
    EXPECT_EQ(stats().corruptionResets, 1u);
}

TEST_F(IntegratorTest, ArenaEdgeIsHardClamped) {
    auto e = createBall(Position(7.99, 5.0), Vector(10.0, 0.0));
    integrator.update(registry);

    const auto& pos = registry.get<Components::Position>(e);
    const auto& vel = registry.get<Components::Velocity>(e);
    EXPECT_DOUBLE_EQ(pos.x, 8.0);
    EXPECT_LE(vel.x, 0.0);
    EXPECT_EQ(stats().boundsClamps, 1u);
    EXPECT_EQ(stats().corruptionResets, 0u);
}

TEST_F(IntegratorTest, SlowBodyFallsAsleep) {
    config.Gravity = Vector(0.0, 0.0, 0.0);
    applyConfig();

    auto e = createBall(Position(0.0, 5.0), Vector(0.005, 0.0));
    integrator.update(registry);

    EXPECT_TRUE(registry.get<Components::Sleep>(e).asleep);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(e).length(), 0.0);
}

TEST_F(IntegratorTest, FallingBodyStaysAwake) {
    auto e = createBall(Position(0.0, 5.0), Vector(0.0, 0.0));
    integrator.update(registry);

    EXPECT_FALSE(registry.get<Components::Sleep>(e).asleep);
}

TEST_F(IntegratorTest, SleepingBodyIsNotIntegrated) {
    auto e = createBall(Position(0.0, 5.0), Vector(0.0, 0.0));
    registry.get<Components::Sleep>(e).asleep = true;

    for (int i = 0; i < 10; ++i) {
        integrator.update(registry);
    }

    EXPECT_DOUBLE_EQ(registry.get<Components::Position>(e).y, 5.0);
    EXPECT_DOUBLE_EQ(registry.get<Components::Velocity>(e).y, 0.0);
}
