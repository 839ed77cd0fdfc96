#include "balldrop/scenarios/multiplier_tower.hpp"

#include <initializer_list>

#include "balldrop/core/constants.hpp"

LevelSystemConfig MultiplierTowerLevel::getSystemsConfig() const {
    LevelSystemConfig config;
    config.sharedConfig.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;
    config.sharedConfig.MaxBodies = layout.maxBodies;
    return config;
}

LevelGeometry MultiplierTowerLevel::buildGeometry() const {
    LevelGeometry geometry;
    int nextId = 0;

    for (std::size_t i = 0; i < layout.multipliers.size(); ++i) {
        double const gateY = layout.firstGateY - static_cast<double>(i) * layout.gateSpacingY;

        for (double side : {-1.0, 1.0}) {
            ObstacleRecord funnel;
            funnel.center = Position(side * layout.funnelOffsetX, gateY + 1.25, 0.0);
            funnel.halfExtents = Vector(2.0, 0.15, 1.0);
            // Left wall falls toward +x, right wall toward -x
            funnel.rotation = Quaternion::fromRollDegrees(-side * layout.funnelAngleDegrees);
            funnel.restitution = SimulatorConstants::DefaultWallRestitution;
            geometry.obstacles.push_back(funnel);
        }

        GateRecord gate;
        gate.bounds = AABB::fromCenterExtents(Position(0.0, gateY, 0.0),
                                              Vector(layout.gateHalfWidth, layout.gateHalfHeight, 1.0));
        gate.multiplier = layout.multipliers[i];
        gate.instanceId = nextId++;
        geometry.gates.push_back(gate);
    }

    for (double side : {-1.0, 1.0}) {
        ObstacleRecord wall;
        wall.center = Position(side * layout.sideWallX, 0.0, 0.0);
        wall.halfExtents = Vector(0.25, 14.0, 1.0);
        wall.restitution = SimulatorConstants::DefaultWallRestitution;
        geometry.obstacles.push_back(wall);
    }

    GateRecord goal;
    goal.bounds = AABB::fromCenterExtents(Position(0.0, layout.goalY, 0.0),
                                          Vector(layout.sideWallX - 0.25, 0.5, 1.0));
    goal.multiplier = 1;
    goal.instanceId = nextId;
    geometry.gates.push_back(goal);

    return geometry;
}

Position MultiplierTowerLevel::dropOrigin() const {
    return Position(0.0, layout.firstGateY + 4.0, 0.0);
}
