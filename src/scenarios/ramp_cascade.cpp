#include "balldrop/scenarios/ramp_cascade.hpp"

#include <initializer_list>

#include "balldrop/core/constants.hpp"

LevelSystemConfig RampCascadeLevel::getSystemsConfig() const {
    LevelSystemConfig config;
    config.sharedConfig.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;
    config.sharedConfig.KillPlaneY = -10.0;
    return config;
}

LevelGeometry RampCascadeLevel::buildGeometry() const {
    LevelGeometry geometry;

    for (int i = 0; i < layout.rampCount; ++i) {
        // Even ramps lean down to the right, odd ramps down to the left
        double const side = (i % 2 == 0) ? -1.0 : 1.0;

        ObstacleRecord ramp;
        ramp.center = Position(side * layout.rampOffsetX, layout.topRampY - i * layout.rampSpacingY, 0.0);
        ramp.halfExtents = Vector(layout.rampHalfLength, layout.rampHalfThickness, 1.0);
        ramp.rotation = Quaternion::fromRollDegrees(side * layout.rampAngleDegrees);
        ramp.restitution = layout.wallRestitution;
        geometry.obstacles.push_back(ramp);
    }

    for (double side : {-1.0, 1.0}) {
        ObstacleRecord wall;
        wall.center = Position(side * layout.sideWallX, 0.0, 0.0);
        wall.halfExtents = Vector(0.25, layout.sideWallHalfHeight, 1.0);
        wall.restitution = layout.wallRestitution;
        geometry.obstacles.push_back(wall);
    }

    // Doubler just right of the top ramp's low end
    GateRecord doubler;
    doubler.bounds = AABB::fromCenterExtents(Position(1.5, layout.topRampY - 1.5, 0.0),
                                             Vector(1.0, 0.5, 1.0));
    doubler.multiplier = layout.doublerMultiplier;
    doubler.instanceId = 0;
    geometry.gates.push_back(doubler);

    GateRecord goal;
    goal.bounds = AABB::fromCenterExtents(Position(0.0, layout.goalY, 0.0),
                                          Vector(layout.sideWallX - 0.25, 0.5, 1.0));
    goal.multiplier = 1;
    goal.instanceId = 1;
    geometry.gates.push_back(goal);

    return geometry;
}

Position RampCascadeLevel::dropOrigin() const {
    return Position(-layout.rampOffsetX, layout.topRampY + 3.0, 0.0);
}
