/**
 * @file ramp_cascade.hpp
 * @brief Declaration of the RampCascadeLevel class
 */

#pragma once

#include "balldrop/scenarios/i_level.hpp"

/**
 * @struct RampCascadeConfig
 * @brief Layout parameters for the ramp cascade
 */
struct RampCascadeConfig {
    int rampCount = 3;
    double rampHalfLength = 3.0;
    double rampHalfThickness = 0.15;
    double rampAngleDegrees = 25.0;     // alternates sign ramp to ramp
    double rampOffsetX = 2.5;
    double topRampY = 6.0;
    double rampSpacingY = 3.0;

    double sideWallX = 7.75;
    double sideWallHalfHeight = 14.0;

    int doublerMultiplier = 2;
    double goalY = -6.5;
    double wallRestitution = 0.3;
};

/**
 * @class RampCascadeLevel
 *
 * Alternating ramps zig-zag the balls down between two side walls. A x2
 * gate sits under the top ramp and a goal spans the arena at the bottom.
 */
class RampCascadeLevel : public ILevel {
public:
    RampCascadeLevel() = default;
    ~RampCascadeLevel() override = default;

    LevelSystemConfig getSystemsConfig() const override;
    LevelGeometry buildGeometry() const override;
    Position dropOrigin() const override;

private:
    RampCascadeConfig layout;
};
