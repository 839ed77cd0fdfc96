/**
 * @file multiplier_tower.hpp
 * @brief Declaration of the MultiplierTowerLevel class
 */

#pragma once

#include <vector>
#include "balldrop/scenarios/i_level.hpp"

/**
 * @struct MultiplierTowerConfig
 * @brief Layout parameters for the multiplier tower
 */
struct MultiplierTowerConfig {
    // One gate per entry, top to bottom
    std::vector<int> multipliers = {2, 3, 2};
    double firstGateY = 6.0;
    double gateSpacingY = 3.5;
    double gateHalfWidth = 2.5;
    double gateHalfHeight = 0.5;

    double funnelAngleDegrees = 35.0;
    double funnelOffsetX = 4.5;

    double sideWallX = 7.75;
    double goalY = -7.0;
    std::size_t maxBodies = 4096;
};

/**
 * @class MultiplierTowerLevel
 *
 * A column of multiplying gates, each with a pair of funnel walls above it
 * steering balls back to the center, ending in a full-width goal.
 */
class MultiplierTowerLevel : public ILevel {
public:
    MultiplierTowerLevel() = default;
    ~MultiplierTowerLevel() override = default;

    LevelSystemConfig getSystemsConfig() const override;
    LevelGeometry buildGeometry() const override;
    Position dropOrigin() const override;

private:
    MultiplierTowerConfig layout;
};
