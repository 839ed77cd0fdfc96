#ifndef BALLDROP_CONSTANTS_H
#define BALLDROP_CONSTANTS_H

#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The built-in levels. Each maps to a scenario class.
     */
    enum class LevelType {
        EMPTY_ARENA,
        RAMP_CASCADE,
        MULTIPLIER_TOWER
    };

    extern const double Pi;

    // Default ball properties (the dropper's settings)
    extern const double DefaultBallRadius;
    extern const double DefaultBallMass;
    extern const double DefaultBallRestitution;
    extern const double DefaultBallFriction;
    extern const double DefaultSleepThreshold;
    extern const double DefaultMaxLifetime;

    // Restitution of a wall when the level authoring does not give one
    extern const double DefaultWallRestitution;

    extern const unsigned int StepsPerSecond;

    std::vector<LevelType> getAllLevels();
    std::string getLevelName(LevelType level);
}

#endif // BALLDROP_CONSTANTS_H
