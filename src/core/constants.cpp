#include "balldrop/core/constants.hpp"

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;

    const double DefaultBallRadius      = 0.17;
    const double DefaultBallMass        = 1.0;
    const double DefaultBallRestitution = 0.3;
    const double DefaultBallFriction    = 0.1;
    const double DefaultSleepThreshold  = 0.015;
    const double DefaultMaxLifetime     = 30.0;

    const double DefaultWallRestitution = 0.3;

    const unsigned int StepsPerSecond = 60;

    std::vector<LevelType> getAllLevels() {
        return {
            LevelType::EMPTY_ARENA,
            LevelType::RAMP_CASCADE,
            LevelType::MULTIPLIER_TOWER
        };
    }

    std::string getLevelName(LevelType level) {
        switch (level) {
            case LevelType::EMPTY_ARENA:      return "EMPTY_ARENA";
            case LevelType::RAMP_CASCADE:     return "RAMP_CASCADE";
            case LevelType::MULTIPLIER_TOWER: return "MULTIPLIER_TOWER";
            default: return "UNKNOWN";
        }
    }

} // namespace SimulatorConstants
