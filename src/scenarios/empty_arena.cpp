#include "balldrop/scenarios/empty_arena.hpp"

#include "balldrop/core/constants.hpp"

LevelSystemConfig EmptyArenaLevel::getSystemsConfig() const {
    LevelSystemConfig config;
    config.sharedConfig.SecondsPerTick = 1.0 / SimulatorConstants::StepsPerSecond;
    // Nothing to catch the balls, so let them fall to the arena floor
    config.sharedConfig.KillPlaneY = -49.0;
    return config;
}

LevelGeometry EmptyArenaLevel::buildGeometry() const {
    return LevelGeometry{};
}

Position EmptyArenaLevel::dropOrigin() const {
    return Position(0.0, 10.0, 0.0);
}
