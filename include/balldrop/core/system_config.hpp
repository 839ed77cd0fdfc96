#pragma once

#include <cstddef>
#include <cstdint>
#include "balldrop/math/vector_math.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all system configuration parameters for the simulation.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / 60.0;
    double MaxTimeStep = 1.0 / 30.0;       // dt is clamped to this on frame hitches

    Vector Gravity = Vector(0.0, -5.0, 0.0);
    double TerminalVelocity = 15.0;

    // Hard clamp applied after integration
    Position ArenaMin = Position(-8.0, -50.0, -1.0);
    Position ArenaMax = Position(8.0, 50.0, 1.0);

    // Beyond this on x or y a body is treated as corrupted and reset
    double CorruptionLimit = 50.0;
    Position FallbackPosition = Position(0.0, 10.0, 0.0);

    double KillPlaneY = -10.0;

    std::size_t MaxBodies = 8192;
    std::uint32_t RandomSeed = 1337;
};
