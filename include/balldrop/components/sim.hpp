#pragma once

#include <cstdint>

namespace Components {

    /**
     * @brief Running counters, reset on level load
     */
    struct SimulationStats {
        std::uint64_t ticks = 0;
        std::uint64_t ignoredTicks = 0;       // non-finite or non-positive dt
        std::uint64_t corruptionResets = 0;   // NaN/Inf or far out of bounds
        std::uint64_t boundsClamps = 0;
        std::uint64_t spawned = 0;
        std::uint64_t droppedSpawns = 0;      // capacity ceiling reached
        std::uint64_t rejectedSpawns = 0;     // invalid requests
        std::uint64_t destroyedExpired = 0;
        std::uint64_t destroyedKillPlane = 0;
        std::uint64_t scored = 0;
        std::uint64_t multiplications = 0;
        std::uint64_t wallContacts = 0;
        std::uint64_t pairContacts = 0;
    };

    /**
     * @brief Singleton simulation clock, stored on its own entity
     */
    struct SimulatorState {
        double elapsedTime = 0.0;
        double lastStep = 0.0;   // clamped dt used by the current tick
        std::uint64_t tickIndex = 0;
        SimulationStats stats;
    };
}
