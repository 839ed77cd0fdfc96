/**
 * @file broad_phase_system.hpp
 * @brief Ball versus ball overlap resolution through a uniform spatial hash
 *
 * Awake bodies are bucketed into a grid rebuilt every tick. Each body then
 * scans its own cell and the eight around it and resolves overlaps against
 * what it finds. Sleeping bodies are not inserted, so they never push
 * anything, but they still scan the grid and are pushed (and woken) by awake
 * neighbours.
 *
 * All reads go to a snapshot taken before the scan and every body writes only
 * its own result, so the scan is safe to split across workers by index range.
 */

#ifndef BROAD_PHASE_SYSTEM_HPP
#define BROAD_PHASE_SYSTEM_HPP

#include <entt/entt.hpp>
#include "balldrop/systems/collision/spatial_hash.hpp"
#include "balldrop/systems/i_system.hpp"

namespace Systems {

struct BroadPhaseConfig {
    // Minimum cell size; grown to twice the largest awake radius when needed
    double cellSize = 0.75;

    // Fraction of the overlap each body resolves per tick
    double penetrationFraction = 0.5;

    // Push cap as a fraction of the body's own radius
    double maxPushFraction = 0.2;

    double overshoot = 1.01;

    // Fraction of the approaching normal velocity each body removes
    double velocitySoftness = 0.5;
};

class BroadPhaseSystem : public ConfigurableSystem<BroadPhaseConfig> {
public:
    BroadPhaseSystem() = default;
    ~BroadPhaseSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Cell size used by the most recent update
     */
    double lastCellSize() const { return grid.getCellSize(); }

    /**
     * @brief Number of bodies inserted into the grid by the most recent update
     */
    std::size_t lastInsertedCount() const { return grid.size(); }

private:
    SpatialHash grid;
};

} // namespace Systems

#endif
