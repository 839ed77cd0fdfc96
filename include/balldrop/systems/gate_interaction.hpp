/**
 * @file gate_interaction.hpp
 * @brief Trigger gates: multiplication and scoring
 *
 * Every checkInterval ticks each awake ball is tested against the level's
 * gates in list order. The first time a ball is found inside a gate the
 * gate's bit is set in its GateTracker and:
 * - multiplier == 1 (goal): a ScoreEvent is emitted and the ball is staged
 *   for destruction; no further gates are tested for it.
 * - multiplier >= 2: multiplier - 1 clones are spawned above the ball, each
 *   carrying its type, scoring fields, lifetime and updated gate mask, and a
 *   MultiplyEvent reports how many were actually created. Clones that would
 *   exceed the body ceiling are never built; they are reported in one
 *   SpawnDroppedEvent.
 *
 * Clones are created after the scan, so none of them is tested in the tick
 * that produced it.
 */

#ifndef GATE_INTERACTION_SYSTEM_HPP
#define GATE_INTERACTION_SYSTEM_HPP

#include <cstdint>
#include <random>
#include <entt/entt.hpp>

#include "balldrop/core/level.hpp"
#include "balldrop/core/spawner.hpp"
#include "balldrop/systems/i_system.hpp"

namespace Systems {

struct GateConfig {
    // Gates are tested on ticks where tickIndex % checkInterval == 0
    int checkInterval = 3;

    // Clone x offset is uniform in +-cloneSpread * radius
    double cloneSpread = 3.0;

    // Clone i is placed cloneStackSpacing * radius * (i + 1) above the ball
    double cloneStackSpacing = 2.2;

    // Clone starting x velocity as a fraction of its x offset
    double cloneVelocityScale = 0.5;

    // Adds the ball's multiplierBoost to a multiplying gate's multiplier
    bool applyMultiplierBoost = false;
};

class GateInteractionSystem : public ConfigurableSystem<GateConfig> {
public:
    /**
     * @param gates Gate table of the loaded level; must outlive this system
     * @param spawner Creates the clones
     * @param dispatcher Receives ScoreEvent and MultiplyEvent
     */
    GateInteractionSystem(const GateTable& gates, Spawner& spawner, entt::dispatcher& dispatcher);
    ~GateInteractionSystem() override = default;

    void update(entt::registry& registry) override;

    /**
     * @brief Also reseeds the clone placement generator from RandomSeed
     */
    void setSystemConfig(const SystemConfig& config) override;

    /**
     * @brief True if gates are tested on this tick
     */
    bool isCheckTick(std::uint64_t tickIndex) const;

    /**
     * @brief Gate multiplier plus the optional boost, kept within [1, MaxBodies + 1]
     */
    std::int64_t effectiveMultiplier(int gateMultiplier, double boost) const;

private:
    const GateTable& gates;
    Spawner& spawner;
    entt::dispatcher& dispatcher;
    std::mt19937 rng;
};

} // namespace Systems

#endif
