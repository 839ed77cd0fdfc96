/**
 * @file body.hpp
 * @brief The body store: one ECS entity per simulated ball
 *
 * A ball is an entity carrying Position, Velocity, Radius, Mass, Material,
 * Sleep, BallType, GateTracker and Lifetime. This header defines the value
 * snapshot collaborators read, the per-type defaults, and the helpers that
 * create and read those entities.
 */

#pragma once

#include <optional>
#include <entt/entt.hpp>

#include "balldrop/components/basic.hpp"
#include "balldrop/components/sim.hpp"
#include "balldrop/core/events.hpp"

/**
 * @brief Value snapshot of every field of one ball
 */
struct Body {
    Position position;
    Vector velocity;
    double radius = 0.17;
    double mass = 1.0;
    double restitution = 0.3;
    double friction = 0.1;
    bool asleep = false;
    double sleepThreshold = 0.015;
    Components::BallTypeId typeId = Components::BallTypeId::Standard;
    double pointsMultiplier = 1.0;
    double multiplierBoost = 0.0;
    Components::GateMask hitGatesMask;
    double spawnTime = 0.0;
    double maxLifetime = 30.0;
};

/**
 * @brief Scoring traits of a ball type
 */
struct BallTypeTraits {
    double pointsMultiplier;
    double multiplierBoost;
};

/**
 * @brief True if @p type names one of the known ball types
 */
bool isKnownBallType(Components::BallTypeId type);

/**
 * @brief Default scoring traits per type
 *
 * Standard x1, BonusPoints x2, MultiplierBoost x1 with +1 gate boost,
 * Lucky x5, Harmful x-1.
 */
BallTypeTraits ballTypeTraits(Components::BallTypeId type);

/**
 * @brief A fully specified body of the given type with the dropper's defaults
 */
Body makeDefaultBody(const Position& position, Components::BallTypeId type, double now);

/**
 * @brief Creates the entity and its components. Performs no validation.
 */
BodyHandle emplaceBody(entt::registry& registry, const Body& body);

/**
 * @brief Snapshot of a live ball, or nullopt if @p handle is not one
 */
std::optional<Body> readBody(const entt::registry& registry, BodyHandle handle);

/**
 * @brief Number of live balls, including ones staged for destruction
 */
std::size_t countBodies(const entt::registry& registry);

/**
 * @brief The singleton simulator state, or nullptr if the registry has none
 */
Components::SimulatorState* findSimulatorState(entt::registry& registry);
const Components::SimulatorState* findSimulatorState(const entt::registry& registry);

/**
 * @brief Destroys every ball tagged PendingDestroy in one batch
 *
 * Enqueues a BodyDestroyedEvent per ball and updates the per-reason counters.
 * Must not be called while any view over the balls is being iterated.
 *
 * @return Number of balls destroyed
 */
std::size_t destroyPendingBodies(entt::registry& registry, entt::dispatcher& dispatcher);
