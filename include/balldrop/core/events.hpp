/**
 * @file events.hpp
 * @brief Events the core emits to outside collaborators
 *
 * Delivered through an entt::dispatcher owned by the simulator. Passes only
 * enqueue; the simulator flushes once the tick (or spawn call) is complete.
 */

#pragma once

#include <cstddef>
#include <entt/entt.hpp>
#include "balldrop/components/basic.hpp"

using BodyHandle = entt::entity;

enum class SpawnOrigin {
    Drop,       // explicit request from the drop input
    GateClone   // multiplication at a gate
};

enum class SpawnStatus {
    Ok,
    UnknownType,
    NoLevelLoaded,
    InvalidPosition,
    CapacityExceeded
};

const char* spawnStatusName(SpawnStatus status);
const char* destroyReasonName(Components::DestroyReason reason);

/// A ball reached a goal gate. The consumer converts it to currency.
struct ScoreEvent {
    Components::BallTypeId typeId;
    double pointsMultiplier;
};

/// Telemetry for UI; spawning itself is internal.
struct MultiplyEvent {
    int gateInstanceId;
    int spawnedCount;
};

struct BodySpawnedEvent {
    BodyHandle handle;
    Components::BallTypeId typeId;
    SpawnOrigin origin;
};

struct BodyDestroyedEvent {
    BodyHandle handle;
    Components::DestroyReason reason;
};

/// Spawns refused because the body ceiling was reached.
struct SpawnDroppedEvent {
    SpawnOrigin origin;
    SpawnStatus status;
    std::size_t count = 1;
};
