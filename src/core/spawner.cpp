#include "balldrop/core/spawner.hpp"

#include <cmath>

#include "balldrop/core/debug.hpp"

Spawner::Spawner(entt::registry& registry, entt::dispatcher& dispatcher)
    : registry(registry), dispatcher(dispatcher) {}

bool Spawner::atCapacity() const {
  return remainingCapacity() == 0;
}

std::size_t Spawner::remainingCapacity() const {
  std::size_t const live = countBodies(registry);
  return live >= sysConfig.MaxBodies ? 0 : sysConfig.MaxBodies - live;
}

double Spawner::now() const {
  const auto* state = findSimulatorState(registry);
  return state != nullptr ? state->elapsedTime : 0.0;
}

SpawnResult Spawner::spawn(const SpawnRequest& request) {
  if (!levelLoaded) {
    return reject(SpawnStatus::NoLevelLoaded, SpawnOrigin::Drop);
  }
  if (!isKnownBallType(request.type)) {
    return reject(SpawnStatus::UnknownType, SpawnOrigin::Drop);
  }
  const Position& p = request.position;
  if (!p.isFinite() || !request.velocity.isFinite() ||
      std::fabs(p.x) > sysConfig.CorruptionLimit ||
      std::fabs(p.y) > sysConfig.CorruptionLimit) {
    return reject(SpawnStatus::InvalidPosition, SpawnOrigin::Drop);
  }
  if (atCapacity()) {
    return reject(SpawnStatus::CapacityExceeded, SpawnOrigin::Drop);
  }

  Body body = makeDefaultBody(p, request.type, now());
  body.velocity = request.velocity;
  return create(body, SpawnOrigin::Drop);
}

SpawnResult Spawner::spawnClone(const Body& body) {
  if (!levelLoaded) {
    return reject(SpawnStatus::NoLevelLoaded, SpawnOrigin::GateClone);
  }
  if (atCapacity()) {
    return reject(SpawnStatus::CapacityExceeded, SpawnOrigin::GateClone);
  }
  return create(body, SpawnOrigin::GateClone);
}

void Spawner::dropClones(std::size_t count) {
  if (count > 0) {
    reject(SpawnStatus::CapacityExceeded, SpawnOrigin::GateClone, count);
  }
}

SpawnResult Spawner::create(const Body& body, SpawnOrigin origin) {
  SpawnResult result;
  result.handle = emplaceBody(registry, body);
  result.status = SpawnStatus::Ok;

  if (auto* state = findSimulatorState(registry)) {
    ++state->stats.spawned;
  }
  dispatcher.enqueue<BodySpawnedEvent>(BodySpawnedEvent{result.handle, body.typeId, origin});
  return result;
}

SpawnResult Spawner::reject(SpawnStatus status, SpawnOrigin origin, std::size_t count) {
  auto* state = findSimulatorState(registry);

  if (status == SpawnStatus::CapacityExceeded) {
    if (state != nullptr) {
      state->stats.droppedSpawns += count;
    }
    dispatcher.enqueue<SpawnDroppedEvent>(SpawnDroppedEvent{origin, status, count});
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Spawner] dropped " << count << " spawn(s) at ceiling of "
              << sysConfig.MaxBodies << " bodies\n");
  } else {
    if (state != nullptr) {
      ++state->stats.rejectedSpawns;
    }
    WARN_MSG("Spawner", "rejected spawn: " << spawnStatusName(status));
  }

  SpawnResult result;
  result.status = status;
  return result;
}
