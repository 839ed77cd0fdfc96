/**
 * @fileoverview simulator.cpp
 * @brief Implementation of DropSimulator.
 */

#include "balldrop/core/simulator.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "balldrop/components/sim.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"
#include "balldrop/systems/collision/broad_phase_system.hpp"
#include "balldrop/systems/collision/wall_collision_system.hpp"
#include "balldrop/systems/gate_interaction.hpp"
#include "balldrop/systems/integrator.hpp"
#include "balldrop/systems/lifecycle.hpp"

DropSimulator::DropSimulator() : spawner(registry, dispatcher) {
  auto stateEntity = registry.create();
  registry.emplace<Components::SimulatorState>(stateEntity);
}

DropSimulator::~DropSimulator() = default;

Components::SimulatorState& DropSimulator::state() {
  return *findSimulatorState(registry);
}

const Components::SimulatorState& DropSimulator::state() const {
  return *findSimulatorState(registry);
}

void DropSimulator::createSystems() {
  systems.clear();

  auto integrator = std::make_unique<Systems::IntegratorSystem>();
  integrator->setSpecificConfig(currentConfig.integratorConfig);

  auto walls = std::make_unique<Systems::WallCollisionSystem>(obstacleCache);
  walls->setSpecificConfig(currentConfig.wallConfig);

  auto broadPhase = std::make_unique<Systems::BroadPhaseSystem>();
  broadPhase->setSpecificConfig(currentConfig.broadPhaseConfig);

  auto gates = std::make_unique<Systems::GateInteractionSystem>(gateTable, spawner, dispatcher);
  gates->setSpecificConfig(currentConfig.gateConfig);

  systems.push_back(std::move(integrator));
  systems.push_back(std::move(walls));
  systems.push_back(std::move(broadPhase));
  systems.push_back(std::move(gates));
  systems.push_back(std::make_unique<Systems::LifecycleSystem>(dispatcher));

  // Configure all systems
  for (auto& system : systems) {
    system->setSystemConfig(currentConfig.sharedConfig);
  }
}

void DropSimulator::loadLevel(const LevelGeometry& geometry, const LevelSystemConfig& config) {
  // Build first so a bad level throws before the running one is touched
  ObstacleCache obstacles(geometry.obstacles);
  GateTable gates(geometry.gates, config.sharedConfig.MaxBodies);

  if (levelLoaded) {
    unloadLevel();
  }

  currentGeometry = geometry;
  currentConfig = config;
  obstacleCache = std::move(obstacles);
  gateTable = std::move(gates);
  state() = Components::SimulatorState{};

  spawner.setSystemConfig(currentConfig.sharedConfig);
  spawner.setLevelLoaded(true);
  createSystems();
  levelLoaded = true;

  DEBUG_MSG(DEBUG_LEVEL_BASIC, "[DropSimulator] loaded level with " << obstacleCache.size()
            << " walls and " << gateTable.size() << " gates\n");
}

void DropSimulator::loadLevel(const ILevel& level) {
  loadLevel(level.buildGeometry(), level.getSystemsConfig());
}

void DropSimulator::unloadLevel() {
  auto balls = registry.view<Components::BallType>();
  std::vector<entt::entity> live(balls.begin(), balls.end());
  for (auto entity : live) {
    registry.emplace_or_replace<Components::PendingDestroy>(
        entity, Components::PendingDestroy{Components::DestroyReason::LevelUnloaded});
  }
  destroyPendingBodies(registry, dispatcher);
  dispatcher.update();

  systems.clear();
  obstacleCache = ObstacleCache();
  gateTable = GateTable();
  spawner.setLevelLoaded(false);
  levelLoaded = false;
  state() = Components::SimulatorState{};
}

void DropSimulator::reset() {
  if (!levelLoaded) {
    return;
  }
  LevelGeometry const geometry = currentGeometry;
  LevelSystemConfig const config = currentConfig;
  loadLevel(geometry, config);
}

SpawnResult DropSimulator::spawnBody(const Position& position, Components::BallTypeId type) {
  SpawnRequest request;
  request.position = position;
  request.type = type;
  return spawnBody(request);
}

SpawnResult DropSimulator::spawnBody(const SpawnRequest& request) {
  SpawnResult const result = spawner.spawn(request);
  dispatcher.update();
  return result;
}

void DropSimulator::tick(double dt) {
  PROFILE_SCOPE("DropSimulator::tick");

  auto& simState = state();
  if (!std::isfinite(dt) || dt <= 0.0) {
    ++simState.stats.ignoredTicks;
    WARN_MSG("DropSimulator", "ignoring tick with dt " << dt);
    return;
  }
  if (!levelLoaded) {
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[DropSimulator] tick with no level loaded\n");
    return;
  }

  simState.lastStep = std::min(dt, currentConfig.sharedConfig.MaxTimeStep);
  simState.elapsedTime += simState.lastStep;
  ++simState.tickIndex;
  ++simState.stats.ticks;

  // Update all systems in order
  for (auto& system : systems) {
    system->update(registry);
  }

  dispatcher.update();
}

std::optional<Body> DropSimulator::getBody(BodyHandle handle) const {
  return readBody(registry, handle);
}

std::size_t DropSimulator::liveBodyCount() const {
  return countBodies(registry);
}

const Components::SimulationStats& DropSimulator::stats() const {
  return state().stats;
}

double DropSimulator::elapsedTime() const {
  return state().elapsedTime;
}

std::uint64_t DropSimulator::tickCount() const {
  return state().tickIndex;
}
