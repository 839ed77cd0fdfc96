/**
 * @file simulator.hpp
 * @brief Main simulator class that owns the body store and the tick pipeline.
 *
 * Per tick the passes run in this order, each reading what the previous one
 * wrote: integrator, wall collision, broad-phase, gate interaction, lifecycle.
 * Events raised during the tick are delivered once it has completed.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>
#include <entt/entt.hpp>

#include "balldrop/core/body.hpp"
#include "balldrop/core/level.hpp"
#include "balldrop/core/spawner.hpp"
#include "balldrop/scenarios/i_level.hpp"
#include "balldrop/systems/i_system.hpp"

/**
 * @class DropSimulator
 * @brief Ball-drop physics core: level load boundary, spawn boundary, tick.
 */
class DropSimulator {
private:
  entt::registry registry;
  entt::dispatcher dispatcher;
  std::vector<std::unique_ptr<Systems::ISystem>> systems;

  LevelGeometry currentGeometry;
  LevelSystemConfig currentConfig;
  ObstacleCache obstacleCache;
  GateTable gateTable;
  Spawner spawner;
  bool levelLoaded = false;

  void createSystems();
  Components::SimulatorState& state();
  const Components::SimulatorState& state() const;

public:
  DropSimulator();
  ~DropSimulator();

  DropSimulator(const DropSimulator&) = delete;
  DropSimulator& operator=(const DropSimulator&) = delete;

  /**
   * @brief Builds the obstacle cache and gate table and starts a fresh level
   *
   * Any previously loaded level is unloaded first. Validation happens before
   * anything is torn down, so a rejected level leaves the old one running.
   *
   * @throws std::invalid_argument if any record is invalid
   */
  void loadLevel(const LevelGeometry& geometry, const LevelSystemConfig& config = LevelSystemConfig());
  void loadLevel(const ILevel& level);

  /**
   * @brief Destroys every ball (reporting LevelUnloaded), clears geometry and counters
   */
  void unloadLevel();

  /**
   * @brief Reloads the current level from its stored records
   */
  void reset();

  bool hasLevel() const { return levelLoaded; }

  /**
   * @brief Spawns a ball of @p type at rest at @p position
   */
  SpawnResult spawnBody(const Position& position, Components::BallTypeId type);
  SpawnResult spawnBody(const SpawnRequest& request);

  /**
   * @brief Advances the simulation by one step of @p dt seconds
   *
   * dt is clamped to MaxTimeStep. A non-finite or non-positive dt is counted
   * and ignored. Never throws on simulation state.
   */
  void tick(double dt);

  std::optional<Body> getBody(BodyHandle handle) const;
  std::size_t liveBodyCount() const;

  /**
   * @brief Event bus; subscribe with events().sink<ScoreEvent>().connect<...>()
   */
  entt::dispatcher& events() { return dispatcher; }

  const Components::SimulationStats& stats() const;
  double elapsedTime() const;
  std::uint64_t tickCount() const;

  const LevelSystemConfig& getConfig() const { return currentConfig; }
  const ObstacleCache& getObstacles() const { return obstacleCache; }
  const GateTable& getGates() const { return gateTable; }

  /**
   * @brief Access to the ECS registry
   */
  entt::registry& getRegistry() { return registry; }
  const entt::registry& getRegistry() const { return registry; }
};
