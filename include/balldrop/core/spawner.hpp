/**
 * @file spawner.hpp
 * @brief The only code path that creates balls
 *
 * Drop requests come from outside the core and are validated at this
 * boundary. Clone requests come from the gate pass and carry a fully built
 * body. Both are subject to the body ceiling; a spawn refused for capacity is
 * counted and reported as a SpawnDroppedEvent rather than an error, since gate
 * chains routinely run into the ceiling.
 */

#pragma once

#include <cstddef>
#include <entt/entt.hpp>

#include "balldrop/core/body.hpp"
#include "balldrop/core/events.hpp"
#include "balldrop/core/system_config.hpp"

/**
 * @brief A drop as requested by the input collaborator
 */
struct SpawnRequest {
  Position position;
  Components::BallTypeId type = Components::BallTypeId::Standard;
  Vector velocity;
};

struct SpawnResult {
  BodyHandle handle = entt::null;
  SpawnStatus status = SpawnStatus::Ok;

  bool ok() const { return status == SpawnStatus::Ok; }
};

class Spawner {
public:
  Spawner(entt::registry& registry, entt::dispatcher& dispatcher);

  void setSystemConfig(const SystemConfig& config) { sysConfig = config; }
  const SystemConfig& getSystemConfig() const { return sysConfig; }

  /**
   * @brief Drops with no level loaded are rejected with NoLevelLoaded
   */
  void setLevelLoaded(bool loaded) { levelLoaded = loaded; }
  bool isLevelLoaded() const { return levelLoaded; }

  /**
   * @brief Validates and creates a default body of the requested type
   *
   * Spawn events are only enqueued; the owner flushes the dispatcher.
   */
  SpawnResult spawn(const SpawnRequest& request);

  /**
   * @brief Creates a gate clone. Only the ceiling is checked.
   */
  SpawnResult spawnClone(const Body& body);

  /**
   * @brief Counts @p count gate clones refused at the ceiling as one drop
   */
  void dropClones(std::size_t count);

  /// Bodies that can still be created before the ceiling is reached
  std::size_t remainingCapacity() const;

private:
  SpawnResult reject(SpawnStatus status, SpawnOrigin origin, std::size_t count = 1);
  SpawnResult create(const Body& body, SpawnOrigin origin);
  bool atCapacity() const;
  double now() const;

  entt::registry& registry;
  entt::dispatcher& dispatcher;
  SystemConfig sysConfig;
  bool levelLoaded = false;
};
