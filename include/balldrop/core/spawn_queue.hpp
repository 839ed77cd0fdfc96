/**
 * @file spawn_queue.hpp
 * @brief FIFO of pending drops, drained by the caller at its own rate
 *
 * Staggered drops are expressed as a queue the application drains a few
 * entries per frame. spawnBody itself stays synchronous.
 */

#pragma once

#include <cstddef>
#include <deque>
#include <random>
#include <vector>

#include "balldrop/core/spawner.hpp"

class DropSimulator;

/**
 * @brief Outcome of one drain call, tallied by status
 */
struct DrainResult {
  std::size_t spawned = 0;
  std::size_t dropped = 0;    // CapacityExceeded
  std::size_t rejected = 0;   // any other failure
  std::vector<BodyHandle> handles;
};

class SpawnQueue {
public:
  void enqueue(const SpawnRequest& request) { pending.push_back(request); }
  void enqueue(const std::vector<SpawnRequest>& requests);

  std::size_t size() const { return pending.size(); }
  bool empty() const { return pending.empty(); }
  void clear() { pending.clear(); }

  /**
   * @brief Spawns up to @p maxCount requests in FIFO order
   *
   * Failed requests are consumed and counted, never retried.
   */
  DrainResult drain(DropSimulator& simulator, std::size_t maxCount);

private:
  std::deque<SpawnRequest> pending;
};

/**
 * @brief One drop request per entry of @p types, jittered around @p origin
 *
 * x is offset uniformly within +-3 radii and y within [0, 0.5] radii so a
 * batch does not start stacked on one point.
 */
std::vector<SpawnRequest> makeDropBatch(const Position& origin,
                                        const std::vector<Components::BallTypeId>& types,
                                        double radius, std::mt19937& rng);
