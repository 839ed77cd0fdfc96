/**
 * @file headless_runner.hpp
 * @brief Drives a level without a renderer: drops balls, ticks, tallies events.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <random>
#include <string>

#include "balldrop/core/level_manager.hpp"
#include "balldrop/core/simulator.hpp"
#include "balldrop/core/spawn_queue.hpp"

/**
 * @brief Totals of the events a run produced
 */
struct RunTotals {
  std::uint64_t spawned = 0;
  std::uint64_t clones = 0;
  std::uint64_t destroyed = 0;
  std::map<Components::DestroyReason, std::uint64_t> destroyedBy;
  std::uint64_t scores = 0;
  double scoredPoints = 0.0;
  std::uint64_t multiplies = 0;
  std::uint64_t droppedSpawns = 0;
};

struct RunOptions {
  std::string levelName = "RAMP_CASCADE";
  double seconds = 10.0;
  std::size_t balls = 200;
  std::size_t dropsPerTick = 4;     // queue drain rate
  std::uint32_t seed = 1337;

  static constexpr std::size_t MaxBalls = 1000000;
};

/**
 * @class HeadlessRunner
 * @brief Owns a simulator and plays the part of the drop and economy collaborators.
 */
class HeadlessRunner {
 public:
  HeadlessRunner();
  ~HeadlessRunner();

  HeadlessRunner(const HeadlessRunner&) = delete;
  HeadlessRunner& operator=(const HeadlessRunner&) = delete;

  /**
   * @brief Loads the named level and queues the drop batch
   * @return false if the level name is unknown, seconds is negative or not
   *         finite, or more than RunOptions::MaxBalls balls are requested
   */
  bool init(const RunOptions& options);

  /**
   * @brief Ticks at the level's fixed step for the configured duration
   */
  void run();

  const RunTotals& totals() const { return runTotals; }
  const DropSimulator& getSimulator() const { return simulator; }

 private:
  void onSpawned(const BodySpawnedEvent& event);
  void onDestroyed(const BodyDestroyedEvent& event);
  void onScore(const ScoreEvent& event);
  void onMultiply(const MultiplyEvent& event);
  void onDropped(const SpawnDroppedEvent& event);

  DropSimulator simulator;
  LevelManager levelManager;
  SpawnQueue queue;
  RunOptions opts;
  RunTotals runTotals;
  std::mt19937 rng;
};
