/**
 * @file headless_runner.cpp
 * @brief Implementation of HeadlessRunner.
 */

#include "balldrop/core/headless_runner.hpp"

#include <cmath>
#include <iostream>
#include <vector>

#include "balldrop/core/constants.hpp"
#include "balldrop/core/debug.hpp"
#include "balldrop/core/profile.hpp"

HeadlessRunner::HeadlessRunner() {
  entt::dispatcher& bus = simulator.events();
  bus.sink<BodySpawnedEvent>().connect<&HeadlessRunner::onSpawned>(*this);
  bus.sink<BodyDestroyedEvent>().connect<&HeadlessRunner::onDestroyed>(*this);
  bus.sink<ScoreEvent>().connect<&HeadlessRunner::onScore>(*this);
  bus.sink<MultiplyEvent>().connect<&HeadlessRunner::onMultiply>(*this);
  bus.sink<SpawnDroppedEvent>().connect<&HeadlessRunner::onDropped>(*this);
}

HeadlessRunner::~HeadlessRunner() {
  simulator.events().disconnect(*this);
}

bool HeadlessRunner::init(const RunOptions& options) {
  if (!std::isfinite(options.seconds) || options.seconds < 0.0) {
    std::cerr << "Run length must be a finite, non-negative number of seconds" << std::endl;
    return false;
  }
  if (options.balls > RunOptions::MaxBalls) {
    std::cerr << "At most " << RunOptions::MaxBalls << " balls can be queued" << std::endl;
    return false;
  }

  opts = options;
  runTotals = RunTotals{};
  rng.seed(opts.seed);
  queue.clear();

  levelManager.buildLevelList();
  auto type = levelManager.findLevel(opts.levelName);
  if (!type) {
    std::cerr << "Unknown level '" << opts.levelName << "'. Available:";
    for (const auto& entry : levelManager.getLevelList()) {
      std::cerr << " " << entry.second;
    }
    std::cerr << std::endl;
    return false;
  }

  auto level = levelManager.createLevel(*type);
  simulator.loadLevel(*level);

  // Cycle through every ball type so each shows up in the totals
  std::vector<Components::BallTypeId> types;
  types.reserve(opts.balls);
  for (std::size_t i = 0; i < opts.balls; ++i) {
    types.push_back(static_cast<Components::BallTypeId>(i % Components::BallTypeCount));
  }
  queue.enqueue(makeDropBatch(level->dropOrigin(), types,
                              SimulatorConstants::DefaultBallRadius, rng));

  DEBUG_MSG(DEBUG_LEVEL_BASIC, "[HeadlessRunner] " << opts.levelName << " with "
            << queue.size() << " queued drops\n");
  return true;
}

void HeadlessRunner::run() {
  PROFILE_SCOPE("HeadlessRunner::run");

  double const step = simulator.getConfig().sharedConfig.SecondsPerTick;
  auto const ticks = static_cast<std::uint64_t>(std::llround(opts.seconds / step));

  for (std::uint64_t i = 0; i < ticks; ++i) {
    if (!queue.empty()) {
      queue.drain(simulator, opts.dropsPerTick);
    }
    simulator.tick(step);
  }
}

void HeadlessRunner::onSpawned(const BodySpawnedEvent& event) {
  if (event.origin == SpawnOrigin::GateClone) {
    ++runTotals.clones;
  } else {
    ++runTotals.spawned;
  }
}

void HeadlessRunner::onDestroyed(const BodyDestroyedEvent& event) {
  ++runTotals.destroyed;
  ++runTotals.destroyedBy[event.reason];
}

void HeadlessRunner::onScore(const ScoreEvent& event) {
  ++runTotals.scores;
  runTotals.scoredPoints += event.pointsMultiplier;
}

void HeadlessRunner::onMultiply(const MultiplyEvent&) {
  ++runTotals.multiplies;
}

void HeadlessRunner::onDropped(const SpawnDroppedEvent& event) {
  runTotals.droppedSpawns += event.count;
}
