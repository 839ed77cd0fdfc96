/**
 * @fileoverview main.cpp
 * @brief Entry point for the headless runner.
 *
 * Usage: balldrop_headless [level] [seconds] [balls]
 */

#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "balldrop/core/headless_runner.hpp"
#include "balldrop/core/profile.hpp"

int main(int argc, char** argv) {
  RunOptions options;
  try {
    if (argc > 1) {
      options.levelName = argv[1];
    }
    if (argc > 2) {
      options.seconds = std::stod(argv[2]);
      if (!std::isfinite(options.seconds) || options.seconds < 0.0) {
        throw std::out_of_range("seconds");
      }
    }
    if (argc > 3) {
      long long const balls = std::stoll(argv[3]);
      if (balls < 0 || static_cast<unsigned long long>(balls) > RunOptions::MaxBalls) {
        throw std::out_of_range("balls");
      }
      options.balls = static_cast<std::size_t>(balls);
    }
  } catch (const std::exception&) {
    std::cerr << "usage: " << argv[0] << " [level] [seconds] [balls]" << std::endl;
    return EXIT_FAILURE;
  }

  HeadlessRunner runner;
  try {
    if (!runner.init(options)) {
      return EXIT_FAILURE;
    }
  } catch (const std::invalid_argument& e) {
    std::cerr << "Level rejected: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  runner.run();

  const RunTotals& totals = runner.totals();
  const auto& stats = runner.getSimulator().stats();
  std::cout << "level:        " << options.levelName << "\n"
            << "ticks:        " << stats.ticks << "\n"
            << "dropped in:   " << totals.spawned << "\n"
            << "clones:       " << totals.clones << "\n"
            << "multiplies:   " << totals.multiplies << "\n"
            << "scores:       " << totals.scores << " (" << totals.scoredPoints << " points)\n"
            << "destroyed:    " << totals.destroyed << "\n";
  for (const auto& [reason, count] : totals.destroyedBy) {
    std::cout << "  " << destroyReasonName(reason) << ": " << count << "\n";
  }
  std::cout << "cap drops:    " << totals.droppedSpawns << "\n"
            << "still live:   " << runner.getSimulator().liveBodyCount() << "\n"
            << "resets:       " << stats.corruptionResets << std::endl;

  Profiling::Profiler::printStats();
  return EXIT_SUCCESS;
}
