#include "balldrop/core/spawn_queue.hpp"

#include "balldrop/core/simulator.hpp"

void SpawnQueue::enqueue(const std::vector<SpawnRequest>& requests) {
  pending.insert(pending.end(), requests.begin(), requests.end());
}

DrainResult SpawnQueue::drain(DropSimulator& simulator, std::size_t maxCount) {
  DrainResult result;
  while (!pending.empty() && result.spawned + result.dropped + result.rejected < maxCount) {
    SpawnRequest const request = pending.front();
    pending.pop_front();

    SpawnResult const spawn = simulator.spawnBody(request);
    switch (spawn.status) {
      case SpawnStatus::Ok:
        ++result.spawned;
        result.handles.push_back(spawn.handle);
        break;
      case SpawnStatus::CapacityExceeded:
        ++result.dropped;
        break;
      default:
        ++result.rejected;
        break;
    }
  }
  return result;
}

std::vector<SpawnRequest> makeDropBatch(const Position& origin,
                                        const std::vector<Components::BallTypeId>& types,
                                        double radius, std::mt19937& rng) {
  std::uniform_real_distribution<double> jitterX(-3.0 * radius, 3.0 * radius);
  std::uniform_real_distribution<double> jitterY(0.0, 0.5 * radius);

  std::vector<SpawnRequest> batch;
  batch.reserve(types.size());
  for (auto type : types) {
    SpawnRequest request;
    request.position = origin + Vector(jitterX(rng), jitterY(rng), 0.0);
    request.type = type;
    batch.push_back(request);
  }
  return batch;
}
