#include "balldrop/core/level.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

#include "balldrop/components/basic.hpp"

ObstacleCache::ObstacleCache(const std::vector<ObstacleRecord>& records) {
  cached.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& rec = records[i];
    if (!rec.center.isFinite() || !rec.halfExtents.isFinite() || !rec.rotation.isFinite()
        || !std::isfinite(rec.restitution)) {
      throw std::invalid_argument("obstacle " + std::to_string(i) + " has non-finite geometry");
    }
    if (rec.halfExtents.x <= 0.0 || rec.halfExtents.y <= 0.0 || rec.halfExtents.z <= 0.0) {
      throw std::invalid_argument("obstacle " + std::to_string(i) + " has non-positive half extents");
    }
    if (rec.rotation.norm() < EPSILON) {
      throw std::invalid_argument("obstacle " + std::to_string(i) + " has a zero rotation quaternion");
    }

    Quaternion const q = rec.rotation.normalized();
    cached.push_back(CachedObstacle{rec.center, rec.halfExtents, q, q.conjugate(), rec.restitution});
  }
}

GateTable::GateTable(const std::vector<GateRecord>& records, std::size_t maxMultiplier) {
  Components::GateMask seen;
  table.reserve(records.size());
  for (std::size_t i = 0; i < records.size(); ++i) {
    const auto& rec = records[i];
    if (!rec.bounds.isValid()) {
      throw std::invalid_argument("gate " + std::to_string(i) + " has invalid bounds");
    }
    if (rec.multiplier < 1) {
      throw std::invalid_argument("gate " + std::to_string(i) + " has multiplier < 1");
    }
    if (static_cast<std::size_t>(rec.multiplier) > maxMultiplier) {
      throw std::invalid_argument("gate " + std::to_string(i) + " multiplier "
                                  + std::to_string(rec.multiplier) + " exceeds the body ceiling of "
                                  + std::to_string(maxMultiplier));
    }
    if (rec.instanceId < 0 || static_cast<std::size_t>(rec.instanceId) >= Components::MaxGates) {
      throw std::invalid_argument("gate " + std::to_string(i) + " instanceId out of range: "
                                  + std::to_string(rec.instanceId));
    }
    if (seen.test(static_cast<std::size_t>(rec.instanceId))) {
      throw std::invalid_argument("duplicate gate instanceId " + std::to_string(rec.instanceId));
    }
    seen.set(static_cast<std::size_t>(rec.instanceId));
    table.push_back(rec);
  }
}
