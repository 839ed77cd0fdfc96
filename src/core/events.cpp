#include "balldrop/core/events.hpp"

const char* spawnStatusName(SpawnStatus status) {
  switch (status) {
    case SpawnStatus::Ok:               return "Ok";
    case SpawnStatus::UnknownType:      return "UnknownType";
    case SpawnStatus::NoLevelLoaded:    return "NoLevelLoaded";
    case SpawnStatus::InvalidPosition:  return "InvalidPosition";
    case SpawnStatus::CapacityExceeded: return "CapacityExceeded";
    default: return "Unknown";
  }
}

const char* destroyReasonName(Components::DestroyReason reason) {
  switch (reason) {
    case Components::DestroyReason::Expired:        return "Expired";
    case Components::DestroyReason::BelowKillPlane: return "BelowKillPlane";
    case Components::DestroyReason::Scored:         return "Scored";
    case Components::DestroyReason::LevelUnloaded:  return "LevelUnloaded";
    default: return "Unknown";
  }
}
