/**
 * @fileoverview level_manager.cpp
 * @brief Implementation of LevelManager.
 */

#include "balldrop/core/level_manager.hpp"

#include "balldrop/scenarios/empty_arena.hpp"
#include "balldrop/scenarios/multiplier_tower.hpp"
#include "balldrop/scenarios/ramp_cascade.hpp"

void LevelManager::buildLevelList() {
  levelList.clear();
  for (auto level : SimulatorConstants::getAllLevels()) {
    levelList.emplace_back(level, SimulatorConstants::getLevelName(level));
  }
}

const std::vector<std::pair<SimulatorConstants::LevelType, std::string>>&
LevelManager::getLevelList() const {
  return levelList;
}

std::optional<SimulatorConstants::LevelType> LevelManager::findLevel(const std::string& name) const {
  for (const auto& [type, levelName] : levelList) {
    if (levelName == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::unique_ptr<ILevel> LevelManager::createLevel(SimulatorConstants::LevelType levelType) const {
  switch (levelType) {
    case SimulatorConstants::LevelType::EMPTY_ARENA:
      return std::make_unique<EmptyArenaLevel>();

    case SimulatorConstants::LevelType::RAMP_CASCADE:
      return std::make_unique<RampCascadeLevel>();

    case SimulatorConstants::LevelType::MULTIPLIER_TOWER:
      return std::make_unique<MultiplierTowerLevel>();

    default:
      return std::make_unique<EmptyArenaLevel>();
  }
}
