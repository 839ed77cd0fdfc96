/**
 * @fileoverview level_manager.hpp
 * @brief Maintains the list of built-in levels and creates level objects.
 */

#ifndef LEVEL_MANAGER_HPP
#define LEVEL_MANAGER_HPP

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "balldrop/core/constants.hpp"
#include "balldrop/scenarios/i_level.hpp"

/**
 * @class LevelManager
 * @brief Catalog of available levels and a factory to create them.
 */
class LevelManager {
 public:
  /**
   * @brief Builds an internal list of all available levels.
   */
  void buildLevelList();

  const std::vector<std::pair<SimulatorConstants::LevelType, std::string>>&
  getLevelList() const;

  /**
   * @brief Looks a level up by its display name (case-sensitive)
   */
  std::optional<SimulatorConstants::LevelType> findLevel(const std::string& name) const;

  /**
   * @brief Creates a new level object of the specified type.
   */
  std::unique_ptr<ILevel> createLevel(SimulatorConstants::LevelType levelType) const;

 private:
  std::vector<std::pair<SimulatorConstants::LevelType, std::string>> levelList;
};

#endif  // LEVEL_MANAGER_HPP
