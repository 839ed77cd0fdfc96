/**
 * @file empty_arena.hpp
 * @brief Declaration of the EmptyArenaLevel class
 */

#pragma once

#include "balldrop/scenarios/i_level.hpp"

/**
 * @class EmptyArenaLevel
 *
 * No walls and no gates. Used for free-fall and crowding stress runs.
 */
class EmptyArenaLevel : public ILevel {
public:
    EmptyArenaLevel() = default;
    ~EmptyArenaLevel() override = default;

    LevelSystemConfig getSystemsConfig() const override;
    LevelGeometry buildGeometry() const override;
    Position dropOrigin() const override;
};
