/**
 * @file spatial_hash.hpp
 * @brief Uniform grid over the x/y plane, stored as a multi-value hash map
 *
 * Rebuilt from scratch every tick. Values are indices into the caller's
 * snapshot array, so nothing in here survives a body being destroyed.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <vector>

#include "balldrop/math/vector_math.hpp"

namespace Systems {

class SpatialHash {
public:
    explicit SpatialHash(double cellSize = 1.0);

    /**
     * @brief Drops all entries and sets a new cell size
     */
    void reset(double newCellSize);

    void insert(std::size_t index, const Position& p);

    /**
     * @brief Appends every index stored in the 3x3 block of cells around @p p
     */
    void queryNeighbourhood(const Position& p, std::vector<std::size_t>& out) const;

    std::int64_t cellKey(const Position& p) const;
    static std::int64_t packKey(std::int32_t cx, std::int32_t cy);

    double getCellSize() const { return cellSize; }
    std::size_t size() const { return cells.size(); }

private:
    std::int32_t cellCoord(double v) const;

    double cellSize;
    std::unordered_multimap<std::int64_t, std::size_t> cells;
};

} // namespace Systems
