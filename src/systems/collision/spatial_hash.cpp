#include "balldrop/systems/collision/spatial_hash.hpp"

#include <cmath>

namespace Systems {

SpatialHash::SpatialHash(double cellSize)
    : cellSize(cellSize > 0.0 ? cellSize : 1.0) {}

void SpatialHash::reset(double newCellSize) {
    cells.clear();
    if (newCellSize > 0.0 && std::isfinite(newCellSize)) {
        cellSize = newCellSize;
    }
}

std::int32_t SpatialHash::cellCoord(double v) const {
    return static_cast<std::int32_t>(std::floor(v / cellSize));
}

std::int64_t SpatialHash::packKey(std::int32_t cx, std::int32_t cy) {
    return (static_cast<std::int64_t>(cx) << 32) ^
           static_cast<std::int64_t>(static_cast<std::uint32_t>(cy));
}

std::int64_t SpatialHash::cellKey(const Position& p) const {
    return packKey(cellCoord(p.x), cellCoord(p.y));
}

void SpatialHash::insert(std::size_t index, const Position& p) {
    cells.emplace(cellKey(p), index);
}

void SpatialHash::queryNeighbourhood(const Position& p, std::vector<std::size_t>& out) const {
    std::int32_t const cx = cellCoord(p.x);
    std::int32_t const cy = cellCoord(p.y);

    for (std::int32_t dx = -1; dx <= 1; ++dx) {
        for (std::int32_t dy = -1; dy <= 1; ++dy) {
            auto range = cells.equal_range(packKey(cx + dx, cy + dy));
            for (auto it = range.first; it != range.second; ++it) {
                out.push_back(it->second);
            }
        }
    }
}

} // namespace Systems
