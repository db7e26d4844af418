#include "defense/spatial_grid.hpp"
#include <algorithm>
#include <cmath>

namespace skyshield::defense {

SpatialGrid::SpatialGrid(double cell_size)
    : cell_size_(cell_size > 0.0 ? cell_size : 1000.0) {}

int SpatialGrid::cell_coord(double v) const {
    return static_cast<int>(std::floor(v / cell_size_));
}

int64_t SpatialGrid::key(int cx, int cz) {
    uint64_t packed = (static_cast<uint64_t>(static_cast<uint32_t>(cx)) << 32) |
                      static_cast<uint64_t>(static_cast<uint32_t>(cz));
    return static_cast<int64_t>(packed);
}

void SpatialGrid::rebuild(const std::vector<Threat>& threats) {
    cells_.clear();
    for (const auto& t : threats) {
        if (!t.active || t.destroyed) continue;
        cells_[key(cell_coord(t.position.x), cell_coord(t.position.z))].push_back(t.id);
    }
}

std::vector<std::string> SpatialGrid::query(const Vec3& center, double range) const {
    std::vector<std::string> out;
    if (cells_.empty() || range < 0.0) return out;

    int reach = static_cast<int>(std::ceil(range / cell_size_));
    int cx = cell_coord(center.x);
    int cz = cell_coord(center.z);

    for (int dx = -reach; dx <= reach; ++dx) {
        for (int dz = -reach; dz <= reach; ++dz) {
            auto it = cells_.find(key(cx + dx, cz + dz));
            if (it == cells_.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    // Each threat lives in exactly one cell, so out has no duplicates
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace skyshield::defense
