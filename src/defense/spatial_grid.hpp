/**
 * SpatialGrid - uniform ground-plane buckets of threat ids.
 *
 * Cells are keyed by (floor(x / cell), floor(z / cell)). Rebuilt once per
 * tick; range queries touch only the cells around the query point.
 */

#ifndef SKYSHIELD_DEFENSE_SPATIAL_GRID_HPP
#define SKYSHIELD_DEFENSE_SPATIAL_GRID_HPP

#include "defense/threat.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

class SpatialGrid {
public:
    explicit SpatialGrid(double cell_size = 1000.0);

    /** Re-bucket every active threat. */
    void rebuild(const std::vector<Threat>& threats);

    /**
     * Threat ids in every cell within ceil(range / cell) of the center's
     * cell. Candidates may lie outside range; callers filter exactly.
     */
    std::vector<std::string> query(const Vec3& center, double range) const;

    size_t cell_count() const { return cells_.size(); }
    double cell_size() const { return cell_size_; }

private:
    double cell_size_;
    std::unordered_map<int64_t, std::vector<std::string>> cells_;

    int cell_coord(double v) const;
    static int64_t key(int cx, int cz);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_SPATIAL_GRID_HPP
