/**
 * InterceptSolver - bisection intercept-point solver with grid pruning.
 *
 * For a (threat, battery) pair, finds the earliest time t at which a
 * straight-line interceptor from the battery can reach the threat's
 * gravity-propagated position. Solutions are memoized in a SolutionCache;
 * batch solving uses a SpatialGrid to skip out-of-range threats.
 */

#ifndef SKYSHIELD_DEFENSE_INTERCEPT_SOLVER_HPP
#define SKYSHIELD_DEFENSE_INTERCEPT_SOLVER_HPP

#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include "defense/solution_cache.hpp"
#include "defense/spatial_grid.hpp"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

struct SolverMetrics {
    double average_batch_ms = 0.0;   // over the last 100 batches
    size_t cache_size = 0;
    size_t grid_cells = 0;
    size_t solves = 0;               // uncached solves since reset
    size_t cache_hits = 0;
};

class InterceptSolver {
public:
    explicit InterceptSolver(const EngineConfig& config);

    /**
     * Uncached bisection solve.
     * Empty when out of range, when the threat lands before any interceptor
     * could arrive, or when the converged point is unreachable.
     */
    static std::optional<InterceptSolution> solve(const Threat& threat,
                                                  const Battery& battery,
                                                  double tolerance = 0.01,
                                                  double horizon = 30.0);

    /** Cached solve; stores infeasible results as well. */
    std::optional<InterceptSolution> solution(const Threat& threat,
                                              const Battery& battery,
                                              double now);

    /** Re-bucket the world's threats. Call once per tick. */
    void rebuild_grid(const std::vector<Threat>& threats);

    /**
     * Feasible solutions for every threat near each battery.
     * Keyed by battery id, then threat id.
     */
    std::unordered_map<std::string, std::unordered_map<std::string, InterceptSolution>>
    solve_batch(const DefenseWorld& world, double now);

    const SpatialGrid& grid() const { return grid_; }
    const SolutionCache& cache() const { return cache_; }
    SolutionCache& cache() { return cache_; }

    SolverMetrics metrics() const;
    void reset();

private:
    EngineConfig config_;
    SpatialGrid grid_;
    SolutionCache cache_;

    std::deque<double> batch_times_ms_;
    size_t solves_ = 0;
    size_t cache_hits_ = 0;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_INTERCEPT_SOLVER_HPP
