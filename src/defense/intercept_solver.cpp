#include "defense/intercept_solver.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <chrono>
#include <numeric>

namespace skyshield::defense {

namespace {
    constexpr size_t METRIC_WINDOW = 100;
}

InterceptSolver::InterceptSolver(const EngineConfig& config)
    : config_(config),
      grid_(config.grid_cell_size),
      cache_(config.solution_ttl, config.cache_capacity, config.cache_evict_count) {}

std::optional<InterceptSolution> InterceptSolver::solve(const Threat& threat,
                                                        const Battery& battery,
                                                        double tolerance,
                                                        double horizon) {
    const double speed = battery.interceptor_speed();
    if (speed <= 0.0) return std::nullopt;

    double direct = distance(threat.position, battery.position());
    if (direct > battery.max_range()) return std::nullopt;

    double min_time = direct / speed;
    double max_time = std::min(threat.time_to_impact, horizon);
    if (min_time > max_time) return std::nullopt;

    const Vec3 g = gravity_vector();
    auto reach_time = [&](const Vec3& p) { return distance(battery.position(), p) / speed; };

    double lo = min_time;
    double hi = max_time;
    while (hi - lo > tolerance) {
        double mid = 0.5 * (lo + hi);
        Vec3 p = project(threat.position, threat.velocity, g, mid);
        if (p.y <= 0.0) {
            hi = mid;
            continue;
        }
        if (reach_time(p) < mid) {
            hi = mid;
        } else {
            lo = mid;
        }
    }

    double t = 0.5 * (lo + hi);
    Vec3 point = project(threat.position, threat.velocity, g, t);
    if (point.y <= 0.0) return std::nullopt;
    if (reach_time(point) > t + tolerance) return std::nullopt;

    return InterceptSolution{point, t};
}

std::optional<InterceptSolution> InterceptSolver::solution(const Threat& threat,
                                                           const Battery& battery,
                                                           double now) {
    if (const CachedSolution* hit = cache_.lookup(threat.id, battery.id(), now)) {
        cache_hits_++;
        return hit->solution;
    }

    auto result = solve(threat, battery, config_.bisection_tolerance, config_.solver_horizon);
    solves_++;
    cache_.store(threat.id, battery.id(), result, now);
    return result;
}

void InterceptSolver::rebuild_grid(const std::vector<Threat>& threats) {
    grid_.rebuild(threats);
}

std::unordered_map<std::string, std::unordered_map<std::string, InterceptSolution>>
InterceptSolver::solve_batch(const DefenseWorld& world, double now) {
    auto t_start = std::chrono::steady_clock::now();

    std::unordered_map<std::string, std::unordered_map<std::string, InterceptSolution>> out;
    for (const auto& battery : world.batteries()) {
        if (!battery->operational() || !battery->can_fire_interceptors()) continue;

        auto& per_battery = out[battery->id()];
        for (const auto& threat_id : grid_.query(battery->position(), battery->max_range())) {
            const Threat* threat = world.get_threat(threat_id);
            if (!threat || !threat->active) continue;
            if (auto s = solution(*threat, *battery, now)) {
                per_battery.emplace(threat_id, *s);
            }
        }
    }

    auto t_end = std::chrono::steady_clock::now();
    batch_times_ms_.push_back(std::chrono::duration<double, std::milli>(t_end - t_start).count());
    if (batch_times_ms_.size() > METRIC_WINDOW) batch_times_ms_.pop_front();

    return out;
}

SolverMetrics InterceptSolver::metrics() const {
    SolverMetrics m;
    if (!batch_times_ms_.empty()) {
        m.average_batch_ms = std::accumulate(batch_times_ms_.begin(), batch_times_ms_.end(), 0.0) /
                             static_cast<double>(batch_times_ms_.size());
    }
    m.cache_size = cache_.size();
    m.grid_cells = grid_.cell_count();
    m.solves = solves_;
    m.cache_hits = cache_hits_;
    return m;
}

void InterceptSolver::reset() {
    cache_.clear();
    grid_.rebuild({});
    batch_times_ms_.clear();
    solves_ = 0;
    cache_hits_ = 0;
}

} // namespace skyshield::defense
