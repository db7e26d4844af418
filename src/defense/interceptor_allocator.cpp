#include "defense/interceptor_allocator.hpp"
#include "defense/engagement_controller.hpp"
#include "defense/intercept_solver.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <limits>

namespace skyshield::defense {

InterceptorAllocator::InterceptorAllocator(const EngineConfig& config)
    : config_(config) {}

std::vector<BatteryCapability> InterceptorAllocator::capabilities(
        DefenseWorld& world,
        InterceptSolver& solver,
        const EngagementController& controller,
        const std::vector<ThreatAssessment>& threats) const {

    std::vector<BatteryCapability> caps;
    const double now = world.sim_time;

    std::set<std::string> wanted;
    for (const auto& t : threats) wanted.insert(t.threat_id);

    for (const auto& battery : world.batteries()) {
        if (!battery->operational() || !battery->can_fire_interceptors()) continue;

        BatteryCapability cap;
        cap.battery_id = battery->id();
        cap.remaining = std::max(0, battery->available_interceptors() -
                                    controller.reserved_shots(battery->id()));
        cap.max_interceptors = battery->max_interceptors();
        cap.success_rate = controller.battery_success_rate(battery->id());

        double total_time = 0.0;
        for (const auto& threat_id : solver.grid().query(battery->position(), battery->max_range())) {
            if (wanted.count(threat_id) == 0) continue;
            const Threat* threat = world.get_threat(threat_id);
            if (!threat || !battery->can_intercept(*threat)) continue;
            if (!solver.solution(*threat, *battery, now)) continue;

            cap.coverage.insert(threat->id);
            total_time += distance(threat->position, battery->position()) /
                          battery->interceptor_speed();
        }

        cap.average_intercept_time = cap.coverage.empty()
            ? std::numeric_limits<double>::infinity()
            : total_time / static_cast<double>(cap.coverage.size());
        caps.push_back(std::move(cap));
    }
    return caps;
}

double InterceptorAllocator::score(const ThreatAssessment& threat,
                                   const BatteryCapability& battery,
                                   int remaining,
                                   size_t total_threats) const {
    double s = threat.priority;
    s += battery.success_rate * 50.0;
    s += std::max(0.0, 30.0 - battery.average_intercept_time);
    if (battery.max_interceptors > 0) {
        s += static_cast<double>(remaining) / battery.max_interceptors * 20.0;
    }
    if (total_threats > 0) {
        s += (1.0 - static_cast<double>(battery.coverage.size()) / total_threats) * 10.0;
    }
    return s;
}

AllocationPlan InterceptorAllocator::allocate(const std::vector<ThreatAssessment>& ranked,
                                              const std::vector<BatteryCapability>& capabilities,
                                              int in_flight,
                                              const RoundCount& round_count) const {
    AllocationPlan plan;
    for (const auto& cap : capabilities) {
        plan.remaining[cap.battery_id] = cap.remaining;
    }

    double total_priority = 0.0;
    double assigned_priority = 0.0;
    for (const auto& t : ranked) total_priority += t.priority;

    int committed = in_flight;
    bool saturated = committed >= config_.max_in_flight;

    for (const auto& threat : ranked) {
        if (saturated) {
            plan.unassigned.push_back(threat.threat_id);
            continue;
        }

        const BatteryCapability* best = nullptr;
        double best_score = -std::numeric_limits<double>::infinity();
        int best_count = 0;

        for (const auto& cap : capabilities) {
            if (cap.coverage.count(threat.threat_id) == 0) continue;
            int count = round_count ? round_count(threat, cap) : threat.required_interceptors;
            if (count <= 0 || plan.remaining[cap.battery_id] < count) continue;

            // Earlier commitments this pass lower the inventory term
            double s = score(threat, cap, plan.remaining[cap.battery_id], ranked.size());
            if (s > best_score) {
                best_score = s;
                best = &cap;
                best_count = count;
            }
        }

        if (!best) {
            plan.unassigned.push_back(threat.threat_id);
            continue;
        }

        if (committed + best_count > config_.max_in_flight) {
            saturated = true;
            plan.unassigned.push_back(threat.threat_id);
            continue;
        }

        committed += best_count;
        plan.remaining[best->battery_id] -= best_count;
        plan.allocations.push_back(Allocation{threat.threat_id, best->battery_id,
                                              best_count, threat.priority, best_score});
        assigned_priority += threat.priority;
    }

    plan.efficiency = total_priority > 0.0 ? assigned_priority / total_priority : 1.0;
    return plan;
}

} // namespace skyshield::defense
