/**
 * InterceptorAllocator - greedy multi-factor battery-to-threat assignment.
 *
 * Threats are visited in priority order. Each one goes to the covering
 * battery with the best score that still holds enough rounds for the
 * full required count. No global optimum is sought.
 */

#ifndef SKYSHIELD_DEFENSE_INTERCEPTOR_ALLOCATOR_HPP
#define SKYSHIELD_DEFENSE_INTERCEPTOR_ALLOCATOR_HPP

#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include "defense/threat_prioritizer.hpp"
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

class EngagementController;
class InterceptSolver;

struct BatteryCapability {
    std::string battery_id;
    std::set<std::string> coverage;        // threat ids this battery can engage
    int remaining = 0;                     // rounds neither fired nor reserved
    int max_interceptors = 0;
    double average_intercept_time = 0.0;   // s, infinity with no coverage
    double success_rate = 0.0;
};

struct Allocation {
    std::string threat_id;
    std::string battery_id;
    int interceptor_count = 0;
    double priority = 0.0;
    double score = 0.0;
};

struct AllocationPlan {
    std::vector<Allocation> allocations;
    std::vector<std::string> unassigned;
    double efficiency = 1.0;   // assigned priority / total priority
    std::unordered_map<std::string, int> remaining;
};

class InterceptorAllocator {
public:
    // Rounds a battery would commit to a threat; null means required_interceptors
    using RoundCount = std::function<int(const ThreatAssessment&, const BatteryCapability&)>;

    explicit InterceptorAllocator(const EngineConfig& config);

    /**
     * Capability snapshot for each battery that can fire. Candidates come
     * from the solver's spatial grid; a threat is covered when the battery
     * accepts it and the solver finds a feasible intercept. The grid must
     * have been rebuilt this tick.
     */
    std::vector<BatteryCapability> capabilities(DefenseWorld& world,
                                                InterceptSolver& solver,
                                                const EngagementController& controller,
                                                const std::vector<ThreatAssessment>& threats) const;

    /** Battery score for one threat given the battery's uncommitted rounds. */
    double score(const ThreatAssessment& threat, const BatteryCapability& battery,
                 int remaining, size_t total_threats) const;

    /**
     * Greedy assignment.
     * @param in_flight rounds airborne or reserved for scheduled shots.
     *        Each allocation adds its count; the first threat that would
     *        push the total past the cap ends the pass and it and every
     *        lower-priority threat are returned unassigned.
     * @param round_count per-battery count to commit, applied before the
     *        inventory and cap checks
     */
    AllocationPlan allocate(const std::vector<ThreatAssessment>& ranked,
                            const std::vector<BatteryCapability>& capabilities,
                            int in_flight,
                            const RoundCount& round_count = nullptr) const;

private:
    EngineConfig config_;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_INTERCEPTOR_ALLOCATOR_HPP
