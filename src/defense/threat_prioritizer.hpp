/**
 * ThreatPrioritizer - scoring, ordering and interceptor-count estimation.
 *
 * Priority is additive over urgency (time to impact), lethality
 * (category), speed and altitude bands. The interceptor count needed to
 * push the leak probability below the target is derived from a per-
 * category success rate learned from engagement outcomes.
 *
 * Also runs the periodic consistency sweep that repairs stale ledger
 * entries and orphaned being-intercepted claims.
 */

#ifndef SKYSHIELD_DEFENSE_THREAT_PRIORITIZER_HPP
#define SKYSHIELD_DEFENSE_THREAT_PRIORITIZER_HPP

#include "defense/assignment_ledger.hpp"
#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include <map>
#include <string>
#include <vector>

namespace skyshield::defense {

class EngagementController;
class KillAdjudicator;

struct ThreatAssessment {
    std::string threat_id;
    ThreatCategory category = ThreatCategory::UNKNOWN;
    double priority = 0.0;
    double difficulty = 0.0;          // [0, 1]
    int required_interceptors = 1;
    double damage_value = 0.0;
    double time_to_impact = 0.0;      // s
};

struct SweepResult {
    std::vector<std::string> cleared_assignments;
    std::vector<std::string> released_claims;

    bool empty() const { return cleared_assignments.empty() && released_claims.empty(); }
};

class ThreatPrioritizer {
public:
    explicit ThreatPrioritizer(const EngineConfig& config);

    double priority(const Threat& threat) const;
    double difficulty(const Threat& threat) const;
    int required_interceptors(const Threat& threat) const;

    /** Learned per-category success rate (default until first outcome). */
    double success_rate(ThreatCategory category) const;

    /** Exponential moving average update from one engagement outcome. */
    void record_outcome(ThreatCategory category, bool hit);

    ThreatAssessment assess(const Threat& threat) const;

    /**
     * Assess active threats, highest priority first.
     * Ties: shorter time to impact, then id.
     */
    std::vector<ThreatAssessment> prioritize(const std::vector<const Threat*>& threats) const;
    std::vector<ThreatAssessment> prioritize(const std::vector<Threat>& threats) const;

    /**
     * Repair stale state:
     *  - ledger entries whose threat is gone, or that nothing is tracking
     *    and no engagement is live on;
     *  - claims on active threats that no active interceptor targets.
     * A second sweep with no state change in between does nothing.
     */
    SweepResult consistency_sweep(DefenseWorld& world, AssignmentLedger& ledger,
                                  const EngagementController& controller,
                                  KillAdjudicator& adjudicator) const;

private:
    EngineConfig config_;
    std::map<ThreatCategory, double> success_rates_;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_THREAT_PRIORITIZER_HPP
