#include "defense/threat_prioritizer.hpp"
#include "defense/engagement_controller.hpp"
#include "defense/kill_adjudicator.hpp"
#include <algorithm>
#include <cmath>

namespace skyshield::defense {

namespace {

double category_bonus(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::BALLISTIC_MISSILE: return 30.0;
        case ThreatCategory::CRUISE_MISSILE:    return 25.0;
        case ThreatCategory::ROCKET:            return 15.0;
        case ThreatCategory::MORTAR:            return 10.0;
        case ThreatCategory::DRONE:             return 5.0;
        default:                                return 10.0;
    }
}

double urgency_bonus(double tti) {
    if (tti < 10.0) return 40.0;
    if (tti < 20.0) return 25.0;
    if (tti < 30.0) return 10.0;
    return 0.0;
}

double speed_bonus(double speed) {
    if (speed > 800.0) return 20.0;
    if (speed > 400.0) return 10.0;
    if (speed > 200.0) return 5.0;
    return 0.0;
}

double altitude_bonus(double altitude) {
    if (altitude < 500.0) return 10.0;
    if (altitude < 1000.0) return 5.0;
    return 0.0;
}

} // namespace

ThreatPrioritizer::ThreatPrioritizer(const EngineConfig& config)
    : config_(config) {}

double ThreatPrioritizer::priority(const Threat& threat) const {
    return config_.base_priority
         + urgency_bonus(threat.time_to_impact)
         + category_bonus(threat.category)
         + speed_bonus(threat.speed())
         + altitude_bonus(threat.altitude());
}

double ThreatPrioritizer::difficulty(const Threat& threat) const {
    double d = 0.0;
    if (threat.speed() > 600.0) d += 0.3;
    if (threat.altitude() < 300.0) d += 0.2;
    if (threat.time_to_impact < 15.0) d += 0.2;
    if (is_maneuvering(threat.category)) d += 0.1;
    return std::min(d, 1.0);
}

double ThreatPrioritizer::success_rate(ThreatCategory category) const {
    auto it = success_rates_.find(category);
    return it == success_rates_.end() ? config_.default_success_rate : it->second;
}

void ThreatPrioritizer::record_outcome(ThreatCategory category, bool hit) {
    double current = success_rate(category);
    double alpha = config_.success_learning_rate;
    success_rates_[category] = current + alpha * ((hit ? 1.0 : 0.0) - current);
}

int ThreatPrioritizer::required_interceptors(const Threat& threat) const {
    const int cap = config_.max_interceptors_per_threat;
    double p = success_rate(threat.category);
    if (p >= 1.0) return 1;
    if (p <= 0.0) return cap;

    double shots = std::log(config_.target_leak_probability) / std::log(1.0 - p);
    int n = static_cast<int>(std::ceil(shots * (1.0 + difficulty(threat))));
    return std::clamp(n, 1, cap);
}

ThreatAssessment ThreatPrioritizer::assess(const Threat& threat) const {
    ThreatAssessment a;
    a.threat_id = threat.id;
    a.category = threat.category;
    a.priority = priority(threat);
    a.difficulty = difficulty(threat);
    a.required_interceptors = required_interceptors(threat);
    a.damage_value = damage_value(threat.category);
    a.time_to_impact = threat.time_to_impact;
    return a;
}

std::vector<ThreatAssessment> ThreatPrioritizer::prioritize(const std::vector<const Threat*>& threats) const {
    std::vector<ThreatAssessment> out;
    out.reserve(threats.size());
    for (const Threat* t : threats) {
        if (t && t->active && !t->destroyed) out.push_back(assess(*t));
    }

    std::sort(out.begin(), out.end(), [](const ThreatAssessment& a, const ThreatAssessment& b) {
        if (a.priority != b.priority) return a.priority > b.priority;
        if (a.time_to_impact != b.time_to_impact) return a.time_to_impact < b.time_to_impact;
        return a.threat_id < b.threat_id;
    });
    return out;
}

std::vector<ThreatAssessment> ThreatPrioritizer::prioritize(const std::vector<Threat>& threats) const {
    std::vector<const Threat*> ptrs;
    ptrs.reserve(threats.size());
    for (const auto& t : threats) ptrs.push_back(&t);
    return prioritize(ptrs);
}

SweepResult ThreatPrioritizer::consistency_sweep(DefenseWorld& world, AssignmentLedger& ledger,
                                                 const EngagementController& controller,
                                                 KillAdjudicator& adjudicator) const {
    SweepResult result;

    for (const auto& threat_id : ledger.threat_ids()) {
        const Threat* threat = world.get_threat(threat_id);
        bool gone = !threat || !threat->active;
        bool untracked = world.interceptors_targeting(threat_id) == 0 &&
                         !controller.is_engaged(threat_id);
        if (gone || untracked) {
            ledger.clear(threat_id);
            result.cleared_assignments.push_back(threat_id);
        }
    }

    for (auto& threat : world.threats()) {
        if (!threat.active || !threat.being_intercepted()) continue;
        if (world.interceptors_targeting(threat.id) > 0) continue;
        adjudicator.release(threat);
        result.released_claims.push_back(threat.id);
    }

    return result;
}

} // namespace skyshield::defense
