#include "defense/intercept_engine.hpp"
#include "defense/guidance_law.hpp"
#include "physics/vec3_ops.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <limits>

namespace skyshield::defense {

InterceptEngine::InterceptEngine(DefenseWorld& world, const EngineConfig& config)
    : world_(world),
      config_(config),
      prioritizer_(config),
      tracker_(config),
      solver_(config),
      allocator_(config),
      controller_(config, [this](Interceptor&& round) { launch(std::move(round)); }),
      adjudicator_(config),
      last_sweep_(-std::numeric_limits<double>::infinity()) {}

TickReport InterceptEngine::update(double dt) {
    const double now = world_.sim_time;

    // 1. Track
    for (const auto& threat : world_.threats()) {
        if (threat.active) tracker_.observe(threat, now);
    }
    tracker_.purge(now);

    // 2. Lifetime limits
    expire_interceptors(now);

    // 3. Spatial index
    solver_.rebuild_grid(world_.threats());

    // 4. Engagement timers and outcomes
    close_engagements(now);

    // 5. Consistency sweep
    if (now - last_sweep_ >= config_.sweep_interval) sweep(now);

    // 6. Allocation and fire
    allocate_and_engage(now);

    // 7. Guidance
    GuidanceSystem::update_all(dt, world_, tracker_, config_);

    TickReport report = std::move(pending_);
    pending_ = TickReport{};
    report.sim_time = now;
    for (const auto& interceptor : world_.interceptors()) {
        if (interceptor.active) report.in_flight.push_back(interceptor.id);
    }

    world_.purge_inactive_interceptors();
    return report;
}

void InterceptEngine::on_proximity_detonation(const std::string& interceptor_id,
                                              const Vec3& position, double fuse_quality) {
    Interceptor* interceptor = world_.get_interceptor(interceptor_id);
    if (!interceptor || !interceptor->active) return;

    DetonationOutcome outcome = adjudicator_.on_detonation(
        world_, *interceptor, position, fuse_quality, ledger_, pending_);
    if (outcome == DetonationOutcome::DISCARDED_DOUBLE_CLAIM) {
        pending_.diagnostics.push_back("Detonation of " + interceptor_id + " discarded: target already claimed");
    }
}

void InterceptEngine::report_leak(const std::string& threat_id) {
    ledger_.clear(threat_id);
    pending_.record(world_.sim_time, "", "", threat_id, "LEAK");
    log::warn("Threat " + threat_id + " leaked");
}

void InterceptEngine::launch(Interceptor&& round) {
    const double now = world_.sim_time;

    if (const Threat* threat = world_.get_threat(round.target_id)) {
        if (auto lead = tracker_.lead_point(*threat, round.position, round.max_speed)) {
            Vec3 dir = normalized(lead->aim_point - round.position);
            if (dir.norm() > 0.5) round.velocity = dir * round.velocity.norm();
        }
    }

    std::string id = round.id;
    round.on_detonation = [this, id](const Vec3& position, double quality) {
        on_proximity_detonation(id, position, quality);
    };

    pending_.sounds.push_back(SoundCue::LAUNCH);
    pending_.record(now, round.battery_id, round.id, round.target_id, "LAUNCH");
    fired_++;
    world_.add_interceptor(std::move(round));
}

void InterceptEngine::expire_interceptors(double now) {
    for (auto& interceptor : world_.interceptors()) {
        if (interceptor.active && now - interceptor.launch_time > config_.interceptor_timeout) {
            interceptor.terminate(InterceptorFate::TIMEOUT);
            pending_.record(now, interceptor.battery_id, interceptor.id, interceptor.target_id, "TIMEOUT");
        } else if (interceptor.fate == InterceptorFate::GROUND_IMPACT) {
            pending_.record(now, interceptor.battery_id, interceptor.id, interceptor.target_id, "GROUND_IMPACT");
        }
    }
}

void InterceptEngine::close_engagements(double now) {
    for (const auto& eng : controller_.update(world_)) {
        if (eng.result != EngagementResult::PENDING) {
            prioritizer_.record_outcome(eng.category, eng.result == EngagementResult::HIT);
        }
        ledger_.clear(eng.threat_id);
        log::debug("Engagement " + eng.id + " on " + eng.threat_id + " closed: " +
                   result_name(eng.result) + " at t=" + std::to_string(now));
    }
}

void InterceptEngine::sweep(double now) {
    last_sweep_ = now;

    SweepResult repaired = prioritizer_.consistency_sweep(world_, ledger_, controller_, adjudicator_);
    for (const auto& id : ledger_.cleanup(now, config_.ledger_max_age)) {
        repaired.cleared_assignments.push_back(id);
    }

    for (const auto& id : repaired.cleared_assignments) {
        pending_.diagnostics.push_back("Sweep cleared stale assignment for " + id);
    }
    for (const auto& id : repaired.released_claims) {
        pending_.diagnostics.push_back("Sweep released orphaned claim on " + id);
    }
    if (!repaired.empty()) {
        log::debug("Sweep repaired " + std::to_string(repaired.cleared_assignments.size()) +
                   " assignment(s), " + std::to_string(repaired.released_claims.size()) + " claim(s)");
    }
}

void InterceptEngine::allocate_and_engage(double now) {
    std::vector<const Threat*> candidates;
    for (const auto& threat : world_.threats()) {
        if (!threat.active || threat.destroyed || threat.being_intercepted()) continue;
        if (controller_.is_engaged(threat.id)) continue;
        if (ledger_.contains(threat.id)) continue;
        if (world_.interceptors_targeting(threat.id) > 0) continue;
        candidates.push_back(&threat);
    }
    if (candidates.empty()) return;

    std::vector<ThreatAssessment> ranked = prioritizer_.prioritize(candidates);
    std::vector<BatteryCapability> caps = allocator_.capabilities(world_, solver_, controller_, ranked);

    const int committed = world_.active_interceptor_count() + controller_.reserved_shots();
    last_plan_ = allocator_.allocate(ranked, caps, committed,
        [this](const ThreatAssessment& threat, const BatteryCapability& cap) {
            return controller_.recommended_interceptors(threat.category, cap.battery_id,
                                                        threat.required_interceptors);
        });

    for (const auto& alloc : last_plan_.allocations) {
        const Threat* threat = world_.get_threat(alloc.threat_id);
        Battery* battery = world_.get_battery(alloc.battery_id);
        if (!threat || !battery) continue;

        const int count = alloc.interceptor_count;
        int in_flight = world_.active_interceptor_count() + controller_.reserved_shots();
        if (in_flight + count > config_.max_in_flight) {
            log::warn("In-flight cap reached; holding " + alloc.threat_id);
            break;
        }

        EngagementStrategy strategy = controller_.select_strategy(count, threat->time_to_impact);
        std::string eng_id = controller_.engage(world_, threat->id, battery->id(), count, strategy);
        const Engagement* eng = controller_.find(eng_id);
        if (eng && eng->live()) {
            ledger_.assign(alloc.threat_id, alloc.battery_id, count, now);
        }
    }
}

} // namespace skyshield::defense
