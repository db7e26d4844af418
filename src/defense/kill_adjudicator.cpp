#include "defense/kill_adjudicator.hpp"
#include "physics/vec3_ops.hpp"
#include "util/log.hpp"
#include <algorithm>
#include <cmath>

namespace skyshield::defense {

namespace {

// Quadratic falloff across a zone: 1 at the inner edge, 0 at the outer edge
double falloff(double d, double inner, double outer) {
    double x = (d - inner) / (outer - inner);
    return 1.0 - x * x;
}

} // namespace

const char* outcome_name(DetonationOutcome outcome) {
    switch (outcome) {
        case DetonationOutcome::DISCARDED_INACTIVE:     return "discarded_inactive";
        case DetonationOutcome::DISCARDED_DOUBLE_CLAIM: return "discarded_double_claim";
        case DetonationOutcome::HIT:                    return "hit";
        case DetonationOutcome::MISS:                   return "miss";
    }
    return "unknown";
}

KillAdjudicator::KillAdjudicator(const EngineConfig& config)
    : config_(config) {}

bool KillAdjudicator::try_claim(Threat& threat) {
    if (threat.being_intercepted_) return false;
    threat.being_intercepted_ = true;
    return true;
}

void KillAdjudicator::release(Threat& threat) {
    threat.being_intercepted_ = false;
}

// ── Blast model ──

const char* KillAdjudicator::zone_name(double d) const {
    const BlastConfig& b = config_.blast;
    if (d <= b.lethal_radius) return "lethal";
    if (d <= b.severe_radius) return "severe";
    if (d <= b.moderate_radius) return "moderate";
    if (d <= b.light_radius) return "light";
    return "none";
}

double KillAdjudicator::kill_probability(double d, double target_speed,
                                         double closing_velocity) const {
    const BlastConfig& b = config_.blast;

    double base;
    if (d <= b.lethal_radius) {
        base = b.direct_hit_pk;
    } else if (d <= b.severe_radius) {
        base = 0.8 + falloff(d, b.lethal_radius, b.severe_radius) * 0.15;
    } else if (d <= b.moderate_radius) {
        base = 0.3 + falloff(d, b.severe_radius, b.moderate_radius) * 0.5;
    } else if (d <= b.light_radius) {
        base = falloff(d, b.moderate_radius, b.light_radius) * 0.3;
    } else {
        return 0.0;
    }

    double crossing = std::min(1.0, b.crossing_reference / (target_speed + 100.0));
    double head_on = 1.0 + b.closing_bonus *
        std::clamp(closing_velocity / b.closing_reference, 0.0, 1.0);

    return std::clamp(base * crossing * head_on, 0.0, 1.0);
}

BlastAssessment KillAdjudicator::assess(const Vec3& blast, const Threat& target,
                                        const Interceptor& interceptor, SimRNG& rng) const {
    BlastAssessment a;
    a.miss_distance = distance(blast, target.position);
    a.zone = zone_name(a.miss_distance);

    Vec3 r = target.position - interceptor.position;
    double range = r.norm();
    double closing = range > 1e-9
        ? -dot(r, target.velocity - interceptor.velocity) / range
        : (interceptor.velocity - target.velocity).norm();

    double pk = kill_probability(a.miss_distance, target.speed(), closing);
    double jitter = config_.blast.pk_jitter;
    if (jitter > 0.0) {
        pk *= rng.uniform(1.0 - jitter, 1.0 + jitter);
    }
    a.pk = std::clamp(pk, 0.0, 1.0);
    a.hit = a.pk > 0.0 && rng.bernoulli(a.pk);
    return a;
}

// ── Events ──

DetonationOutcome KillAdjudicator::on_detonation(DefenseWorld& world, Interceptor& interceptor,
                                                 const Vec3& position, double fuse_quality,
                                                 AssignmentLedger& ledger, TickReport& report) {
    const double now = world.sim_time;
    interceptor.terminate(InterceptorFate::DETONATED);
    report.explosions.push_back(ExplosionEvent{position, fuse_quality, interceptor.id});
    report.sounds.push_back(SoundCue::EXPLOSION);

    Threat* target = world.get_threat(interceptor.target_id);
    if (!target || !target->active) {
        stats_.discarded++;
        report.record(now, interceptor.battery_id, interceptor.id, interceptor.target_id, "DISCARD");
        return DetonationOutcome::DISCARDED_INACTIVE;
    }

    if (!try_claim(*target)) {
        stats_.discarded++;
        report.record(now, interceptor.battery_id, interceptor.id, target->id, "DISCARD");
        return DetonationOutcome::DISCARDED_DOUBLE_CLAIM;
    }

    BlastAssessment blast = assess(position, *target, interceptor, world.rng);

    if (!blast.hit) {
        release(*target);
        stats_.misses++;
        report.sounds.push_back(SoundCue::INTERCEPT_FAILED);
        report.record(now, interceptor.battery_id, interceptor.id, target->id, "MISS");
        log::debug("Miss on " + target->id + " by " + interceptor.id + " (" + blast.zone +
                   ", d=" + std::to_string(blast.miss_distance) + "m)");
        return DetonationOutcome::MISS;
    }

    target->active = false;
    target->destroyed = true;
    stats_.kills++;
    ledger.clear(target->id);
    report.sounds.push_back(SoundCue::INTERCEPT_SUCCESS);
    report.record(now, interceptor.battery_id, interceptor.id, target->id, "KILL");
    score_kill(*target, now, report);

    std::string destroyed_id = target->id;
    repurpose(world, destroyed_id, report);
    return DetonationOutcome::HIT;
}

void KillAdjudicator::score_kill(const Threat& threat, double now, TickReport& report) {
    combo_ = (now - last_kill_time_ <= config_.combo_window) ? combo_ + 1 : 1;
    last_kill_time_ = now;

    int points = static_cast<int>(damage_value(threat.category) / 10.0) * combo_;
    stats_.score += points;
    stats_.best_combo = std::max(stats_.best_combo, combo_);
    report.scores.push_back(ScoreEvent{threat.id, points, combo_});
}

int KillAdjudicator::repurpose(DefenseWorld& world, const std::string& destroyed_id,
                               TickReport& report) {
    const double now = world.sim_time;
    int redirected = 0;

    for (auto& interceptor : world.interceptors()) {
        if (!interceptor.active || interceptor.target_id != destroyed_id) continue;

        const Threat* best = nullptr;
        double best_score = 0.0;
        for (const auto& candidate : world.threats()) {
            if (!candidate.active || candidate.destroyed || candidate.id == destroyed_id) continue;

            double d = distance(interceptor.position, candidate.position);
            if (d > config_.retarget_radius) continue;

            int chasing = world.interceptors_targeting(candidate.id);
            if (chasing >= config_.max_interceptors_per_retarget) continue;

            double score = (1.0 / std::max(d, 1e-3)) *
                           (1.0 / std::max(candidate.time_to_impact, 1.0)) *
                           (1.0 / (chasing + 1));
            if (score > best_score) {
                best_score = score;
                best = &candidate;
            }
        }

        if (best) {
            interceptor.retarget(best->id);
            stats_.retargeted++;
            redirected++;
            report.record(now, interceptor.battery_id, interceptor.id, best->id, "RETARGET");
        } else {
            self_destruct(interceptor, now, report);
        }
    }
    return redirected;
}

void KillAdjudicator::self_destruct(Interceptor& interceptor, double now, TickReport& report) {
    std::string old_target = interceptor.target_id;
    interceptor.terminate(InterceptorFate::SELF_DESTRUCT);
    interceptor.target_id.clear();
    stats_.self_destructed++;

    report.explosions.push_back(ExplosionEvent{interceptor.position, 0.0, interceptor.id});
    report.sounds.push_back(SoundCue::SELF_DESTRUCT);
    report.record(now, interceptor.battery_id, interceptor.id, old_target, "SELF_DESTRUCT");

    std::string line = "Interceptor " + interceptor.id + " self-destructed: no retarget candidate";
    report.diagnostics.push_back(line);
    log::info(line);
}

} // namespace skyshield::defense
