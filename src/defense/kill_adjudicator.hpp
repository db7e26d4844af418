/**
 * KillAdjudicator - proximity-detonation kill assessment and retargeting.
 *
 * Sole owner of the per-threat being-intercepted claim. On each fuse
 * event it claims the target, rolls the blast model with the world's
 * seeded RNG, and on a kill redirects or self-destructs every other
 * interceptor that was chasing the same threat.
 */

#ifndef SKYSHIELD_DEFENSE_KILL_ADJUDICATOR_HPP
#define SKYSHIELD_DEFENSE_KILL_ADJUDICATOR_HPP

#include "defense/assignment_ledger.hpp"
#include "defense/defense_events.hpp"
#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include <string>

namespace skyshield::defense {

enum class DetonationOutcome {
    DISCARDED_INACTIVE,      // target already gone
    DISCARDED_DOUBLE_CLAIM,  // another interceptor holds the claim
    HIT,
    MISS
};

const char* outcome_name(DetonationOutcome outcome);

struct BlastAssessment {
    double miss_distance = 0.0;   // m
    double pk = 0.0;              // after jitter, clamped to [0, 1]
    const char* zone = "none";    // lethal/severe/moderate/light/none
    bool hit = false;
};

struct AdjudicationStats {
    int kills = 0;
    int misses = 0;
    int discarded = 0;
    int retargeted = 0;
    int self_destructed = 0;
    int score = 0;
    int best_combo = 0;
};

class KillAdjudicator {
public:
    explicit KillAdjudicator(const EngineConfig& config);

    // ── Claim (check-and-set) ──

    /** @return true if this call set the claim */
    bool try_claim(Threat& threat);
    void release(Threat& threat);

    // ── Blast model ──

    /**
     * Kill probability before jitter.
     * @param miss_distance Blast-to-target distance (m)
     * @param target_speed Target speed (m/s); fast crossers are harder
     * @param closing_velocity Interceptor closing speed (m/s); head-on helps
     */
    double kill_probability(double miss_distance, double target_speed,
                            double closing_velocity) const;

    const char* zone_name(double miss_distance) const;

    BlastAssessment assess(const Vec3& blast, const Threat& target,
                           const Interceptor& interceptor, SimRNG& rng) const;

    // ── Events ──

    /**
     * Resolve a proximity detonation. The interceptor is always consumed.
     * On a kill the ledger entry is cleared and repurpose() runs.
     */
    DetonationOutcome on_detonation(DefenseWorld& world, Interceptor& interceptor,
                                    const Vec3& position, double fuse_quality,
                                    AssignmentLedger& ledger, TickReport& report);

    /**
     * Redirect every other active interceptor chasing destroyed_id to the
     * best nearby live threat, or self-destruct it.
     * @return number of interceptors retargeted
     */
    int repurpose(DefenseWorld& world, const std::string& destroyed_id, TickReport& report);

    const AdjudicationStats& stats() const { return stats_; }

private:
    EngineConfig config_;
    AdjudicationStats stats_;

    double last_kill_time_ = -1e9;
    int combo_ = 0;

    void score_kill(const Threat& threat, double now, TickReport& report);
    void self_destruct(Interceptor& interceptor, double now, TickReport& report);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_KILL_ADJUDICATOR_HPP
