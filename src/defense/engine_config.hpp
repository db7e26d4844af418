/**
 * EngineConfig - tunables for the interception core.
 *
 * Defaults are the operational values; a scenario may override any of
 * them through its "engine" object (camelCase keys, see from_json).
 */

#ifndef SKYSHIELD_DEFENSE_ENGINE_CONFIG_HPP
#define SKYSHIELD_DEFENSE_ENGINE_CONFIG_HPP

#include "io/json_reader.hpp"
#include <cstddef>

namespace skyshield::defense {

enum class GuidanceMode {
    TRUE_PN,
    AUGMENTED_PN
};

struct BlastConfig {
    // Damage zone radii (m)
    double lethal_radius = 3.0;
    double severe_radius = 6.0;
    double moderate_radius = 10.0;
    double light_radius = 15.0;

    double direct_hit_pk = 0.95;      // inside lethal radius
    double pk_jitter = 0.1;           // multiplicative spread, +/-
    double crossing_reference = 300.0;  // m/s, crossing-speed factor numerator
    double closing_bonus = 0.15;      // max bonus for head-on geometry
    double closing_reference = 1000.0;  // m/s closing for full bonus
};

struct FuseConfig {
    double arming_distance = 20.0;    // m travelled before the fuse arms
    double detonation_radius = 12.0;  // m
    double optimal_radius = 6.0;      // m
};

struct EngineConfig {
    // ── Prioritizer ──
    double base_priority = 100.0;
    double default_success_rate = 0.85;
    double success_learning_rate = 0.1;
    double target_leak_probability = 0.05;
    int max_interceptors_per_threat = 4;
    double sweep_interval = 1.0 / 3.0;     // s

    // ── Tracker ──
    int track_history = 10;
    double max_track_acceleration = 50.0;  // m/s^2
    double lead_step = 0.1;                // s
    double lead_horizon = 30.0;            // s
    double spin_up_time = 2.0;             // s
    double track_stale_after = 30.0;       // s

    // ── Solver / cache ──
    double grid_cell_size = 1000.0;        // m
    double solution_ttl = 0.1;             // s
    size_t cache_capacity = 1000;
    size_t cache_evict_count = 100;
    double bisection_tolerance = 0.01;     // s
    double solver_horizon = 30.0;          // s

    // ── Allocator ──
    int max_in_flight = 8;

    // ── Engagement controller ──
    double assessment_delay = 2.0;         // s
    double salvo_interval = 0.5;           // s
    double engagement_retention = 30.0;    // s
    double second_shot_min_tti = 5.0;      // s
    int learning_min_attempts = 5;
    double learning_low_pk = 0.7;
    double learning_high_pk = 0.9;

    // ── Guidance ──
    GuidanceMode guidance_mode = GuidanceMode::AUGMENTED_PN;
    double navigation_constant = 3.0;
    double max_acceleration = 300.0;       // m/s^2
    double min_closing_velocity = 50.0;    // m/s
    double terminal_phase_tgo = 3.0;       // s, target-accel compensation below this

    // ── Adjudicator ──
    double retarget_radius = 50.0;         // m
    int max_interceptors_per_retarget = 3;
    double combo_window = 5.0;             // s
    BlastConfig blast;
    FuseConfig fuse;

    // ── Lifetime ──
    double interceptor_timeout = 30.0;     // s
    double ledger_max_age = 30.0;          // s

    /**
     * Overlay values from a scenario "engine" object onto the defaults.
     * @throws std::runtime_error for out-of-range values
     */
    static EngineConfig from_json(const JsonValue& engine);

    /** @throws std::runtime_error naming the first invalid field */
    void validate() const;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_ENGINE_CONFIG_HPP
