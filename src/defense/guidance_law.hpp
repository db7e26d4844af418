#ifndef SKYSHIELD_DEFENSE_GUIDANCE_LAW_HPP
#define SKYSHIELD_DEFENSE_GUIDANCE_LAW_HPP

#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"

namespace skyshield::defense {

class PredictiveTracker;

/**
 * Interceptor Guidance Laws
 *
 * Proportional navigation in the local Cartesian frame:
 * - True PN: LOS rate from relative geometry, omega = (r x v_rel) / |r|^2
 * - Augmented PN: LOS rate from the change in LOS direction since the
 *   previous tick (falls back to true PN when there is no history)
 * - Terminal: PN plus target-acceleration compensation
 * Every command is clamped to the interceptor's lateral-acceleration limit.
 */

/**
 * Relative state for one guidance evaluation
 */
struct GuidanceGeometry {
    Vec3 interceptor_position;
    Vec3 interceptor_velocity;
    Vec3 target_position;
    Vec3 target_velocity;
};

/**
 * Guidance parameters
 */
struct GuidanceParams {
    GuidanceMode mode = GuidanceMode::AUGMENTED_PN;
    double navigation_constant = 3.0;   // N (typically 3-5)
    double max_acceleration = 300.0;    // m/s^2
    double min_closing_velocity = 50.0; // m/s, floor for time-to-go only

    static GuidanceParams from_config(const EngineConfig& config);
};

/**
 * Guidance command output
 */
struct GuidanceCommand {
    Vec3 acceleration;            // m/s^2, clamped
    Vec3 los;                     // unit line of sight this tick
    Vec3 los_rate;                // 1/s
    double closing_velocity = 0;  // m/s (positive = closing)
    double time_to_go = 0;        // s
    double required_g = 0;        // g's before the clamp
    double range = 0;             // m
};

/**
 * Zero-effort-miss estimate
 */
struct ZeroEffortMiss {
    Vec3 miss;                    // target minus interceptor at closest approach
    double distance = 0;          // m
    double time_to_go = 0;        // s
};

/**
 * Proportional Navigation
 *
 * a_cmd = N * V_c * LOS_rate
 *
 * @param geom Relative geometry
 * @param params Guidance parameters
 * @param prev_los Unit LOS from the previous tick, or nullptr
 * @param dt Time since prev_los was taken
 * @return Guidance command (zero when range is degenerate)
 */
GuidanceCommand proportional_navigation(
    const GuidanceGeometry& geom,
    const GuidanceParams& params,
    const Vec3* prev_los = nullptr,
    double dt = 0.0);

/**
 * Terminal-phase guidance
 *
 * PN plus target-acceleration compensation:
 * a_cmd = a_pn + a_target * (t_go * N / 2), then clamped.
 */
GuidanceCommand terminal_guidance(
    const GuidanceGeometry& geom,
    const Vec3& target_acceleration,
    const GuidanceParams& params,
    const Vec3* prev_los = nullptr,
    double dt = 0.0);

/**
 * Miss distance if neither body changes its current acceleration.
 * Interceptor acceleration is included in its projection.
 */
ZeroEffortMiss zero_effort_miss(
    const GuidanceGeometry& geom,
    const Vec3& interceptor_acceleration);

/**
 * Guidance system: refreshes the command of every airborne interceptor.
 */
class GuidanceSystem {
public:
    static void update_all(double dt, DefenseWorld& world,
                           const PredictiveTracker& tracker,
                           const EngineConfig& config);

private:
    static void update_entity(Interceptor& interceptor, double dt,
                              DefenseWorld& world,
                              const PredictiveTracker& tracker,
                              const GuidanceParams& params,
                              double terminal_phase_tgo);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_GUIDANCE_LAW_HPP
