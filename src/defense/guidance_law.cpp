#include "defense/guidance_law.hpp"
#include "defense/predictive_tracker.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>

namespace skyshield::defense {

namespace {
    constexpr double MIN_RANGE = 1e-6;  // m, below this geometry is degenerate
}

GuidanceParams GuidanceParams::from_config(const EngineConfig& config) {
    GuidanceParams p;
    p.mode = config.guidance_mode;
    p.navigation_constant = config.navigation_constant;
    p.max_acceleration = config.max_acceleration;
    p.min_closing_velocity = config.min_closing_velocity;
    return p;
}

GuidanceCommand proportional_navigation(
    const GuidanceGeometry& geom,
    const GuidanceParams& params,
    const Vec3* prev_los,
    double dt) {

    GuidanceCommand cmd;

    Vec3 r = geom.target_position - geom.interceptor_position;
    Vec3 vr = geom.target_velocity - geom.interceptor_velocity;
    cmd.range = r.norm();
    if (cmd.range < MIN_RANGE) return cmd;

    cmd.los = r / cmd.range;
    cmd.closing_velocity = -dot(r, vr) / cmd.range;
    cmd.time_to_go = cmd.range / std::max(cmd.closing_velocity, params.min_closing_velocity);

    // LOS rate
    if (params.mode == GuidanceMode::AUGMENTED_PN && prev_los && dt > 0.0) {
        cmd.los_rate = (cmd.los - *prev_los) / dt;
    } else {
        Vec3 omega = cross(r, vr) / (cmd.range * cmd.range);
        cmd.los_rate = cross(omega, cmd.los);
    }

    // PN command: a_cmd = N * Vc * LOS_rate
    Vec3 a = cmd.los_rate * (params.navigation_constant * cmd.closing_velocity);
    cmd.required_g = a.norm() / GRAVITY;
    cmd.acceleration = clamp_norm(a, params.max_acceleration);

    return cmd;
}

GuidanceCommand terminal_guidance(
    const GuidanceGeometry& geom,
    const Vec3& target_acceleration,
    const GuidanceParams& params,
    const Vec3* prev_los,
    double dt) {

    GuidanceCommand cmd = proportional_navigation(geom, params, prev_los, dt);
    if (cmd.range < MIN_RANGE) return cmd;

    Vec3 pn = cmd.los_rate * (params.navigation_constant * cmd.closing_velocity);
    Vec3 a = pn + target_acceleration * (cmd.time_to_go * params.navigation_constant / 2.0);
    cmd.required_g = a.norm() / GRAVITY;
    cmd.acceleration = clamp_norm(a, params.max_acceleration);

    return cmd;
}

ZeroEffortMiss zero_effort_miss(
    const GuidanceGeometry& geom,
    const Vec3& interceptor_acceleration) {

    ZeroEffortMiss zem;

    Vec3 r = geom.target_position - geom.interceptor_position;
    Vec3 vr = geom.target_velocity - geom.interceptor_velocity;
    double v2 = vr.norm_squared();

    double tgo = v2 > 1e-12 ? -dot(r, vr) / v2 : 0.0;
    zem.time_to_go = std::max(tgo, 0.0);

    Vec3 target_at = geom.target_position + geom.target_velocity * zem.time_to_go;
    Vec3 interceptor_at = project(geom.interceptor_position, geom.interceptor_velocity,
                                  interceptor_acceleration, zem.time_to_go);
    zem.miss = target_at - interceptor_at;
    zem.distance = zem.miss.norm();
    return zem;
}

// ═══════════════════════════════════════════════════════════════
// GuidanceSystem
// ═══════════════════════════════════════════════════════════════

void GuidanceSystem::update_all(double dt, DefenseWorld& world,
                                const PredictiveTracker& tracker,
                                const EngineConfig& config) {
    GuidanceParams params = GuidanceParams::from_config(config);
    for (auto& interceptor : world.interceptors()) {
        if (!interceptor.active) continue;
        update_entity(interceptor, dt, world, tracker, params, config.terminal_phase_tgo);
    }
}

void GuidanceSystem::update_entity(Interceptor& interceptor, double dt,
                                   DefenseWorld& world,
                                   const PredictiveTracker& tracker,
                                   const GuidanceParams& params,
                                   double terminal_phase_tgo) {
    const Threat* target = interceptor.target_id.empty()
        ? nullptr : world.get_threat(interceptor.target_id);
    if (!target || !target->active) {
        // Coast until the adjudicator retargets or destroys us
        interceptor.commanded_accel = Vec3::Zero();
        interceptor.has_last_los = false;
        return;
    }

    GuidanceGeometry geom{interceptor.position, interceptor.velocity,
                          target->position, target->velocity};
    const Vec3* prev = interceptor.has_last_los ? &interceptor.last_los : nullptr;

    GuidanceCommand cmd = proportional_navigation(geom, params, prev, dt);
    if (cmd.range > 0.0 && cmd.time_to_go < terminal_phase_tgo) {
        cmd = terminal_guidance(geom, tracker.acceleration(target->id), params, prev, dt);
    }

    interceptor.commanded_accel = cmd.acceleration;
    if (cmd.range > 0.0) {
        interceptor.last_los = cmd.los;
        interceptor.has_last_los = true;
    }
}

} // namespace skyshield::defense
