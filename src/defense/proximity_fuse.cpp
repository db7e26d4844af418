#include "defense/proximity_fuse.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>

namespace skyshield::defense {

void ProximityFuse::update_all(double dt, DefenseWorld& world, const FuseConfig& config) {
    // Index loop: a detonation callback may retarget other interceptors
    for (size_t i = 0; i < world.interceptors().size(); ++i) {
        Interceptor& interceptor = world.interceptors()[i];
        if (!interceptor.active || interceptor.target_id.empty()) continue;
        update_entity(interceptor, dt, world, config);
    }
}

double ProximityFuse::quality(double d, const FuseConfig& config) {
    if (d <= config.optimal_radius) {
        return 0.9 + (1.0 - d / config.optimal_radius) * 0.1;
    }
    double span = config.detonation_radius - config.optimal_radius;
    return std::max(0.5, 0.9 - ((d - config.optimal_radius) / span) * 0.4);
}

ClosestApproach ProximityFuse::closest_approach(const Vec3& rel_position,
                                                const Vec3& rel_velocity,
                                                double dt) {
    // r(tau) = r + v*tau for tau in [-dt, 0]
    double v2 = rel_velocity.norm_squared();
    double tau = 0.0;
    if (v2 > 1e-12) {
        tau = std::clamp(-dot(rel_position, rel_velocity) / v2, -dt, 0.0);
    }
    return ClosestApproach{(rel_position + rel_velocity * tau).norm(), tau};
}

void ProximityFuse::update_entity(Interceptor& interceptor, double dt,
                                  DefenseWorld& world, const FuseConfig& config) {
    if (interceptor.distance_travelled < config.arming_distance) return;

    const Threat* target = world.get_threat(interceptor.target_id);
    if (!target || !target->active) return;

    Vec3 r = target->position - interceptor.position;
    Vec3 vr = target->velocity - interceptor.velocity;
    ClosestApproach ca = closest_approach(r, vr, dt);
    if (ca.distance > config.detonation_radius) return;

    // Blast placed at the closest-approach offset from the target's current position
    Vec3 blast = target->position - (r + vr * ca.time_offset);
    if (interceptor.on_detonation) {
        interceptor.on_detonation(blast, quality(ca.distance, config));
    }
}

} // namespace skyshield::defense
