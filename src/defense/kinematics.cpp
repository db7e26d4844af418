#include "defense/kinematics.hpp"
#include "physics/vec3_ops.hpp"
#include <cmath>
#include <limits>

namespace skyshield::defense {

// ═══════════════════════════════════════════════════════════════
// Threats
// ═══════════════════════════════════════════════════════════════

std::vector<std::string> ThreatKinematics::update_all(double dt, DefenseWorld& world) {
    std::vector<std::string> impacted;
    for (auto& threat : world.threats()) {
        if (!threat.active || threat.destroyed) continue;
        if (update_entity(threat, dt)) impacted.push_back(threat.id);
    }
    return impacted;
}

bool ThreatKinematics::update_entity(Threat& threat, double dt) {
    if (is_maneuvering(threat.category)) {
        threat.position += threat.velocity * dt;
    } else {
        Vec3 g = gravity_vector();
        threat.position = project(threat.position, threat.velocity, g, dt);
        threat.velocity += g * dt;
    }

    if (threat.position.y <= 0.0) {
        threat.position.y = 0.0;
        threat.active = false;
        threat.time_to_impact = 0.0;
        threat.impact_point = threat.position;
        return true;
    }

    refresh_impact_estimate(threat);
    return false;
}

double ThreatKinematics::time_to_impact(const Threat& threat) {
    const double y = threat.position.y;
    const double vy = threat.velocity.y;
    if (y <= 0.0) return 0.0;

    if (is_maneuvering(threat.category)) {
        if (vy >= 0.0) return std::numeric_limits<double>::infinity();
        return -y / vy;
    }

    // y + vy*t - g/2*t^2 = 0, positive root
    double a = 0.5 * GRAVITY;
    double disc = vy * vy + 4.0 * a * y;
    return (vy + std::sqrt(disc)) / (2.0 * a);
}

std::optional<Vec3> ThreatKinematics::impact_point(const Threat& threat) {
    double t = time_to_impact(threat);
    if (!std::isfinite(t)) return std::nullopt;

    Vec3 accel = is_maneuvering(threat.category) ? Vec3::Zero() : gravity_vector();
    Vec3 p = project(threat.position, threat.velocity, accel, t);
    p.y = 0.0;
    return p;
}

void ThreatKinematics::refresh_impact_estimate(Threat& threat) {
    threat.time_to_impact = time_to_impact(threat);
    threat.impact_point = impact_point(threat);
}

// ═══════════════════════════════════════════════════════════════
// Interceptors
// ═══════════════════════════════════════════════════════════════

void InterceptorKinematics::update_all(double dt, DefenseWorld& world, double spin_up_time) {
    for (auto& interceptor : world.interceptors()) {
        if (!interceptor.active) continue;
        update_entity(interceptor, dt, spin_up_time);
    }
}

void InterceptorKinematics::update_entity(Interceptor& interceptor, double dt, double spin_up_time) {
    Vec3 dir = normalized(interceptor.velocity);
    double boost = spin_up_time > 0.0 ? interceptor.max_speed / spin_up_time : 0.0;

    Vec3 accel = interceptor.commanded_accel;
    if (interceptor.velocity.norm() < interceptor.max_speed) {
        accel += dir * boost;
    }

    interceptor.velocity = clamp_norm(interceptor.velocity + accel * dt, interceptor.max_speed);
    Vec3 step = interceptor.velocity * dt;
    interceptor.position += step;
    interceptor.distance_travelled += step.norm();

    if (interceptor.position.y < 0.0) {
        interceptor.terminate(InterceptorFate::GROUND_IMPACT);
    }
}

} // namespace skyshield::defense
