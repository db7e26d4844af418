#include "defense/battery.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>

namespace skyshield::defense {

namespace {
    // Launch tube exit speed as a fraction of max interceptor speed
    constexpr double LAUNCH_SPEED_FRACTION = 0.3;
}

const char* battery_kind_name(BatteryKind kind) {
    return kind == BatteryKind::LASER ? "laser" : "launcher";
}

Battery::Battery(const BatterySpec& spec)
    : spec_(spec),
      available_(std::clamp(spec.interceptors, 0, std::max(spec.max_interceptors, 0))),
      operational_(spec.operational) {}

bool Battery::in_envelope(const Threat& threat) const {
    if (!threat.active || threat.destroyed) return false;
    if (threat.position.y <= 0.0) return false;
    double range = distance(threat.position, spec_.position);
    return range >= spec_.min_range && range <= spec_.max_range;
}

// ── LauncherBattery ──

bool LauncherBattery::can_fire_interceptors() const {
    return operational_ && available_ > 0;
}

bool LauncherBattery::can_intercept(const Threat& threat) const {
    return operational_ && in_envelope(threat);
}

int LauncherBattery::fire_interceptors(const Threat& threat, int count, double now,
                                       const LaunchCallback& on_launch) {
    if (!can_fire_interceptors() || !threat.active) return 0;

    int to_fire = std::min(count, available_);
    Vec3 dir = normalized(threat.position - spec_.position);
    if (dir.norm() < 0.5) dir = Vec3{0.0, 1.0, 0.0};

    for (int i = 0; i < to_fire; ++i) {
        Interceptor rnd;
        rnd.id = spec_.id + "-I" + std::to_string(++launch_counter_);
        rnd.battery_id = spec_.id;
        rnd.target_id = threat.id;
        rnd.position = spec_.position;
        rnd.velocity = dir * (spec_.interceptor_speed * LAUNCH_SPEED_FRACTION);
        rnd.launch_time = now;
        rnd.max_speed = spec_.interceptor_speed;
        available_--;
        if (on_launch) on_launch(std::move(rnd));
    }
    return to_fire;
}

// ── LaserBattery ──

bool LaserBattery::can_intercept(const Threat& threat) const {
    return operational_ && in_envelope(threat);
}

} // namespace skyshield::defense
