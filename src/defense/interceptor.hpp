/**
 * Interceptor - a fired round under guidance.
 *
 * An empty target_id means the interceptor has no target (coasting).
 * The detonation callback is bound at launch and invoked by the
 * proximity fuse with the blast position and fuse quality.
 */

#ifndef SKYSHIELD_DEFENSE_INTERCEPTOR_HPP
#define SKYSHIELD_DEFENSE_INTERCEPTOR_HPP

#include "core/state_vector.hpp"
#include <functional>
#include <string>

namespace skyshield::defense {

enum class InterceptorFate {
    IN_FLIGHT,
    DETONATED,
    SELF_DESTRUCT,
    GROUND_IMPACT,
    TIMEOUT
};

const char* fate_name(InterceptorFate fate);

struct Interceptor {
    using DetonationCallback = std::function<void(const Vec3& position, double fuse_quality)>;

    std::string id;
    std::string battery_id;
    std::string target_id;

    Vec3 position;
    Vec3 velocity;

    bool active = true;
    InterceptorFate fate = InterceptorFate::IN_FLIGHT;

    double launch_time = 0.0;
    double max_speed = 0.0;           // m/s
    double distance_travelled = 0.0;  // m, arms the fuse

    // Guidance state
    Vec3 commanded_accel;             // m/s^2, last command
    Vec3 last_los;                    // unit LOS from the previous tick
    bool has_last_los = false;

    DetonationCallback on_detonation;

    // Drops LOS memory so the next tick starts guidance fresh
    void retarget(const std::string& new_target) {
        target_id = new_target;
        has_last_los = false;
    }

    void terminate(InterceptorFate how) {
        active = false;
        fate = how;
        commanded_accel = Vec3::Zero();
    }
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_INTERCEPTOR_HPP
