/**
 * ProximityFuse - host-side fuse model for airborne interceptors.
 *
 * Arms after the interceptor has travelled the arming distance, then
 * fires the interceptor's detonation callback at the point of closest
 * approach to its target within the last step, if that approach falls
 * inside the detonation radius.
 */

#ifndef SKYSHIELD_DEFENSE_PROXIMITY_FUSE_HPP
#define SKYSHIELD_DEFENSE_PROXIMITY_FUSE_HPP

#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"

namespace skyshield::defense {

struct ClosestApproach {
    double distance = 0.0;   // m
    double time_offset = 0.0;  // s, in [-dt, 0] relative to now
};

class ProximityFuse {
public:
    static void update_all(double dt, DefenseWorld& world, const FuseConfig& config);

    /** Fuse quality in [0.5, 1] for a detonation at miss distance d. */
    static double quality(double d, const FuseConfig& config);

    /**
     * Closest approach over the last dt seconds assuming straight-line
     * relative motion between the two bodies.
     */
    static ClosestApproach closest_approach(const Vec3& rel_position,
                                            const Vec3& rel_velocity,
                                            double dt);

private:
    static void update_entity(Interceptor& interceptor, double dt,
                              DefenseWorld& world, const FuseConfig& config);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_PROXIMITY_FUSE_HPP
