/**
 * Host-side kinematics for threats and interceptors.
 *
 * Threats fly ballistic (gravity only) unless their category maneuvers,
 * in which case they hold velocity. Interceptors spin up along their
 * velocity vector toward max speed and add the guidance command.
 */

#ifndef SKYSHIELD_DEFENSE_KINEMATICS_HPP
#define SKYSHIELD_DEFENSE_KINEMATICS_HPP

#include "defense/defense_world.hpp"
#include <optional>
#include <string>
#include <vector>

namespace skyshield::defense {

class ThreatKinematics {
public:
    /**
     * Propagate every active threat and refresh its impact estimate.
     * @return ids of threats that reached the ground this step
     */
    static std::vector<std::string> update_all(double dt, DefenseWorld& world);

    /** Seconds until ground contact, infinity if never. */
    static double time_to_impact(const Threat& threat);

    static std::optional<Vec3> impact_point(const Threat& threat);

    /** Recompute time_to_impact and impact_point from current state. */
    static void refresh_impact_estimate(Threat& threat);

private:
    static bool update_entity(Threat& threat, double dt);
};

class InterceptorKinematics {
public:
    static void update_all(double dt, DefenseWorld& world, double spin_up_time);

private:
    static void update_entity(Interceptor& interceptor, double dt, double spin_up_time);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_KINEMATICS_HPP
