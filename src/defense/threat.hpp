/**
 * Threat - an inbound body tracked by the defense core.
 *
 * Kinematics are owned by the host (scenario runner); the core reads
 * them each tick. The being-intercepted claim is private: only the
 * KillAdjudicator may flip it, everyone else reads it.
 */

#ifndef SKYSHIELD_DEFENSE_THREAT_HPP
#define SKYSHIELD_DEFENSE_THREAT_HPP

#include "core/state_vector.hpp"
#include <limits>
#include <optional>
#include <string>

namespace skyshield::defense {

enum class ThreatCategory {
    BALLISTIC_MISSILE,
    CRUISE_MISSILE,
    ROCKET,
    MORTAR,
    DRONE,
    UNKNOWN
};

const char* category_name(ThreatCategory category);

// Unrecognized names map to UNKNOWN
ThreatCategory parse_category(const std::string& name);

// Cruise missiles and drones can change course in flight
bool is_maneuvering(ThreatCategory category);

// Expected damage if the threat leaks, used for scoring
double damage_value(ThreatCategory category);

class KillAdjudicator;

struct Threat {
    std::string id;
    ThreatCategory category = ThreatCategory::UNKNOWN;

    Vec3 position;          // m, y = altitude
    Vec3 velocity;          // m/s

    bool active = true;
    bool destroyed = false;

    double time_to_impact = std::numeric_limits<double>::infinity();  // s
    std::optional<Vec3> impact_point;

    double spawn_time = 0.0;

    bool being_intercepted() const { return being_intercepted_; }

    double speed() const { return velocity.norm(); }
    double altitude() const { return position.y; }

private:
    friend class KillAdjudicator;
    bool being_intercepted_ = false;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_THREAT_HPP
