#include "defense/threat.hpp"

namespace skyshield::defense {

const char* category_name(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::BALLISTIC_MISSILE: return "ballistic_missile";
        case ThreatCategory::CRUISE_MISSILE:    return "cruise_missile";
        case ThreatCategory::ROCKET:            return "rocket";
        case ThreatCategory::MORTAR:            return "mortar";
        case ThreatCategory::DRONE:             return "drone";
        default:                                return "unknown";
    }
}

ThreatCategory parse_category(const std::string& name) {
    if (name == "ballistic_missile" || name == "ballistic") return ThreatCategory::BALLISTIC_MISSILE;
    if (name == "cruise_missile" || name == "cruise")       return ThreatCategory::CRUISE_MISSILE;
    if (name == "rocket")                                    return ThreatCategory::ROCKET;
    if (name == "mortar")                                    return ThreatCategory::MORTAR;
    if (name == "drone")                                     return ThreatCategory::DRONE;
    return ThreatCategory::UNKNOWN;
}

bool is_maneuvering(ThreatCategory category) {
    return category == ThreatCategory::CRUISE_MISSILE ||
           category == ThreatCategory::DRONE;
}

double damage_value(ThreatCategory category) {
    switch (category) {
        case ThreatCategory::BALLISTIC_MISSILE: return 1000.0;
        case ThreatCategory::CRUISE_MISSILE:    return 800.0;
        case ThreatCategory::ROCKET:            return 400.0;
        case ThreatCategory::MORTAR:            return 200.0;
        case ThreatCategory::DRONE:             return 100.0;
        default:                                return 300.0;
    }
}

} // namespace skyshield::defense
