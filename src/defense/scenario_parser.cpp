#include "defense/scenario_parser.hpp"
#include "defense/kinematics.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <unordered_set>

namespace skyshield::defense {

namespace {

std::string required_id(const JsonValue& def, const char* what) {
    std::string id = def["id"].get_string("");
    if (id.empty()) {
        throw std::runtime_error(std::string("Scenario ") + what + " entry without an id");
    }
    return id;
}

} // namespace

BatterySpec ScenarioParser::parse_battery(const JsonValue& def) {
    BatterySpec spec;
    spec.id = required_id(def, "battery");

    std::string kind = def["kind"].get_string("launcher");
    if (kind == "launcher") {
        spec.kind = BatteryKind::LAUNCHER;
    } else if (kind == "laser") {
        spec.kind = BatteryKind::LASER;
    } else {
        throw std::runtime_error("Battery " + spec.id + ": unknown kind '" + kind + "'");
    }

    spec.position = def["position"].get_vec3();
    spec.max_range = def["maxRange"].get_number(spec.max_range);
    spec.min_range = def["minRange"].get_number(spec.min_range);
    spec.interceptor_speed = def["interceptorSpeed"].get_number(spec.interceptor_speed);
    spec.max_interceptors = def["maxInterceptors"].get_int(spec.max_interceptors);
    spec.interceptors = def["interceptors"].get_int(spec.max_interceptors);
    spec.operational = def["operational"].get_bool(true);

    if (spec.max_range <= spec.min_range) {
        throw std::runtime_error("Battery " + spec.id + ": maxRange must exceed minRange");
    }
    if (spec.kind == BatteryKind::LAUNCHER && spec.interceptor_speed <= 0.0) {
        throw std::runtime_error("Battery " + spec.id + ": interceptorSpeed must be > 0");
    }
    return spec;
}

ThreatSpawn ScenarioParser::parse_threat(const JsonValue& def) {
    ThreatSpawn spawn;
    Threat& t = spawn.threat;
    t.id = required_id(def, "threat");
    t.category = parse_category(def["category"].get_string("unknown"));
    t.position = def["position"].get_vec3();
    t.velocity = def["velocity"].get_vec3();
    spawn.spawn_time = def["spawnTime"].get_number(0.0);
    t.spawn_time = spawn.spawn_time;

    if (t.position.y <= 0.0) {
        throw std::runtime_error("Threat " + t.id + ": spawn altitude must be above ground");
    }
    ThreatKinematics::refresh_impact_estimate(t);
    return spawn;
}

Scenario ScenarioParser::parse(const JsonValue& doc) {
    if (!doc.is_object()) throw std::runtime_error("Scenario root must be an object");

    Scenario scenario;
    scenario.engine = EngineConfig::from_json(doc["engine"]);

    std::unordered_set<std::string> ids;
    auto check_unique = [&](const std::string& id) {
        if (!ids.insert(id).second) throw std::runtime_error("Duplicate scenario id: " + id);
    };

    for (const auto& def : doc["batteries"].as_array()) {
        scenario.batteries.push_back(parse_battery(def));
        check_unique(scenario.batteries.back().id);
    }
    for (const auto& def : doc["threats"].as_array()) {
        scenario.threats.push_back(parse_threat(def));
        check_unique(scenario.threats.back().threat.id);
    }

    std::stable_sort(scenario.threats.begin(), scenario.threats.end(),
        [](const ThreatSpawn& a, const ThreatSpawn& b) { return a.spawn_time < b.spawn_time; });
    return scenario;
}

DefenseWorld ScenarioParser::build_world(const Scenario& scenario) {
    DefenseWorld world;
    for (const auto& spec : scenario.batteries) {
        if (spec.kind == BatteryKind::LASER) {
            world.add_battery(std::make_unique<LaserBattery>(spec));
        } else {
            world.add_battery(std::make_unique<LauncherBattery>(spec));
        }
    }
    return world;
}

} // namespace skyshield::defense
