/**
 * ScenarioParser - parse scenario JSON into a DefenseWorld.
 *
 * Format:
 *   {
 *     "batteries": [{ "id", "kind": "launcher"|"laser", "position": [x,y,z],
 *                     "maxRange", "minRange", "interceptorSpeed",
 *                     "maxInterceptors", "interceptors", "operational" }],
 *     "threats":   [{ "id", "category", "position": [x,y,z],
 *                     "velocity": [x,y,z], "spawnTime" }],
 *     "engine":    { ...EngineConfig overrides... }
 *   }
 */

#ifndef SKYSHIELD_DEFENSE_SCENARIO_PARSER_HPP
#define SKYSHIELD_DEFENSE_SCENARIO_PARSER_HPP

#include "defense/battery.hpp"
#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include "io/json_reader.hpp"
#include <string>
#include <vector>

namespace skyshield::defense {

struct RunConfig {
    int num_runs = 10;
    int base_seed = 42;
    double max_sim_time = 120.0;
    double dt = 1.0 / 60.0;
    std::string scenario_path;
    std::string output_path;        // empty = stdout
    bool verbose = false;
    std::string log_level = "warn";
};

struct ThreatSpawn {
    Threat threat;
    double spawn_time = 0.0;
};

struct Scenario {
    std::vector<BatterySpec> batteries;
    std::vector<ThreatSpawn> threats;   // sorted by spawn time
    EngineConfig engine;
};

class ScenarioParser {
public:
    /**
     * Parse and validate a scenario document.
     * @throws std::runtime_error on missing ids, duplicate ids or unknown
     *         battery kinds
     */
    static Scenario parse(const JsonValue& doc);

    static BatterySpec parse_battery(const JsonValue& def);
    static ThreatSpawn parse_threat(const JsonValue& def);

    /** Fresh world holding the scenario's batteries (threats spawn later). */
    static DefenseWorld build_world(const Scenario& scenario);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_SCENARIO_PARSER_HPP
