#include "defense/scenario_runner.hpp"
#include "defense/kinematics.hpp"
#include "defense/proximity_fuse.hpp"
#include <cmath>
#include <iostream>

namespace skyshield::defense {

ScenarioRunner::ScenarioRunner(const RunConfig& config)
    : config_(config) {}

std::vector<RunResult> ScenarioRunner::run(const Scenario& scenario,
                                           ProgressCallback on_progress) {
    std::vector<RunResult> results;
    results.reserve(config_.num_runs);

    for (int i = 0; i < config_.num_runs; i++) {
        int seed = config_.base_seed + i;

        if (config_.verbose) {
            std::cerr << "Run " << (i + 1) << "/" << config_.num_runs
                      << " (seed=" << seed << ")..." << std::flush;
        }

        results.push_back(run_single(scenario, i, seed));

        if (config_.verbose) {
            const RunResult& r = results.back();
            std::cerr << " done (t=" << r.sim_time_final
                      << "s, kills=" << r.kills << "/" << r.threats_total
                      << ", leaked=" << r.leaked << ")\n";
        }

        if (on_progress) on_progress(i + 1, config_.num_runs);
    }

    return results;
}

RunResult ScenarioRunner::run_single(const Scenario& scenario, int run_index, int seed,
                                     const TickObserver& observer) const {
    RunResult result;
    result.run_index = run_index;
    result.seed = seed;
    result.threats_total = static_cast<int>(scenario.threats.size());

    try {
        DefenseWorld world = ScenarioParser::build_world(scenario);
        world.rng.reseed(static_cast<uint32_t>(seed));
        world.sim_time = 0.0;

        InterceptEngine engine(world, scenario.engine);
        const double dt = config_.dt;
        const int total_steps = static_cast<int>(std::ceil(config_.max_sim_time / dt));
        size_t next_spawn = 0;

        for (int step = 0; step < total_steps; step++) {
            world.sim_time += dt;
            spawn_due(world, scenario, next_spawn);

            // Kinematics -> fuse -> core
            for (const auto& id : ThreatKinematics::update_all(dt, world)) {
                result.leaked++;
                engine.report_leak(id);
            }
            InterceptorKinematics::update_all(dt, world, scenario.engine.spin_up_time);
            ProximityFuse::update_all(dt, world, scenario.engine.fuse);

            TickReport report = engine.update(dt);
            result.engagement_log.insert(result.engagement_log.end(),
                                         report.records.begin(), report.records.end());
            if (observer) observer(report);

            if (resolved(world, scenario, next_spawn)) break;
        }

        const AdjudicationStats& adj = engine.adjudicator().stats();
        result.sim_time_final = world.sim_time;
        result.kills = adj.kills;
        result.misses = adj.misses;
        result.retargeted = adj.retargeted;
        result.self_destructed = adj.self_destructed;
        result.score = adj.score;
        result.best_combo = adj.best_combo;
        result.interceptors_fired = engine.interceptors_fired();
        result.engagement_stats = engine.controller().stats();

    } catch (const std::exception& e) {
        result.error = std::string("Run error: ") + e.what();
    }

    return result;
}

void ScenarioRunner::spawn_due(DefenseWorld& world, const Scenario& scenario, size_t& next_spawn) {
    while (next_spawn < scenario.threats.size() &&
           scenario.threats[next_spawn].spawn_time <= world.sim_time) {
        Threat threat = scenario.threats[next_spawn].threat;
        ThreatKinematics::refresh_impact_estimate(threat);
        world.add_threat(std::move(threat));
        next_spawn++;
    }
}

bool ScenarioRunner::resolved(const DefenseWorld& world, const Scenario& scenario, size_t next_spawn) {
    if (next_spawn < scenario.threats.size()) return false;
    for (const auto& t : world.threats()) {
        if (t.active) return false;
    }
    return world.active_interceptor_count() == 0;
}

} // namespace skyshield::defense
