#include "defense/run_results.hpp"
#include "io/json_writer.hpp"

namespace skyshield::defense {

void write_results_json(const std::vector<RunResult>& results,
                        const RunConfig& config,
                        std::ostream& out) {
    JsonWriter w(out);

    w.begin_object();

    // ── config ──
    w.key("config").begin_object();
    w.kv("numRuns", config.num_runs);
    w.kv("baseSeed", config.base_seed);
    w.kv("maxSimTime", config.max_sim_time);
    w.kv("dt", config.dt);
    w.end_object();

    // ── summary ──
    int ok_runs = 0, kills = 0, leaked = 0, fired = 0, threats = 0;
    for (const auto& run : results) {
        if (!run.error.empty()) continue;
        ok_runs++;
        kills += run.kills;
        leaked += run.leaked;
        fired += run.interceptors_fired;
        threats += run.threats_total;
    }
    w.key("summary").begin_object();
    w.kv("completedRuns", ok_runs);
    w.kv("erroredRuns", static_cast<int>(results.size()) - ok_runs);
    w.kv("killRatio", threats > 0 ? static_cast<double>(kills) / threats : 0.0);
    w.kv("leakRatio", threats > 0 ? static_cast<double>(leaked) / threats : 0.0);
    w.kv("interceptorsPerKill", kills > 0 ? static_cast<double>(fired) / kills : 0.0);
    w.end_object();

    // ── runs ──
    w.key("runs").begin_array();
    for (const auto& run : results) {
        w.begin_object();

        w.kv("runIndex", run.run_index);
        w.kv("seed", run.seed);
        w.kv("simTimeFinal", run.sim_time_final);

        if (run.error.empty()) {
            w.key("error").null_value();
        } else {
            w.kv("error", run.error);
        }

        w.kv("threats", run.threats_total);
        w.kv("kills", run.kills);
        w.kv("misses", run.misses);
        w.kv("leaked", run.leaked);
        w.kv("interceptorsFired", run.interceptors_fired);
        w.kv("retargeted", run.retargeted);
        w.kv("selfDestructed", run.self_destructed);
        w.kv("score", run.score);
        w.kv("bestCombo", run.best_combo);

        const auto& s = run.engagement_stats;
        w.key("engagements").begin_object();
        w.kv("retained", s.total);
        w.kv("active", s.active);
        w.kv("successRate", s.success_rate);
        w.kv("averageInterceptors", s.average_interceptors);
        w.end_object();

        w.key("engagementLog").begin_array();
        for (const auto& rec : run.engagement_log) {
            w.begin_object();
            w.kv("time", rec.time);
            w.kv("batteryId", rec.battery_id);
            w.kv("interceptorId", rec.interceptor_id);
            w.kv("threatId", rec.threat_id);
            w.kv("result", rec.result);
            w.end_object();
        }
        w.end_array();

        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

} // namespace skyshield::defense
