/**
 * RunResult - per-run outcome data and JSON report serialization.
 */

#ifndef SKYSHIELD_DEFENSE_RUN_RESULTS_HPP
#define SKYSHIELD_DEFENSE_RUN_RESULTS_HPP

#include "defense/defense_events.hpp"
#include "defense/engagement_controller.hpp"
#include "defense/scenario_parser.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace skyshield::defense {

struct RunResult {
    int run_index = 0;
    int seed = 0;
    double sim_time_final = 0.0;

    int threats_total = 0;
    int kills = 0;
    int misses = 0;
    int leaked = 0;
    int interceptors_fired = 0;
    int retargeted = 0;
    int self_destructed = 0;
    int score = 0;
    int best_combo = 0;

    EngagementStats engagement_stats;
    std::vector<EngagementRecord> engagement_log;
    std::string error;         // empty = success
};

/**
 * Write the batch report.
 * Format: { "config": {...}, "summary": {...}, "runs": [...] }
 */
void write_results_json(const std::vector<RunResult>& results,
                        const RunConfig& config,
                        std::ostream& out);

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_RUN_RESULTS_HPP
