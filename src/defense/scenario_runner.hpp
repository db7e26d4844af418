/**
 * ScenarioRunner - batch driver for the interception core.
 *
 * Runs N independent seeded simulations of a scenario. Each run builds a
 * fresh world, spawns threats on schedule, steps kinematics and the fuse,
 * then ticks the engine. A run ends early once every threat has been
 * resolved and no interceptor is airborne.
 */

#ifndef SKYSHIELD_DEFENSE_SCENARIO_RUNNER_HPP
#define SKYSHIELD_DEFENSE_SCENARIO_RUNNER_HPP

#include "defense/intercept_engine.hpp"
#include "defense/run_results.hpp"
#include "defense/scenario_parser.hpp"
#include <functional>
#include <vector>

namespace skyshield::defense {

class ScenarioRunner {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;
    using TickObserver = std::function<void(const TickReport&)>;

    explicit ScenarioRunner(const RunConfig& config);

    std::vector<RunResult> run(const Scenario& scenario,
                               ProgressCallback on_progress = nullptr);

    /**
     * One seeded run. Errors are caught and recorded in the result.
     * observer, if set, sees every tick report.
     */
    RunResult run_single(const Scenario& scenario, int run_index, int seed,
                         const TickObserver& observer = nullptr) const;

private:
    RunConfig config_;

    static void spawn_due(DefenseWorld& world, const Scenario& scenario, size_t& next_spawn);
    static bool resolved(const DefenseWorld& world, const Scenario& scenario, size_t next_spawn);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_SCENARIO_RUNNER_HPP
