/**
 * skyshield_engine - headless batch runner for the interception core.
 *
 * Reads a scenario JSON (batteries, threats, engine overrides), runs N
 * seeded simulations at native speed and writes a JSON report.
 *
 * Usage:
 *   skyshield_engine --scenario <path> [--runs N] [--seed S] [--max-time T]
 *                    [--dt D] [--output <path>] [--verbose] [--log-level L]
 */

#include "defense/run_results.hpp"
#include "defense/scenario_parser.hpp"
#include "defense/scenario_runner.hpp"
#include "io/json_reader.hpp"
#include "util/log.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

namespace sd = skyshield::defense;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " --scenario <path> [options]\n"
              << "\n"
              << "Options:\n"
              << "  --scenario <path>    Scenario JSON file (required)\n"
              << "  --runs N             Number of seeded runs (default: 10)\n"
              << "  --seed S             Base RNG seed (default: 42)\n"
              << "  --max-time T         Max sim time per run in seconds (default: 120)\n"
              << "  --dt D               Timestep in seconds (default: 1/60)\n"
              << "  --output <path>      Output JSON file (default: stdout)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --log-level L        debug|info|warn|error|off (default: warn)\n"
              << "  --help               Show this message\n";
}

static bool write_report(const std::vector<sd::RunResult>& results,
                         const sd::RunConfig& config) {
    if (config.output_path.empty()) {
        sd::write_results_json(results, config, std::cout);
        return true;
    }
    std::ofstream out(config.output_path);
    if (!out.is_open()) {
        std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
        return false;
    }
    sd::write_results_json(results, config, out);
    if (config.verbose) {
        std::cerr << "Results written to: " << config.output_path << "\n";
    }
    return true;
}

int main(int argc, char* argv[]) {
    sd::RunConfig config;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--scenario" && i + 1 < argc) {
                config.scenario_path = argv[++i];
            } else if (arg == "--runs" && i + 1 < argc) {
                config.num_runs = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.base_seed = std::stoi(argv[++i]);
            } else if (arg == "--max-time" && i + 1 < argc) {
                config.max_sim_time = std::stod(argv[++i]);
            } else if (arg == "--dt" && i + 1 < argc) {
                config.dt = std::stod(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                config.log_level = argv[++i];
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
        skyshield::log::set_level(skyshield::log::parse_level(config.log_level));
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid argument: " << e.what() << "\n";
        return 1;
    }

    if (config.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n\n";
        print_usage(argv[0]);
        return 1;
    }
    if (config.num_runs < 1 || config.dt <= 0.0 || config.max_sim_time <= 0.0) {
        std::cerr << "Error: --runs, --dt and --max-time must be positive\n";
        return 1;
    }

    sd::Scenario scenario;
    try {
        scenario = sd::ScenarioParser::parse(skyshield::JsonReader::parse_file(config.scenario_path));
    } catch (const std::exception& e) {
        std::cerr << "Error loading scenario: " << e.what() << "\n";
        return 1;
    }

    if (scenario.threats.empty()) {
        std::cerr << "Error: scenario has no threats\n";
        return 1;
    }

    if (config.verbose) {
        std::cerr << "=== SkyShield Engine ===\n"
                  << "Scenario: " << config.scenario_path << "\n"
                  << "Batteries: " << scenario.batteries.size() << "\n"
                  << "Threats: " << scenario.threats.size() << "\n"
                  << "Runs: " << config.num_runs << "\n"
                  << "Base seed: " << config.base_seed << "\n"
                  << "Max time: " << config.max_sim_time << "s\n"
                  << "Timestep: " << config.dt << "s\n"
                  << "Output: " << (config.output_path.empty() ? "stdout" : config.output_path)
                  << "\n\n";
    }

    auto t_start = std::chrono::steady_clock::now();

    sd::ScenarioRunner runner(config);
    auto results = runner.run(scenario);

    auto t_end = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (config.verbose) {
        int kills = 0, leaked = 0, errors = 0;
        for (const auto& r : results) {
            if (!r.error.empty()) {
                errors++;
                std::cerr << r.error << "\n";
                continue;
            }
            kills += r.kills;
            leaked += r.leaked;
        }
        std::cerr << "\n=== Results ===\n"
                  << "Completed: " << results.size() << " runs in " << elapsed << "s\n"
                  << "Errors: " << errors << "\n"
                  << "Total kills: " << kills << "\n"
                  << "Total leaked: " << leaked << "\n";
    }

    return write_report(results, config) ? 0 : 1;
}
