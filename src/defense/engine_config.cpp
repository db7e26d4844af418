#include "defense/engine_config.hpp"
#include <stdexcept>
#include <string>

namespace skyshield::defense {

namespace {

void read(const JsonValue& obj, const char* key, double& out) {
    out = obj[key].get_number(out);
}

void read(const JsonValue& obj, const char* key, int& out) {
    out = obj[key].get_int(out);
}

void read(const JsonValue& obj, const char* key, size_t& out) {
    int v = obj[key].get_int(static_cast<int>(out));
    if (v < 0) throw std::runtime_error(std::string("engine.") + key + " must be >= 0");
    out = static_cast<size_t>(v);
}

void require_positive(double v, const char* name) {
    if (!(v > 0.0)) {
        throw std::runtime_error(std::string("engine.") + name + " must be > 0");
    }
}

} // namespace

EngineConfig EngineConfig::from_json(const JsonValue& engine) {
    EngineConfig c;
    if (!engine.is_object()) return c;

    read(engine, "basePriority", c.base_priority);
    read(engine, "defaultSuccessRate", c.default_success_rate);
    read(engine, "successLearningRate", c.success_learning_rate);
    read(engine, "targetLeakProbability", c.target_leak_probability);
    read(engine, "maxInterceptorsPerThreat", c.max_interceptors_per_threat);
    read(engine, "sweepInterval", c.sweep_interval);

    read(engine, "trackHistory", c.track_history);
    read(engine, "maxTrackAcceleration", c.max_track_acceleration);
    read(engine, "spinUpTime", c.spin_up_time);

    read(engine, "gridCellSize", c.grid_cell_size);
    read(engine, "solutionTtl", c.solution_ttl);
    read(engine, "cacheCapacity", c.cache_capacity);
    read(engine, "cacheEvictCount", c.cache_evict_count);
    read(engine, "bisectionTolerance", c.bisection_tolerance);

    read(engine, "maxInFlight", c.max_in_flight);

    read(engine, "assessmentDelay", c.assessment_delay);
    read(engine, "salvoInterval", c.salvo_interval);
    read(engine, "engagementRetention", c.engagement_retention);
    read(engine, "secondShotMinTti", c.second_shot_min_tti);

    std::string mode = engine["guidanceMode"].get_string("");
    if (mode == "true") {
        c.guidance_mode = GuidanceMode::TRUE_PN;
    } else if (mode == "augmented") {
        c.guidance_mode = GuidanceMode::AUGMENTED_PN;
    } else if (!mode.empty()) {
        throw std::runtime_error("engine.guidanceMode must be 'true' or 'augmented', got '" + mode + "'");
    }
    read(engine, "navigationConstant", c.navigation_constant);
    read(engine, "maxAcceleration", c.max_acceleration);
    read(engine, "minClosingVelocity", c.min_closing_velocity);
    read(engine, "terminalPhaseTgo", c.terminal_phase_tgo);

    read(engine, "retargetRadius", c.retarget_radius);
    read(engine, "maxInterceptorsPerRetarget", c.max_interceptors_per_retarget);
    read(engine, "comboWindow", c.combo_window);
    read(engine, "interceptorTimeout", c.interceptor_timeout);

    const auto& blast = engine["blast"];
    read(blast, "lethalRadius", c.blast.lethal_radius);
    read(blast, "severeRadius", c.blast.severe_radius);
    read(blast, "moderateRadius", c.blast.moderate_radius);
    read(blast, "lightRadius", c.blast.light_radius);
    read(blast, "directHitPk", c.blast.direct_hit_pk);
    read(blast, "pkJitter", c.blast.pk_jitter);

    const auto& fuse = engine["fuse"];
    read(fuse, "armingDistance", c.fuse.arming_distance);
    read(fuse, "detonationRadius", c.fuse.detonation_radius);
    read(fuse, "optimalRadius", c.fuse.optimal_radius);

    c.validate();
    return c;
}

void EngineConfig::validate() const {
    if (default_success_rate < 0.0 || default_success_rate > 1.0) {
        throw std::runtime_error("engine.defaultSuccessRate must be in [0, 1]");
    }
    if (target_leak_probability <= 0.0 || target_leak_probability >= 1.0) {
        throw std::runtime_error("engine.targetLeakProbability must be in (0, 1)");
    }
    if (navigation_constant < 3.0 || navigation_constant > 5.0) {
        throw std::runtime_error("engine.navigationConstant must be in [3, 5]");
    }
    if (max_interceptors_per_threat < 1) {
        throw std::runtime_error("engine.maxInterceptorsPerThreat must be >= 1");
    }
    if (track_history < 2) {
        throw std::runtime_error("engine.trackHistory must be >= 2");
    }
    require_positive(grid_cell_size, "gridCellSize");
    require_positive(bisection_tolerance, "bisectionTolerance");
    require_positive(max_acceleration, "maxAcceleration");
    require_positive(min_closing_velocity, "minClosingVelocity");
    require_positive(spin_up_time, "spinUpTime");
    if (!(blast.lethal_radius < blast.severe_radius &&
          blast.severe_radius < blast.moderate_radius &&
          blast.moderate_radius < blast.light_radius)) {
        throw std::runtime_error("engine.blast radii must be strictly increasing");
    }
    if (!(fuse.optimal_radius < fuse.detonation_radius)) {
        throw std::runtime_error("engine.fuse.optimalRadius must be below detonationRadius");
    }
}

} // namespace skyshield::defense
