#include "defense/engagement_controller.hpp"
#include "util/log.hpp"
#include <algorithm>

namespace skyshield::defense {

namespace {
    constexpr double DUE_EPSILON = 1e-9;  // s, tolerance on scheduled times
}

const char* strategy_name(EngagementStrategy strategy) {
    switch (strategy) {
        case EngagementStrategy::SINGLE:           return "single";
        case EngagementStrategy::SALVO:            return "salvo";
        case EngagementStrategy::SHOOT_LOOK_SHOOT: return "shoot_look_shoot";
    }
    return "unknown";
}

const char* status_name(EngagementStatus status) {
    switch (status) {
        case EngagementStatus::ACTIVE:    return "active";
        case EngagementStatus::ASSESSING: return "assessing";
        case EngagementStatus::COMPLETED: return "completed";
        case EngagementStatus::FAILED:    return "failed";
    }
    return "unknown";
}

const char* result_name(EngagementResult result) {
    switch (result) {
        case EngagementResult::PENDING: return "pending";
        case EngagementResult::HIT:     return "hit";
        case EngagementResult::MISS:    return "miss";
    }
    return "unknown";
}

EngagementController::EngagementController(const EngineConfig& config, LaunchHandler on_launch)
    : config_(config), on_launch_(std::move(on_launch)) {}

std::string EngagementController::engage(DefenseWorld& world, const std::string& threat_id,
                                         const std::string& battery_id, int interceptor_count,
                                         EngagementStrategy strategy) {
    const Threat* threat = world.get_threat(threat_id);
    if (!threat || is_engaged(threat_id)) return "";

    const double now = world.sim_time;

    Engagement eng;
    eng.id = "E" + std::to_string(next_id_++);
    eng.threat_id = threat_id;
    eng.battery_id = battery_id;
    eng.category = threat->category;
    eng.strategy = strategy;
    eng.start_time = now;
    eng.planned_shots = strategy == EngagementStrategy::SALVO ? std::max(interceptor_count, 1) : 1;

    if (!fire_shot(eng, world)) {
        eng.status = EngagementStatus::FAILED;
        eng.completion_time = now;
        log::warn("Engagement " + eng.id + " failed: " + battery_id +
                  " could not fire on " + threat_id);
        engagements_.push_back(std::move(eng));
        return engagements_.back().id;
    }

    switch (strategy) {
        case EngagementStrategy::SALVO:
            for (int k = 1; k < eng.planned_shots; ++k) {
                eng.pending.push_back({ScheduledActionType::FIRE_SHOT,
                                       now + k * config_.salvo_interval});
            }
            break;
        case EngagementStrategy::SHOOT_LOOK_SHOOT:
            eng.status = EngagementStatus::ASSESSING;
            eng.pending.push_back({ScheduledActionType::ASSESS, now + config_.assessment_delay});
            break;
        case EngagementStrategy::SINGLE:
            break;
    }

    log::debug("Engagement " + eng.id + ": " + battery_id + " -> " + threat_id +
               " (" + strategy_name(strategy) + ", " + std::to_string(eng.planned_shots) + " planned)");
    engagements_.push_back(std::move(eng));
    return engagements_.back().id;
}

bool EngagementController::fire_shot(Engagement& eng, DefenseWorld& world) {
    Battery* battery = world.get_battery(eng.battery_id);
    const Threat* threat = world.get_threat(eng.threat_id);
    if (!battery || !threat || !threat->active) return false;

    int fired = battery->fire_interceptors(*threat, 1, world.sim_time,
        [&](Interceptor&& round) {
            eng.interceptor_ids.push_back(round.id);
            if (on_launch_) on_launch_(std::move(round));
        });
    if (fired > 0) eng.shots_fired += fired;
    return fired > 0;
}

std::vector<Engagement> EngagementController::update(DefenseWorld& world) {
    const double now = world.sim_time;
    std::vector<Engagement> finished;

    for (auto& eng : engagements_) {
        if (!eng.live()) continue;

        while (!eng.pending.empty() && eng.pending.front().due_time <= now + DUE_EPSILON) {
            ScheduledAction action = eng.pending.front();
            eng.pending.erase(eng.pending.begin());
            run_action(eng, action, world);
            if (!eng.live()) break;
        }

        if (eng.status == EngagementStatus::ACTIVE) resolve(eng, world);
        if (!eng.live()) finished.push_back(eng);
    }

    engagements_.erase(
        std::remove_if(engagements_.begin(), engagements_.end(),
            [&](const Engagement& e) {
                return !e.live() && now - e.completion_time > config_.engagement_retention;
            }),
        engagements_.end());

    return finished;
}

void EngagementController::run_action(Engagement& eng, const ScheduledAction& action,
                                      DefenseWorld& world) {
    switch (action.type) {
        case ScheduledActionType::FIRE_SHOT:
            if (world.active_interceptor_count() >= config_.max_in_flight) {
                // Cap reached: hold the reserved round for the next interval
                schedule(eng, {ScheduledActionType::FIRE_SHOT,
                               world.sim_time + config_.salvo_interval});
            } else if (!fire_shot(eng, world)) {
                // Battery dry or threat gone: the shot is dropped
                eng.planned_shots = std::max(eng.shots_fired, 1);
            }
            break;
        case ScheduledActionType::ASSESS:
            assess(eng, world);
            break;
    }
}

void EngagementController::assess(Engagement& eng, DefenseWorld& world) {
    const double now = world.sim_time;
    const Threat* threat = world.get_threat(eng.threat_id);
    if (!threat || !threat->active) {
        finish(eng, threat && threat->destroyed ? EngagementResult::HIT : EngagementResult::MISS, now);
        return;
    }

    if (any_interceptor_alive(eng, world)) {
        // First round still on its way; resolve like a single shot
        eng.status = EngagementStatus::ACTIVE;
        return;
    }

    if (threat->time_to_impact > config_.second_shot_min_tti &&
        world.active_interceptor_count() >= config_.max_in_flight) {
        // No room for the follow-up yet; look again shortly
        schedule(eng, {ScheduledActionType::ASSESS, now + config_.salvo_interval});
        return;
    }

    if (threat->time_to_impact > config_.second_shot_min_tti) {
        eng.status = EngagementStatus::ACTIVE;
        eng.planned_shots++;
        if (!fire_shot(eng, world)) {
            eng.planned_shots--;
            finish(eng, EngagementResult::MISS, now);
        }
        return;
    }

    finish(eng, EngagementResult::MISS, now);
}

void EngagementController::resolve(Engagement& eng, DefenseWorld& world) {
    const double now = world.sim_time;
    const Threat* threat = world.get_threat(eng.threat_id);

    if (!threat) {
        finish(eng, EngagementResult::MISS, now);
    } else if (threat->destroyed) {
        finish(eng, EngagementResult::HIT, now);
    } else if (!threat->active) {
        finish(eng, EngagementResult::MISS, now);
    } else if (!shots_outstanding(eng) && !any_interceptor_alive(eng, world)) {
        finish(eng, EngagementResult::MISS, now);
    }
}

void EngagementController::finish(Engagement& eng, EngagementResult result, double now) {
    eng.status = EngagementStatus::COMPLETED;
    eng.result = result;
    eng.completion_time = now;
    eng.pending.clear();

    auto& h = history_[{eng.category, eng.battery_id}];
    h.attempts++;
    if (result == EngagementResult::HIT) h.hits++;
}

void EngagementController::schedule(Engagement& eng, const ScheduledAction& action) {
    auto pos = std::upper_bound(eng.pending.begin(), eng.pending.end(), action.due_time,
        [](double t, const ScheduledAction& a) { return t < a.due_time; });
    eng.pending.insert(pos, action);
}

bool EngagementController::any_interceptor_alive(const Engagement& eng,
                                                 const DefenseWorld& world) const {
    for (const auto& id : eng.interceptor_ids) {
        const Interceptor* i = world.get_interceptor(id);
        if (i && i->active && i->target_id == eng.threat_id) return true;
    }
    return false;
}

bool EngagementController::shots_outstanding(const Engagement& eng) const {
    return std::any_of(eng.pending.begin(), eng.pending.end(),
        [](const ScheduledAction& a) { return a.type == ScheduledActionType::FIRE_SHOT; });
}

bool EngagementController::is_engaged(const std::string& threat_id) const {
    return std::any_of(engagements_.begin(), engagements_.end(),
        [&](const Engagement& e) { return e.threat_id == threat_id && e.live(); });
}

const Engagement* EngagementController::find(const std::string& engagement_id) const {
    for (const auto& e : engagements_) {
        if (e.id == engagement_id) return &e;
    }
    return nullptr;
}

std::vector<const Engagement*> EngagementController::engagements_for(const std::string& threat_id) const {
    std::vector<const Engagement*> out;
    for (const auto& e : engagements_) {
        if (e.threat_id == threat_id) out.push_back(&e);
    }
    return out;
}

int EngagementController::reserved_shots(const std::string& battery_id) const {
    int n = 0;
    for (const auto& e : engagements_) {
        if (!e.live()) continue;
        if (!battery_id.empty() && e.battery_id != battery_id) continue;
        n += static_cast<int>(std::count_if(e.pending.begin(), e.pending.end(),
            [](const ScheduledAction& a) { return a.type == ScheduledActionType::FIRE_SHOT; }));
    }
    return n;
}

bool EngagementController::saturated(const DefenseWorld& world) const {
    return world.active_interceptor_count() + reserved_shots() >= config_.max_in_flight;
}

EngagementStrategy EngagementController::select_strategy(int interceptor_count,
                                                         double time_to_impact) const {
    if (interceptor_count >= 2) return EngagementStrategy::SALVO;
    if (time_to_impact > config_.assessment_delay + config_.second_shot_min_tti) {
        return EngagementStrategy::SHOOT_LOOK_SHOOT;
    }
    return EngagementStrategy::SINGLE;
}

int EngagementController::recommended_interceptors(ThreatCategory category,
                                                   const std::string& battery_id,
                                                   int base_count) const {
    int count = base_count;
    auto it = history_.find({category, battery_id});
    if (it != history_.end() && it->second.attempts > config_.learning_min_attempts) {
        double pk = static_cast<double>(it->second.hits) / it->second.attempts;
        if (pk < config_.learning_low_pk) {
            count++;
        } else if (pk > config_.learning_high_pk) {
            count--;
        }
    }
    return std::clamp(count, 1, config_.max_interceptors_per_threat);
}

double EngagementController::battery_success_rate(const std::string& battery_id) const {
    int attempts = 0;
    int hits = 0;
    for (const auto& [key, h] : history_) {
        if (key.second != battery_id) continue;
        attempts += h.attempts;
        hits += h.hits;
    }
    if (attempts <= config_.learning_min_attempts) return config_.default_success_rate;
    return static_cast<double>(hits) / attempts;
}

EngagementStats EngagementController::stats() const {
    EngagementStats s;
    size_t rounds = 0;
    for (const auto& e : engagements_) {
        s.total++;
        rounds += e.interceptor_ids.size();
        if (e.live()) {
            s.active++;
        } else if (e.status == EngagementStatus::FAILED) {
            s.failed++;
        } else if (e.result == EngagementResult::HIT) {
            s.hits++;
        } else {
            s.misses++;
        }
    }
    if (s.hits + s.misses > 0) {
        s.success_rate = static_cast<double>(s.hits) / (s.hits + s.misses);
    }
    if (s.total > 0) {
        s.average_interceptors = static_cast<double>(rounds) / s.total;
    }
    return s;
}

} // namespace skyshield::defense
