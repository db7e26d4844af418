#include "defense/predictive_tracker.hpp"
#include "physics/vec3_ops.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace skyshield::defense {

namespace {
    constexpr double CONVERGED_TIME_ERROR = 0.01;  // s
    constexpr double HIGH_MANEUVER = 20.0;         // m/s^2
    constexpr double MODERATE_MANEUVER = 10.0;     // m/s^2
    constexpr double FULL_CONFIDENCE_SAMPLES = 5.0;
    constexpr double MIN_CONFIDENCE = 0.5;
    constexpr double VARIANCE_SCALE = 100.0;       // m^2
    constexpr double PREVIEW_DECAY = 10.0;         // s
}

PredictiveTracker::PredictiveTracker(const EngineConfig& config)
    : config_(config) {}

void PredictiveTracker::observe(const Threat& threat, double now) {
    auto& track = history_[threat.id];
    if (!track.empty() && track.back().time >= now) {
        // Same tick observed twice; keep the latest state
        track.back() = TrackSample{threat.position, threat.velocity, now};
        return;
    }
    track.push_back(TrackSample{threat.position, threat.velocity, now});
    while (track.size() > static_cast<size_t>(config_.track_history)) {
        track.pop_front();
    }
}

const std::deque<TrackSample>* PredictiveTracker::samples(const std::string& threat_id) const {
    auto it = history_.find(threat_id);
    return it == history_.end() ? nullptr : &it->second;
}

size_t PredictiveTracker::sample_count(const std::string& threat_id) const {
    const auto* track = samples(threat_id);
    return track ? track->size() : 0;
}

Vec3 PredictiveTracker::acceleration(const std::string& threat_id) const {
    const auto* track = samples(threat_id);
    if (!track || track->size() < 2) return gravity_vector();

    const TrackSample& prev = (*track)[track->size() - 2];
    const TrackSample& last = track->back();
    double dt = last.time - prev.time;
    if (dt <= 0.0) return gravity_vector();

    Vec3 accel = (last.velocity - prev.velocity) / dt;
    return clamp_norm(accel, config_.max_track_acceleration);
}

double PredictiveTracker::gravity_model_variance(const std::deque<TrackSample>& track) {
    if (track.size() < 3) return 0.0;

    double sum_sq = 0.0;
    int n = 0;
    for (size_t i = 2; i < track.size(); ++i) {
        const TrackSample& base = track[i - 2];
        double dt = track[i].time - base.time;
        Vec3 projected = project(base.position, base.velocity, gravity_vector(), dt);
        sum_sq += (projected - track[i].position).norm_squared();
        n++;
    }
    return n > 0 ? sum_sq / n : 0.0;
}

double PredictiveTracker::confidence(const std::string& threat_id) const {
    const auto* track = samples(threat_id);
    if (!track || track->empty()) return MIN_CONFIDENCE;

    double c = std::min(1.0, static_cast<double>(track->size()) / FULL_CONFIDENCE_SAMPLES);

    double accel = acceleration(threat_id).norm();
    if (accel > HIGH_MANEUVER) {
        c *= 0.8;
    } else if (accel > MODERATE_MANEUVER) {
        c *= 0.9;
    }

    if (track->size() >= 3) {
        c *= std::exp(-gravity_model_variance(*track) / VARIANCE_SCALE);
    }

    return std::max(MIN_CONFIDENCE, c);
}

double PredictiveTracker::effective_intercept_time(double d, double max_speed, double spin_up) {
    if (max_speed <= 0.0) return std::numeric_limits<double>::infinity();
    if (spin_up <= 0.0) return d / max_speed;

    double spin_up_distance = 0.5 * max_speed * spin_up;
    if (d <= spin_up_distance) {
        double accel = max_speed / spin_up;
        return std::sqrt(2.0 * d / accel);
    }
    return spin_up + (d - spin_up_distance) / max_speed;
}

std::optional<LeadSolution> PredictiveTracker::lead_point(const Threat& threat,
                                                          const Vec3& launch_position,
                                                          double max_speed) const {
    return lead_point(threat, launch_position, max_speed, config_.spin_up_time);
}

std::optional<LeadSolution> PredictiveTracker::lead_point(const Threat& threat,
                                                          const Vec3& launch_position,
                                                          double max_speed,
                                                          double spin_up) const {
    Vec3 accel = acceleration(threat.id);

    std::optional<LeadSolution> best;
    double best_error = std::numeric_limits<double>::infinity();

    for (double t = 0.0; t <= config_.lead_horizon + 1e-9; t += config_.lead_step) {
        Vec3 p = project(threat.position, threat.velocity, accel, t);
        if (p.y <= 0.0) break;

        double t_i = effective_intercept_time(distance(launch_position, p), max_speed, spin_up);
        double err = std::abs(t - t_i);
        if (err < best_error) {
            best_error = err;
            best = LeadSolution{p, t, 0.0, accel};
        }
        if (err < CONVERGED_TIME_ERROR) break;
    }

    if (best) best->confidence = confidence(threat.id);
    return best;
}

std::vector<TrajectoryPoint> PredictiveTracker::predict_trajectory(const Threat& threat,
                                                                   double horizon,
                                                                   double step) const {
    std::vector<TrajectoryPoint> points;
    if (step <= 0.0) return points;

    Vec3 accel = acceleration(threat.id);
    double base = confidence(threat.id);

    for (double t = 0.0; t <= horizon + 1e-9; t += step) {
        Vec3 p = project(threat.position, threat.velocity, accel, t);
        if (p.y < 0.0) break;
        points.push_back(TrajectoryPoint{p, threat.velocity + accel * t, t,
                                         base * std::exp(-t / PREVIEW_DECAY)});
    }
    return points;
}

void PredictiveTracker::purge(double now) {
    for (auto it = history_.begin(); it != history_.end(); ) {
        if (it->second.empty() || now - it->second.back().time > config_.track_stale_after) {
            it = history_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace skyshield::defense
