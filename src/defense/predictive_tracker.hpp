/**
 * PredictiveTracker - per-threat kinematic history and lead prediction.
 *
 * Keeps a bounded window of (position, velocity, time) samples per threat,
 * estimates acceleration from the two newest samples, and searches the
 * threat's projected path for the point an interceptor can reach at the
 * same moment. Confidence blends sample count, maneuver intensity and how
 * well a pure-gravity model explains the recent track.
 */

#ifndef SKYSHIELD_DEFENSE_PREDICTIVE_TRACKER_HPP
#define SKYSHIELD_DEFENSE_PREDICTIVE_TRACKER_HPP

#include "defense/engine_config.hpp"
#include "defense/threat.hpp"
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

struct TrackSample {
    Vec3 position;
    Vec3 velocity;
    double time = 0.0;
};

struct LeadSolution {
    Vec3 aim_point;
    double time_to_intercept = 0.0;   // s from now
    double confidence = 0.0;          // [0.5, 1]
    Vec3 threat_acceleration;
};

struct TrajectoryPoint {
    Vec3 position;
    Vec3 velocity;
    double time = 0.0;                // s from now
    double confidence = 0.0;
};

class PredictiveTracker {
public:
    explicit PredictiveTracker(const EngineConfig& config);

    /** Append the threat's current state to its history. */
    void observe(const Threat& threat, double now);

    /** Acceleration estimate; gravity when the history is too short. */
    Vec3 acceleration(const std::string& threat_id) const;

    /** Track confidence in [0.5, 1]. */
    double confidence(const std::string& threat_id) const;

    /**
     * Time for an interceptor that spins up linearly to max_speed over
     * spin_up seconds to cover distance d.
     */
    static double effective_intercept_time(double d, double max_speed, double spin_up);

    /**
     * Search the threat's projected path for the best lead point.
     * Empty when no sampled point lies above ground.
     */
    std::optional<LeadSolution> lead_point(const Threat& threat,
                                           const Vec3& launch_position,
                                           double max_speed) const;
    std::optional<LeadSolution> lead_point(const Threat& threat,
                                           const Vec3& launch_position,
                                           double max_speed,
                                           double spin_up) const;

    /** Sampled preview of the projected path, stopping at ground contact. */
    std::vector<TrajectoryPoint> predict_trajectory(const Threat& threat,
                                                    double horizon,
                                                    double step) const;

    /** Drop histories whose newest sample is older than the stale limit. */
    void purge(double now);

    void forget(const std::string& threat_id) { history_.erase(threat_id); }
    size_t tracked_count() const { return history_.size(); }
    size_t sample_count(const std::string& threat_id) const;

private:
    EngineConfig config_;
    std::unordered_map<std::string, std::deque<TrackSample>> history_;

    const std::deque<TrackSample>* samples(const std::string& threat_id) const;

    /** Mean squared error of a gravity-only projection across the track. */
    static double gravity_model_variance(const std::deque<TrackSample>& track);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_PREDICTIVE_TRACKER_HPP
