/**
 * Side-channel events emitted by the interception core.
 *
 * Rendering, audio, scoring and UI collaborators consume these from the
 * tick report; the core never calls them directly.
 */

#ifndef SKYSHIELD_DEFENSE_DEFENSE_EVENTS_HPP
#define SKYSHIELD_DEFENSE_DEFENSE_EVENTS_HPP

#include "core/state_vector.hpp"
#include <string>
#include <vector>

namespace skyshield::defense {

enum class SoundCue {
    LAUNCH,
    EXPLOSION,
    INTERCEPT_SUCCESS,
    INTERCEPT_FAILED,
    SELF_DESTRUCT
};

const char* sound_cue_name(SoundCue cue);

struct ExplosionEvent {
    Vec3 position;
    double quality = 0.0;   // fuse quality in [0, 1]; 0 for self-destruct
    std::string interceptor_id;
};

struct ScoreEvent {
    std::string threat_id;
    int points = 0;
    int combo = 1;
};

// One line of the engagement log: "LAUNCH", "KILL", "MISS", "DISCARD",
// "RETARGET", "SELF_DESTRUCT", "TIMEOUT", "LEAK"
struct EngagementRecord {
    double time = 0.0;
    std::string battery_id;
    std::string interceptor_id;
    std::string threat_id;
    std::string result;
};

struct TickReport {
    double sim_time = 0.0;
    std::vector<std::string> in_flight;     // active interceptor ids
    std::vector<ExplosionEvent> explosions;
    std::vector<SoundCue> sounds;
    std::vector<ScoreEvent> scores;
    std::vector<std::string> diagnostics;
    std::vector<EngagementRecord> records;

    void record(double time, const std::string& battery, const std::string& interceptor,
                const std::string& threat, const std::string& result) {
        records.push_back(EngagementRecord{time, battery, interceptor, threat, result});
    }

    void clear() {
        in_flight.clear();
        explosions.clear();
        sounds.clear();
        scores.clear();
        diagnostics.clear();
        records.clear();
    }
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_DEFENSE_EVENTS_HPP
