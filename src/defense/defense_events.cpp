#include "defense/defense_events.hpp"

namespace skyshield::defense {

const char* sound_cue_name(SoundCue cue) {
    switch (cue) {
        case SoundCue::LAUNCH:            return "launch";
        case SoundCue::EXPLOSION:         return "explosion";
        case SoundCue::INTERCEPT_SUCCESS: return "intercept_success";
        case SoundCue::INTERCEPT_FAILED:  return "intercept_failed";
        case SoundCue::SELF_DESTRUCT:     return "self_destruct";
    }
    return "unknown";
}

} // namespace skyshield::defense
