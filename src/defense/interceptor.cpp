#include "defense/interceptor.hpp"

namespace skyshield::defense {

const char* fate_name(InterceptorFate fate) {
    switch (fate) {
        case InterceptorFate::IN_FLIGHT:     return "in_flight";
        case InterceptorFate::DETONATED:     return "detonated";
        case InterceptorFate::SELF_DESTRUCT: return "self_destruct";
        case InterceptorFate::GROUND_IMPACT: return "ground_impact";
        case InterceptorFate::TIMEOUT:       return "timeout";
    }
    return "unknown";
}

} // namespace skyshield::defense
