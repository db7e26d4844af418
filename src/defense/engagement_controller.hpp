/**
 * EngagementController - per-threat engagement state machine.
 *
 * Strategies:
 *   SINGLE            one shot; resolves when the threat dies or the round is gone
 *   SALVO             N shots spaced by the salvo interval
 *   SHOOT_LOOK_SHOOT  one shot, assess after the assessment delay, then
 *                     fire again only if the first round missed and there
 *                     is still time
 *
 * Delays run on simulation time through a per-engagement queue of
 * scheduled actions, drained once per tick by update(). Finished
 * engagements are retained for a while for statistics, then dropped.
 */

#ifndef SKYSHIELD_DEFENSE_ENGAGEMENT_CONTROLLER_HPP
#define SKYSHIELD_DEFENSE_ENGAGEMENT_CONTROLLER_HPP

#include "defense/defense_world.hpp"
#include "defense/engine_config.hpp"
#include <functional>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace skyshield::defense {

enum class EngagementStrategy {
    SINGLE,
    SALVO,
    SHOOT_LOOK_SHOOT
};

enum class EngagementStatus {
    ACTIVE,
    ASSESSING,
    COMPLETED,
    FAILED
};

enum class EngagementResult {
    PENDING,
    HIT,
    MISS
};

const char* strategy_name(EngagementStrategy strategy);
const char* status_name(EngagementStatus status);
const char* result_name(EngagementResult result);

enum class ScheduledActionType {
    FIRE_SHOT,
    ASSESS
};

struct ScheduledAction {
    ScheduledActionType type;
    double due_time = 0.0;
};

struct Engagement {
    std::string id;
    std::string threat_id;
    std::string battery_id;
    ThreatCategory category = ThreatCategory::UNKNOWN;

    EngagementStrategy strategy = EngagementStrategy::SINGLE;
    EngagementStatus status = EngagementStatus::ACTIVE;
    EngagementResult result = EngagementResult::PENDING;

    std::vector<std::string> interceptor_ids;
    std::vector<ScheduledAction> pending;   // ordered by due_time

    int planned_shots = 1;
    int shots_fired = 0;

    double start_time = 0.0;
    double completion_time = 0.0;

    bool live() const {
        return status == EngagementStatus::ACTIVE || status == EngagementStatus::ASSESSING;
    }
};

struct EngagementStats {
    int total = 0;
    int active = 0;
    int hits = 0;
    int misses = 0;
    int failed = 0;
    double success_rate = 0.0;              // hits / (hits + misses)
    double average_interceptors = 0.0;      // rounds per engagement
};

struct EngagementHistory {
    int attempts = 0;
    int hits = 0;
};

class EngagementController {
public:
    using LaunchHandler = std::function<void(Interceptor&&)>;

    /**
     * @param on_launch receives every round this controller fires; the
     *        owner binds detonation callbacks and adds it to the world
     */
    EngagementController(const EngineConfig& config, LaunchHandler on_launch);

    /**
     * Open an engagement and fire its first shot.
     * @return engagement id; empty when the threat is already engaged or
     *         unknown. A first shot that cannot fire yields a FAILED
     *         engagement (id still returned).
     */
    std::string engage(DefenseWorld& world, const std::string& threat_id,
                       const std::string& battery_id, int interceptor_count,
                       EngagementStrategy strategy);

    /**
     * Drain due scheduled actions, resolve outcomes, drop expired records.
     * @return engagements that finished during this call
     */
    std::vector<Engagement> update(DefenseWorld& world);

    /** Any ACTIVE or ASSESSING engagement on the threat. */
    bool is_engaged(const std::string& threat_id) const;

    const Engagement* find(const std::string& engagement_id) const;
    std::vector<const Engagement*> engagements_for(const std::string& threat_id) const;
    size_t engagement_count() const { return engagements_.size(); }

    /** SALVO for 2+ rounds, SHOOT_LOOK_SHOOT when a follow-up fits, else SINGLE. */
    EngagementStrategy select_strategy(int interceptor_count, double time_to_impact) const;

    /**
     * Adjust a round count from recorded outcomes for this category and
     * battery: +1 when Pk has been poor, -1 when it has been excellent.
     */
    int recommended_interceptors(ThreatCategory category, const std::string& battery_id,
                                 int base_count) const;

    /**
     * Scheduled shots of live engagements not yet fired. These rounds are
     * committed: they count against inventory and the in-flight cap.
     * An empty battery id counts across every battery.
     */
    int reserved_shots(const std::string& battery_id = "") const;

    /** Airborne plus reserved rounds reached the in-flight cap. */
    bool saturated(const DefenseWorld& world) const;

    /** Recorded hit rate for a battery, default until enough attempts. */
    double battery_success_rate(const std::string& battery_id) const;

    EngagementStats stats() const;

private:
    EngineConfig config_;
    LaunchHandler on_launch_;
    std::vector<Engagement> engagements_;
    std::map<std::pair<ThreatCategory, std::string>, EngagementHistory> history_;
    int next_id_ = 1;

    bool fire_shot(Engagement& eng, DefenseWorld& world);
    void schedule(Engagement& eng, const ScheduledAction& action);
    void run_action(Engagement& eng, const ScheduledAction& action, DefenseWorld& world);
    void assess(Engagement& eng, DefenseWorld& world);
    void resolve(Engagement& eng, DefenseWorld& world);
    void finish(Engagement& eng, EngagementResult result, double now);
    bool any_interceptor_alive(const Engagement& eng, const DefenseWorld& world) const;
    bool shots_outstanding(const Engagement& eng) const;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_ENGAGEMENT_CONTROLLER_HPP
