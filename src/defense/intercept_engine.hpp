/**
 * InterceptEngine - per-tick orchestrator of the interception core.
 *
 * Owns every core component and runs them in order each tick:
 *   track -> expire -> grid -> engagements -> sweep -> allocate/fire -> guide
 * Proximity detonations arrive through on_proximity_detonation(), bound
 * into each interceptor's callback at launch. Side-channel events
 * accumulate and are handed out with the next tick report.
 */

#ifndef SKYSHIELD_DEFENSE_INTERCEPT_ENGINE_HPP
#define SKYSHIELD_DEFENSE_INTERCEPT_ENGINE_HPP

#include "defense/assignment_ledger.hpp"
#include "defense/defense_events.hpp"
#include "defense/defense_world.hpp"
#include "defense/engagement_controller.hpp"
#include "defense/engine_config.hpp"
#include "defense/intercept_solver.hpp"
#include "defense/interceptor_allocator.hpp"
#include "defense/kill_adjudicator.hpp"
#include "defense/predictive_tracker.hpp"
#include "defense/threat_prioritizer.hpp"
#include <string>

namespace skyshield::defense {

class InterceptEngine {
public:
    /** The world must outlive the engine. */
    InterceptEngine(DefenseWorld& world, const EngineConfig& config);

    InterceptEngine(const InterceptEngine&) = delete;
    InterceptEngine& operator=(const InterceptEngine&) = delete;

    /**
     * Advance the core by one tick at the world's current sim_time.
     * The host advances sim_time and kinematics before calling.
     */
    TickReport update(double dt);

    /** Fuse callback target. Unknown or spent interceptors are ignored. */
    void on_proximity_detonation(const std::string& interceptor_id,
                                 const Vec3& position, double fuse_quality);

    /** Record a leak (threat reached the ground) in the next report. */
    void report_leak(const std::string& threat_id);

    const EngineConfig& config() const { return config_; }
    const ThreatPrioritizer& prioritizer() const { return prioritizer_; }
    const PredictiveTracker& tracker() const { return tracker_; }
    const InterceptSolver& solver() const { return solver_; }
    const EngagementController& controller() const { return controller_; }
    const KillAdjudicator& adjudicator() const { return adjudicator_; }
    KillAdjudicator& adjudicator() { return adjudicator_; }
    const AssignmentLedger& ledger() const { return ledger_; }
    const AllocationPlan& last_plan() const { return last_plan_; }

    int interceptors_fired() const { return fired_; }

private:
    DefenseWorld& world_;
    EngineConfig config_;

    ThreatPrioritizer prioritizer_;
    PredictiveTracker tracker_;
    InterceptSolver solver_;
    InterceptorAllocator allocator_;
    EngagementController controller_;
    KillAdjudicator adjudicator_;
    AssignmentLedger ledger_;

    TickReport pending_;
    AllocationPlan last_plan_;
    double last_sweep_;
    int fired_ = 0;

    void launch(Interceptor&& round);
    void expire_interceptors(double now);
    void close_engagements(double now);
    void sweep(double now);
    void allocate_and_engage(double now);
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_INTERCEPT_ENGINE_HPP
