#include "defense/intercept_engine.hpp"
#include "defense/kinematics.hpp"
#include "defense/proximity_fuse.hpp"
#include "defense/scenario_parser.hpp"
#include "defense/scenario_runner.hpp"
#include "io/json_reader.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <string>
#include <vector>

using namespace skyshield;
using namespace skyshield::defense;
using namespace skyshield::defense::testing;

namespace {

constexpr double DT = 1.0 / 60.0;

bool has_record(const TickReport& report, const std::string& result,
                const std::string& interceptor_id = "") {
    return std::any_of(report.records.begin(), report.records.end(),
        [&](const EngagementRecord& r) {
            return r.result == result &&
                   (interceptor_id.empty() || r.interceptor_id == interceptor_id);
        });
}

bool has_diagnostic(const TickReport& report, const std::string& text) {
    return std::any_of(report.diagnostics.begin(), report.diagnostics.end(),
        [&](const std::string& d) { return d.find(text) != std::string::npos; });
}

Scenario load_mixed_salvo() {
    return ScenarioParser::parse(
        JsonReader::parse_file(std::string(SKYSHIELD_SCENARIO_DIR) + "/mixed_salvo.json"));
}

} // namespace

// ═══════════════════════════════════════════════════════════════
// InterceptEngine
// ═══════════════════════════════════════════════════════════════

class EngineFixture : public ::testing::Test {
protected:
    EngineConfig config = deterministic_config();
    DefenseWorld world;

    void SetUp() override {
        add_launcher(world, make_battery_spec("B1", Vec3::Zero(), 250.0, 2000.0, 10));
    }
};

TEST_F(EngineFixture, EngagesFeasibleThreatOnFirstTick) {
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);

    TickReport report = engine.update(DT);

    ASSERT_EQ(engine.last_plan().allocations.size(), 1u);
    EXPECT_EQ(engine.last_plan().allocations[0].interceptor_count, 2);
    EXPECT_TRUE(engine.controller().is_engaged("T1"));
    EXPECT_EQ(engine.ledger().count("T1"), 2);

    // Salvo: first round now, second after the salvo interval
    EXPECT_EQ(engine.interceptors_fired(), 1);
    EXPECT_EQ(report.in_flight, (std::vector<std::string>{"B1-I1"}));
    EXPECT_TRUE(has_record(report, "LAUNCH", "B1-I1"));
    EXPECT_EQ(world.get_battery("B1")->available_interceptors(), 9);

    const Interceptor* round = world.get_interceptor("B1-I1");
    ASSERT_NE(round, nullptr);
    EXPECT_TRUE(static_cast<bool>(round->on_detonation));
    EXPECT_LE(round->commanded_accel.norm(), config.max_acceleration + 1e-9);
}

TEST_F(EngineFixture, KillClosesEngagementAndFeedsLearning) {
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);
    engine.update(DT);

    world.sim_time += DT;
    const Vec3 target = world.get_threat("T1")->position;
    world.get_interceptor("B1-I1")->on_detonation(target, 1.0);
    EXPECT_TRUE(world.get_threat("T1")->destroyed);
    EXPECT_FALSE(engine.ledger().contains("T1"));

    TickReport report = engine.update(DT);
    EXPECT_TRUE(has_record(report, "KILL", "B1-I1"));
    EXPECT_FALSE(report.scores.empty());
    EXPECT_TRUE(report.in_flight.empty());
    EXPECT_TRUE(world.interceptors().empty());

    EXPECT_FALSE(engine.controller().is_engaged("T1"));
    EXPECT_EQ(engine.controller().stats().hits, 1);
    EXPECT_NEAR(engine.prioritizer().success_rate(ThreatCategory::BALLISTIC_MISSILE), 0.865, 1e-12);
    EXPECT_EQ(engine.adjudicator().stats().kills, 1);

    // The salvo's second round is never fired once the threat is dead
    world.sim_time = 1.0;
    engine.update(DT);
    EXPECT_EQ(engine.interceptors_fired(), 1);
}

TEST_F(EngineFixture, UnknownDetonationsAreIgnored) {
    InterceptEngine engine(world, config);
    engine.on_proximity_detonation("ghost", Vec3::Zero(), 1.0);
    TickReport report = engine.update(DT);
    EXPECT_TRUE(report.records.empty());
    EXPECT_EQ(engine.adjudicator().stats().discarded, 0);
}

TEST_F(EngineFixture, SweepReleasesOrphanedClaim) {
    world.add_threat(make_threat("T1", Vec3{8000, 500, 0}, Vec3{-100, 0, 0}));
    InterceptEngine engine(world, config);
    ASSERT_TRUE(engine.adjudicator().try_claim(*world.get_threat("T1")));

    TickReport report = engine.update(DT);
    EXPECT_FALSE(world.get_threat("T1")->being_intercepted());
    EXPECT_TRUE(has_diagnostic(report, "Sweep released orphaned claim on T1"));
    EXPECT_EQ(engine.interceptors_fired(), 0);
}

TEST_F(EngineFixture, InterceptorsTimeOut) {
    config.interceptor_timeout = 1.0;
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);
    engine.update(DT);

    world.sim_time = 1.5;
    TickReport report = engine.update(DT);
    EXPECT_TRUE(has_record(report, "TIMEOUT", "B1-I1"));
    EXPECT_EQ(world.get_interceptor("B1-I1"), nullptr);
}

TEST_F(EngineFixture, LeakIsReportedAndLedgerCleared) {
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);
    engine.update(DT);
    ASSERT_TRUE(engine.ledger().contains("T1"));

    world.get_threat("T1")->active = false;
    engine.report_leak("T1");
    EXPECT_FALSE(engine.ledger().contains("T1"));

    world.sim_time += DT;
    TickReport report = engine.update(DT);
    EXPECT_TRUE(has_record(report, "LEAK"));
}

TEST_F(EngineFixture, SaturatedDefenseHoldsFire) {
    // T1's two-round salvo takes both slots: one airborne, one reserved
    config.max_in_flight = 2;
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);

    engine.update(DT);
    EXPECT_EQ(engine.interceptors_fired(), 1);

    // Arrives while the first round is still airborne
    world.add_threat(make_threat("T2", Vec3{900, 600, 0}, Vec3{-80, -40, 0}));
    world.sim_time += DT;
    engine.update(DT);
    EXPECT_EQ(engine.interceptors_fired(), 1);
    EXPECT_EQ(engine.last_plan().unassigned, (std::vector<std::string>{"T2"}));
}

TEST(InterceptEngine, InFlightCapHoldsUnderMassRaid) {
    EngineConfig config = deterministic_config();
    DefenseWorld world;
    add_launcher(world, make_battery_spec("B1", Vec3::Zero(), 250.0, 2000.0, 50));
    for (int i = 0; i < 12; ++i) {
        world.add_threat(reference_threat("T" + std::to_string(i)));
    }
    InterceptEngine engine(world, config);

    for (int step = 0; step < 180; ++step) {
        TickReport report = engine.update(DT);
        ASSERT_LE(static_cast<int>(report.in_flight.size()), config.max_in_flight)
            << "t=" << world.sim_time;
        ASSERT_LE(world.active_interceptor_count() + engine.controller().reserved_shots(),
                  config.max_in_flight) << "t=" << world.sim_time;
        world.sim_time += DT;
    }

    // Four two-round salvos fill the cap; nothing else goes up
    EXPECT_EQ(engine.interceptors_fired(), 8);
    EXPECT_EQ(world.active_interceptor_count(), 8);
    EXPECT_EQ(engine.last_plan().unassigned.size(), 8u);
}

TEST(InterceptEngine, PendingSalvoRoundsKeepTheirInventory) {
    EngineConfig config = deterministic_config();
    DefenseWorld world;
    add_launcher(world, make_battery_spec("B1", Vec3::Zero(), 250.0, 2000.0, 3));
    world.add_threat(reference_threat("T1"));
    InterceptEngine engine(world, config);

    engine.update(DT);
    EXPECT_EQ(world.get_battery("B1")->available_interceptors(), 2);
    EXPECT_EQ(engine.controller().reserved_shots("B1"), 1);

    world.add_threat(make_threat("T2", Vec3{900, 600, 0}, Vec3{-80, -40, 0}));
    world.sim_time += DT;
    engine.update(DT);
    EXPECT_EQ(engine.last_plan().unassigned, (std::vector<std::string>{"T2"}));
    EXPECT_FALSE(engine.controller().is_engaged("T2"));

    world.sim_time = 0.5;
    engine.update(DT);
    auto t1 = engine.controller().engagements_for("T1");
    ASSERT_EQ(t1.size(), 1u);
    EXPECT_EQ(t1[0]->shots_fired, 2);
    EXPECT_EQ(t1[0]->planned_shots, 2);
    EXPECT_EQ(engine.interceptors_fired(), 2);
    EXPECT_EQ(world.get_battery("B1")->available_interceptors(), 1);
}

// ═══════════════════════════════════════════════════════════════
// Host kinematics
// ═══════════════════════════════════════════════════════════════

TEST(ThreatKinematics, BallisticAndManeuveringFlight) {
    DefenseWorld world;
    world.add_threat(make_threat("B", Vec3{0, 100, 0}, Vec3{10, 0, 0}));
    world.add_threat(make_threat("C", Vec3{0, 100, 0}, Vec3{10, -1, 0}, ThreatCategory::CRUISE_MISSILE));

    auto impacted = ThreatKinematics::update_all(1.0, world);
    EXPECT_TRUE(impacted.empty());

    const Threat* b = world.get_threat("B");
    EXPECT_NEAR(b->position.x, 10.0, 1e-12);
    EXPECT_NEAR(b->position.y, 100.0 - 0.5 * 9.81, 1e-12);
    EXPECT_NEAR(b->velocity.y, -9.81, 1e-12);

    const Threat* c = world.get_threat("C");
    EXPECT_NEAR(c->position.y, 99.0, 1e-12);
    EXPECT_NEAR(c->time_to_impact, 99.0, 1e-9);
    ASSERT_TRUE(c->impact_point.has_value());
    EXPECT_NEAR(c->impact_point->x, 10.0 + 990.0, 1e-9);
}

TEST(ThreatKinematics, GroundContactEndsFlight) {
    DefenseWorld world;
    world.add_threat(make_threat("T1", Vec3{0, 1, 0}, Vec3{0, -10, 0}));
    auto impacted = ThreatKinematics::update_all(1.0, world);
    ASSERT_EQ(impacted, (std::vector<std::string>{"T1"}));

    const Threat* t = world.get_threat("T1");
    EXPECT_FALSE(t->active);
    EXPECT_FALSE(t->destroyed);
    EXPECT_DOUBLE_EQ(t->position.y, 0.0);
    EXPECT_DOUBLE_EQ(t->time_to_impact, 0.0);
}

TEST(InterceptorKinematics, SpinsUpToMaxSpeed) {
    DefenseWorld world;
    Interceptor round = make_interceptor("I1", "T1", Vec3{0, 10, 0}, Vec3{180, 0, 0});
    round.distance_travelled = 0.0;
    world.add_interceptor(std::move(round));

    InterceptorKinematics::update_all(0.1, world, 2.0);
    const Interceptor* i = world.get_interceptor("I1");
    EXPECT_NEAR(i->velocity.x, 180.0 + 300.0 * 0.1, 1e-9);
    EXPECT_NEAR(i->distance_travelled, 21.0, 1e-9);

    for (int k = 0; k < 50; ++k) InterceptorKinematics::update_all(0.1, world, 2.0);
    EXPECT_NEAR(world.get_interceptor("I1")->velocity.norm(), 600.0, 1e-9);
}

TEST(InterceptorKinematics, GroundImpactTerminatesRound) {
    DefenseWorld world;
    world.add_interceptor(make_interceptor("I1", "T1", Vec3{0, 1, 0}, Vec3{0, -100, 0}));
    InterceptorKinematics::update_all(0.1, world, 2.0);
    const Interceptor* i = world.get_interceptor("I1");
    EXPECT_FALSE(i->active);
    EXPECT_EQ(i->fate, InterceptorFate::GROUND_IMPACT);
}

// ═══════════════════════════════════════════════════════════════
// ScenarioRunner (end to end)
// ═══════════════════════════════════════════════════════════════

TEST(ScenarioRunner, MixedSalvoRunsCleanly) {
    Scenario scenario = load_mixed_salvo();
    RunConfig rc;
    rc.num_runs = 2;
    rc.max_sim_time = 60.0;

    int progress_calls = 0;
    ScenarioRunner runner(rc);
    auto results = runner.run(scenario, [&](int done, int total) {
        progress_calls++;
        EXPECT_EQ(total, 2);
        EXPECT_EQ(done, progress_calls);
    });

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(progress_calls, 2);
    for (const auto& r : results) {
        EXPECT_TRUE(r.error.empty()) << r.error;
        EXPECT_EQ(r.threats_total, 5);
        EXPECT_GT(r.interceptors_fired, 0);
        EXPECT_LE(r.kills + r.leaked, r.threats_total);
        EXPECT_LE(r.sim_time_final, 60.0 + 1e-6);
        EXPECT_FALSE(r.engagement_log.empty());
    }
    EXPECT_EQ(results[0].seed, 42);
    EXPECT_EQ(results[1].seed, 43);
}

TEST(ScenarioRunner, SameSeedReplaysIdentically) {
    Scenario scenario = load_mixed_salvo();
    RunConfig rc;
    rc.max_sim_time = 40.0;
    ScenarioRunner runner(rc);

    RunResult a = runner.run_single(scenario, 0, 7);
    RunResult b = runner.run_single(scenario, 0, 7);
    EXPECT_EQ(a.kills, b.kills);
    EXPECT_EQ(a.leaked, b.leaked);
    EXPECT_EQ(a.score, b.score);
    EXPECT_EQ(a.interceptors_fired, b.interceptors_fired);
    ASSERT_EQ(a.engagement_log.size(), b.engagement_log.size());
    for (size_t i = 0; i < a.engagement_log.size(); ++i) {
        EXPECT_EQ(a.engagement_log[i].result, b.engagement_log[i].result);
        EXPECT_EQ(a.engagement_log[i].interceptor_id, b.engagement_log[i].interceptor_id);
    }
}

TEST(ScenarioRunner, UndefendedThreatLeaks) {
    Scenario scenario;
    scenario.batteries.push_back(make_battery_spec("B1", Vec3::Zero(), 250.0, 2000.0));
    BatterySpec laser = make_battery_spec("L1", Vec3{8000, 0, 0});
    laser.kind = BatteryKind::LASER;
    scenario.batteries.push_back(laser);
    scenario.threats.push_back(ThreatSpawn{
        make_threat("R1", Vec3{8000, 200, 0}, Vec3{0, -50, 0}, ThreatCategory::ROCKET), 0.0});

    RunConfig rc;
    rc.max_sim_time = 10.0;
    RunResult r = ScenarioRunner(rc).run_single(scenario, 0, 1);

    EXPECT_TRUE(r.error.empty()) << r.error;
    EXPECT_EQ(r.leaked, 1);
    EXPECT_EQ(r.kills, 0);
    EXPECT_EQ(r.interceptors_fired, 0);
    EXPECT_LT(r.sim_time_final, 10.0);
    ASSERT_EQ(r.engagement_log.size(), 1u);
    EXPECT_EQ(r.engagement_log[0].result, "LEAK");
    EXPECT_EQ(r.engagement_log[0].threat_id, "R1");
}

TEST(ScenarioRunner, TickInvariantsHoldThroughMixedSalvo) {
    Scenario scenario = load_mixed_salvo();
    DefenseWorld world = ScenarioParser::build_world(scenario);
    InterceptEngine engine(world, scenario.engine);

    size_t next = 0;
    for (int step = 0; step < 40 * 60; ++step) {
        world.sim_time += DT;
        while (next < scenario.threats.size() &&
               scenario.threats[next].spawn_time <= world.sim_time) {
            Threat t = scenario.threats[next++].threat;
            ThreatKinematics::refresh_impact_estimate(t);
            world.add_threat(std::move(t));
        }

        for (const auto& id : ThreatKinematics::update_all(DT, world)) engine.report_leak(id);
        InterceptorKinematics::update_all(DT, world, scenario.engine.spin_up_time);
        ProximityFuse::update_all(DT, world, scenario.engine.fuse);
        engine.update(DT);

        for (const auto& threat : world.threats()) {
            int live = 0;
            for (const Engagement* e : engine.controller().engagements_for(threat.id)) {
                if (e->live()) live++;
            }
            ASSERT_LE(live, 1) << threat.id << " at t=" << world.sim_time;
            if (threat.destroyed) {
                ASSERT_EQ(world.interceptors_targeting(threat.id), 0) << threat.id;
            }
        }
        for (const auto& battery : world.batteries()) {
            ASSERT_GE(battery->available_interceptors(), 0) << battery->id();
        }
        ASSERT_LE(world.active_interceptor_count(), scenario.engine.max_in_flight);
        for (const auto& round : world.interceptors()) {
            ASSERT_LE(round.commanded_accel.norm(), scenario.engine.max_acceleration + 1e-9);
        }
        for (const auto& id : engine.ledger().threat_ids()) {
            ASSERT_NE(world.get_threat(id), nullptr) << id;
        }
    }
}
