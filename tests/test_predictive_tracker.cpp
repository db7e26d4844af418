#include "defense/predictive_tracker.hpp"
#include "physics/vec3_ops.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace skyshield;
using namespace skyshield::defense;
using namespace skyshield::defense::testing;

namespace {

// Threat state at time t along p0 + v0*t + a*t^2/2
Threat sample_at(const Vec3& p0, const Vec3& v0, const Vec3& a, double t,
                 ThreatCategory category = ThreatCategory::BALLISTIC_MISSILE) {
    Threat th;
    th.id = "T1";
    th.category = category;
    th.position = project(p0, v0, a, t);
    th.velocity = v0 + a * t;
    return th;
}

} // namespace

TEST(PredictiveTracker, AssumesGravityWithoutHistory) {
    PredictiveTracker tracker{EngineConfig{}};
    Vec3 a = tracker.acceleration("T1");
    EXPECT_DOUBLE_EQ(a.y, -GRAVITY);
    EXPECT_DOUBLE_EQ(tracker.confidence("T1"), 0.5);

    tracker.observe(reference_threat(), 0.0);
    EXPECT_DOUBLE_EQ(tracker.acceleration("T1").y, -GRAVITY);
}

TEST(PredictiveTracker, EstimatesAccelerationFromNewestSamples) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat t = reference_threat();
    tracker.observe(t, 0.0);
    t.velocity = t.velocity + Vec3{2, -GRAVITY, 0};
    tracker.observe(t, 1.0);

    Vec3 a = tracker.acceleration("T1");
    EXPECT_NEAR(a.x, 2.0, 1e-12);
    EXPECT_NEAR(a.y, -GRAVITY, 1e-12);
}

TEST(PredictiveTracker, ClampsImplausibleAcceleration) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat t = reference_threat();
    tracker.observe(t, 0.0);
    t.velocity = t.velocity + Vec3{100, 0, 0};
    tracker.observe(t, 1.0);
    EXPECT_NEAR(tracker.acceleration("T1").norm(), 50.0, 1e-9);
}

TEST(PredictiveTracker, HistoryIsBounded) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat t = reference_threat();
    for (int i = 0; i < 15; ++i) tracker.observe(t, i * 0.1);
    EXPECT_EQ(tracker.sample_count("T1"), 10u);

    // A second observation in the same tick replaces the newest sample
    tracker.observe(t, 1.4);
    EXPECT_EQ(tracker.sample_count("T1"), 10u);
}

TEST(PredictiveTracker, BallisticTrackEarnsFullConfidence) {
    PredictiveTracker tracker{EngineConfig{}};
    Vec3 p0{2000, 1500, 0};
    Vec3 v0{-150, 80, 0};
    for (int i = 0; i < 5; ++i) {
        tracker.observe(sample_at(p0, v0, gravity_vector(), i * 0.1), i * 0.1);
    }
    EXPECT_NEAR(tracker.confidence("T1"), 1.0, 1e-9);
}

TEST(PredictiveTracker, ManeuveringTrackLosesConfidence) {
    PredictiveTracker tracker{EngineConfig{}};
    Vec3 p0{2000, 300, 0};
    Vec3 v0{-200, 0, 0};
    Vec3 jink{0, 0, 30};
    for (int i = 0; i < 5; ++i) {
        tracker.observe(sample_at(p0, v0, jink, i * 0.1, ThreatCategory::CRUISE_MISSILE), i * 0.1);
    }
    EXPECT_NEAR(tracker.acceleration("T1").z, 30.0, 1e-6);

    double c = tracker.confidence("T1");
    EXPECT_LT(c, 0.81);
    EXPECT_GT(c, 0.75);
}

TEST(PredictiveTracker, ShortTrackConfidenceIsFloored) {
    PredictiveTracker tracker{EngineConfig{}};
    tracker.observe(reference_threat(), 0.0);
    EXPECT_DOUBLE_EQ(tracker.confidence("T1"), 0.5);
}

TEST(PredictiveTracker, EffectiveInterceptTimeAccountsForSpinUp) {
    // Still accelerating: d = a*t^2/2 with a = 100 m/s^2
    EXPECT_NEAR(PredictiveTracker::effective_intercept_time(100.0, 200.0, 2.0), std::sqrt(2.0), 1e-12);
    // Past spin-up: 2 s to cover 200 m, then cruise
    EXPECT_NEAR(PredictiveTracker::effective_intercept_time(1000.0, 200.0, 2.0), 6.0, 1e-12);
    EXPECT_NEAR(PredictiveTracker::effective_intercept_time(1000.0, 200.0, 0.0), 5.0, 1e-12);
}

TEST(PredictiveTracker, LeadPointOnHoveringTarget) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat drone = make_threat("T1", Vec3{1000, 500, 0}, Vec3::Zero(), ThreatCategory::DRONE);
    tracker.observe(drone, 0.0);
    tracker.observe(drone, 0.1);

    auto lead = tracker.lead_point(drone, Vec3::Zero(), 200.0, 2.0);
    ASSERT_TRUE(lead.has_value());
    EXPECT_NEAR(lead->aim_point.x, 1000.0, 1e-9);
    EXPECT_NEAR(lead->aim_point.y, 500.0, 1e-9);

    double expected = PredictiveTracker::effective_intercept_time(
        distance(Vec3::Zero(), drone.position), 200.0, 2.0);
    EXPECT_NEAR(lead->time_to_intercept, expected, 0.06);
    EXPECT_DOUBLE_EQ(lead->confidence, 0.5);
}

TEST(PredictiveTracker, LeadPointMatchesInterceptorArrival) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat t = reference_threat();
    tracker.observe(t, 0.0);

    auto lead = tracker.lead_point(t, Vec3::Zero(), 250.0);
    ASSERT_TRUE(lead.has_value());
    EXPECT_GT(lead->aim_point.y, 0.0);
    double arrival = PredictiveTracker::effective_intercept_time(
        distance(Vec3::Zero(), lead->aim_point), 250.0, 2.0);
    EXPECT_LT(std::abs(lead->time_to_intercept - arrival), 0.1);
    EXPECT_LT(lead->time_to_intercept, t.time_to_impact);
}

TEST(PredictiveTracker, NoLeadPointForGroundedThreat) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat grounded = make_threat("T1", Vec3{500, 0, 0}, Vec3{-100, -10, 0});
    EXPECT_FALSE(tracker.lead_point(grounded, Vec3::Zero(), 250.0).has_value());
}

TEST(PredictiveTracker, TrajectoryPreviewStopsAtGround) {
    PredictiveTracker tracker{EngineConfig{}};
    Threat t = reference_threat();
    auto points = tracker.predict_trajectory(t, 30.0, 0.5);

    // Ground contact at ~6.21 s
    ASSERT_EQ(points.size(), 13u);
    EXPECT_DOUBLE_EQ(points.front().time, 0.0);
    EXPECT_GE(points.back().position.y, 0.0);
    for (size_t i = 1; i < points.size(); ++i) {
        EXPECT_LT(points[i].confidence, points[i - 1].confidence);
    }
}

TEST(PredictiveTracker, PurgesStaleTracks) {
    PredictiveTracker tracker{EngineConfig{}};
    tracker.observe(reference_threat("T1"), 0.0);
    tracker.observe(reference_threat("T2"), 20.0);

    tracker.purge(29.0);
    EXPECT_EQ(tracker.tracked_count(), 2u);

    tracker.purge(31.0);
    EXPECT_EQ(tracker.tracked_count(), 1u);
    EXPECT_EQ(tracker.sample_count("T1"), 0u);
    EXPECT_EQ(tracker.sample_count("T2"), 1u);

    tracker.forget("T2");
    EXPECT_EQ(tracker.tracked_count(), 0u);
}
