#include "defense/proximity_fuse.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace skyshield;
using namespace skyshield::defense;
using namespace skyshield::defense::testing;

namespace {

struct Blast {
    Vec3 position;
    double quality;
};

} // namespace

TEST(ProximityFuse, QualityFallsFromOptimalToDetonationRadius) {
    FuseConfig cfg;
    EXPECT_DOUBLE_EQ(ProximityFuse::quality(0.0, cfg), 1.0);
    EXPECT_NEAR(ProximityFuse::quality(3.0, cfg), 0.95, 1e-12);
    EXPECT_NEAR(ProximityFuse::quality(6.0, cfg), 0.9, 1e-12);
    EXPECT_NEAR(ProximityFuse::quality(9.0, cfg), 0.7, 1e-12);
    EXPECT_NEAR(ProximityFuse::quality(12.0, cfg), 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(ProximityFuse::quality(30.0, cfg), 0.5);
}

TEST(ProximityFuse, ClosestApproachWithinLastStep) {
    // Passed through the target 0.1 s ago
    ClosestApproach ca = ProximityFuse::closest_approach(Vec3{10, 0, 0}, Vec3{100, 0, 0}, 0.2);
    EXPECT_NEAR(ca.distance, 0.0, 1e-12);
    EXPECT_NEAR(ca.time_offset, -0.1, 1e-12);

    // Still closing: nearest point is now
    ca = ProximityFuse::closest_approach(Vec3{10, 0, 0}, Vec3{-100, 0, 0}, 0.2);
    EXPECT_NEAR(ca.distance, 10.0, 1e-12);
    EXPECT_DOUBLE_EQ(ca.time_offset, 0.0);

    // Nearest point was before the step began
    ca = ProximityFuse::closest_approach(Vec3{50, 0, 0}, Vec3{100, 0, 0}, 0.2);
    EXPECT_NEAR(ca.distance, 30.0, 1e-12);
    EXPECT_NEAR(ca.time_offset, -0.2, 1e-12);
}

class FuseWorld : public ::testing::Test {
protected:
    DefenseWorld world;
    FuseConfig cfg;
    std::vector<Blast> blasts;

    Interceptor& add_round(const std::string& id, const Vec3& pos, const Vec3& vel,
                           double travelled = 500.0) {
        Interceptor round = make_interceptor(id, "T1", pos, vel);
        round.distance_travelled = travelled;
        round.on_detonation = [this](const Vec3& p, double q) { blasts.push_back({p, q}); };
        return world.add_interceptor(std::move(round));
    }
};

TEST_F(FuseWorld, FiresInsideDetonationRadius) {
    world.add_threat(make_threat("T1", Vec3{5, 1000, 0}, Vec3::Zero()));
    add_round("I1", Vec3{0, 1000, 0}, Vec3{300, 0, 0});

    ProximityFuse::update_all(1.0 / 60.0, world, cfg);
    ASSERT_EQ(blasts.size(), 1u);
    EXPECT_NEAR(blasts[0].position.x, 0.0, 1e-9);
    EXPECT_NEAR(blasts[0].quality, 0.9 + (1.0 - 5.0 / 6.0) * 0.1, 1e-12);
}

TEST_F(FuseWorld, BlastPlacedAtClosestApproachWhenPassingThrough) {
    world.add_threat(make_threat("T1", Vec3{0, 1000, 0}, Vec3::Zero()));
    add_round("I1", Vec3{10, 1000, 0}, Vec3{600, 0, 0});

    ProximityFuse::update_all(0.05, world, cfg);
    ASSERT_EQ(blasts.size(), 1u);
    EXPECT_NEAR(blasts[0].position.x, 0.0, 1e-9);
    EXPECT_NEAR(blasts[0].position.y, 1000.0, 1e-9);
    EXPECT_NEAR(blasts[0].quality, 1.0, 1e-9);
}

TEST_F(FuseWorld, UnarmedOrDistantRoundsHoldFire) {
    world.add_threat(make_threat("T1", Vec3{5, 1000, 0}, Vec3::Zero()));
    add_round("I_fresh", Vec3{0, 1000, 0}, Vec3{300, 0, 0}, 10.0);
    add_round("I_far", Vec3{-100, 1000, 0}, Vec3{300, 0, 0});

    ProximityFuse::update_all(1.0 / 60.0, world, cfg);
    EXPECT_TRUE(blasts.empty());
}

TEST_F(FuseWorld, IgnoresDeadTargetsAndCoastingRounds) {
    Threat& t = world.add_threat(make_threat("T1", Vec3{5, 1000, 0}, Vec3::Zero()));
    t.active = false;
    add_round("I1", Vec3{0, 1000, 0}, Vec3{300, 0, 0});
    Interceptor& coasting = add_round("I2", Vec3{0, 1000, 0}, Vec3{300, 0, 0});
    coasting.target_id.clear();

    ProximityFuse::update_all(1.0 / 60.0, world, cfg);
    EXPECT_TRUE(blasts.empty());
}
