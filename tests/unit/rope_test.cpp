#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <memory>
#include <stdexcept>
#include "rigid2d/collision/rope.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/collision_advance.hpp"
#include "rigid2d/forces/gravity.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/systems/contact_sim.hpp"

using namespace RigidBodyCollision;

class RopeTest : public ::testing::Test {
protected:
    entt::registry registry;
    entt::entity anchor = entt::null;
    entt::entity bob = entt::null;

    void SetUp() override {
        anchor = Shapes::createWall(registry, "anchor", 0.1, 0.1);
        bob = Shapes::createBall(registry, "bob", 0.25);
    }

    Rope hang(RopeType type, double length = 1.0) {
        return Rope(registry, anchor, Vector(0, 0), bob, Vector(0, 0), length, type);
    }
};

TEST_F(RopeTest, SlackRopeReportsNothing) {
    Rope rope = hang(RopeType::Rope);
    Bodies::setPose(registry, bob, Vector(0.0, -0.5), 0.0);
    EXPECT_FALSE(rope.isTight(registry));
    EXPECT_NEAR(rope.getStretch(registry), -0.5, 1e-12);

    CollisionList list;
    rope.addCollision(registry, list, 0.0);
    EXPECT_TRUE(list.empty());
}

TEST_F(RopeTest, NearlyTightRopeIsOneSidedRecord) {
    Rope rope = hang(RopeType::Rope);
    Bodies::setPose(registry, bob, Vector(0.0, -0.996), 0.0);
    Bodies::setVelocity(registry, bob, Vector(0.0, -1.0), 0.0);
    EXPECT_TRUE(rope.isTight(registry));

    CollisionList list;
    rope.addCollision(registry, list, 2.0);
    ASSERT_EQ(list.size(), 1u);
    const CollisionRecord& c = list[0];
    EXPECT_EQ(c.kind, CollisionKind::Rope);
    EXPECT_FALSE(c.isJoint());
    EXPECT_EQ(c.connector, &rope);
    EXPECT_EQ(c.primaryBody, anchor);
    EXPECT_EQ(c.normalBody, bob);
    // slack left before the rope pulls
    EXPECT_NEAR(c.distance, 0.004, 1e-12);
    EXPECT_NEAR(c.normal.x, 0.0, 1e-12);
    EXPECT_NEAR(c.normal.y, -1.0, 1e-12);
    // the bob moving away closes the slack
    EXPECT_NEAR(c.normalVelocity, -1.0, 1e-12);
    EXPECT_TRUE(c.ballObject);
    EXPECT_TRUE(c.ballNormal);
    EXPECT_NEAR(c.radius2, -0.996, 1e-12);
    EXPECT_DOUBLE_EQ(c.targetGap, 0.005);
    EXPECT_DOUBLE_EQ(c.detectedTime, 2.0);

    // over-stretched is a penetration
    Bodies::setPose(registry, bob, Vector(0.0, -1.02), 0.0);
    CollisionRecord copy = c;
    rope.updateCollision(registry, copy);
    EXPECT_NEAR(copy.distance, -0.02, 1e-12);
    EXPECT_TRUE(copy.illegalState());
}

TEST_F(RopeTest, RodIsAlwaysAJoint) {
    Rope rod = hang(RopeType::Rod);
    Bodies::setPose(registry, bob, Vector(0.0, -0.5), 0.0);
    EXPECT_TRUE(rod.isTight(registry));

    CollisionList list;
    rod.addCollision(registry, list, 0.0);
    ASSERT_EQ(list.size(), 1u);
    const CollisionRecord& c = list[0];
    EXPECT_TRUE(c.isJoint());
    EXPECT_TRUE(c.contact());
    EXPECT_NEAR(c.distance, 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(c.targetGap, 0.0);
    EXPECT_DOUBLE_EQ(c.elasticity, 0.0);
    EXPECT_NEAR(c.radius2, -1.0, 1e-12);
    EXPECT_NEAR(rod.getNormalDistance(registry), 0.5, 1e-12);
}

TEST_F(RopeTest, AlignPullsOutAlongTheRope) {
    Rope rope = hang(RopeType::Rope);
    Bodies::setPose(registry, bob, Vector(1.2, 1.6), 0.4);
    rope.align(registry);
    Vector const pos(registry.get<Components::Position>(bob));
    // rest length less half the distance tolerance, same direction
    EXPECT_NEAR(pos.x, 0.6 * 0.995, 1e-12);
    EXPECT_NEAR(pos.y, 0.8 * 0.995, 1e-12);
    EXPECT_DOUBLE_EQ(Bodies::currentPose(registry, bob).angle, 0.4);

    // a slack rope is left alone
    Bodies::setPose(registry, bob, Vector(0.0, -0.5), 0.0);
    rope.align(registry);
    EXPECT_NEAR(registry.get<Components::Position>(bob).y, -0.5, 1e-12);

    Rope rod = hang(RopeType::Rod);
    rod.align(registry);
    EXPECT_NEAR(registry.get<Components::Position>(bob).y, -1.0, 1e-12);
}

TEST_F(RopeTest, RejectsBadEnds) {
    EXPECT_THROW(Rope(registry, bob, Vector(), bob, Vector(), 1.0, RopeType::Rope),
                 std::invalid_argument);
    EXPECT_THROW(Rope(registry, bob, Vector(), anchor, Vector(), 1.0, RopeType::Rope),
                 std::invalid_argument);
    EXPECT_THROW(hang(RopeType::Rod, 0.0), std::invalid_argument);
}

TEST_F(RopeTest, ImpulseStopsTheBobAtFullLength) {
    Systems::ImpulseSim sim(registry);
    sim.addBody(anchor);
    sim.addBody(bob);
    Bodies::setElasticity(registry, bob, 0.0);
    Bodies::setPose(registry, bob, Vector(0.0, -0.996), 0.0);
    Bodies::setVelocity(registry, bob, Vector(0.5, -1.0), 0.0);
    sim.initializeFromBody(bob);

    Rope rope = hang(RopeType::Rope);
    CollisionList list;
    rope.addCollision(registry, list, 0.0);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_TRUE(sim.handleCollisions(list, nullptr));

    // only the component along the rope is removed
    const auto& v = registry.get<Components::Velocity>(bob);
    EXPECT_NEAR(v.x, 0.5, 1e-9);
    EXPECT_NEAR(v.y, 0.0, 1e-9);
}

TEST_F(RopeTest, PendulumOnRopeStaysAtItsLength) {
    Systems::ContactSim sim(registry);
    Bodies::setPose(registry, bob, Vector(0.8, -0.6), 0.0);
    auto rope = std::make_shared<Rope>(registry, anchor, Vector(0, 0), bob, Vector(0, 0),
                                       1.0, RopeType::Rope);
    sim.addBody(anchor);
    sim.addBody(bob);
    sim.addRope(rope);
    sim.addRope(rope);
    ASSERT_EQ(sim.getRopes().size(), 1u);
    sim.alignConnectors();
    EXPECT_NEAR(rope->getLength(registry), 0.995, 1e-12);
    sim.addForceLaw(std::make_shared<Systems::GravityLaw>(9.8));

    Engine::CollisionAdvance advance(sim);
    double const e0 = sim.getEnergyInfo().total();
    double maxStretch = -1.0;
    for (int i = 0; i < 200; ++i) {
        Engine::AdvanceResult const r = advance.tryAdvance(0.01);
        ASSERT_TRUE(r.ok()) << r.message;
        maxStretch = std::max(maxStretch, rope->getStretch(registry));
    }
    EXPECT_NEAR(advance.getTime(), 2.0, 1e-9);
    // the rope never stretches past the distance tolerance
    EXPECT_LT(maxStretch, 0.01);
    EXPECT_GT(rope->getLength(registry), 0.98);
    EXPECT_NEAR(sim.getEnergyInfo().total(), e0, 0.05);
}
