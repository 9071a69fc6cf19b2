#include <gtest/gtest.h>
#include <stdexcept>
#include "rigid2d/components/body.hpp"
#include "rigid2d/forces/damping.hpp"
#include "rigid2d/forces/gravity.hpp"
#include "rigid2d/forces/spring.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/systems/impulse_sim.hpp"

using namespace Systems;

class ForceLawTest : public ::testing::Test {
protected:
    entt::registry registry;
};

TEST_F(ForceLawTest, GravityPullsFiniteMassesDown) {
    auto ball = Shapes::createBall(registry, "ball", 0.5, 2.0);
    Shapes::createWall(registry, "floor", 10.0, 1.0);

    GravityLaw gravity(3.0);
    auto forces = gravity.calculateForces(registry);
    ASSERT_EQ(forces.size(), 1u);
    EXPECT_EQ(forces[0].body, ball);
    EXPECT_DOUBLE_EQ(forces[0].vector.x, 0.0);
    EXPECT_DOUBLE_EQ(forces[0].vector.y, -6.0);
}

TEST_F(ForceLawTest, GravityPotentialUsesZeroEnergyLevel) {
    auto a = Shapes::createBall(registry, "a", 0.5, 1.0);
    auto b = Shapes::createBall(registry, "b", 0.5, 1.0);
    Bodies::setPose(registry, a, Vector(0.0, 2.0), 0.0);
    Bodies::setPose(registry, b, Vector(3.0, 2.0), 0.0);
    Bodies::setZeroEnergyLevel(registry, b, 1.0);

    GravityLaw gravity;
    GravityConfig cfg = gravity.getSpecificConfig();
    cfg.gravity = 10.0;
    cfg.zeroEnergyLevel = -1.0;
    gravity.setSpecificConfig(cfg);

    // a uses the global level, b its own
    EXPECT_DOUBLE_EQ(gravity.getPotentialEnergy(registry), 10.0 * 3.0 + 10.0 * 1.0);
}

TEST_F(ForceLawTest, DampingOpposesMotion) {
    auto block = Shapes::createBlock(registry, "block", 1.0, 1.0);
    Bodies::setVelocity(registry, block, Vector(2.0, -1.0), 4.0);

    DampingLaw damping(0.5, 0.25);
    auto forces = damping.calculateForces(registry);
    ASSERT_EQ(forces.size(), 1u);
    EXPECT_DOUBLE_EQ(forces[0].vector.x, -1.0);
    EXPECT_DOUBLE_EQ(forces[0].vector.y, 0.5);
    EXPECT_DOUBLE_EQ(forces[0].torque, -0.5);
    EXPECT_DOUBLE_EQ(damping.getPotentialEnergy(registry), 0.0);

    DampingLaw none;
    EXPECT_TRUE(none.calculateForces(registry).empty());
}

TEST_F(ForceLawTest, SpringToWorldAnchor) {
    auto block = Shapes::createBlock(registry, "block", 1.0, 1.0);
    Bodies::setPose(registry, block, Vector(3.0, 0.0), 0.0);

    // attach at the block's left side, anchor at the origin
    Spring spring(block, Vector(-0.5, 0.0), entt::null, Vector(0.0, 0.0), 1.5, 2.0);
    EXPECT_DOUBLE_EQ(spring.getLength(registry), 2.5);
    EXPECT_DOUBLE_EQ(spring.getStretch(registry), 1.0);
    EXPECT_DOUBLE_EQ(spring.getPotentialEnergy(registry), 1.0);

    auto forces = spring.calculateForces(registry);
    ASSERT_EQ(forces.size(), 1u);
    EXPECT_EQ(forces[0].body, block);
    // stretched: pulls the block toward the anchor
    EXPECT_DOUBLE_EQ(forces[0].vector.x, -2.0);
    EXPECT_DOUBLE_EQ(forces[0].vector.y, 0.0);
    EXPECT_DOUBLE_EQ(forces[0].location.x, 2.5);
}

TEST_F(ForceLawTest, SpringBetweenBodiesIsBalanced) {
    auto a = Shapes::createBlock(registry, "a", 1.0, 1.0);
    auto b = Shapes::createBlock(registry, "b", 1.0, 1.0);
    Bodies::setPose(registry, b, Vector(0.0, 1.0), 0.0);

    // compressed
    Spring spring(a, Vector(0.0, 0.0), b, Vector(0.0, 0.0), 2.0, 3.0);
    auto forces = spring.calculateForces(registry);
    ASSERT_EQ(forces.size(), 2u);
    EXPECT_DOUBLE_EQ(forces[0].vector.y + forces[1].vector.y, 0.0);
    EXPECT_LT(forces[0].vector.y, 0.0);
}

TEST_F(ForceLawTest, SpringRejectsNegativeParameters) {
    auto a = Shapes::createBlock(registry, "a", 1.0, 1.0);
    EXPECT_THROW(Spring(a, Vector(), entt::null, Vector(), -1.0, 1.0), std::invalid_argument);
    EXPECT_THROW(Spring(a, Vector(), entt::null, Vector(), 1.0, -1.0), std::invalid_argument);
}

TEST_F(ForceLawTest, SimAcceptsOneGravityAndOneDamping) {
    Systems::ImpulseSim sim(registry);
    auto gravity = std::make_shared<GravityLaw>();
    sim.addForceLaw(gravity);
    sim.addForceLaw(gravity);
    EXPECT_EQ(sim.getForceLaws().size(), 1u);
    EXPECT_THROW(sim.addForceLaw(std::make_shared<GravityLaw>(3.0)), std::invalid_argument);

    sim.addForceLaw(std::make_shared<DampingLaw>(0.1, 1.0));
    EXPECT_THROW(sim.addForceLaw(std::make_shared<DampingLaw>()), std::invalid_argument);
    EXPECT_EQ(sim.getForceLaws().size(), 2u);

    EXPECT_TRUE(sim.removeForceLaw(gravity));
    EXPECT_FALSE(sim.removeForceLaw(gravity));
}
