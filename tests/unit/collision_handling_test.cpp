#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "rigid2d/collision/collision_handling.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/systems/impulse_sim.hpp"

using namespace RigidBodyCollision;

class CollisionHandlingTest : public ::testing::Test {
protected:
    entt::registry registry;

    // two unit-mass balls of radius 0.5 approaching head on, target gap apart
    void headOn(Systems::ImpulseSim& sim, entt::entity& left, entt::entity& right) {
        left = Shapes::createBall(registry, "left", 0.5);
        right = Shapes::createBall(registry, "right", 0.5);
        Bodies::setPose(registry, left, Vector(-0.5025, 0.0), 0.0);
        Bodies::setPose(registry, right, Vector(0.5025, 0.0), 0.0);
        Bodies::setVelocity(registry, left, Vector(1.0, 0.0), 0.0);
        Bodies::setVelocity(registry, right, Vector(-1.0, 0.0), 0.0);
        sim.addBody(left);
        sim.addBody(right);
    }

    CollisionList detect(Systems::ImpulseSim& sim) {
        CollisionList found;
        sim.findCollisions(found, sim.getVarsList().getValues(), 0.0);
        return found;
    }
};

TEST_F(CollisionHandlingTest, ElasticHeadOnSwapsVelocities) {
    for (auto handling : {CollisionHandling::SIMULTANEOUS, CollisionHandling::HYBRID,
                          CollisionHandling::SERIAL_SEPARATE,
                          CollisionHandling::SERIAL_GROUPED_LASTPASS}) {
        registry.clear();
        Systems::ImpulseSim sim(registry);
        EngineConfig cfg = sim.getSpecificConfig();
        cfg.collisionHandling = handling;
        sim.setSpecificConfig(cfg);

        entt::entity left, right;
        headOn(sim, left, right);
        double const before = sim.getEnergyInfo().total();

        CollisionList found = detect(sim);
        ASSERT_EQ(found.size(), 1u) << handlingName(handling);
        EXPECT_LT(found[0].normalVelocity, 0.0);

        CollisionTotals totals;
        EXPECT_TRUE(sim.handleCollisions(found, &totals));
        EXPECT_NEAR(registry.get<Components::Velocity>(left).x, -1.0, 1e-6) << handlingName(handling);
        EXPECT_NEAR(registry.get<Components::Velocity>(right).x, 1.0, 1e-6) << handlingName(handling);
        EXPECT_NEAR(registry.get<Components::AngularVelocity>(left).omega, 0.0, 1e-9);
        EXPECT_NEAR(sim.getEnergyInfo().total(), before, 1e-6);
        EXPECT_GT(totals.getImpulses(), 0);
    }
}

TEST_F(CollisionHandlingTest, InelasticHeadOnStops) {
    Systems::ImpulseSim sim(registry);
    entt::entity left, right;
    headOn(sim, left, right);
    Bodies::setElasticity(registry, left, 0.0);

    CollisionList found = detect(sim);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].elasticity, 0.0);
    sim.handleCollisions(found, nullptr);
    EXPECT_NEAR(registry.get<Components::Velocity>(left).x, 0.0, 1e-6);
    EXPECT_NEAR(registry.get<Components::Velocity>(right).x, 0.0, 1e-6);
}

TEST_F(CollisionHandlingTest, HalfElasticReboundIsHalfTheClosingSpeed) {
    for (auto handling : {CollisionHandling::SIMULTANEOUS,
                          CollisionHandling::SERIAL_GROUPED_LASTPASS}) {
        registry.clear();
        Systems::ImpulseSim sim(registry);
        EngineConfig cfg = sim.getSpecificConfig();
        cfg.collisionHandling = handling;
        sim.setSpecificConfig(cfg);

        entt::entity left, right;
        headOn(sim, left, right);
        Bodies::setElasticity(registry, right, 0.5);

        CollisionList found = detect(sim);
        ASSERT_EQ(found.size(), 1u);
        EXPECT_DOUBLE_EQ(found[0].elasticity, 0.5);
        EXPECT_NEAR(found[0].normalVelocity, -2.0, 1e-9);

        sim.handleCollisions(found, nullptr);
        double const vLeft = registry.get<Components::Velocity>(left).x;
        double const vRight = registry.get<Components::Velocity>(right).x;
        // separating at e times the closing speed, momentum unchanged
        EXPECT_NEAR(vRight - vLeft, 1.0, 1e-6) << handlingName(handling);
        EXPECT_NEAR(vLeft + vRight, 0.0, 1e-9) << handlingName(handling);
    }
}

TEST_F(CollisionHandlingTest, FallingStackStopsInOneSolve) {
    Systems::ImpulseSim sim(registry);
    EngineConfig cfg = sim.getSpecificConfig();
    cfg.collisionHandling = CollisionHandling::SIMULTANEOUS;
    sim.setSpecificConfig(cfg);

    auto floor = Shapes::createWall(registry, "floor", 10.0, 1.0);
    auto bottom = Shapes::createBlock(registry, "bottom", 1.0, 1.0);
    auto top = Shapes::createBlock(registry, "top", 1.0, 1.0);
    Bodies::setPose(registry, bottom, Vector(0.0, 1.005), 0.0);
    Bodies::setPose(registry, top, Vector(0.0, 2.01), 0.0);
    for (auto e : {bottom, top}) {
        Bodies::setVelocity(registry, e, Vector(0.0, -1.0), 0.0);
        Bodies::setElasticity(registry, e, 0.0);
    }
    sim.addBody(floor);
    sim.addBody(bottom);
    sim.addBody(top);

    CollisionList found = detect(sim);
    int onFloor = 0;
    int between = 0;
    for (const auto& c : found) {
        if (c.hasBody(floor)) {
            ++onFloor;
        } else if (c.hasBody(bottom) && c.hasBody(top)) {
            ++between;
        }
    }
    EXPECT_EQ(onFloor, 2);
    EXPECT_GE(between, 2);
    EXPECT_EQ(connectedSubsets(registry, found).size(), 1u);

    CollisionTotals totals;
    EXPECT_TRUE(sim.handleCollisions(found, &totals));
    for (auto e : {bottom, top}) {
        EXPECT_NEAR(registry.get<Components::Velocity>(e).x, 0.0, 1e-4);
        EXPECT_NEAR(registry.get<Components::Velocity>(e).y, 0.0, 1e-4);
        EXPECT_NEAR(registry.get<Components::AngularVelocity>(e).omega, 0.0, 1e-4);
    }
}

TEST_F(CollisionHandlingTest, EmptyListIsAnError) {
    Systems::ImpulseSim sim(registry);
    CollisionList none;
    EXPECT_THROW(sim.handleCollisions(none, nullptr), std::invalid_argument);
}

TEST_F(CollisionHandlingTest, InfluenceMatrixIsSymmetric) {
    Systems::ImpulseSim sim(registry);
    auto wall = Shapes::createWall(registry, "floor", 10.0, 1.0);
    auto block = Shapes::createBlock(registry, "block", 1.0, 1.0);
    Bodies::setPose(registry, block, Vector(0.0, 1.004), 0.0);
    sim.addBody(wall);
    sim.addBody(block);

    CollisionList found = detect(sim);
    ASSERT_EQ(found.size(), 2u);
    Matrix A = makeCollisionMatrix(registry, found);
    ASSERT_EQ(A.size(), 2u);
    EXPECT_GT(A[0][0], 0.0);
    EXPECT_NEAR(A[0][1], A[1][0], 1e-12);
    EXPECT_EQ(connectedSubsets(registry, found).size(), 1u);
}

TEST_F(CollisionHandlingTest, HandlingByName) {
    EXPECT_EQ(handlingFromName("serial_grouped_lastpass"), CollisionHandling::SERIAL_GROUPED_LASTPASS);
    EXPECT_EQ(handlingFromName("Hybrid"), CollisionHandling::HYBRID);
    EXPECT_EQ(handlingName(CollisionHandling::SIMULTANEOUS), "SIMULTANEOUS");
    EXPECT_THROW(handlingFromName("sequential"), std::invalid_argument);
}
