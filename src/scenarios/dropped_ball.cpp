/**
 * @file dropped_ball.cpp
 * @brief Implementation of the dropped ball scenario
 */

#include "rigid2d/scenarios/dropped_ball.hpp"

#include "rigid2d/components/body.hpp"
#include "rigid2d/geometry/shapes.hpp"

ScenarioConfig DroppedBallScenario::getConfig() const {
    ScenarioConfig cfg;
    cfg.engineConfig.timeStep = 0.025;
    cfg.engineConfig.collisionHandling = RigidBodyCollision::CollisionHandling::SERIAL_GROUPED_LASTPASS;
    cfg.engineConfig.randomSeed = 99999;

    // impulses only: the resting ball is never held up by a contact force
    cfg.contactForces = false;
    cfg.useGravity = true;
    cfg.gravityConfig.gravity = scenarioEntityConfig.gravity;
    cfg.useDamping = false;

    cfg.distanceTol = 0.01;
    cfg.velocityTol = 0.5;
    cfg.collisionAccuracy = 0.6;
    cfg.runTime = 15.0;
    return cfg;
}

void DroppedBallScenario::createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const {
    const auto& c = scenarioEntityConfig;

    auto ball = Shapes::createBall(registry, "ball", c.ballRadius);
    Bodies::setPose(registry, ball, Vector(0.0, c.dropHeight), 0.0);
    Bodies::setElasticity(registry, ball, c.elasticity);
    sim.addBody(ball);

    auto floor = Shapes::createWall(registry, "floor", c.floorWidth, c.floorThickness);
    Bodies::setPose(registry, floor, Vector(0.0, c.floorCenterY), 0.0);
    Bodies::setElasticity(registry, floor, c.elasticity);
    sim.addBody(floor);

    // zero potential energy with the ball resting on the floor
    double const floorTop = c.floorCenterY + c.floorThickness / 2.0;
    Bodies::setZeroEnergyLevel(registry, ball, floorTop + c.ballRadius);
}
