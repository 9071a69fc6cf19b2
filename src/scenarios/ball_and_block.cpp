/**
 * @file ball_and_block.cpp
 * @brief Implementation of the ball and block collision scenario
 */

#include "rigid2d/scenarios/ball_and_block.hpp"

#include "rigid2d/components/body.hpp"
#include "rigid2d/geometry/shapes.hpp"

ScenarioConfig BallAndBlockScenario::getConfig() const {
    ScenarioConfig cfg;
    cfg.engineConfig.timeStep = 0.025;
    cfg.engineConfig.collisionHandling = RigidBodyCollision::CollisionHandling::SERIAL_GROUPED_LASTPASS;
    cfg.engineConfig.extraAccel = RigidBodyCollision::ExtraAccel::VELOCITY;
    cfg.engineConfig.randomSeed = 99999;

    cfg.contactForces = true;
    cfg.useGravity = false;
    cfg.useDamping = true;
    cfg.dampingConfig.damping = 0.0;
    cfg.dampingConfig.rotateRatio = 0.5;

    cfg.distanceTol = 0.01;
    cfg.velocityTol = 0.5;
    cfg.collisionAccuracy = 0.6;
    cfg.runTime = 3.0;
    return cfg;
}

void BallAndBlockScenario::createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const {
    const auto& c = scenarioEntityConfig;

    auto ball = Shapes::createBall(registry, "ball", c.ballRadius, c.ballMass, c.ballCenterOfMass);
    Bodies::setPose(registry, ball, c.ballPosition, 0.0);
    Bodies::setVelocity(registry, ball, c.ballVelocity, c.ballOmega);
    Bodies::setElasticity(registry, ball, c.elasticity);
    sim.addBody(ball);

    auto block = Shapes::createBlock(registry, "block", c.blockWidth, c.blockHeight, c.blockMass);
    Bodies::setPose(registry, block, Vector(0.0, 0.0), 0.0);
    Bodies::setElasticity(registry, block, c.elasticity);
    sim.addBody(block);
}
