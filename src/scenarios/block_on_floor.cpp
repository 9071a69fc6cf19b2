/**
 * @file block_on_floor.cpp
 * @brief Implementation of the block on floor resting contact scenario
 */

#include "rigid2d/scenarios/block_on_floor.hpp"

#include "rigid2d/components/body.hpp"
#include "rigid2d/geometry/shapes.hpp"

ScenarioConfig BlockOnFloorScenario::getConfig() const {
    ScenarioConfig cfg;
    cfg.engineConfig.timeStep = 0.025;
    cfg.engineConfig.extraAccel = RigidBodyCollision::ExtraAccel::VELOCITY_AND_DISTANCE;
    cfg.engineConfig.randomSeed = 99999;

    cfg.contactForces = true;
    cfg.useGravity = true;
    cfg.gravityConfig.gravity = scenarioEntityConfig.gravity;
    cfg.useDamping = false;

    cfg.distanceTol = 0.01;
    cfg.velocityTol = 0.5;
    cfg.collisionAccuracy = 0.6;
    cfg.runTime = 5.0;
    return cfg;
}

void BlockOnFloorScenario::createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const {
    const auto& c = scenarioEntityConfig;

    auto floor = Shapes::createWall(registry, "floor", c.floorWidth, c.floorThickness);
    Bodies::setPose(registry, floor, Vector(0.0, c.floorTop - c.floorThickness / 2.0), 0.0);
    Bodies::setElasticity(registry, floor, c.elasticity);
    sim.addBody(floor);

    double const restY = c.floorTop + c.blockHeight / 2.0;
    auto block = Shapes::createBlock(registry, "block", c.blockWidth, c.blockHeight, c.blockMass);
    Bodies::setPose(registry, block, Vector(0.0, restY + c.dropGap), 0.0);
    Bodies::setElasticity(registry, block, c.elasticity);
    Bodies::setZeroEnergyLevel(registry, block, restY);
    sim.addBody(block);
}
