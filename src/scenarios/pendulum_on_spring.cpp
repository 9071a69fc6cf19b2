/**
 * @file pendulum_on_spring.cpp
 * @brief Implementation of the spring-loaded pendulum scenario
 */

#include "rigid2d/scenarios/pendulum_on_spring.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>

#include "rigid2d/collision/joint.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/forces/spring.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/systems/contact_sim.hpp"

ScenarioConfig PendulumOnSpringScenario::getConfig() const {
    ScenarioConfig cfg;
    cfg.engineConfig.timeStep = 0.025;
    cfg.engineConfig.extraAccel = RigidBodyCollision::ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS;
    cfg.engineConfig.randomSeed = 99999;

    cfg.contactForces = true;
    cfg.useGravity = true;
    cfg.gravityConfig.gravity = scenarioEntityConfig.gravity;
    cfg.gravityConfig.zeroEnergyLevel = scenarioEntityConfig.pivotY;
    cfg.useDamping = false;
    cfg.runTime = 10.0;
    return cfg;
}

void PendulumOnSpringScenario::createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const {
    auto* contactSim = dynamic_cast<Systems::ContactSim*>(&sim);
    if (contactSim == nullptr) {
        throw std::invalid_argument("PendulumOnSpringScenario needs a contact sim for its joint");
    }
    const auto& c = scenarioEntityConfig;
    double const L = c.armLength;
    Vector const pivotPoint(0.0, c.pivotY);

    auto pivot = Shapes::createWall(registry, "pivot", 0.1, 0.1);
    Bodies::setPose(registry, pivot, pivotPoint, 0.0);
    sim.addBody(pivot);

    auto arm = Shapes::createBlock(registry, "arm", c.armWidth, L, c.armMass);
    Vector const center = pivotPoint + Vector(std::sin(c.startAngle), -std::cos(c.startAngle)) * (L / 2.0);
    Bodies::setPose(registry, arm, center, c.startAngle);
    sim.addBody(arm);

    contactSim->addJoints(RigidBodyCollision::addDoubleJoint(
        registry, arm, Vector(0.0, L / 2.0), pivot, Vector(0.0, 0.0)));
    contactSim->alignConnectors();

    // world anchor: no body on the second end
    sim.addForceLaw(std::make_shared<Systems::Spring>(
        arm, Vector(0.0, -L / 2.0),
        entt::null, Vector(c.anchorX, c.pivotY - L),
        c.springRestLength, c.springStiffness));
}
