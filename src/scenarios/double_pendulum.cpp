/**
 * @file double_pendulum.cpp
 * @brief Implementation of the double pendulum joint scenario
 */

#include "rigid2d/scenarios/double_pendulum.hpp"

#include <cmath>
#include <stdexcept>

#include "rigid2d/collision/joint.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/systems/contact_sim.hpp"

namespace {

// Center of an arm of length L hanging from @p top at @p angle from straight down
Vector hangingCenter(const Vector& top, double length, double angle) {
    return top + Vector(std::sin(angle), -std::cos(angle)) * (length / 2.0);
}

} // namespace

ScenarioConfig DoublePendulumScenario::getConfig() const {
    ScenarioConfig cfg;
    cfg.engineConfig.timeStep = 0.025;
    cfg.engineConfig.extraAccel = RigidBodyCollision::ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS;
    cfg.engineConfig.randomSeed = 99999;
    cfg.engineConfig.jointSmallImpacts = true;

    cfg.contactForces = true;
    cfg.useGravity = true;
    cfg.gravityConfig.gravity = scenarioEntityConfig.gravity;
    cfg.gravityConfig.zeroEnergyLevel = scenarioEntityConfig.pivotY;
    cfg.useDamping = false;
    cfg.runTime = 10.0;
    return cfg;
}

void DoublePendulumScenario::createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const {
    auto* contactSim = dynamic_cast<Systems::ContactSim*>(&sim);
    if (contactSim == nullptr) {
        throw std::invalid_argument("DoublePendulumScenario needs a contact sim for its joints");
    }
    const auto& c = scenarioEntityConfig;
    double const L = c.armLength;
    Vector const pivotPoint(0.0, c.pivotY);

    auto pivot = Shapes::createWall(registry, "pivot", 0.1, 0.1);
    Bodies::setPose(registry, pivot, pivotPoint, 0.0);
    sim.addBody(pivot);

    auto arm1 = Shapes::createBlock(registry, "arm1", c.armWidth, L, c.armMass);
    Bodies::setPose(registry, arm1, hangingCenter(pivotPoint, L, c.angle1), c.angle1);
    sim.addBody(arm1);

    Vector const elbow = pivotPoint + Vector(std::sin(c.angle1), -std::cos(c.angle1)) * L;
    auto arm2 = Shapes::createBlock(registry, "arm2", c.armWidth, L, c.armMass);
    Bodies::setPose(registry, arm2, hangingCenter(elbow, L, c.angle2), c.angle2);
    sim.addBody(arm2);
    Bodies::addNonCollide(registry, arm2, pivot);

    Vector const top(0.0, L / 2.0);
    Vector const bottom(0.0, -L / 2.0);
    contactSim->addJoints(RigidBodyCollision::addDoubleJoint(registry, arm1, top, pivot, Vector(0.0, 0.0)));
    contactSim->addJoints(RigidBodyCollision::addDoubleJoint(registry, arm1, bottom, arm2, top));
    contactSim->alignConnectors();
}
