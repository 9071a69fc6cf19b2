/**
 * @fileoverview impulse_sim.cpp
 * @brief State vector bookkeeping, forces and impulse resolution
 */

#include "rigid2d/systems/impulse_sim.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "rigid2d/collision/broadphase.hpp"
#include "rigid2d/collision/collision_handling.hpp"
#include "rigid2d/collision/narrowphase.hpp"
#include "rigid2d/components/basic.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"
#include "rigid2d/forces/damping.hpp"
#include "rigid2d/forces/gravity.hpp"

namespace Systems {

ImpulseSim::ImpulseSim(entt::registry& registry)
    : registry(registry), rng(specificConfig.randomSeed)
{
}

void ImpulseSim::addBody(entt::entity body) {
    if (!registry.valid(body) || !registry.all_of<Components::Shape, Components::BodyInfo>(body)) {
        throw std::invalid_argument("ImpulseSim::addBody: entity is not a rigid body");
    }
    if (std::find(bodies.begin(), bodies.end(), body) == bodies.end()) {
        auto& info = registry.get<Components::BodyInfo>(body);
        info.varsIndex = vars.addBody(info.name);
        bodies.push_back(body);
    }
    initializeFromBody(body);
    for (auto b : bodies) {
        Bodies::eraseOldCoords(registry, b);
    }
}

void ImpulseSim::initializeFromBody(entt::entity body) {
    int const idx = registry.get<Components::BodyInfo>(body).varsIndex;
    if (idx < 0) {
        throw std::invalid_argument("ImpulseSim: unknown body " + Bodies::name(registry, body));
    }
    Bodies::eraseOldCoords(registry, body);
    const auto& pos = registry.get<Components::Position>(body);
    const auto& vel = registry.get<Components::Velocity>(body);
    vars.setValue(idx + VarsList::X_, pos.x);
    vars.setValue(idx + VarsList::Y_, pos.y);
    vars.setValue(idx + VarsList::W_, registry.get<Components::AngularPosition>(body).angle);
    vars.setValue(idx + VarsList::VX_, vel.x);
    vars.setValue(idx + VarsList::VY_, vel.y);
    vars.setValue(idx + VarsList::VW_, registry.get<Components::AngularVelocity>(body).omega);
}

void ImpulseSim::addForceLaw(const std::shared_ptr<IForceLaw>& law) {
    if (std::find(forceLaws.begin(), forceLaws.end(), law) != forceLaws.end()) {
        return;
    }
    for (const auto& f : forceLaws) {
        bool const sameKind =
            (dynamic_cast<const DampingLaw*>(law.get()) && dynamic_cast<const DampingLaw*>(f.get())) ||
            (dynamic_cast<const GravityLaw*>(law.get()) && dynamic_cast<const GravityLaw*>(f.get()));
        if (sameKind) {
            throw std::invalid_argument("cannot add " + law->getName() + " twice");
        }
    }
    forceLaws.push_back(law);
}

bool ImpulseSim::removeForceLaw(const std::shared_ptr<IForceLaw>& law) {
    auto it = std::find(forceLaws.begin(), forceLaws.end(), law);
    if (it == forceLaws.end()) {
        return false;
    }
    forceLaws.erase(it);
    return true;
}

void ImpulseSim::setRandomSeed(unsigned int seed) {
    specificConfig.randomSeed = seed;
    rng.seed(seed);
}

void ImpulseSim::setSpecificConfig(const EngineConfig& config) {
    if (!(config.extraAccelTimeStep > 0.0)) {
        throw std::invalid_argument("extraAccelTimeStep must be positive");
    }
    if (!(config.timeStep > 0.0)) {
        throw std::invalid_argument("timeStep must be positive");
    }
    ConfigurableSystem<EngineConfig>::setSpecificConfig(config);
    rng.seed(config.randomSeed);
}

EnergyInfo ImpulseSim::getEnergyInfo() const {
    EnergyInfo info;
    for (auto b : bodies) {
        if (Bodies::isFixed(registry, b)) continue;
        const auto& v = registry.get<Components::Velocity>(b);
        double const w = registry.get<Components::AngularVelocity>(b).omega;
        info.translational += 0.5 * registry.get<Components::Mass>(b).value * v.lengthSquared();
        info.rotational += 0.5 * registry.get<Components::Inertia>(b).I * w * w;
    }
    for (const auto& law : forceLaws) {
        info.potential += law->getPotentialEnergy(registry);
    }
    return info;
}

void ImpulseSim::moveObjects(const std::vector<double>& values) {
    for (auto b : bodies) {
        int const idx = registry.get<Components::BodyInfo>(b).varsIndex;
        Bodies::setPose(registry, b,
                        Vector(values[idx + VarsList::X_], values[idx + VarsList::Y_]),
                        values[idx + VarsList::W_]);
        Bodies::setVelocity(registry, b,
                            Vector(values[idx + VarsList::VX_], values[idx + VarsList::VY_]),
                            values[idx + VarsList::VW_]);
    }
}

void ImpulseSim::applyForce(std::vector<double>& change, const Force& force) const {
    if (std::find(bodies.begin(), bodies.end(), force.body) == bodies.end()) {
        return;
    }
    if (Bodies::isFixed(registry, force.body)) {
        return;
    }
    int const idx = registry.get<Components::BodyInfo>(force.body).varsIndex;
    double const invM = Bodies::inverseMass(registry, force.body);
    double const invI = Bodies::inverseInertia(registry, force.body);
    change[idx + VarsList::VX_] += force.vector.x * invM;
    change[idx + VarsList::VY_] += force.vector.y * invM;
    Vector const r = force.location - Vector(registry.get<Components::Position>(force.body));
    change[idx + VarsList::VW_] += r.cross(force.vector) * invI;
    if (force.torque != 0.0) {
        change[idx + VarsList::VW_] += force.torque * invI;
    }
}

std::optional<std::string> ImpulseSim::evaluate(const std::vector<double>& values,
                                                std::vector<double>& change,
                                                double /*timeStep*/)
{
    moveObjects(values);
    change.assign(values.size(), 0.0);
    for (auto b : bodies) {
        int const idx = registry.get<Components::BodyInfo>(b).varsIndex;
        if (Bodies::isFixed(registry, b)) {
            continue;  // infinite mass bodies don't move
        }
        change[idx + VarsList::X_] = values[idx + VarsList::VX_];
        change[idx + VarsList::Y_] = values[idx + VarsList::VY_];
        change[idx + VarsList::W_] = values[idx + VarsList::VW_];
    }
    for (const auto& law : forceLaws) {
        for (const auto& force : law->calculateForces(registry)) {
            applyForce(change, force);
        }
    }
    change[VarsList::TimeIndex] = 1.0;
    for (double d : change) {
        if (!std::isfinite(d)) {
            return std::string("non-finite derivative at time ") + std::to_string(values[VarsList::TimeIndex]);
        }
    }
    return std::nullopt;
}

void ImpulseSim::modifyObjects() {
    moveObjects(vars.getValues());
}

void ImpulseSim::findCollisions(RigidBodyCollision::CollisionList& collisions,
                                const std::vector<double>& values,
                                double /*stepSize*/)
{
    PROFILE_SCOPE("ImpulseSim::findCollisions");
    double const time = values[VarsList::TimeIndex];
    auto pairs = RigidBodyCollision::broadPhase(registry);
    RigidBodyCollision::narrowPhase(registry, pairs, time, collisions);
}

bool ImpulseSim::handleCollisions(RigidBodyCollision::CollisionList& collisions,
                                  RigidBodyCollision::CollisionTotals* totals)
{
    bool const impulse = RigidBodyCollision::handleCollisions(
        registry, vars, collisions, specificConfig.collisionHandling, rng, totals);
    modifyObjects();
    return impulse;
}

void ImpulseSim::updateCollision(RigidBodyCollision::CollisionRecord& c, double time) {
    RigidBodyCollision::updateRecordGeometry(registry, c);
    c.updateCollision(time);
}

RigidBodyCollision::CollisionList ImpulseSim::takeEvaluateCollisions() {
    RigidBodyCollision::CollisionList out;
    out.swap(evaluateCollisions);
    return out;
}

void ImpulseSim::saveState() {
    vars.saveState();
    for (auto b : bodies) {
        Bodies::saveOldCoords(registry, b);
    }
}

void ImpulseSim::restoreState() {
    if (!vars.restoreState()) {
        RIGID2D_DEBUG_MSG(RIGID2D_DEBUG_LEVEL_BASIC, "restoreState: no saved state\n");
    }
    for (auto b : bodies) {
        Bodies::eraseOldCoords(registry, b);
    }
}

void ImpulseSim::saveInitialState() {
    initialState = vars.getValues();
}

void ImpulseSim::reset() {
    if (!initialState.empty() && initialState.size() == vars.getValues().size()) {
        vars.setValues(initialState);
    }
    for (auto b : bodies) {
        Bodies::eraseOldCoords(registry, b);
    }
    rng.seed(specificConfig.randomSeed);
    modifyObjects();
}

} // namespace Systems
