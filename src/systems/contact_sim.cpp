/**
 * @fileoverview contact_sim.cpp
 * @brief Contact forces and joints on top of the impulse sim
 */

#include "rigid2d/systems/contact_sim.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "rigid2d/collision/collision_handling.hpp"
#include "rigid2d/collision/contact_forces.hpp"
#include "rigid2d/collision/contact_solver.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/constants.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"

namespace Systems {

#if !defined(ENABLE_CONTACT_DEBUG)
    #define ENABLE_CONTACT_DEBUG 0
#endif

#define DEBUG_LOG(x) \
    do { if (ENABLE_CONTACT_DEBUG) { std::cout << x << std::endl; } } while(0)

using RigidBodyCollision::CollisionList;
using RigidBodyCollision::CollisionRecord;

ContactSim::ContactSim(entt::registry& registry)
    : ImpulseSim(registry)
{
}

void ContactSim::addJoint(const std::shared_ptr<RigidBodyCollision::Joint>& joint) {
    if (std::find(joints.begin(), joints.end(), joint) == joints.end()) {
        joints.push_back(joint);
    }
}

void ContactSim::addJoints(const RigidBodyCollision::JointList& list) {
    for (const auto& j : list) {
        addJoint(j);
    }
}

bool ContactSim::removeJoint(const std::shared_ptr<RigidBodyCollision::Joint>& joint) {
    auto it = std::find(joints.begin(), joints.end(), joint);
    if (it == joints.end()) {
        return false;
    }
    joints.erase(it);
    return true;
}

void ContactSim::addRope(const std::shared_ptr<RigidBodyCollision::Rope>& rope) {
    if (std::find(ropes.begin(), ropes.end(), rope) == ropes.end()) {
        ropes.push_back(rope);
    }
}

void ContactSim::alignConnectors() {
    for (const auto& j : joints) {
        j->align(registry);
    }
    for (const auto& r : ropes) {
        r->align(registry);
    }
    for (auto b : bodies) {
        initializeFromBody(b);
    }
}

void ContactSim::findCollisions(CollisionList& collisions,
                                const std::vector<double>& values,
                                double stepSize)
{
    ImpulseSim::findCollisions(collisions, values, stepSize);
    double const time = values[VarsList::TimeIndex];
    for (const auto& j : joints) {
        j->addCollision(registry, collisions, time);
    }
    for (const auto& r : ropes) {
        r->addCollision(registry, collisions, time);
    }
}

std::optional<std::string> ContactSim::evaluate(const std::vector<double>& values,
                                                std::vector<double>& change,
                                                double timeStep)
{
    PROFILE_SCOPE("ContactSim::evaluate");
    if (auto err = ImpulseSim::evaluate(values, change, timeStep)) {
        return err;
    }

    CollisionList found;
    findCollisions(found, values, timeStep);
    long const illegal = std::count_if(found.begin(), found.end(),
                                       [](const CollisionRecord& c) { return c.illegalState(); });
    if (illegal > 0) {
        std::ostringstream msg;
        msg << "penetration during evaluate at time " << values[VarsList::TimeIndex]
            << " (" << illegal << " records)";
        evaluateCollisions = std::move(found);
        return msg.str();
    }

    found.erase(std::remove_if(found.begin(), found.end(),
                               [](const CollisionRecord& c) { return !c.contact(); }),
                found.end());

    int maxContacts = 0;
    for (const auto& indices : RigidBodyCollision::connectedSubsets(registry, found)) {
        CollisionList subset;
        subset.reserve(indices.size());
        for (size_t i : indices) {
            subset.push_back(found[i]);
        }
        maxContacts = std::max(maxContacts, static_cast<int>(subset.size()));
        calcContactForces(values, change, subset);
    }
    numContacts = maxContacts;
    return std::nullopt;
}

void ContactSim::calcContactForces(const std::vector<double>& values,
                                   std::vector<double>& change,
                                   CollisionList& subset)
{
    RigidBodyCollision::Matrix const A = RigidBodyCollision::makeCollisionMatrix(registry, subset);
    std::vector<double> const b = RigidBodyCollision::calculateBVector(
        registry, subset, change, values,
        specificConfig.extraAccel, specificConfig.extraAccelTimeStep);
    std::vector<bool> joint(subset.size());
    for (size_t i = 0; i < subset.size(); ++i) {
        joint[i] = subset[i].isJoint();
    }

    std::vector<double> f(subset.size(), 0.0);
    RigidBodyCollision::LcpResult const r = RigidBodyCollision::solveLCP_PGS(
        A, b, joint, f,
        SimulatorConstants::SolverMaxIterations, SimulatorConstants::SolverTolerance);
    if (!r.converged && r.maxResidual > 1e-4) {
        RIGID2D_DEBUG_MSG(RIGID2D_DEBUG_LEVEL_BASIC,
            "contact forces not converged at t=" << values[VarsList::TimeIndex]
            << " n=" << subset.size() << " residual=" << r.maxResidual << "\n");
    }

    for (size_t i = 0; i < subset.size(); ++i) {
        subset[i].force = f[i];
        DebugStats::updateContactForce(f[i], r.iterations);
        applyContactForce(subset[i], f[i], change);
        DEBUG_LOG("[Contact] f=" << f[i] << " " << subset[i].toString());
    }
}

void ContactSim::applyContactForce(const CollisionRecord& c, double f,
                                   std::vector<double>& change) const
{
    if (f == 0.0) {
        return;
    }
    // fixed bodies are skipped inside applyForce
    Force f1;
    f1.body = c.primaryBody;
    f1.location = c.impact1;
    f1.vector = c.normal * f;
    f1.name = "contact_force";
    applyForce(change, f1);

    Force f2;
    f2.body = c.normalBody;
    f2.location = c.hasImpact2 ? c.impact2 : c.impact1;
    f2.vector = c.normal * -f;
    f2.name = "contact_force";
    applyForce(change, f2);
}

} // namespace Systems
