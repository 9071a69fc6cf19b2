/**
 * @file contact_sim.hpp
 * @brief Impulse sim that also computes resting contact forces and joints
 */

#pragma once

#include "rigid2d/collision/joint.hpp"
#include "rigid2d/collision/rope.hpp"
#include "rigid2d/systems/impulse_sim.hpp"

namespace Systems {

/**
 * @class ContactSim
 * @brief Adds contact forces inside the derivative and bilateral joints
 *
 * Every evaluate() detects contacts in the sub-step state, groups them by the
 * bodies they connect and solves for forces that keep each contact gap at half
 * the distance tolerance. Joints take part in every detection pass as
 * contact records with a zero target gap; ropes join them once tight. A
 * penetration seen during
 * evaluate() fails the step and leaves the records for the caller.
 */
class ContactSim : public ImpulseSim {
public:
    explicit ContactSim(entt::registry& registry);

    void addJoint(const std::shared_ptr<RigidBodyCollision::Joint>& joint);
    void addJoints(const RigidBodyCollision::JointList& list);
    bool removeJoint(const std::shared_ptr<RigidBodyCollision::Joint>& joint);
    const RigidBodyCollision::JointList& getJoints() const { return joints; }

    void addRope(const std::shared_ptr<RigidBodyCollision::Rope>& rope);
    const RigidBodyCollision::RopeList& getRopes() const { return ropes; }

    /**
     * @brief Aligns every joint and rope, then reloads all bodies into the
     *        state vector
     */
    void alignConnectors();

    /** @brief Largest group of interrelated contacts in the last evaluate() */
    int getNumContacts() const { return numContacts; }

    std::optional<std::string> evaluate(const std::vector<double>& values,
                                        std::vector<double>& change,
                                        double timeStep) override;

    void findCollisions(RigidBodyCollision::CollisionList& collisions,
                        const std::vector<double>& values,
                        double stepSize) override;

private:
    void calcContactForces(const std::vector<double>& values,
                           std::vector<double>& change,
                           RigidBodyCollision::CollisionList& subset);

    void applyContactForce(const RigidBodyCollision::CollisionRecord& c, double f,
                           std::vector<double>& change) const;

    RigidBodyCollision::JointList joints;
    RigidBodyCollision::RopeList ropes;
    int numContacts = 0;
};

} // namespace Systems
