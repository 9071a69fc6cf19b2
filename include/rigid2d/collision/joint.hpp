/**
 * @file joint.hpp
 * @brief Bilateral constraint holding two attach points together along a normal
 */

#ifndef RIGID2D_JOINT_HPP
#define RIGID2D_JOINT_HPP

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"
#include "rigid2d/collision/connector.hpp"

namespace RigidBodyCollision {

enum class NormalType {
    World,  // normal fixed in world coordinates
    Body    // normal in body coordinates of the second body
};

/**
 * @class Joint
 * @brief Keeps the normal distance between two attach points at zero
 *
 * A single joint constrains one direction. Two joints with perpendicular
 * normals on the same attach points make a pin (a "double joint").
 */
class Joint : public IConnector {
public:
    Joint(entt::entity body1, const Vector& attach1,
          entt::entity body2, const Vector& attach2,
          NormalType normalType, const Vector& normal);

    /** @brief Adds a joint record, detected at @p time, to the front of the list */
    void addCollision(const entt::registry& registry, CollisionList& collisions,
                      double time) const override;

    /** @brief Recomputes impact points, normal and distance of a record of this joint */
    void updateCollision(const entt::registry& registry, CollisionRecord& c) const override;

    /**
     * @brief Moves the second body, or the first if the second is fixed, so the
     *        attach points coincide; angles are unchanged
     */
    void align(entt::registry& registry) const override;

    /** @brief Current separation of the attach points along the normal */
    double getNormalDistance(const entt::registry& registry) const override;

    Vector getNormalWorld(const entt::registry& registry) const;
    Vector getPosition1(const entt::registry& registry) const;
    Vector getPosition2(const entt::registry& registry) const;

    entt::entity getBody1() const override { return body1; }
    entt::entity getBody2() const override { return body2; }

private:
    entt::entity body1;
    Vector attach1;
    entt::entity body2;
    Vector attach2;
    NormalType normalType;
    Vector normal;
};

using JointList = std::vector<std::shared_ptr<Joint>>;

/**
 * @brief Creates two perpendicular joints pinning the attach points together
 *
 * The bodies are marked as never colliding and the second body is aligned.
 */
JointList addDoubleJoint(entt::registry& registry,
                         entt::entity body1, const Vector& attach1,
                         entt::entity body2, const Vector& attach2);

} // namespace RigidBodyCollision

#endif
