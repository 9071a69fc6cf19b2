#include "rigid2d/collision/joint.hpp"

#include <cmath>
#include <stdexcept>

#include "rigid2d/collision/narrowphase.hpp"
#include "rigid2d/components/body.hpp"

namespace RigidBodyCollision {

Joint::Joint(entt::entity body1, const Vector& attach1,
             entt::entity body2, const Vector& attach2,
             NormalType normalType, const Vector& normal)
    : body1(body1), attach1(attach1), body2(body2), attach2(attach2),
      normalType(normalType), normal(normal.normalized())
{
    if (body1 == body2) {
        throw std::invalid_argument("Joint: both ends on the same body");
    }
}

Vector Joint::getNormalWorld(const entt::registry& registry) const {
    if (normalType == NormalType::World) {
        return normal;
    }
    return Bodies::currentPose(registry, body2).rotateBodyToWorld(normal);
}

Vector Joint::getPosition1(const entt::registry& registry) const {
    return Bodies::currentPose(registry, body1).bodyToWorld(attach1);
}

Vector Joint::getPosition2(const entt::registry& registry) const {
    return Bodies::currentPose(registry, body2).bodyToWorld(attach2);
}

void Joint::updateCollision(const entt::registry& registry, CollisionRecord& c) const {
    if (c.primaryBody != body1 || c.normalBody != body2 || c.connector != this) {
        throw std::logic_error("Joint::updateCollision: record belongs to another joint");
    }
    c.impact1 = getPosition1(registry);
    c.impact2 = getPosition2(registry);
    c.hasImpact2 = true;
    c.normalFixed = normalType == NormalType::World;
    c.normal = getNormalWorld(registry);
    c.distance = c.normal.dotProduct(c.impact1 - c.impact2);
    c.creator = "Joint";
}

void Joint::addCollision(const entt::registry& registry, CollisionList& collisions, double time) const {
    CollisionRecord c;
    c.primaryBody = body1;
    c.normalBody = body2;
    c.kind = CollisionKind::Joint;
    c.connector = this;
    c.radius1 = std::numeric_limits<double>::infinity();
    c.radius2 = std::numeric_limits<double>::infinity();
    c.initFromBodies(registry);
    updateCollision(registry, c);
    computeVelocity(registry, c);
    c.setDetectedTime(time);
    collisions.insert(collisions.begin(), c);
}

void Joint::align(entt::registry& registry) const {
    auto alignTo = [&registry](entt::entity body, const Vector& pBody, const Vector& pWorld) {
        Geometry::Pose const pose = Bodies::currentPose(registry, body);
        Vector const offset = pose.rotateBodyToWorld(pBody - pose.cmBody);
        Bodies::setPose(registry, body, pWorld - offset, pose.angle);
    };
    if (!Bodies::isFixed(registry, body2)) {
        alignTo(body2, attach2, getPosition1(registry));
    } else if (!Bodies::isFixed(registry, body1)) {
        alignTo(body1, attach1, getPosition2(registry));
    }
}

double Joint::getNormalDistance(const entt::registry& registry) const {
    Vector const n = getNormalWorld(registry);
    return n.dotProduct(getPosition1(registry) - getPosition2(registry));
}

JointList addDoubleJoint(entt::registry& registry,
                         entt::entity body1, const Vector& attach1,
                         entt::entity body2, const Vector& attach2)
{
    JointList joints;
    joints.push_back(std::make_shared<Joint>(body1, attach1, body2, attach2,
                                             NormalType::Body, Vector(0, 1)));
    joints.push_back(std::make_shared<Joint>(body1, attach1, body2, attach2,
                                             NormalType::Body, Vector(1, 0)));
    Bodies::addNonCollide(registry, body1, body2);
    joints.front()->align(registry);
    return joints;
}

} // namespace RigidBodyCollision
