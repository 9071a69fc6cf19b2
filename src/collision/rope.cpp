#include "rigid2d/collision/rope.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "rigid2d/collision/narrowphase.hpp"
#include "rigid2d/components/body.hpp"

namespace RigidBodyCollision {

Rope::Rope(const entt::registry& registry,
           entt::entity body1, const Vector& attach1,
           entt::entity body2, const Vector& attach2,
           double restLength, RopeType type)
    : body1(body1), attach1(attach1), body2(body2), attach2(attach2),
      restLength(restLength), type(type)
{
    if (body1 == body2) {
        throw std::invalid_argument("Rope: both ends on the same body");
    }
    if (Bodies::isFixed(registry, body2)) {
        throw std::invalid_argument("Rope: second body must have finite mass");
    }
    if (!(restLength > 0)) {
        throw std::invalid_argument("Rope: length must be positive");
    }
    distanceTol = std::max(registry.get<Components::CollisionTolerance>(body1).distanceTol,
                           registry.get<Components::CollisionTolerance>(body2).distanceTol);
}

Vector Rope::getPosition1(const entt::registry& registry) const {
    return Bodies::currentPose(registry, body1).bodyToWorld(attach1);
}

Vector Rope::getPosition2(const entt::registry& registry) const {
    return Bodies::currentPose(registry, body2).bodyToWorld(attach2);
}

double Rope::getLength(const entt::registry& registry) const {
    return (getPosition2(registry) - getPosition1(registry)).length();
}

double Rope::getStretch(const entt::registry& registry) const {
    return getLength(registry) - restLength;
}

bool Rope::isTight(const entt::registry& registry) const {
    return isRod() || getLength(registry) > restLength - distanceTol;
}

void Rope::updateCollision(const entt::registry& registry, CollisionRecord& c) const {
    if (c.primaryBody != body1 || c.normalBody != body2 || c.connector != this) {
        throw std::logic_error("Rope::updateCollision: record belongs to another connector");
    }
    Geometry::Pose const pose1 = Bodies::currentPose(registry, body1);
    Geometry::Pose const pose2 = Bodies::currentPose(registry, body2);
    c.impact1 = pose1.bodyToWorld(attach1);
    c.impact2 = pose2.bodyToWorld(attach2);
    c.hasImpact2 = true;
    Vector const d = c.impact2 - c.impact1;
    double const len = d.length();
    if (len < 1e-12) {
        throw std::runtime_error("Rope::updateCollision: attach points coincide");
    }
    c.distance = restLength - len;
    c.normal = d / len;
    c.normalFixed = false;
    // point on a zero radius circle moving inside a circle of the rope's length
    c.ballObject = true;
    c.radius1 = 0.0;
    c.u1 = c.impact1 - pose1.position;
    c.ballNormal = true;
    c.radius2 = isRod() ? -restLength : -len;
    c.u2 = c.impact2 - pose2.position;
    c.creator = isRod() ? "Rod" : "Rope";
}

void Rope::addCollision(const entt::registry& registry, CollisionList& collisions, double time) const {
    CollisionRecord c;
    c.primaryBody = body1;
    c.normalBody = body2;
    c.kind = isRod() ? CollisionKind::Joint : CollisionKind::Rope;
    c.connector = this;
    c.initFromBodies(registry);
    updateCollision(registry, c);
    if (!isRod() && !(c.distance < distanceTol)) {
        return;
    }
    computeVelocity(registry, c);
    c.setDetectedTime(time);
    collisions.insert(collisions.begin(), c);
}

void Rope::align(entt::registry& registry) const {
    Vector const p1 = getPosition1(registry);
    Vector const d = getPosition2(registry) - p1;
    double const len = d.length();
    double const target = isRod() ? restLength : restLength - distanceTol / 2;
    if (!isRod() && len < target) {
        return;
    }
    // straight down when the attach points are too close to give a direction
    Vector const dir = len > 0.01 ? d / len : Vector(0.0, -1.0);
    Vector const goal = p1 + dir * target;
    Geometry::Pose const pose = Bodies::currentPose(registry, body2);
    Vector const offset = pose.rotateBodyToWorld(attach2 - pose.cmBody);
    Bodies::setPose(registry, body2, goal - offset, pose.angle);
}

} // namespace RigidBodyCollision
