#include "rigid2d/collision/collision_data.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>

#include "rigid2d/components/basic.hpp"

namespace RigidBodyCollision {

namespace {

// How far apart two impact points may be and still describe the same contact.
// Curved features allow more slack, based on where the gap between the
// curves grows past the distance tolerance.
double nearness(double r1, double r2, double distTol) {
    double const inf = std::numeric_limits<double>::infinity();
    double r;
    if (r1 == inf) {
        r = r2 > 0 ? r2 : r1;
    } else if (r2 == inf) {
        r = r1 > 0 ? r1 : r2;
    } else if (r1 > 0 && r2 > 0) {
        r = std::min(r1, r2);
    } else if (r1 < 0) {
        r = -r1;
    } else {
        r = -r2;
    }
    if (r == inf) {
        return distTol;
    }
    return 2 * r * std::sqrt(2 * distTol / r);
}

} // namespace

const char* kindName(CollisionKind kind) {
    switch (kind) {
        case CollisionKind::CornerEdge:   return "CornerEdge";
        case CollisionKind::CornerCorner: return "CornerCorner";
        case CollisionKind::EdgeEdge:     return "EdgeEdge";
        case CollisionKind::Joint:        return "Joint";
        case CollisionKind::Rope:         return "Rope";
    }
    return "Unknown";
}

void CollisionRecord::initFromBodies(const entt::registry& registry) {
    const auto& tol1 = registry.get<Components::CollisionTolerance>(primaryBody);
    const auto& tol2 = registry.get<Components::CollisionTolerance>(normalBody);
    distanceTol = std::max(tol1.distanceTol, tol2.distanceTol);
    velocityTol = std::max(tol1.velocityTol, tol2.velocityTol);
    targetGap = isJoint() ? 0.0 : distanceTol / 2;
    accuracy = std::max(tol1.accuracy, tol2.accuracy) * distanceTol / 2;
    if (isJoint()) {
        elasticity = 0.0;
    } else {
        double const e1 = registry.get<Components::Material>(primaryBody).elasticity;
        double const e2 = registry.get<Components::Material>(normalBody).elasticity;
        elasticity = std::min(e1, e2);
    }
}

bool CollisionRecord::contact() const {
    return isJoint() || (std::fabs(normalVelocity) < velocityTol
                         && distance > 0 && distance < distanceTol);
}

bool CollisionRecord::closeEnough(bool allowTiny) const {
    if (contact()) {
        return true;
    }
    if (allowTiny) {
        // a penetration too fast to back up to the target gap is still handled
        return distance > 0 && distance < targetGap + accuracy;
    }
    return distance > targetGap - accuracy && distance < targetGap + accuracy;
}

bool CollisionRecord::isColliding() const {
    if (isJoint()) {
        return false;
    }
    if (distance < 0) {
        return true;
    }
    return normalVelocity < -velocityTol && distance < targetGap - accuracy;
}

bool CollisionRecord::isTouching() const {
    return isJoint() || distance < distanceTol;
}

bool CollisionRecord::illegalState() const {
    return !isJoint() && distance < 0;
}

void CollisionRecord::setDetectedTime(double time) {
    if (std::isfinite(detectedTime)) {
        throw std::logic_error("detected time already set " + toString());
    }
    detectedTime = time;
    detectedDistance = distance;
    detectedVelocity = normalVelocity;
    estimate = NaN;
    if (!isJoint() && normalVelocity < -0.001) {
        estimate = time + (targetGap - distance) / normalVelocity;
    }
}

void CollisionRecord::updateCollision(double time) {
    if (!std::isfinite(distance)) {
        throw std::runtime_error("distance is NaN " + toString());
    }
    updateTime = time;
    if ((needsHandling() || !contact()) && normalVelocity < 0) {
        updateEstimatedTime(time, true);
    } else {
        estimate = NaN;
    }
}

void CollisionRecord::updateEstimatedTime(double time, bool doUpdate) {
    double const t1 = time;
    double const t2 = detectedTime;
    double const d1 = distance;
    double const v1 = normalVelocity;
    double const v2 = detectedVelocity;
    double const h = t2 - t1;
    if (!(h > 1e-12)) {
        return;
    }
    // d(t) = d1 + v1·t + a·t²/2, solved for d(t) = targetGap
    double const a = (v2 - v1) / h;
    if (std::fabs(a) < 1e-12) {
        return;
    }
    double const det = std::sqrt(v1 * v1 - 2 * a * (d1 - targetGap));
    double const e1 = t1 + (-v1 + det) / a;
    double const e2 = t1 + (-v1 - det) / a;
    if (!doUpdate) {
        return;
    }
    bool didUpdate = false;
    if (e1 > t1 && e1 < t2) {
        estimate = e1;
        didUpdate = true;
    }
    if (e2 > t1 && e2 < t2 && (!didUpdate || e2 < e1)) {
        estimate = e2;
    }
}

bool CollisionRecord::similarTo(const CollisionRecord& other) const {
    if (connector != nullptr || other.connector != nullptr) {
        return false;
    }
    if (!other.hasBody(primaryBody) || !other.hasBody(normalBody)) {
        return false;
    }
    if (primaryVertex >= 0 && other.primaryBody == primaryBody
        && other.primaryVertex == primaryVertex) {
        return true;
    }
    if (other.normalBody != normalBody || other.normalEdge != normalEdge) {
        return false;
    }
    if (other.primaryEdge != primaryEdge) {
        return false;
    }
    double const near = nearness(radius1, radius2, distanceTol);
    if ((impact1 - other.impact1).lengthSquared() > near * near) {
        return false;
    }
    return std::fabs(normal.dotProduct(other.normal)) >= 0.9;
}

std::string CollisionRecord::toString() const {
    std::ostringstream ss;
    ss << kindName(kind) << "{creator: " << creator
       << ", primary: " << static_cast<uint32_t>(entt::to_integral(primaryBody))
       << ", normal: " << static_cast<uint32_t>(entt::to_integral(normalBody))
       << ", distance: " << distance
       << ", velocity: " << normalVelocity
       << ", targetGap: " << targetGap
       << ", detectedTime: " << detectedTime
       << ", estimate: " << estimate
       << ", impact1: (" << impact1.x << ", " << impact1.y << ")"
       << ", normal: (" << normal.x << ", " << normal.y << ")"
       << ", needsHandling: " << mustHandle
       << ", impulse: " << impulse
       << "}";
    return ss.str();
}

void addCollision(CollisionList& collisions, const CollisionRecord& record) {
    if (!record.isJoint() && !std::isfinite(record.distance)) {
        throw std::invalid_argument("addCollision: distance is NaN " + record.toString());
    }
    bool shouldAdd = true;
    std::vector<size_t> removeMe;
    if (!record.isJoint()) {
        for (size_t i = 0; i < collisions.size(); ++i) {
            const auto& existing = collisions[i];
            if (!record.similarTo(existing)) {
                continue;
            }
            double const time1 = existing.detectedTime;
            double const time2 = record.detectedTime;
            if (time1 > time2 + 1e-14) {
                // the later detection has the better velocity estimate
                shouldAdd = false;
                break;
            }
            if (time2 > time1 + 1e-14) {
                removeMe.push_back(i);
            } else if (record.distance < existing.distance) {
                removeMe.push_back(i);
            } else {
                shouldAdd = false;
                break;
            }
        }
    }
    if (!shouldAdd) {
        return;
    }
    for (auto it = removeMe.rbegin(); it != removeMe.rend(); ++it) {
        collisions.erase(collisions.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    collisions.push_back(record);
}

} // namespace RigidBodyCollision
