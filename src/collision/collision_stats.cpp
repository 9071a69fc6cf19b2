#include "rigid2d/collision/collision_stats.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace RigidBodyCollision {

void CollisionTotals::reset() {
    collisions = 0;
    searches = 0;
    impulses = 0;
    steps = 0;
    backups = 0;
}

std::string CollisionTotals::toString() const {
    std::ostringstream ss;
    ss << "CollisionTotals{searches: " << searches
       << ", impulses: " << impulses
       << ", collisions: " << collisions
       << ", steps: " << steps
       << ", backups: " << backups << "}";
    return ss.str();
}

void CollisionStats::clear() {
    double const inf = std::numeric_limits<double>::infinity();
    numCollisions = 0;
    numJoints = 0;
    numContacts = 0;
    numNonContact = 0;
    numNeedsHandling = 0;
    numImminent = 0;
    minDistance = inf;
    estTime = inf;
    detectedTime = inf;
}

void CollisionStats::update(const CollisionList& collisions) {
    double const inf = std::numeric_limits<double>::infinity();
    clear();
    numCollisions = static_cast<int>(collisions.size());
    for (const auto& c : collisions) {
        if (c.isJoint()) {
            numJoints++;
        } else if (c.contact()) {
            numContacts++;
        }
        if (!c.contact()) {
            numNonContact++;
        }
        if (c.needsHandling()) {
            numNeedsHandling++;
            if (c.detectedTime < detectedTime) {
                detectedTime = c.detectedTime;
            }
        }
        // separating contacts do not count toward the next collision time
        if ((c.needsHandling() || !c.contact()) && c.normalVelocity < 0) {
            numImminent++;
            if (!std::isfinite(c.distance)) {
                throw std::runtime_error("distance is NaN " + c.toString());
            }
            minDistance = std::min(minDistance, c.distance);
            if (!std::isnan(estTime)) {
                if (std::isnan(c.estimate)) {
                    estTime = std::numeric_limits<double>::quiet_NaN();
                } else if (c.estimate < estTime) {
                    estTime = c.estimate;
                }
            }
        }
    }
    if (estTime == inf) {
        estTime = std::numeric_limits<double>::quiet_NaN();
    }
    if (detectedTime == inf) {
        detectedTime = std::numeric_limits<double>::quiet_NaN();
    }
}

std::string CollisionStats::toString() const {
    std::ostringstream ss;
    ss << "CollisionStats{collisions: " << numCollisions;
    if (numCollisions > 0) {
        ss << ", estTime: " << estTime
           << ", detectedTime: " << detectedTime
           << ", needsHandling: " << numNeedsHandling
           << ", minDistance: " << minDistance
           << ", nonContact: " << numNonContact
           << ", imminent: " << numImminent
           << ", joints: " << numJoints
           << ", contacts: " << numContacts;
    }
    ss << "}";
    return ss.str();
}

} // namespace RigidBodyCollision
