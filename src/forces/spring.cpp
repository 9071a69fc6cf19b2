#include "rigid2d/forces/spring.hpp"

#include <stdexcept>

#include "rigid2d/components/body.hpp"

namespace Systems {

Spring::Spring(entt::entity body1, const Vector& attach1,
               entt::entity body2, const Vector& attach2,
               double restLength, double stiffness)
    : body1(body1), attach1(attach1), body2(body2), attach2(attach2),
      restLength(restLength), stiffness(stiffness)
{
    if (restLength < 0.0 || stiffness < 0.0) {
        throw std::invalid_argument("Spring: rest length and stiffness must not be negative");
    }
}

Vector Spring::attachWorld(const entt::registry& registry, entt::entity body, const Vector& attach) const {
    if (body == entt::null) {
        return attach;
    }
    return Bodies::currentPose(registry, body).bodyToWorld(attach);
}

Vector Spring::getStartPoint(const entt::registry& registry) const {
    return attachWorld(registry, body1, attach1);
}

Vector Spring::getEndPoint(const entt::registry& registry) const {
    return attachWorld(registry, body2, attach2);
}

double Spring::getLength(const entt::registry& registry) const {
    return getStartPoint(registry).distanceTo(getEndPoint(registry));
}

double Spring::getStretch(const entt::registry& registry) const {
    return getLength(registry) - restLength;
}

std::vector<Force> Spring::calculateForces(const entt::registry& registry) const {
    Vector const p1 = getStartPoint(registry);
    Vector const p2 = getEndPoint(registry);
    Vector const d = p2 - p1;
    double const len = d.length();
    std::vector<Force> forces;
    if (len < EPSILON) {
        return forces;
    }
    // pulls the ends together when stretched
    Vector const f = d * (stiffness * (len - restLength) / len);
    if (body1 != entt::null) {
        Force force;
        force.body = body1;
        force.location = p1;
        force.vector = f;
        force.name = "spring";
        forces.push_back(force);
    }
    if (body2 != entt::null) {
        Force force;
        force.body = body2;
        force.location = p2;
        force.vector = -f;
        force.name = "spring";
        forces.push_back(force);
    }
    return forces;
}

double Spring::getPotentialEnergy(const entt::registry& registry) const {
    double const stretch = getStretch(registry);
    return 0.5 * stiffness * stretch * stretch;
}

} // namespace Systems
