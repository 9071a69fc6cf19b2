/**
 * @file spring.hpp
 * @brief Linear spring between attach points on two bodies
 */

#pragma once

#include "rigid2d/forces/force_law.hpp"

namespace Systems {

/**
 * @class Spring
 * @brief Hooke's law spring: force magnitude k·(L − L0) along the spring
 *
 * Either end may be anchored to a fixed world point by passing entt::null for
 * its body; the attach point is then in world coordinates. Otherwise attach
 * points are in body coordinates.
 */
class Spring : public IForceLaw {
public:
    Spring(entt::entity body1, const Vector& attach1,
           entt::entity body2, const Vector& attach2,
           double restLength, double stiffness);

    std::vector<Force> calculateForces(const entt::registry& registry) const override;

    /** @brief ½·k·(L − L0)² */
    double getPotentialEnergy(const entt::registry& registry) const override;

    std::string getName() const override { return "SPRING"; }

    Vector getStartPoint(const entt::registry& registry) const;
    Vector getEndPoint(const entt::registry& registry) const;
    double getLength(const entt::registry& registry) const;
    double getStretch(const entt::registry& registry) const;

    double getRestLength() const { return restLength; }
    double getStiffness() const { return stiffness; }

private:
    Vector attachWorld(const entt::registry& registry, entt::entity body, const Vector& attach) const;

    entt::entity body1;
    Vector attach1;
    entt::entity body2;
    Vector attach2;
    double restLength;
    double stiffness;
};

} // namespace Systems
