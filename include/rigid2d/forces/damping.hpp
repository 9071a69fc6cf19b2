/**
 * @file damping.hpp
 * @brief Linear velocity damping and rotational damping
 */

#pragma once

#include "rigid2d/forces/force_law.hpp"
#include "rigid2d/systems/i_system.hpp"

namespace Systems {

struct DampingConfig {
    // Force is -damping·v
    double damping = 0.0;

    // Torque is -damping·rotateRatio·ω
    double rotateRatio = 1.0;
};

class DampingLaw : public IForceLaw, public ConfigurableSystem<DampingConfig> {
public:
    DampingLaw() = default;
    DampingLaw(double damping, double rotateRatio);

    std::vector<Force> calculateForces(const entt::registry& registry) const override;

    double getPotentialEnergy(const entt::registry&) const override { return 0.0; }

    std::string getName() const override { return "DAMPING_LAW"; }
};

} // namespace Systems
