/**
 * @file gravity.hpp
 * @brief Uniform downward gravity on every finite-mass body
 *
 * Required components:
 * - Mass
 * - Position (for potential energy)
 * - BodyInfo (per-body zero energy level)
 */

#pragma once

#include "rigid2d/forces/force_law.hpp"
#include "rigid2d/systems/i_system.hpp"

namespace Systems {

/**
 * @struct GravityConfig
 * @brief Configuration parameters specific to the gravity law
 */
struct GravityConfig {
    // Gravitational acceleration in m/s², pointing down
    double gravity = 9.8;

    // Height of zero potential energy for bodies without their own level
    double zeroEnergyLevel = 0.0;
};

class GravityLaw : public IForceLaw, public ConfigurableSystem<GravityConfig> {
public:
    GravityLaw() = default;
    explicit GravityLaw(double gravity);

    std::vector<Force> calculateForces(const entt::registry& registry) const override;

    /** @brief Sum of m·g·(y − zero level) over finite-mass bodies */
    double getPotentialEnergy(const entt::registry& registry) const override;

    std::string getName() const override { return "GRAVITY_LAW"; }
};

} // namespace Systems
