/**
 * @file pendulum_on_spring.hpp
 * @brief Declaration of the PendulumOnSpringScenario class
 */

#pragma once

#include "rigid2d/scenarios/i_scenario.hpp"

struct PendulumOnSpringConfig {
    double armLength = 1.0;
    double armWidth = 0.2;
    double armMass = 1.0;
    double pivotY = 2.0;
    double startAngle = 0.8;

    // Spring from the free end of the arm to a fixed point beside the pivot
    double anchorX = 1.5;
    double springRestLength = 1.0;
    double springStiffness = 4.0;

    double gravity = 9.8;
};

/**
 * @class PendulumOnSpringScenario
 * @brief A pinned pendulum pulled sideways by a spring
 *
 * Gravity, the spring and the joint are all conservative, so the total energy
 * stays constant.
 */
class PendulumOnSpringScenario : public IScenario {
public:
    PendulumOnSpringScenario() = default;
    explicit PendulumOnSpringScenario(const PendulumOnSpringConfig& config) : scenarioEntityConfig(config) {}

    ScenarioConfig getConfig() const override;

    /** @throws std::invalid_argument unless @p sim is a ContactSim */
    void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const override;

private:
    PendulumOnSpringConfig scenarioEntityConfig;
};
