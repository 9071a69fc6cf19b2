/**
 * @file double_pendulum.hpp
 * @brief Declaration of the DoublePendulumScenario class
 */

#pragma once

#include "rigid2d/scenarios/i_scenario.hpp"

struct DoublePendulumConfig {
    double armLength = 1.0;
    double armWidth = 0.2;
    double armMass = 1.0;
    double pivotY = 2.0;

    // Starting angles of the arms from straight down, in radians
    double angle1 = 0.6;
    double angle2 = 1.2;

    double gravity = 9.8;
};

/**
 * @class DoublePendulumScenario
 * @brief Two blocks hanging from a fixed pivot, pinned end to end with double joints
 */
class DoublePendulumScenario : public IScenario {
public:
    DoublePendulumScenario() = default;
    explicit DoublePendulumScenario(const DoublePendulumConfig& config) : scenarioEntityConfig(config) {}

    ScenarioConfig getConfig() const override;

    /** @throws std::invalid_argument unless @p sim is a ContactSim */
    void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const override;

private:
    DoublePendulumConfig scenarioEntityConfig;
};
