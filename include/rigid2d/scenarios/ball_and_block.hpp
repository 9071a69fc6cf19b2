/**
 * @file ball_and_block.hpp
 * @brief Declaration of the BallAndBlockScenario class
 */

#pragma once

#include "rigid2d/math/vector_math.hpp"
#include "rigid2d/scenarios/i_scenario.hpp"

/**
 * @struct BallAndBlockConfig
 * @brief Configuration parameters specific to the ball and block scenario
 */
struct BallAndBlockConfig {
    double ballRadius = 0.75;
    double ballMass = 1.0;
    Vector ballCenterOfMass = Vector(0.0, 0.2);   // body coordinates
    Vector ballPosition = Vector(-2.0, 2.0);
    Vector ballVelocity = Vector(1.0, -1.0);
    double ballOmega = 1.0;

    double blockWidth = 1.0;
    double blockHeight = 1.0;
    double blockMass = 1.0;

    double elasticity = 1.0;
};

/**
 * @class BallAndBlockScenario
 * @brief A spinning ball with an off-center mass hits the corner of a free block
 *
 * No gravity and no damping, so energy and momentum are conserved through the
 * collision.
 */
class BallAndBlockScenario : public IScenario {
public:
    BallAndBlockScenario() = default;
    explicit BallAndBlockScenario(const BallAndBlockConfig& config) : scenarioEntityConfig(config) {}

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const override;

private:
    BallAndBlockConfig scenarioEntityConfig;
};
