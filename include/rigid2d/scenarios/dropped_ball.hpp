/**
 * @file dropped_ball.hpp
 * @brief Declaration of the DroppedBallScenario class
 */

#pragma once

#include "rigid2d/scenarios/i_scenario.hpp"

struct DroppedBallConfig {
    double ballRadius = 0.5;
    double dropHeight = 0.0;        // y of the ball center

    double floorWidth = 10.0;
    double floorThickness = 1.0;
    double floorCenterY = -2.5;

    double gravity = 3.0;
    double elasticity = 0.8;
};

/**
 * @class DroppedBallScenario
 * @brief A ball falls onto a fixed floor under gravity
 *
 * Runs on the impulse-only sim. Each bounce loses energy, so the bounces get
 * shorter until the collisions can no longer be separated and advance() fails.
 */
class DroppedBallScenario : public IScenario {
public:
    DroppedBallScenario() = default;
    explicit DroppedBallScenario(const DroppedBallConfig& config) : scenarioEntityConfig(config) {}

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const override;

private:
    DroppedBallConfig scenarioEntityConfig;
};
