/**
 * @file block_on_floor.hpp
 * @brief Declaration of the BlockOnFloorScenario class
 */

#pragma once

#include "rigid2d/scenarios/i_scenario.hpp"

struct BlockOnFloorConfig {
    double blockWidth = 1.0;
    double blockHeight = 1.0;
    double blockMass = 1.0;
    double dropGap = 0.2;           // starting gap between block and floor

    double floorWidth = 10.0;
    double floorThickness = 1.0;
    double floorTop = -2.0;

    double gravity = 3.0;
    double elasticity = 0.5;
};

/**
 * @class BlockOnFloorScenario
 * @brief A block dropped flat onto a fixed floor, bouncing until it rests there
 */
class BlockOnFloorScenario : public IScenario {
public:
    BlockOnFloorScenario() = default;
    explicit BlockOnFloorScenario(const BlockOnFloorConfig& config) : scenarioEntityConfig(config) {}

    ScenarioConfig getConfig() const override;
    void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const override;

private:
    BlockOnFloorConfig scenarioEntityConfig;
};
