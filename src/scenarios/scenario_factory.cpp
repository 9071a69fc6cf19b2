/**
 * @file scenario_factory.cpp
 */

#include "rigid2d/scenarios/scenario_factory.hpp"

#include <stdexcept>

#include "rigid2d/scenarios/ball_and_block.hpp"
#include "rigid2d/scenarios/block_on_floor.hpp"
#include "rigid2d/scenarios/double_pendulum.hpp"
#include "rigid2d/scenarios/dropped_ball.hpp"
#include "rigid2d/scenarios/pendulum_on_spring.hpp"

std::unique_ptr<IScenario> makeScenario(SimulatorConstants::ScenarioType type) {
    using SimulatorConstants::ScenarioType;
    switch (type) {
        case ScenarioType::BALL_AND_BLOCK:
            return std::make_unique<BallAndBlockScenario>();
        case ScenarioType::DROPPED_BALL:
            return std::make_unique<DroppedBallScenario>();
        case ScenarioType::DOUBLE_PENDULUM:
            return std::make_unique<DoublePendulumScenario>();
        case ScenarioType::BLOCK_ON_FLOOR:
            return std::make_unique<BlockOnFloorScenario>();
        case ScenarioType::PENDULUM_ON_SPRING:
            return std::make_unique<PendulumOnSpringScenario>();
    }
    throw std::invalid_argument("makeScenario: unknown scenario type");
}
