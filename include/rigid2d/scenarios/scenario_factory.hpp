/**
 * @file scenario_factory.hpp
 * @brief Creates the built-in scenarios by type
 */

#pragma once

#include <memory>

#include "rigid2d/core/constants.hpp"
#include "rigid2d/scenarios/i_scenario.hpp"

std::unique_ptr<IScenario> makeScenario(SimulatorConstants::ScenarioType type);
