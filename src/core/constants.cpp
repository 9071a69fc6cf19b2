#include "rigid2d/core/constants.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace SimulatorConstants {

    const double Pi = 3.14159265358979323846;

    const double InfiniteMassThreshold = 1e29;

    const double DefaultDistanceTol       = 0.01;
    const double DefaultVelocityTol       = 0.5;
    const double DefaultCollisionAccuracy = 0.6;

    const double DefaultTimeStep = 0.025;
    const double MinTimeStep     = 1e-16;
    const double StuckResetStep  = 1e-7;
    const int    StuckThreshold  = 3;
    const int    MaxStuckCount   = 30;

    const double TinyImpulse               = 1e-4;
    const double SmallVelocity             = 1e-5;
    const double DefaultExtraAccelTimeStep = 0.025;

    const int    SolverMaxIterations = 5000;
    const double SolverTolerance     = 1e-12;

    bool isInfiniteMass(double mass) {
        return !std::isfinite(mass) || mass > InfiniteMassThreshold;
    }

    std::vector<ScenarioType> getAllScenarios() {
        return {
            ScenarioType::BALL_AND_BLOCK,
            ScenarioType::DROPPED_BALL,
            ScenarioType::DOUBLE_PENDULUM,
            ScenarioType::BLOCK_ON_FLOOR,
            ScenarioType::PENDULUM_ON_SPRING
        };
    }

    std::string getScenarioName(ScenarioType scenario) {
        switch (scenario) {
            case ScenarioType::BALL_AND_BLOCK:     return "BALL_AND_BLOCK";
            case ScenarioType::DROPPED_BALL:       return "DROPPED_BALL";
            case ScenarioType::DOUBLE_PENDULUM:    return "DOUBLE_PENDULUM";
            case ScenarioType::BLOCK_ON_FLOOR:     return "BLOCK_ON_FLOOR";
            case ScenarioType::PENDULUM_ON_SPRING: return "PENDULUM_ON_SPRING";
            default: return "UNKNOWN";
        }
    }

    ScenarioType scenarioFromName(const std::string& name) {
        std::string upper = name;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        for (auto type : getAllScenarios()) {
            if (getScenarioName(type) == upper) {
                return type;
            }
        }
        throw std::invalid_argument("unknown scenario: " + name);
    }

} // namespace SimulatorConstants
