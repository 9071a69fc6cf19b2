#ifndef RIGID2D_CONSTANTS_HPP
#define RIGID2D_CONSTANTS_HPP

#include <string>
#include <vector>

namespace SimulatorConstants {

    /**
     * @brief The scenarios the engine ships with.
     */
    enum class ScenarioType {
        BALL_AND_BLOCK,
        DROPPED_BALL,
        DOUBLE_PENDULUM,
        BLOCK_ON_FLOOR,
        PENDULUM_ON_SPRING
    };

    extern const double Pi;

    // Masses above this are treated as immovable
    extern const double InfiniteMassThreshold;

    // Per-body defaults
    extern const double DefaultDistanceTol;
    extern const double DefaultVelocityTol;
    extern const double DefaultCollisionAccuracy;

    // Advance loop
    extern const double DefaultTimeStep;
    extern const double MinTimeStep;        // advance() ignores smaller requests
    extern const double StuckResetStep;     // a step this long proves progress
    extern const int    StuckThreshold;     // force binary search from here
    extern const int    MaxStuckCount;      // give up from here

    // Collision handling
    extern const double TinyImpulse;
    extern const double SmallVelocity;
    extern const double DefaultExtraAccelTimeStep;

    // Contact solver
    extern const int    SolverMaxIterations;
    extern const double SolverTolerance;

    bool isInfiniteMass(double mass);

    std::vector<ScenarioType> getAllScenarios();
    std::string getScenarioName(ScenarioType scenario);

    /**
     * @brief Looks up a scenario by its name, case-insensitively
     * @throws std::invalid_argument if no scenario has that name
     */
    ScenarioType scenarioFromName(const std::string& name);

} // namespace SimulatorConstants

#endif
