/**
 * @file i_scenario.hpp
 * @brief Declaration of the IScenario interface
 */

#pragma once

#include <entt/entt.hpp>

#include "rigid2d/core/sim_config.hpp"
#include "rigid2d/forces/damping.hpp"
#include "rigid2d/forces/gravity.hpp"
#include "rigid2d/systems/impulse_sim.hpp"

/**
 * @struct ScenarioConfig
 * @brief Everything a scenario needs from the engine around it
 */
struct ScenarioConfig {
    EngineConfig engineConfig;

    // Which sim and strategy to build
    bool contactForces = true;      // ContactSim, else ImpulseSim
    bool detectCollisions = true;   // CollisionAdvance, else SimpleAdvance

    bool useGravity = false;
    Systems::GravityConfig gravityConfig;

    bool useDamping = true;
    Systems::DampingConfig dampingConfig;

    // Applied to every body after createEntities()
    double distanceTol = 0.01;
    double velocityTol = 0.5;
    double collisionAccuracy = 0.6;

    // How long the CLI runs the scenario by default, in seconds
    double runTime = 10.0;
};

/**
 * @brief Abstract base class for any simulation scenario
 *
 * Each scenario must provide:
 *  - getConfig() returning ScenarioConfig
 *  - createEntities() that spawns the bodies and adds them to the sim
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual ScenarioConfig getConfig() const = 0;

    /**
     * @brief Creates the bodies, springs and joints of the scenario
     *
     * The sim already carries the gravity and damping laws of getConfig().
     */
    virtual void createEntities(entt::registry& registry, Systems::ImpulseSim& sim) const = 0;
};
