/**
 * @file sim_config.hpp
 * @brief Engine-wide settings applied to a collision sim and its advance strategy
 */

#pragma once

#include "rigid2d/collision/collision_handling.hpp"
#include "rigid2d/collision/contact_forces.hpp"
#include "rigid2d/integration/ode_solver.hpp"

/**
 * @struct EngineConfig
 * @brief Settings of the impulse and contact sims
 */
struct EngineConfig {
    double timeStep = 0.025;

    RigidBodyCollision::CollisionHandling collisionHandling =
        RigidBodyCollision::CollisionHandling::SERIAL_GROUPED_LASTPASS;

    // Contact sim only
    RigidBodyCollision::ExtraAccel extraAccel =
        RigidBodyCollision::ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS;
    double extraAccelTimeStep = 0.025;

    unsigned int randomSeed = 0;

    // One extra resolver pass per advance() to remove residual joint velocity
    bool jointSmallImpacts = false;

    Integration::SolverType solver = Integration::SolverType::RUNGE_KUTTA;
};
