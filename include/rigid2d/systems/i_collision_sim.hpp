/**
 * @file i_collision_sim.hpp
 * @brief What the advance controller needs from a simulation with collisions
 */

#pragma once

#include "rigid2d/collision/collision_data.hpp"
#include "rigid2d/collision/collision_stats.hpp"
#include "rigid2d/integration/ode_solver.hpp"

namespace Systems {

/**
 * @class ICollisionSim
 * @brief An ODE sim that can detect and resolve collisions between steps
 *
 * The state vector is the single source of truth. modifyObjects() copies it
 * into the bodies, which detection and resolution then read.
 */
class ICollisionSim : public Integration::IOdeSim {
public:
    /**
     * @brief Adds every collision and contact of the current body state
     * @param vars State the bodies were moved to; slot 0 is the time
     * @param stepSize Length of the step that led here
     */
    virtual void findCollisions(RigidBodyCollision::CollisionList& collisions,
                                const std::vector<double>& vars,
                                double stepSize) = 0;

    /**
     * @brief Applies impulses for the records
     * @param totals Counters to update, may be null
     * @return Whether any significant impulse was applied
     */
    virtual bool handleCollisions(RigidBodyCollision::CollisionList& collisions,
                                  RigidBodyCollision::CollisionTotals* totals) = 0;

    /** @brief Recomputes a record for the current body state at @p time */
    virtual void updateCollision(RigidBodyCollision::CollisionRecord& c, double time) = 0;

    /**
     * @brief Records that made the last evaluate() fail, moved out
     *
     * Empty when the last failure was not a penetration.
     */
    virtual RigidBodyCollision::CollisionList takeEvaluateCollisions() = 0;

    /** @brief Saves the state as the start of the current step */
    virtual void saveState() = 0;
    /** @brief Goes back to the state saved by saveState() */
    virtual void restoreState() = 0;

    /** @brief Marks the current state as the one reset() returns to */
    virtual void saveInitialState() = 0;
    virtual void reset() = 0;

    virtual double getTime() const = 0;
};

} // namespace Systems
