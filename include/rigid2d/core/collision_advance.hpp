/**
 * @file collision_advance.hpp
 * @brief Advances a collision sim, backing up and bisecting to find collisions
 *
 * One advance(dt) call integrates in sub-steps. After each sub-step the bodies
 * are checked for collisions. When a sub-step ends with bodies penetrating, the
 * state is moved back to the start of that sub-step and a shorter one is tried,
 * either up to the estimated collision time or half the previous length. Once
 * the colliding bodies are close enough they get impulses and integration
 * continues from the new velocities.
 */

#pragma once

#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "rigid2d/collision/collision_data.hpp"
#include "rigid2d/collision/collision_stats.hpp"
#include "rigid2d/core/advance_strategy.hpp"
#include "rigid2d/integration/ode_solver.hpp"
#include "rigid2d/systems/i_collision_sim.hpp"

namespace Engine {

/**
 * @brief Places in the advance loop that can print what is happening there
 */
enum class WayPoint {
    START,
    ADVANCE_SIM_START,
    ADVANCE_SIM_FAIL,
    ADVANCE_SIM_COLLIDING,
    ADVANCE_SIM_FINISH,
    POST_COLLISION,
    PRE_COLLISION,
    HANDLE_COLLISION_START,
    COLLISIONS_TO_HANDLE,
    HANDLE_REMOVE_DISTANT,
    HANDLE_COLLISION_SUCCESS,
    HANDLE_COLLISION_FAIL,
    ADVANCED_NO_BACKUP,
    SMALL_IMPACTS,
    SMALL_IMPACTS_START,
    SMALL_IMPACTS_FINISH,
    BINARY_SEARCH_FAIL,
    NEXT_STEP_ESTIMATE,
    NEXT_STEP_BINARY,
    NEXT_STEP_FULL,
    MAYBE_STUCK,
    ESTIMATE_IN_PAST,
    ESTIMATE_FAILED,
    NO_ESTIMATE,
    SUMMARY,
    FINISH,
    STUCK
};

std::string wayPointName(WayPoint wayPoint);

/**
 * @brief Preset sets of way points to print
 *
 * NONE still prints STUCK. CUSTOM starts from SMALL_IMPACTS only; add more
 * with CollisionAdvance::addWayPoints().
 */
enum class DebugLevel {
    NONE,
    LOW,
    MEDIUM,
    HIGH,
    OPTIMAL,
    CUSTOM
};

/** @throws std::invalid_argument for an unknown name */
DebugLevel debugLevelFromName(const std::string& name);

enum class AdvanceError {
    STUCK,          // the same collision kept needing a backup
    INTEGRATOR,     // the solver failed for a reason other than a collision
    TIME_STALLED,   // the next step became too small to move time
    ILLEGAL_STATE   // bodies still penetrate after handling
};

std::string advanceErrorName(AdvanceError error);

class AdvanceException : public std::runtime_error {
public:
    AdvanceException(AdvanceError kind, const std::string& message);

    AdvanceError getKind() const { return kind; }

private:
    AdvanceError kind;
};

struct AdvanceResult {
    std::optional<AdvanceError> error;
    std::string message;

    bool ok() const { return !error.has_value(); }
};

/**
 * @class CollisionAdvance
 * @brief The advance strategy for sims whose bodies collide
 *
 * A failing call leaves the sim as it was when the call started.
 */
class CollisionAdvance : public IAdvanceStrategy {
public:
    static constexpr int MaxStuckCount = 30;

    /**
     * @param solver Solver to use; a Runge-Kutta solver over @p sim when null
     */
    explicit CollisionAdvance(Systems::ICollisionSim& sim,
                              std::unique_ptr<Integration::IOdeSolver> solver = nullptr);

    /** @throws AdvanceException when the step cannot be completed */
    void advance(double timeStep, MemoList* memo = nullptr) override;

    /** @brief Like advance() but reports failure through the result */
    AdvanceResult tryAdvance(double timeStep, MemoList* memo = nullptr);

    double getTime() const override { return sim.getTime(); }
    double getTimeStep() const override { return timeStep; }
    /** @throws std::invalid_argument unless @p step is positive */
    void setTimeStep(double step) override;
    void reset() override;
    void save() override;

    const RigidBodyCollision::CollisionTotals& getCollisionTotals() const { return totals; }

    /** @brief Records found in the last sub-step of the last call */
    const RigidBodyCollision::CollisionList& getCollisions() const { return collisions; }

    /**
     * @brief Whether to apply impulses to touching joints at the end of a call
     *        that handled no collision, removing velocity the contact forces
     *        leave in the joints
     */
    void setJointSmallImpacts(bool value) { jointSmallImpacts = value; }
    bool getJointSmallImpacts() const { return jointSmallImpacts; }

    void setOdeSolver(std::unique_ptr<Integration::IOdeSolver> solver);
    Integration::IOdeSolver& getOdeSolver() { return *odeSolver; }

    void setDebugLevel(DebugLevel level);
    DebugLevel getDebugLevel() const { return debugLevel; }
    void addWayPoints(const std::vector<WayPoint>& wayPoints);
    bool printsWayPoint(WayPoint wayPoint) const { return wayPoints.count(wayPoint) > 0; }

private:
    void run(double timeStep, MemoList* memo);

    bool advanceSim(double stepSize);
    void backup(double stepSize);
    bool handleCollision(int numClose);
    void smallImpacts();
    void calcNextStep(bool didBackup);

    /** @brief Drops records that are no longer touching */
    bool removeDistant(RigidBodyCollision::CollisionList* removed);
    void checkNoneCollide();
    /** @throws AdvanceException (INTEGRATOR) when a variable is inf or NaN */
    void checkFinite(const std::string& where);

    void fail(AdvanceError kind, const std::string& message);

    void print(WayPoint wayPoint) const;
    void printCollisions(const std::string& label, bool printAll) const;

    Systems::ICollisionSim& sim;
    std::unique_ptr<Integration::IOdeSolver> odeSolver;

    RigidBodyCollision::CollisionList collisions;
    RigidBodyCollision::CollisionStats stats;
    RigidBodyCollision::CollisionTotals totals;

    double timeStep = 0.025;
    bool jointSmallImpacts = false;

    DebugLevel debugLevel = DebugLevel::NONE;
    std::set<WayPoint> wayPoints;

    // state of the current advance() call
    double totalTimeStep = 0.0;
    double timeAdvanced = 0.0;
    double currentStep = 0.0;
    bool binarySearch = false;
    int binarySteps = 0;
    double detectedTime = 0.0;
    double nextEstimate = 0.0;
    int stuckCount = 0;
    int backupCount = 0;
    int odeSteps = 0;
    int collisionCounter = 0;
    int numClose = 0;
};

} // namespace Engine
