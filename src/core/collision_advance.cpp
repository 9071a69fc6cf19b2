/**
 * @fileoverview collision_advance.cpp
 * @brief Sub-stepping, backup and binary search around collisions
 */

#include "rigid2d/core/collision_advance.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>

#include "rigid2d/core/constants.hpp"
#include "rigid2d/core/profile.hpp"

namespace Engine {

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

const std::vector<std::pair<WayPoint, const char*>>& wayPointNames() {
    static const std::vector<std::pair<WayPoint, const char*>> names = {
        {WayPoint::START, "START"},
        {WayPoint::ADVANCE_SIM_START, "ADVANCE_SIM_START"},
        {WayPoint::ADVANCE_SIM_FAIL, "ADVANCE_SIM_FAIL"},
        {WayPoint::ADVANCE_SIM_COLLIDING, "ADVANCE_SIM_COLLIDING"},
        {WayPoint::ADVANCE_SIM_FINISH, "ADVANCE_SIM_FINISH"},
        {WayPoint::POST_COLLISION, "POST_COLLISION"},
        {WayPoint::PRE_COLLISION, "PRE_COLLISION"},
        {WayPoint::HANDLE_COLLISION_START, "HANDLE_COLLISION_START"},
        {WayPoint::COLLISIONS_TO_HANDLE, "COLLISIONS_TO_HANDLE"},
        {WayPoint::HANDLE_REMOVE_DISTANT, "HANDLE_REMOVE_DISTANT"},
        {WayPoint::HANDLE_COLLISION_SUCCESS, "HANDLE_COLLISION_SUCCESS"},
        {WayPoint::HANDLE_COLLISION_FAIL, "HANDLE_COLLISION_FAIL"},
        {WayPoint::ADVANCED_NO_BACKUP, "ADVANCED_NO_BACKUP"},
        {WayPoint::SMALL_IMPACTS, "SMALL_IMPACTS"},
        {WayPoint::SMALL_IMPACTS_START, "SMALL_IMPACTS_START"},
        {WayPoint::SMALL_IMPACTS_FINISH, "SMALL_IMPACTS_FINISH"},
        {WayPoint::BINARY_SEARCH_FAIL, "BINARY_SEARCH_FAIL"},
        {WayPoint::NEXT_STEP_ESTIMATE, "NEXT_STEP_ESTIMATE"},
        {WayPoint::NEXT_STEP_BINARY, "NEXT_STEP_BINARY"},
        {WayPoint::NEXT_STEP_FULL, "NEXT_STEP_FULL"},
        {WayPoint::MAYBE_STUCK, "MAYBE_STUCK"},
        {WayPoint::ESTIMATE_IN_PAST, "ESTIMATE_IN_PAST"},
        {WayPoint::ESTIMATE_FAILED, "ESTIMATE_FAILED"},
        {WayPoint::NO_ESTIMATE, "NO_ESTIMATE"},
        {WayPoint::SUMMARY, "SUMMARY"},
        {WayPoint::FINISH, "FINISH"},
        {WayPoint::STUCK, "STUCK"}
    };
    return names;
}

std::string upper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

double maxImpulse(const RigidBodyCollision::CollisionList& list) {
    double m = 0.0;
    for (const auto& c : list) {
        if (std::isfinite(c.impulse)) {
            m = std::max(m, c.impulse);
        }
    }
    return m;
}

double minVelocity(const RigidBodyCollision::CollisionList& list) {
    double m = std::numeric_limits<double>::infinity();
    for (const auto& c : list) {
        m = std::min(m, c.normalVelocity);
    }
    return m;
}

} // namespace

std::string wayPointName(WayPoint wayPoint) {
    for (const auto& [wp, name] : wayPointNames()) {
        if (wp == wayPoint) {
            return name;
        }
    }
    return "UNKNOWN";
}

DebugLevel debugLevelFromName(const std::string& name) {
    std::string const n = upper(name);
    if (n == "NONE") return DebugLevel::NONE;
    if (n == "LOW") return DebugLevel::LOW;
    if (n == "MEDIUM") return DebugLevel::MEDIUM;
    if (n == "HIGH") return DebugLevel::HIGH;
    if (n == "OPTIMAL") return DebugLevel::OPTIMAL;
    if (n == "CUSTOM") return DebugLevel::CUSTOM;
    throw std::invalid_argument("unknown debug level: " + name);
}

std::string advanceErrorName(AdvanceError error) {
    switch (error) {
        case AdvanceError::STUCK:         return "STUCK";
        case AdvanceError::INTEGRATOR:    return "INTEGRATOR";
        case AdvanceError::TIME_STALLED:  return "TIME_STALLED";
        case AdvanceError::ILLEGAL_STATE: return "ILLEGAL_STATE";
    }
    return "UNKNOWN";
}

AdvanceException::AdvanceException(AdvanceError kind, const std::string& message)
    : std::runtime_error(advanceErrorName(kind) + ": " + message), kind(kind)
{
}

CollisionAdvance::CollisionAdvance(Systems::ICollisionSim& sim,
                                   std::unique_ptr<Integration::IOdeSolver> solver)
    : sim(sim), odeSolver(std::move(solver))
{
    if (!odeSolver) {
        odeSolver = std::make_unique<Integration::RungeKutta>(sim);
    }
    setDebugLevel(DebugLevel::NONE);
}

void CollisionAdvance::setTimeStep(double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("time step must be positive");
    }
    timeStep = step;
}

void CollisionAdvance::setOdeSolver(std::unique_ptr<Integration::IOdeSolver> solver) {
    if (!solver) {
        throw std::invalid_argument("setOdeSolver: null solver");
    }
    odeSolver = std::move(solver);
}

void CollisionAdvance::reset() {
    sim.reset();
    totals.reset();
    collisions.clear();
}

void CollisionAdvance::save() {
    sim.saveInitialState();
}

void CollisionAdvance::setDebugLevel(DebugLevel level) {
    debugLevel = level;
    switch (level) {
        case DebugLevel::NONE:
            wayPoints = {WayPoint::STUCK};
            break;
        case DebugLevel::LOW:
            wayPoints = {WayPoint::SUMMARY, WayPoint::STUCK};
            break;
        case DebugLevel::MEDIUM:
            wayPoints = {WayPoint::COLLISIONS_TO_HANDLE, WayPoint::HANDLE_REMOVE_DISTANT,
                         WayPoint::HANDLE_COLLISION_SUCCESS, WayPoint::PRE_COLLISION,
                         WayPoint::POST_COLLISION, WayPoint::STUCK};
            break;
        case DebugLevel::OPTIMAL:
        case DebugLevel::HIGH:
            wayPoints = {WayPoint::ADVANCE_SIM_FAIL, WayPoint::ADVANCE_SIM_COLLIDING,
                         WayPoint::POST_COLLISION, WayPoint::PRE_COLLISION,
                         WayPoint::HANDLE_REMOVE_DISTANT, WayPoint::HANDLE_COLLISION_START,
                         WayPoint::HANDLE_COLLISION_SUCCESS, WayPoint::HANDLE_COLLISION_FAIL,
                         WayPoint::SMALL_IMPACTS, WayPoint::SMALL_IMPACTS_START,
                         WayPoint::SMALL_IMPACTS_FINISH, WayPoint::BINARY_SEARCH_FAIL,
                         WayPoint::NEXT_STEP_ESTIMATE, WayPoint::NEXT_STEP_BINARY,
                         WayPoint::ESTIMATE_IN_PAST, WayPoint::ESTIMATE_FAILED,
                         WayPoint::NO_ESTIMATE, WayPoint::MAYBE_STUCK, WayPoint::STUCK,
                         WayPoint::SUMMARY};
            if (level == DebugLevel::HIGH) {
                wayPoints.insert({WayPoint::START, WayPoint::ADVANCED_NO_BACKUP,
                                  WayPoint::FINISH, WayPoint::ADVANCE_SIM_START,
                                  WayPoint::ADVANCE_SIM_FINISH, WayPoint::NEXT_STEP_FULL});
            }
            break;
        case DebugLevel::CUSTOM:
            wayPoints = {WayPoint::SMALL_IMPACTS};
            break;
    }
}

void CollisionAdvance::addWayPoints(const std::vector<WayPoint>& points) {
    wayPoints.insert(points.begin(), points.end());
}

AdvanceResult CollisionAdvance::tryAdvance(double step, MemoList* memo) {
    AdvanceResult result;
    try {
        advance(step, memo);
    } catch (const AdvanceException& e) {
        result.error = e.getKind();
        result.message = e.what();
    }
    return result;
}

void CollisionAdvance::advance(double step, MemoList* memo) {
    PROFILE_SCOPE("CollisionAdvance::advance");
    if (step < SimulatorConstants::MinTimeStep) {
        sim.modifyObjects();
        return;
    }
    VarsList& vars = sim.getVarsList();
    std::vector<double> const start = vars.getValues();
    try {
        run(step, memo);
    } catch (const AdvanceException&) {
        vars.setValues(start);
        sim.modifyObjects();
        throw;
    } catch (const std::exception& e) {
        // detection and handling report bad geometry or bad records this way
        vars.setValues(start);
        sim.modifyObjects();
        throw AdvanceException(AdvanceError::ILLEGAL_STATE, e.what());
    }
}

void CollisionAdvance::fail(AdvanceError kind, const std::string& message) {
    throw AdvanceException(kind, message);
}

void CollisionAdvance::run(double step, MemoList* memo) {
    timeAdvanced = 0.0;
    totalTimeStep = step;
    currentStep = step;
    binarySteps = 0;
    binarySearch = false;
    detectedTime = NaN;
    nextEstimate = NaN;
    stuckCount = 0;
    backupCount = 0;
    odeSteps = 0;
    collisionCounter = 0;
    numClose = 0;
    stats.clear();
    collisions.clear();
    print(WayPoint::START);

    bool didHandle = false;
    while (timeAdvanced < totalTimeStep - SimulatorConstants::MinTimeStep) {
        advanceSim(currentStep);
        stats.update(collisions);
        print(WayPoint::ADVANCE_SIM_FINISH);

        bool didBackup = false;
        if (stats.numNeedsHandling > 0) {
            detectedTime = stats.detectedTime;
            backup(currentStep);
            didBackup = true;
            stats.update(collisions);
            print(WayPoint::PRE_COLLISION);
            stuckCount++;
            if (stuckCount >= SimulatorConstants::StuckThreshold) {
                if (!binarySearch) {
                    print(WayPoint::MAYBE_STUCK);
                    binarySearch = true;
                }
                if (stuckCount >= MaxStuckCount) {
                    print(WayPoint::STUCK);
                    fail(AdvanceError::STUCK, "collision was not resolved after "
                         + std::to_string(stuckCount) + " tries at time "
                         + std::to_string(sim.getTime()));
                }
            }
        }

        numClose = static_cast<int>(std::count_if(collisions.begin(), collisions.end(),
            [didBackup](const RigidBodyCollision::CollisionRecord& c) {
                return (c.needsHandling() || !c.contact()) && c.normalVelocity < 0
                    && c.closeEnough(didBackup);
            }));
        if (numClose > 0) {
            RigidBodyCollision::CollisionList removed;
            if (removeDistant(&removed)) {
                print(WayPoint::HANDLE_REMOVE_DISTANT);
            }
            didHandle = handleCollision(numClose) || didHandle;
            nextEstimate = NaN;
            stats.update(removed);
        }

        if (!didBackup) {
            if (currentStep > SimulatorConstants::StuckResetStep) {
                stuckCount = 0;
            }
            timeAdvanced += currentStep;
            print(WayPoint::ADVANCED_NO_BACKUP);
            if (memo != nullptr) {
                memo->memorize();
            }
            if (binarySearch && ++binarySteps >= 2) {
                print(WayPoint::BINARY_SEARCH_FAIL);
                binarySearch = false;
                binarySteps = 0;
                detectedTime = NaN;
            } else if (std::isfinite(nextEstimate)) {
                binarySearch = true;
                print(WayPoint::ESTIMATE_FAILED);
            }
        }
        checkNoneCollide();
        calcNextStep(didBackup);
    }

    if (!didHandle && jointSmallImpacts && stats.numJoints > 0) {
        smallImpacts();
    }
    totals.addCollisions(collisionCounter);
    totals.addSteps(odeSteps);
    totals.addBackups(backupCount);
    print(WayPoint::SUMMARY);
    print(WayPoint::FINISH);
}

bool CollisionAdvance::advanceSim(double stepSize) {
    collisions.clear();
    sim.saveState();
    print(WayPoint::ADVANCE_SIM_START);
    std::optional<std::string> const error = odeSolver->step(stepSize);
    sim.modifyObjects();
    odeSteps++;
    if (error) {
        collisions = sim.takeEvaluateCollisions();
        print(WayPoint::ADVANCE_SIM_FAIL);
        if (collisions.empty()) {
            fail(AdvanceError::INTEGRATOR, *error);
        }
    } else {
        checkFinite("after ode step");
        sim.findCollisions(collisions, sim.getVarsList().getValues(), stepSize);
        print(WayPoint::ADVANCE_SIM_COLLIDING);
    }

    // earliest estimated time first, records without an estimate last
    std::stable_sort(collisions.begin(), collisions.end(),
        [](const RigidBodyCollision::CollisionRecord& c1,
           const RigidBodyCollision::CollisionRecord& c2) {
            double const est1 = std::round(1e7 * c1.estimate);
            double const est2 = std::round(1e7 * c2.estimate);
            if (std::isnan(est1)) {
                return false;
            }
            if (std::isnan(est2)) {
                return true;
            }
            return est1 < est2;
        });
    for (auto& c : collisions) {
        c.setNeedsHandling(c.isColliding());
    }
    return !error.has_value();
}

void CollisionAdvance::backup(double stepSize) {
    print(WayPoint::POST_COLLISION);
    sim.restoreState();
    sim.modifyObjects();
    backupCount++;
    double const time = sim.getTime();
    collisions.erase(std::remove_if(collisions.begin(), collisions.end(),
                                    [](const RigidBodyCollision::CollisionRecord& c) {
                                        return !c.isColliding();
                                    }),
                     collisions.end());
    for (auto& c : collisions) {
        sim.updateCollision(c, time);
    }
    sim.findCollisions(collisions, sim.getVarsList().getValues(), stepSize);
}

bool CollisionAdvance::handleCollision(int close) {
    print(WayPoint::HANDLE_COLLISION_START);
    print(WayPoint::COLLISIONS_TO_HANDLE);
    if (sim.handleCollisions(collisions, &totals)) {
        checkFinite("after collision handling");
        sim.modifyObjects();
        double const time = sim.getTime();
        for (auto& c : collisions) {
            sim.updateCollision(c, time);
        }
        print(WayPoint::HANDLE_COLLISION_SUCCESS);
        if (binarySearch) {
            totals.addSearches(1);
        }
        collisionCounter += close;
        binarySearch = false;
        binarySteps = 0;
        detectedTime = NaN;
        return true;
    }
    binarySearch = true;
    print(WayPoint::HANDLE_COLLISION_FAIL);
    return false;
}

void CollisionAdvance::smallImpacts() {
    if (collisions.empty()) {
        return;
    }
    print(WayPoint::SMALL_IMPACTS_START);
    removeDistant(nullptr);
    if (!collisions.empty()) {
        sim.handleCollisions(collisions, &totals);
        checkFinite("after small impacts");
        sim.modifyObjects();
    }
    print(WayPoint::SMALL_IMPACTS_FINISH);
    print(WayPoint::SMALL_IMPACTS);
}

void CollisionAdvance::calcNextStep(bool didBackup) {
    nextEstimate = stats.estTime;
    if (!binarySearch) {
        // an estimate that is not ahead of the current time can't set a step
        if (nextEstimate - sim.getTime() < SimulatorConstants::MinTimeStep) {
            binarySearch = true;
            print(WayPoint::ESTIMATE_IN_PAST);
        }
        if (stats.numNeedsHandling > 0 && std::isnan(nextEstimate)) {
            binarySearch = true;
            print(WayPoint::NO_ESTIMATE);
        }
    }
    double const fullStep = totalTimeStep - timeAdvanced;
    if (binarySearch) {
        nextEstimate = NaN;
        if (didBackup) {
            currentStep = currentStep / 2.0;
            binarySteps = 0;
        }
        currentStep = std::min(currentStep, fullStep);
        print(WayPoint::NEXT_STEP_BINARY);
    } else if (!std::isnan(nextEstimate)) {
        currentStep = std::min(nextEstimate - sim.getTime(), fullStep);
        print(WayPoint::NEXT_STEP_ESTIMATE);
    } else {
        currentStep = fullStep;
        print(WayPoint::NEXT_STEP_FULL);
    }
    if (currentStep < SimulatorConstants::MinTimeStep
        && timeAdvanced < totalTimeStep - SimulatorConstants::MinTimeStep) {
        fail(AdvanceError::TIME_STALLED, "step size underflow at time "
             + std::to_string(sim.getTime()));
    }
}

bool CollisionAdvance::removeDistant(RigidBodyCollision::CollisionList* removed) {
    bool any = false;
    auto it = collisions.begin();
    while (it != collisions.end()) {
        if (!it->isTouching()) {
            if (removed != nullptr) {
                removed->push_back(*it);
            }
            it = collisions.erase(it);
            any = true;
        } else {
            ++it;
        }
    }
    return any;
}

void CollisionAdvance::checkNoneCollide() {
    long const numIllegal = std::count_if(collisions.begin(), collisions.end(),
        [](const RigidBodyCollision::CollisionRecord& c) { return c.illegalState(); });
    if (numIllegal > 0) {
        printCollisions("TROUBLE", true);
        fail(AdvanceError::ILLEGAL_STATE, "found " + std::to_string(numIllegal)
             + " colliding at end of loop, " + stats.toString());
    }
}

void CollisionAdvance::checkFinite(const std::string& where) {
    const VarsList& vars = sim.getVarsList();
    if (vars.allFinite()) {
        return;
    }
    for (int i = 0; i < vars.numVariables(); ++i) {
        if (!std::isfinite(vars.getValue(i))) {
            fail(AdvanceError::INTEGRATOR, "non-finite " + vars.getName(i) + " " + where
                 + " at time " + std::to_string(sim.getTime()));
        }
    }
}

void CollisionAdvance::print(WayPoint wayPoint) const {
    if (wayPoints.count(wayPoint) == 0) {
        return;
    }
    std::ostringstream ss;
    ss << std::setprecision(7);
    ss << "t=" << sim.getTime() << " ";
    switch (wayPoint) {
        case WayPoint::START:
            ss << "START advance by " << totalTimeStep;
            break;
        case WayPoint::ADVANCE_SIM_START:
            ss << "ADVANCE_SIM_START: step(" << currentStep << ") to "
               << sim.getTime() + currentStep
               << " binarySearch=" << binarySearch
               << " nextEstimate=" << nextEstimate
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::ADVANCE_SIM_FAIL:
            ss << "ADVANCE_SIM_FAIL couldn't advance to " << sim.getTime() + currentStep
               << " found " << collisions.size() << " collisions";
            break;
        case WayPoint::ADVANCE_SIM_COLLIDING:
            ss << "ADVANCE_SIM_COLLIDING advanced by " << currentStep
               << " but found " << stats.numNeedsHandling << " colliding";
            break;
        case WayPoint::ADVANCE_SIM_FINISH:
            ss << "ADVANCE_SIM_FINISH " << stats.toString();
            break;
        case WayPoint::POST_COLLISION:
            ss << "POST_COLLISION " << stats.toString();
            break;
        case WayPoint::PRE_COLLISION:
            ss << "PRE_COLLISION " << stats.toString();
            break;
        case WayPoint::HANDLE_COLLISION_START:
            ss << "HANDLE_COLLISION_START: numClose=" << numClose
               << " binarySearch=" << binarySearch
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::COLLISIONS_TO_HANDLE:
            ss << "COLLISIONS_TO_HANDLE " << collisions.size();
            break;
        case WayPoint::HANDLE_REMOVE_DISTANT:
            ss << "HANDLE_REMOVE_DISTANT " << collisions.size() << " left";
            break;
        case WayPoint::HANDLE_COLLISION_SUCCESS:
            ss << "HANDLE_COLLISION_SUCCESS max impulse=" << maxImpulse(collisions)
               << " min velocity=" << minVelocity(collisions);
            break;
        case WayPoint::HANDLE_COLLISION_FAIL:
            ss << "HANDLE_COLLISION_FAIL detectedTime=" << detectedTime
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::ADVANCED_NO_BACKUP:
            ss << "ADVANCED_NO_BACKUP nextEstimate=" << nextEstimate
               << " currentStep=" << currentStep
               << " imminent=" << stats.numImminent
               << " non-collisions=" << (static_cast<int>(collisions.size()) - stats.numImminent);
            break;
        case WayPoint::SMALL_IMPACTS_START:
            ss << "SMALL_IMPACTS_START " << collisions.size() << " records";
            break;
        case WayPoint::SMALL_IMPACTS_FINISH:
            ss << "SMALL_IMPACTS_FINISH " << collisions.size() << " records";
            break;
        case WayPoint::SMALL_IMPACTS:
            ss << "SMALL_IMPACTS num collisions=" << collisions.size()
               << " max impulse=" << maxImpulse(collisions)
               << " min velocity=" << minVelocity(collisions);
            break;
        case WayPoint::BINARY_SEARCH_FAIL:
            ss << "BINARY_SEARCH_FAIL turning off binary search, binarySteps=" << binarySteps;
            break;
        case WayPoint::NEXT_STEP_ESTIMATE:
            ss << "NEXT_STEP_ESTIMATE nextEstimate=" << nextEstimate
               << " currentStep=" << currentStep
               << " numNeedsHandling=" << stats.numNeedsHandling
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::NEXT_STEP_BINARY:
            ss << "NEXT_STEP_BINARY currentStep=" << currentStep
               << " detectedTime=" << detectedTime
               << " binarySteps=" << binarySteps
               << " numNeedsHandling=" << stats.numNeedsHandling
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::NEXT_STEP_FULL:
            ss << "NEXT_STEP_FULL currentStep=" << currentStep
               << " totalTimeStep=" << totalTimeStep
               << " timeAdvanced=" << timeAdvanced
               << " stuckCount=" << stuckCount;
            break;
        case WayPoint::MAYBE_STUCK:
            ss << "MAYBE_STUCK turning on binary search stuckCount=" << stuckCount
               << " nextEstimate=" << nextEstimate;
            break;
        case WayPoint::ESTIMATE_IN_PAST:
            ss << "ESTIMATE_IN_PAST turning on binary search nextEstimate=" << nextEstimate
               << " needsHandling=" << stats.numNeedsHandling;
            break;
        case WayPoint::ESTIMATE_FAILED:
            ss << "ESTIMATE_FAILED turning on binary search nextEstimate=" << nextEstimate
               << " needsHandling=" << stats.numNeedsHandling;
            break;
        case WayPoint::NO_ESTIMATE:
            ss << "NO_ESTIMATE turning on binary search nextEstimate=" << nextEstimate
               << " needsHandling=" << stats.numNeedsHandling;
            break;
        case WayPoint::SUMMARY:
            if (collisionCounter == 0 && backupCount == 0) {
                return;
            }
            ss << "**** SUMMARY handled " << collisionCounter << " collisions; "
               << backupCount << " backups; " << odeSteps << " steps; "
               << totals.toString();
            break;
        case WayPoint::FINISH:
            ss << "FINISH exiting advance collisions=" << totals.getCollisions()
               << " steps=" << totals.getSteps();
            break;
        case WayPoint::STUCK:
            ss << "STUCK collision was not resolved after " << stuckCount << " tries";
            break;
    }
    std::cout << ss.str() << std::endl;

    if (wayPoint == WayPoint::COLLISIONS_TO_HANDLE || wayPoint == WayPoint::STUCK
        || wayPoint == WayPoint::HANDLE_COLLISION_FAIL
        || wayPoint == WayPoint::SMALL_IMPACTS_START
        || wayPoint == WayPoint::SMALL_IMPACTS_FINISH) {
        printCollisions(wayPointName(wayPoint), wayPoint != WayPoint::COLLISIONS_TO_HANDLE);
    }
}

void CollisionAdvance::printCollisions(const std::string& label, bool printAll) const {
    for (size_t i = 0; i < collisions.size(); ++i) {
        const auto& c = collisions[i];
        if (printAll || c.needsHandling() || !c.contact()) {
            std::cout << label << " [" << i << "] " << c.toString() << std::endl;
        }
    }
}

} // namespace Engine
