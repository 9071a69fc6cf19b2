/**
 * @fileoverview simple_advance.cpp
 */

#include "rigid2d/core/simple_advance.hpp"

#include <stdexcept>

#include "rigid2d/core/collision_advance.hpp"
#include "rigid2d/core/constants.hpp"

namespace Engine {

SimpleAdvance::SimpleAdvance(Systems::ICollisionSim& sim,
                             std::unique_ptr<Integration::IOdeSolver> solver)
    : sim(sim), odeSolver(std::move(solver))
{
    if (!odeSolver) {
        odeSolver = std::make_unique<Integration::RungeKutta>(sim);
    }
}

void SimpleAdvance::setTimeStep(double step) {
    if (!(step > 0.0)) {
        throw std::invalid_argument("time step must be positive");
    }
    timeStep = step;
}

void SimpleAdvance::setOdeSolver(std::unique_ptr<Integration::IOdeSolver> solver) {
    if (!solver) {
        throw std::invalid_argument("setOdeSolver: null solver");
    }
    odeSolver = std::move(solver);
}

void SimpleAdvance::advance(double step, MemoList* memo) {
    if (step >= SimulatorConstants::MinTimeStep) {
        sim.saveState();
        if (auto err = odeSolver->step(step)) {
            sim.restoreState();
            sim.modifyObjects();
            throw AdvanceException(AdvanceError::INTEGRATOR, *err);
        }
        if (!sim.getVarsList().allFinite()) {
            sim.restoreState();
            sim.modifyObjects();
            throw AdvanceException(AdvanceError::INTEGRATOR, "non-finite state after ode step");
        }
    }
    sim.modifyObjects();
    if (memo != nullptr) {
        memo->memorize();
    }
}

} // namespace Engine
