/**
 * @file simple_advance.hpp
 * @brief Advance strategy for sims without collisions
 */

#pragma once

#include <memory>

#include "rigid2d/core/advance_strategy.hpp"
#include "rigid2d/integration/ode_solver.hpp"
#include "rigid2d/systems/i_collision_sim.hpp"

namespace Engine {

/**
 * @class SimpleAdvance
 * @brief Takes one solver step per advance() and nothing else
 *
 * Collisions are never looked for. A solver error is thrown as an
 * AdvanceException after the state is put back.
 */
class SimpleAdvance : public IAdvanceStrategy {
public:
    explicit SimpleAdvance(Systems::ICollisionSim& sim,
                           std::unique_ptr<Integration::IOdeSolver> solver = nullptr);

    void advance(double timeStep, MemoList* memo = nullptr) override;

    double getTime() const override { return sim.getTime(); }
    double getTimeStep() const override { return timeStep; }
    void setTimeStep(double step) override;
    void reset() override { sim.reset(); }
    void save() override { sim.saveInitialState(); }

    void setOdeSolver(std::unique_ptr<Integration::IOdeSolver> solver);
    Integration::IOdeSolver& getOdeSolver() { return *odeSolver; }

private:
    Systems::ICollisionSim& sim;
    std::unique_ptr<Integration::IOdeSolver> odeSolver;
    double timeStep = 0.025;
};

} // namespace Engine
