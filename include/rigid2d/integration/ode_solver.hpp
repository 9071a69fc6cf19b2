/**
 * @file ode_solver.hpp
 * @brief Fixed-step ODE solvers over a VarsList
 *
 * Solvers know nothing about geometry. They ask an IOdeSim for the rate of
 * change of every variable and combine the rates into an update. If an
 * evaluation fails the solver returns the sim's message immediately; the
 * variables may then be partially integrated and the caller must restore them.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "rigid2d/core/vars_list.hpp"

namespace Integration {

/**
 * @class IOdeSim
 * @brief A system of first order differential equations
 */
class IOdeSim {
public:
    virtual ~IOdeSim() = default;

    virtual VarsList& getVarsList() = 0;

    /**
     * @brief Computes the rate of change of each variable
     *
     * @param vars Variables to evaluate at, same layout as the VarsList
     * @param change Receives the derivatives; resized to match @p vars
     * @param timeStep Offset of @p vars from the current time, for diagnostics
     * @return An error message, or std::nullopt on success
     */
    virtual std::optional<std::string> evaluate(const std::vector<double>& vars,
                                                std::vector<double>& change,
                                                double timeStep) = 0;

    /** @brief Pushes the VarsList values into the bodies */
    virtual void modifyObjects() = 0;
};

/**
 * @class IEnergySystem
 * @brief Reports the total energy of the bodies as last set by modifyObjects()
 */
class IEnergySystem {
public:
    virtual ~IEnergySystem() = default;
    virtual double getTotalEnergy() const = 0;
};

class IOdeSolver {
public:
    virtual ~IOdeSolver() = default;

    /**
     * @brief Advances the sim's variables by @p stepSize
     * @return An error message, or std::nullopt on success
     */
    virtual std::optional<std::string> step(double stepSize) = 0;

    virtual std::string getName() const = 0;
};

/**
 * @brief Classic fourth order Runge-Kutta
 */
class RungeKutta : public IOdeSolver {
public:
    explicit RungeKutta(IOdeSim& sim);

    std::optional<std::string> step(double stepSize) override;
    std::string getName() const override { return "RUNGE_KUTTA"; }

private:
    IOdeSim& sim;
    std::vector<double> inp, k1, k2, k3, k4;
};

/**
 * @brief Heun's method: average of the slopes at both ends of the step
 */
class ModifiedEuler : public IOdeSolver {
public:
    explicit ModifiedEuler(IOdeSim& sim);

    std::optional<std::string> step(double stepSize) override;
    std::string getName() const override { return "MODIFIED_EULER"; }

private:
    IOdeSim& sim;
    std::vector<double> inp, k1, k2;
};

class EulersMethod : public IOdeSolver {
public:
    explicit EulersMethod(IOdeSim& sim);

    std::optional<std::string> step(double stepSize) override;
    std::string getName() const override { return "EULERS_METHOD"; }

private:
    IOdeSim& sim;
    std::vector<double> k1;
};

/**
 * @class AdaptiveStepSolver
 * @brief Repeats each step with smaller sub-steps until the energy settles
 *
 * Every try starts again from the state at the start of the step and divides
 * the sub-step by five. With second differences (the default) the step is
 * accepted once the change in energy over the step stops changing between
 * tries, which also works for systems that gain or lose energy. Without them
 * the change in energy itself must fall below the tolerance.
 */
class AdaptiveStepSolver : public IOdeSolver {
public:
    /** @throws std::invalid_argument for a null solver */
    AdaptiveStepSolver(IOdeSim& sim, IEnergySystem& energy, std::unique_ptr<IOdeSolver> solver);

    std::optional<std::string> step(double stepSize) override;
    std::string getName() const override { return "ADAPTIVE_" + solver->getName(); }

    bool getSecondDiff() const { return secondDiff; }
    void setSecondDiff(bool value) { secondDiff = value; }
    double getTolerance() const { return tolerance; }
    void setTolerance(double value) { tolerance = value; }

    /** @brief Sub-steps of the accepted tries, summed over all steps */
    long getTotalSteps() const { return totalSteps; }

private:
    IOdeSim& sim;
    IEnergySystem& energy;
    std::unique_ptr<IOdeSolver> solver;
    bool secondDiff = true;
    double tolerance = 1e-6;
    long totalSteps = 0;
};

enum class SolverType {
    RUNGE_KUTTA,
    MODIFIED_EULER,
    EULERS_METHOD,
    ADAPTIVE        // adaptive steps around Runge-Kutta
};

/** @throws std::invalid_argument for an unknown name */
SolverType solverFromName(const std::string& name);

/**
 * @param energy Needed by SolverType::ADAPTIVE only
 * @throws std::invalid_argument for ADAPTIVE without an energy system
 */
std::unique_ptr<IOdeSolver> makeSolver(SolverType type, IOdeSim& sim,
                                       IEnergySystem* energy = nullptr);

} // namespace Integration
