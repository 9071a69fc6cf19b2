#include "rigid2d/integration/ode_solver.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "rigid2d/core/profile.hpp"

namespace Integration {

namespace {

// out = base + h·k
void axpy(const std::vector<double>& base, const std::vector<double>& k,
          double h, std::vector<double>& out) {
    out.resize(base.size());
    for (size_t i = 0; i < base.size(); ++i) {
        out[i] = base[i] + h * k[i];
    }
}

} // namespace

RungeKutta::RungeKutta(IOdeSim& sim) : sim(sim) {}

std::optional<std::string> RungeKutta::step(double stepSize) {
    PROFILE_SCOPE("RungeKutta::step");
    VarsList& va = sim.getVarsList();
    std::vector<double> vars = va.getValues();
    size_t const n = vars.size();

    if (auto err = sim.evaluate(vars, k1, 0.0)) {
        return err;
    }
    axpy(vars, k1, stepSize / 2, inp);
    if (auto err = sim.evaluate(inp, k2, stepSize / 2)) {
        return err;
    }
    axpy(vars, k2, stepSize / 2, inp);
    if (auto err = sim.evaluate(inp, k3, stepSize / 2)) {
        return err;
    }
    axpy(vars, k3, stepSize, inp);
    if (auto err = sim.evaluate(inp, k4, stepSize)) {
        return err;
    }
    for (size_t i = 0; i < n; ++i) {
        vars[i] += (k1[i] + 2 * k2[i] + 2 * k3[i] + k4[i]) * stepSize / 6.0;
    }
    va.setValues(vars);
    return std::nullopt;
}

ModifiedEuler::ModifiedEuler(IOdeSim& sim) : sim(sim) {}

std::optional<std::string> ModifiedEuler::step(double stepSize) {
    PROFILE_SCOPE("ModifiedEuler::step");
    VarsList& va = sim.getVarsList();
    std::vector<double> vars = va.getValues();

    if (auto err = sim.evaluate(vars, k1, 0.0)) {
        return err;
    }
    axpy(vars, k1, stepSize, inp);
    if (auto err = sim.evaluate(inp, k2, stepSize)) {
        return err;
    }
    for (size_t i = 0; i < vars.size(); ++i) {
        vars[i] += (k1[i] + k2[i]) * stepSize / 2.0;
    }
    va.setValues(vars);
    return std::nullopt;
}

EulersMethod::EulersMethod(IOdeSim& sim) : sim(sim) {}

std::optional<std::string> EulersMethod::step(double stepSize) {
    PROFILE_SCOPE("EulersMethod::step");
    VarsList& va = sim.getVarsList();
    std::vector<double> vars = va.getValues();

    if (auto err = sim.evaluate(vars, k1, 0.0)) {
        return err;
    }
    for (size_t i = 0; i < vars.size(); ++i) {
        vars[i] += k1[i] * stepSize;
    }
    va.setValues(vars);
    return std::nullopt;
}

AdaptiveStepSolver::AdaptiveStepSolver(IOdeSim& sim, IEnergySystem& energy,
                                       std::unique_ptr<IOdeSolver> solver)
    : sim(sim), energy(energy), solver(std::move(solver))
{
    if (!this->solver) {
        throw std::invalid_argument("AdaptiveStepSolver: null solver");
    }
}

std::optional<std::string> AdaptiveStepSolver::step(double stepSize) {
    PROFILE_SCOPE("AdaptiveStepSolver::step");
    if (stepSize < 1e-15) {
        return std::nullopt;
    }
    VarsList& va = sim.getVarsList();
    std::vector<double> const start = va.getValues();
    double const startTime = va.getTime();
    double const endTime = startTime + stepSize;
    sim.modifyObjects();
    double const startEnergy = energy.getTotalEnergy();

    double lastEnergyDiff = std::numeric_limits<double>::infinity();
    double value = std::numeric_limits<double>::infinity();
    double h = stepSize;
    bool firstTime = true;
    long steps = 0;
    do {
        if (!firstTime) {
            va.setValues(start);
            sim.modifyObjects();
            h /= 5;
            if (h < 1e-15) {
                return "AdaptiveStepSolver: time step too small " + std::to_string(h);
            }
        }
        steps = 0;
        double t = startTime;
        while (endTime - t > 1e-12) {
            double d = h;
            if (t + d > endTime - 1e-10) {
                d = endTime - t;
            }
            ++steps;
            std::optional<std::string> const err = solver->step(d);
            sim.modifyObjects();
            if (err) {
                return err;
            }
            t += d;
        }
        double const energyDiff = std::fabs(startEnergy - energy.getTotalEnergy());
        if (secondDiff) {
            if (!firstTime) {
                value = std::fabs(energyDiff - lastEnergyDiff);
            }
        } else {
            value = energyDiff;
        }
        lastEnergyDiff = energyDiff;
        firstTime = false;
    } while (value > tolerance);
    totalSteps += steps;
    return std::nullopt;
}

SolverType solverFromName(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "RUNGE_KUTTA") return SolverType::RUNGE_KUTTA;
    if (upper == "MODIFIED_EULER") return SolverType::MODIFIED_EULER;
    if (upper == "EULERS_METHOD") return SolverType::EULERS_METHOD;
    if (upper == "ADAPTIVE") return SolverType::ADAPTIVE;
    throw std::invalid_argument("unknown ODE solver: " + name);
}

std::unique_ptr<IOdeSolver> makeSolver(SolverType type, IOdeSim& sim, IEnergySystem* energy) {
    switch (type) {
        case SolverType::MODIFIED_EULER: return std::make_unique<ModifiedEuler>(sim);
        case SolverType::EULERS_METHOD:  return std::make_unique<EulersMethod>(sim);
        case SolverType::ADAPTIVE:
            if (energy == nullptr) {
                throw std::invalid_argument("makeSolver: ADAPTIVE needs an energy system");
            }
            return std::make_unique<AdaptiveStepSolver>(sim, *energy,
                                                        std::make_unique<RungeKutta>(sim));
        case SolverType::RUNGE_KUTTA:    break;
    }
    return std::make_unique<RungeKutta>(sim);
}

} // namespace Integration
