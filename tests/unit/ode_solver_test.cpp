#include <gtest/gtest.h>
#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "rigid2d/integration/ode_solver.hpp"

using namespace Integration;

namespace {

// x'' = -x, using the x and vx slots of one body
class Oscillator : public IOdeSim, public IEnergySystem {
public:
    Oscillator() {
        idx = vars.addBody("mass");
        vars.setValue(idx + VarsList::X_, 1.0);
    }

    VarsList& getVarsList() override { return vars; }

    std::optional<std::string> evaluate(const std::vector<double>& values,
                                        std::vector<double>& change,
                                        double) override {
        ++evaluations;
        if (failAfter >= 0 && evaluations > failAfter) {
            return std::string("forced failure");
        }
        change.assign(values.size(), 0.0);
        change[VarsList::TimeIndex] = 1.0;
        change[idx + VarsList::X_] = values[idx + VarsList::VX_];
        change[idx + VarsList::VX_] = -values[idx + VarsList::X_];
        return std::nullopt;
    }

    void modifyObjects() override {}

    double getTotalEnergy() const override {
        double const x = vars.getValue(idx + VarsList::X_);
        double const v = vars.getValue(idx + VarsList::VX_);
        return (x * x + v * v) / 2;
    }

    double x() const { return vars.getValue(idx + VarsList::X_); }

    VarsList vars;
    int idx = 0;
    int evaluations = 0;
    int failAfter = -1;
};

double integrate(IOdeSolver& solver, Oscillator& sim, double h, int steps) {
    for (int i = 0; i < steps; ++i) {
        EXPECT_FALSE(solver.step(h).has_value());
    }
    return std::fabs(sim.x() - std::cos(sim.vars.getTime()));
}

} // namespace

TEST(OdeSolverTest, RungeKuttaIsFourthOrder) {
    Oscillator sim;
    RungeKutta rk(sim);
    double const err = integrate(rk, sim, 0.01, 100);
    EXPECT_NEAR(sim.vars.getTime(), 1.0, 1e-12);
    EXPECT_LT(err, 1e-8);
    EXPECT_EQ(sim.evaluations, 400);
}

TEST(OdeSolverTest, LowerOrderSolversAreLessAccurate) {
    Oscillator a, b, c;
    RungeKutta rk(a);
    ModifiedEuler me(b);
    EulersMethod eu(c);
    double const errRk = integrate(rk, a, 0.05, 20);
    double const errMe = integrate(me, b, 0.05, 20);
    double const errEu = integrate(eu, c, 0.05, 20);
    EXPECT_LT(errRk, errMe);
    EXPECT_LT(errMe, errEu);
    EXPECT_LT(errMe, 1e-3);
}

TEST(OdeSolverTest, EvaluateErrorStopsTheStep) {
    Oscillator sim;
    sim.failAfter = 2;
    RungeKutta rk(sim);
    auto err = rk.step(0.1);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "forced failure");
    EXPECT_EQ(sim.evaluations, 3);
    // the variables were not written
    EXPECT_DOUBLE_EQ(sim.vars.getTime(), 0.0);
}

TEST(OdeSolverTest, SolverByName) {
    Oscillator sim;
    EXPECT_EQ(solverFromName("runge_kutta"), SolverType::RUNGE_KUTTA);
    EXPECT_EQ(solverFromName("MODIFIED_EULER"), SolverType::MODIFIED_EULER);
    EXPECT_THROW(solverFromName("verlet"), std::invalid_argument);
    EXPECT_EQ(makeSolver(SolverType::EULERS_METHOD, sim)->getName(), "EULERS_METHOD");
    EXPECT_EQ(makeSolver(SolverType::RUNGE_KUTTA, sim)->getName(), "RUNGE_KUTTA");
    EXPECT_EQ(solverFromName("adaptive"), SolverType::ADAPTIVE);
    EXPECT_THROW(makeSolver(SolverType::ADAPTIVE, sim), std::invalid_argument);
    EXPECT_EQ(makeSolver(SolverType::ADAPTIVE, sim, &sim)->getName(), "ADAPTIVE_RUNGE_KUTTA");
}

TEST(OdeSolverTest, AdaptiveStepsShrinkUntilEnergyHolds) {
    Oscillator sim;
    AdaptiveStepSolver adaptive(sim, sim, std::make_unique<EulersMethod>(sim));
    adaptive.setSecondDiff(false);
    EXPECT_EQ(adaptive.getName(), "ADAPTIVE_EULERS_METHOD");

    double const e0 = sim.getTotalEnergy();
    EXPECT_FALSE(adaptive.step(0.1).has_value());
    EXPECT_NEAR(sim.vars.getTime(), 0.1, 1e-9);
    EXPECT_LT(std::fabs(sim.getTotalEnergy() - e0), adaptive.getTolerance());
    // plain Euler gains energy h/2 per unit time, so only tiny steps pass
    EXPECT_GT(adaptive.getTotalSteps(), 1000);

    Oscillator plain;
    EulersMethod euler(plain);
    EXPECT_FALSE(euler.step(0.1).has_value());
    EXPECT_GT(std::fabs(plain.getTotalEnergy() - e0), 1e-3);
}

TEST(OdeSolverTest, AdaptiveSecondDifferenceStopsOnSecondTry) {
    Oscillator sim;
    AdaptiveStepSolver adaptive(sim, sim, std::make_unique<RungeKutta>(sim));
    EXPECT_TRUE(adaptive.getSecondDiff());

    EXPECT_FALSE(adaptive.step(0.1).has_value());
    // one full step, then five fifths that agree with it on energy
    EXPECT_EQ(adaptive.getTotalSteps(), 5);
    EXPECT_EQ(sim.evaluations, 4 + 5 * 4);
    EXPECT_NEAR(sim.x(), std::cos(0.1), 1e-10);
}

TEST(OdeSolverTest, AdaptivePassesOnSolverErrors) {
    Oscillator sim;
    sim.failAfter = 1;
    AdaptiveStepSolver adaptive(sim, sim, std::make_unique<RungeKutta>(sim));
    auto err = adaptive.step(0.1);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(*err, "forced failure");
    EXPECT_THROW(AdaptiveStepSolver(sim, sim, nullptr), std::invalid_argument);
}
