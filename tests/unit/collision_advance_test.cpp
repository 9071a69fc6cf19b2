#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>
#include "rigid2d/components/basic.hpp"
#include "rigid2d/core/collision_advance.hpp"
#include "rigid2d/core/constants.hpp"
#include "rigid2d/core/simple_advance.hpp"
#include "rigid2d/forces/gravity.hpp"
#include "rigid2d/forces/spring.hpp"
#include "rigid2d/geometry/shapes.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/scenarios/scenario_factory.hpp"
#include "rigid2d/sim.hpp"

using namespace Engine;
using RigidBodyCollision::CollisionList;
using RigidBodyCollision::CollisionRecord;

namespace {

/**
 * One body sliding along x. In STUCK mode every step that moves time forward
 * reports a penetration that no impulse can fix; in CRASH mode evaluate() fails.
 * DEGENERATE throws from detection, OVERFLOW drives x to infinity, and
 * BAD_IMPULSE answers the STUCK penetration with a NaN velocity.
 */
class ScriptedSim : public Systems::ICollisionSim {
public:
    enum class Mode { FREE, STUCK, CRASH, DEGENERATE, OVERFLOW, BAD_IMPULSE };

    explicit ScriptedSim(Mode mode) : mode(mode) {
        idx = vars.addBody("slider");
        vars.setValue(idx + VarsList::VX_, 1.0);
    }

    VarsList& getVarsList() override { return vars; }

    std::optional<std::string> evaluate(const std::vector<double>& values,
                                        std::vector<double>& change, double) override {
        if (mode == Mode::CRASH) {
            return std::string("solver blew up");
        }
        change.assign(values.size(), 0.0);
        change[VarsList::TimeIndex] = 1.0;
        change[idx + VarsList::X_] = mode == Mode::OVERFLOW
            ? std::numeric_limits<double>::infinity()
            : values[idx + VarsList::VX_];
        return std::nullopt;
    }

    void modifyObjects() override { ++modified; }

    void findCollisions(CollisionList& collisions, const std::vector<double>& values,
                        double) override {
        if (mode == Mode::DEGENERATE) {
            throw std::runtime_error("concentric circles");
        }
        bool const penetrates = mode == Mode::STUCK || mode == Mode::BAD_IMPULSE;
        if (!penetrates || values[VarsList::TimeIndex] <= savedTime) {
            return;
        }
        CollisionRecord c;
        c.primaryVertex = 0;
        c.distance = -0.001;
        c.normalVelocity = -1.0;
        c.setDetectedTime(values[VarsList::TimeIndex]);
        collisions.push_back(c);
    }

    bool handleCollisions(CollisionList&, RigidBodyCollision::CollisionTotals*) override {
        ++handled;
        if (mode == Mode::BAD_IMPULSE) {
            vars.setValue(idx + VarsList::VX_, std::numeric_limits<double>::quiet_NaN());
            return true;
        }
        return false;
    }

    void updateCollision(CollisionRecord& c, double) override {
        // BAD_IMPULSE backs up to just inside the target gap so the record is handled
        c.distance = mode == Mode::BAD_IMPULSE ? 0.006 : 0.02;
        c.estimate = CollisionRecord::NaN;
    }

    CollisionList takeEvaluateCollisions() override { return {}; }

    void saveState() override {
        vars.saveState();
        savedTime = vars.getTime();
    }
    void restoreState() override { vars.restoreState(); }
    void saveInitialState() override { initial = vars.getValues(); }
    void reset() override {
        if (!initial.empty()) vars.setValues(initial);
    }
    double getTime() const override { return vars.getTime(); }

    double x() const { return vars.getValue(idx + VarsList::X_); }

    Mode mode;
    VarsList vars;
    int idx = 0;
    int modified = 0;
    int handled = 0;
    double savedTime = -1.0;
    std::vector<double> initial;
};

class TimeLog : public MemoList {
public:
    explicit TimeLog(const Engine::IAdvanceStrategy& strategy) : strategy(strategy) {}
    void memorize() override { times.push_back(strategy.getTime()); }

    const Engine::IAdvanceStrategy& strategy;
    std::vector<double> times;
};

entt::entity findBody(const entt::registry& registry, const std::string& name) {
    auto view = registry.view<Components::BodyInfo>();
    for (auto e : view) {
        if (view.get<Components::BodyInfo>(e).name == name) {
            return e;
        }
    }
    return entt::null;
}

Vector positionOf(const Simulator& simulator, const std::string& name) {
    entt::entity const e = findBody(simulator.getRegistry(), name);
    return Vector(simulator.getRegistry().get<Components::Position>(e));
}

} // namespace

TEST(CollisionAdvanceTest, FreeMotionTakesOneStep) {
    ScriptedSim sim(ScriptedSim::Mode::FREE);
    CollisionAdvance advance(sim);
    TimeLog log(advance);

    advance.advance(0.025, &log);
    EXPECT_NEAR(advance.getTime(), 0.025, 1e-15);
    EXPECT_NEAR(sim.x(), 0.025, 1e-15);
    ASSERT_EQ(log.times.size(), 1u);
    EXPECT_EQ(advance.getCollisionTotals().getSteps(), 1);
    EXPECT_TRUE(advance.getCollisions().empty());
}

TEST(CollisionAdvanceTest, TinyStepOnlyRefreshesObjects) {
    ScriptedSim sim(ScriptedSim::Mode::FREE);
    CollisionAdvance advance(sim);
    advance.advance(1e-17);
    EXPECT_DOUBLE_EQ(advance.getTime(), 0.0);
    EXPECT_EQ(sim.modified, 1);
}

TEST(CollisionAdvanceTest, UnresolvableCollisionIsStuck) {
    ScriptedSim sim(ScriptedSim::Mode::STUCK);
    CollisionAdvance advance(sim);

    try {
        advance.advance(0.025);
        FAIL() << "expected the advance to get stuck";
    } catch (const AdvanceException& e) {
        EXPECT_EQ(e.getKind(), AdvanceError::STUCK);
        EXPECT_EQ(std::string(e.what()).rfind("STUCK: ", 0), 0u);
    }
    // the state from before the call is back
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);
    EXPECT_DOUBLE_EQ(sim.x(), 0.0);
}

TEST(CollisionAdvanceTest, SolverFailureWithoutRecordsIsIntegratorError) {
    ScriptedSim sim(ScriptedSim::Mode::CRASH);
    CollisionAdvance advance(sim);
    AdvanceResult r = advance.tryAdvance(0.025);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(*r.error, AdvanceError::INTEGRATOR);
    EXPECT_NE(r.message.find("solver blew up"), std::string::npos);
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);
}

TEST(CollisionAdvanceTest, DetectionErrorRestoresStateAndIsReported) {
    ScriptedSim sim(ScriptedSim::Mode::DEGENERATE);
    CollisionAdvance advance(sim);
    AdvanceResult r = advance.tryAdvance(0.025);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(*r.error, AdvanceError::ILLEGAL_STATE);
    EXPECT_NE(r.message.find("concentric circles"), std::string::npos);
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);
    EXPECT_DOUBLE_EQ(sim.x(), 0.0);

    EXPECT_THROW(advance.advance(0.025), AdvanceException);
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);
}

TEST(CollisionAdvanceTest, OverflowingStepIsIntegratorError) {
    ScriptedSim sim(ScriptedSim::Mode::OVERFLOW);
    CollisionAdvance advance(sim);
    AdvanceResult r = advance.tryAdvance(0.025);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(*r.error, AdvanceError::INTEGRATOR);
    EXPECT_NE(r.message.find("after ode step"), std::string::npos);
    EXPECT_TRUE(sim.getVarsList().allFinite());
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);

    ScriptedSim other(ScriptedSim::Mode::OVERFLOW);
    SimpleAdvance simple(other);
    EXPECT_THROW(simple.advance(0.025), AdvanceException);
    EXPECT_TRUE(other.getVarsList().allFinite());
}

TEST(CollisionAdvanceTest, NonFiniteImpulseIsIntegratorError) {
    ScriptedSim sim(ScriptedSim::Mode::BAD_IMPULSE);
    CollisionAdvance advance(sim);
    AdvanceResult r = advance.tryAdvance(0.025);
    ASSERT_FALSE(r.ok());
    EXPECT_GT(sim.handled, 0);
    EXPECT_EQ(*r.error, AdvanceError::INTEGRATOR);
    EXPECT_NE(r.message.find("after collision handling"), std::string::npos);
    EXPECT_DOUBLE_EQ(sim.getVarsList().getValue(sim.idx + VarsList::VX_), 1.0);
    EXPECT_DOUBLE_EQ(sim.getTime(), 0.0);
}

TEST(CollisionAdvanceTest, SimpleAdvanceSteps) {
    ScriptedSim sim(ScriptedSim::Mode::FREE);
    SimpleAdvance advance(sim);
    TimeLog log(advance);
    advance.advance(0.1, &log);
    EXPECT_NEAR(sim.x(), 0.1, 1e-15);
    EXPECT_EQ(log.times.size(), 1u);

    ScriptedSim broken(ScriptedSim::Mode::CRASH);
    SimpleAdvance failing(broken);
    EXPECT_THROW(failing.advance(0.1), AdvanceException);
    EXPECT_DOUBLE_EQ(broken.getTime(), 0.0);
}

TEST(CollisionAdvanceTest, Settings) {
    ScriptedSim sim(ScriptedSim::Mode::FREE);
    CollisionAdvance advance(sim);
    EXPECT_THROW(advance.setTimeStep(0.0), std::invalid_argument);
    EXPECT_THROW(advance.setTimeStep(-0.1), std::invalid_argument);
    advance.setTimeStep(0.01);
    EXPECT_DOUBLE_EQ(advance.getTimeStep(), 0.01);
    EXPECT_THROW(advance.setOdeSolver(nullptr), std::invalid_argument);
    advance.setOdeSolver(std::make_unique<Integration::ModifiedEuler>(sim));
    EXPECT_EQ(advance.getOdeSolver().getName(), "MODIFIED_EULER");

    advance.save();
    advance.advance(0.5);
    advance.reset();
    EXPECT_DOUBLE_EQ(advance.getTime(), 0.0);
}

TEST(CollisionAdvanceTest, DebugLevelsChooseWayPoints) {
    ScriptedSim sim(ScriptedSim::Mode::FREE);
    CollisionAdvance advance(sim);
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::STUCK));
    EXPECT_FALSE(advance.printsWayPoint(WayPoint::SUMMARY));

    advance.setDebugLevel(DebugLevel::LOW);
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::SUMMARY));
    EXPECT_FALSE(advance.printsWayPoint(WayPoint::START));

    advance.setDebugLevel(DebugLevel::OPTIMAL);
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::NEXT_STEP_BINARY));
    EXPECT_FALSE(advance.printsWayPoint(WayPoint::START));

    advance.setDebugLevel(DebugLevel::HIGH);
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::START));
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::NEXT_STEP_FULL));

    advance.setDebugLevel(DebugLevel::CUSTOM);
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::SMALL_IMPACTS));
    EXPECT_FALSE(advance.printsWayPoint(WayPoint::STUCK));
    advance.addWayPoints({WayPoint::MAYBE_STUCK});
    EXPECT_TRUE(advance.printsWayPoint(WayPoint::MAYBE_STUCK));

    EXPECT_EQ(debugLevelFromName("medium"), DebugLevel::MEDIUM);
    EXPECT_THROW(debugLevelFromName("verbose"), std::invalid_argument);
    EXPECT_EQ(wayPointName(WayPoint::ESTIMATE_IN_PAST), "ESTIMATE_IN_PAST");
}

TEST(CollisionAdvanceTest, SpringOscillatorKeepsItsEnergy) {
    entt::registry registry;
    Systems::ImpulseSim sim(registry);
    auto ball = Shapes::createBall(registry, "ball", 0.25);
    Bodies::setPose(registry, ball, Vector(0.0, -1.0), 0.0);
    Bodies::setVelocity(registry, ball, Vector(0.5, 0.0), 0.0);
    sim.addBody(ball);
    sim.addForceLaw(std::make_shared<Systems::GravityLaw>(9.8));
    sim.addForceLaw(std::make_shared<Systems::Spring>(
        ball, Vector(0.0, 0.0), entt::null, Vector(0.0, 1.0), 1.5, 4.0));

    CollisionAdvance advance(sim);
    double const e0 = sim.getEnergyInfo().total();
    for (int i = 0; i < 400; ++i) {
        advance.advance(0.025);
    }
    EXPECT_NEAR(advance.getTime(), 10.0, 1e-9);
    EXPECT_NEAR(sim.getEnergyInfo().total(), e0, 1e-4);
    EXPECT_EQ(advance.getCollisionTotals().getCollisions(), 0);
}

TEST(CollisionAdvanceTest, BallAndBlockConservesMomentumAndEnergy) {
    Simulator simulator;
    simulator.loadScenario(makeScenario(SimulatorConstants::ScenarioType::BALL_AND_BLOCK));
    double const e0 = simulator.getEnergyInfo().total();

    TimeLog log(simulator.getAdvanceStrategy());
    double last = simulator.getTime();
    while (simulator.getTime() < 3.0 - 0.0125) {
        simulator.getAdvanceStrategy().advance(0.025, &log);
        EXPECT_GE(simulator.getTime(), last);
        last = simulator.getTime();
    }
    EXPECT_NEAR(simulator.getTime(), 3.0, 1e-9);
    for (size_t i = 1; i < log.times.size(); ++i) {
        EXPECT_GT(log.times[i], log.times[i - 1]);
    }

    Vector const ball = positionOf(simulator, "ball");
    Vector const block = positionOf(simulator, "block");
    // equal masses, so the midpoint moves with the initial ball velocity / 2
    EXPECT_NEAR(ball.x + block.x, 1.0, 1e-9);
    EXPECT_NEAR(ball.y + block.y, -1.0, 1e-9);
    EXPECT_NEAR(ball.x, -1.135972, 1e-3);
    EXPECT_NEAR(ball.y, 1.181265, 1e-3);
    EXPECT_NEAR(block.x, 2.135972, 1e-3);
    EXPECT_NEAR(block.y, -2.181265, 1e-3);

    EXPECT_NEAR(simulator.getEnergyInfo().total(), e0, 1e-5);
    ASSERT_NE(simulator.getCollisionAdvance(), nullptr);
    EXPECT_EQ(simulator.getCollisionAdvance()->getCollisionTotals().getCollisions(), 1);
}

TEST(CollisionAdvanceTest, SameSeedSameTrajectory) {
    Simulator a, b;
    a.loadScenario(makeScenario(SimulatorConstants::ScenarioType::BALL_AND_BLOCK));
    b.loadScenario(makeScenario(SimulatorConstants::ScenarioType::BALL_AND_BLOCK));
    a.runUntil(3.0);
    b.runUntil(3.0);
    Vector const pa = positionOf(a, "ball");
    Vector const pb = positionOf(b, "ball");
    EXPECT_DOUBLE_EQ(pa.x, pb.x);
    EXPECT_DOUBLE_EQ(pa.y, pb.y);
    const auto& ta = a.getCollisionAdvance()->getCollisionTotals();
    const auto& tb = b.getCollisionAdvance()->getCollisionTotals();
    EXPECT_EQ(ta.getSteps(), tb.getSteps());
    EXPECT_EQ(ta.getBackups(), tb.getBackups());
    EXPECT_EQ(ta.getCollisions(), 1);
    EXPECT_EQ(tb.getCollisions(), 1);
    EXPECT_EQ(ta.getSearches(), 0);
    EXPECT_EQ(tb.getSearches(), 0);
}

TEST(CollisionAdvanceTest, BouncingBallWithoutContactForcesFails) {
    Simulator simulator;
    simulator.loadScenario(makeScenario(SimulatorConstants::ScenarioType::DROPPED_BALL));
    CollisionAdvance* advance = simulator.getCollisionAdvance();
    ASSERT_NE(advance, nullptr);

    AdvanceResult result;
    while (simulator.getTime() < 15.0 && result.ok()) {
        result = advance->tryAdvance(advance->getTimeStep());
    }
    ASSERT_FALSE(result.ok());
    EXPECT_FALSE(result.message.empty());
    EXPECT_LT(simulator.getTime(), 15.0);
}
