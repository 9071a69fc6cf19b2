/**
 * @fileoverview sim.cpp
 * @brief Implementation of Simulator.
 */

#include "rigid2d/sim.hpp"

#include <memory>
#include <stdexcept>

#include "rigid2d/components/body.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"
#include "rigid2d/core/simple_advance.hpp"
#include "rigid2d/forces/damping.hpp"
#include "rigid2d/forces/gravity.hpp"
#include "rigid2d/systems/contact_sim.hpp"

Simulator::Simulator() = default;

Simulator::~Simulator() = default;

void Simulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  if (!scenario) {
    throw std::invalid_argument("loadScenario: null scenario");
  }
  scenarioPtr = std::move(scenario);
  currentConfig = scenarioPtr->getConfig();
  reset();
}

void Simulator::applyConfig(const ScenarioConfig& cfg) {
  currentConfig = cfg;
  reset();
}

void Simulator::createSystems() {
  // the strategy refers to the sim, so it goes first
  strategy.reset();
  if (currentConfig.contactForces) {
    sim = std::make_unique<Systems::ContactSim>(registry);
  } else {
    sim = std::make_unique<Systems::ImpulseSim>(registry);
  }
  sim->setSpecificConfig(currentConfig.engineConfig);

  if (currentConfig.useGravity) {
    auto gravity = std::make_shared<Systems::GravityLaw>();
    gravity->setSpecificConfig(currentConfig.gravityConfig);
    sim->addForceLaw(gravity);
  }
  if (currentConfig.useDamping) {
    auto damping = std::make_shared<Systems::DampingLaw>();
    damping->setSpecificConfig(currentConfig.dampingConfig);
    sim->addForceLaw(damping);
  }

  const EngineConfig& engine = currentConfig.engineConfig;
  if (currentConfig.detectCollisions) {
    auto advance = std::make_unique<Engine::CollisionAdvance>(
        *sim, Integration::makeSolver(engine.solver, *sim, sim.get()));
    advance->setJointSmallImpacts(engine.jointSmallImpacts);
    strategy = std::move(advance);
  } else {
    strategy = std::make_unique<Engine::SimpleAdvance>(
        *sim, Integration::makeSolver(engine.solver, *sim, sim.get()));
  }
  strategy->setTimeStep(engine.timeStep);
}

void Simulator::reset() {
  PROFILE_SCOPE("Simulator::reset");
  strategy.reset();
  sim.reset();
  registry.clear();

  createSystems();

  if (scenarioPtr) {
    scenarioPtr->createEntities(registry, *sim);
  }
  for (auto body : sim->getBodies()) {
    Bodies::setTolerances(registry, body, currentConfig.distanceTol,
                          currentConfig.velocityTol, currentConfig.collisionAccuracy);
  }
  sim->modifyObjects();
  strategy->save();
  RIGID2D_DEBUG_MSG(RIGID2D_DEBUG_LEVEL_BASIC,
      "Simulator: " << sim->getBodies().size() << " bodies loaded\n");
}

void Simulator::tick() {
  PROFILE_SCOPE("Simulator::tick");
  getAdvanceStrategy().advance(currentConfig.engineConfig.timeStep);
}

int Simulator::runUntil(double time) {
  int ticks = 0;
  // half a step of slack so rounding does not add a tick
  while (getTime() < time - 0.5 * currentConfig.engineConfig.timeStep) {
    tick();
    ++ticks;
  }
  return ticks;
}

double Simulator::getTime() const {
  return getSim().getTime();
}

Systems::EnergyInfo Simulator::getEnergyInfo() const {
  return getSim().getEnergyInfo();
}

entt::registry& Simulator::getRegistry() {
  return registry;
}

const entt::registry& Simulator::getRegistry() const {
  return registry;
}

Systems::ImpulseSim& Simulator::getSim() const {
  if (!sim) {
    throw std::logic_error("Simulator: no scenario loaded");
  }
  return *sim;
}

Engine::IAdvanceStrategy& Simulator::getAdvanceStrategy() const {
  if (!strategy) {
    throw std::logic_error("Simulator: no scenario loaded");
  }
  return *strategy;
}

Engine::CollisionAdvance* Simulator::getCollisionAdvance() const {
  return dynamic_cast<Engine::CollisionAdvance*>(strategy.get());
}

IScenario& Simulator::getCurrentScenario() const {
  if (!scenarioPtr) {
    throw std::logic_error("Simulator: no scenario loaded");
  }
  return *scenarioPtr;
}
