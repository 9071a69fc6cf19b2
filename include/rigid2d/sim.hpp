/**
 * @file sim.hpp
 * @brief Owns the registry, the collision sim and the advance strategy of a scenario
 */

#pragma once

#include <memory>

#include <entt/entt.hpp>

#include "rigid2d/core/advance_strategy.hpp"
#include "rigid2d/core/collision_advance.hpp"
#include "rigid2d/scenarios/i_scenario.hpp"
#include "rigid2d/systems/impulse_sim.hpp"

/**
 * @class Simulator
 * @brief Builds a scenario and moves it forward one time step per tick
 */
class Simulator {
 public:
  Simulator();
  ~Simulator();

  /**
   * @brief Loads a scenario and builds it with its own configuration
   * @param scenario A unique pointer to the scenario object.
   */
  void loadScenario(std::unique_ptr<IScenario> scenario);

  /**
   * @brief Replaces the configuration and rebuilds the current scenario with it
   * @throws std::invalid_argument for an invalid engine config
   */
  void applyConfig(const ScenarioConfig& cfg);

  /**
   * @brief Clears the registry and creates the scenario again from scratch
   */
  void reset();

  /**
   * @brief Advances the sim by the configured time step
   * @throws Engine::AdvanceException when the step fails
   */
  void tick();

  /**
   * @brief Ticks until the sim time reaches @p time
   * @return The number of ticks taken
   */
  int runUntil(double time);

  double getTime() const;
  Systems::EnergyInfo getEnergyInfo() const;

  entt::registry& getRegistry();
  const entt::registry& getRegistry() const;

  /** @note This call requires that a scenario has been loaded. */
  Systems::ImpulseSim& getSim() const;
  Engine::IAdvanceStrategy& getAdvanceStrategy() const;

  /** @brief The strategy as a CollisionAdvance, or null for a SimpleAdvance */
  Engine::CollisionAdvance* getCollisionAdvance() const;

  const ScenarioConfig& getConfig() const { return currentConfig; }

  /** @note This call requires that a scenario has been loaded. */
  IScenario& getCurrentScenario() const;

 private:
  entt::registry registry;
  std::unique_ptr<IScenario> scenarioPtr;
  std::unique_ptr<Systems::ImpulseSim> sim;
  std::unique_ptr<Engine::IAdvanceStrategy> strategy;
  ScenarioConfig currentConfig;

  /**
   * @brief Creates the sim, its force laws and the strategy according to current config
   */
  void createSystems();
};
