/**
 * @file impulse_sim.hpp
 * @brief Rigid body ODE sim that resolves collisions with impulses only
 */

#pragma once

#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/core/sim_config.hpp"
#include "rigid2d/core/vars_list.hpp"
#include "rigid2d/forces/force_law.hpp"
#include "rigid2d/systems/i_collision_sim.hpp"
#include "rigid2d/systems/i_system.hpp"

namespace Systems {

struct EnergyInfo {
    double potential = 0.0;
    double translational = 0.0;
    double rotational = 0.0;

    double total() const { return potential + translational + rotational; }
};

/**
 * @class ImpulseSim
 * @brief Integrates the bodies of a registry under a list of force laws
 *
 * Each body added owns six slots of the VarsList. Fixed bodies get slots too
 * but their derivative is always zero. Contacts are not given forces: a body
 * resting on another keeps colliding with it, so resting states are only
 * reached by the contact sim.
 */
class ImpulseSim : public ICollisionSim, public Integration::IEnergySystem,
                   public ConfigurableSystem<EngineConfig> {
public:
    explicit ImpulseSim(entt::registry& registry);

    /**
     * @brief Gives the body slots in the state vector, copying its current
     *        components there
     * @throws std::invalid_argument if the entity is not a rigid body
     */
    void addBody(entt::entity body);

    const std::vector<entt::entity>& getBodies() const { return bodies; }

    /**
     * @brief Copies a body's components back into its slots
     *
     * Use after changing a body's position or velocity directly.
     */
    void initializeFromBody(entt::entity body);

    /**
     * @throws std::invalid_argument when adding a second gravity or damping law
     */
    void addForceLaw(const std::shared_ptr<IForceLaw>& law);
    bool removeForceLaw(const std::shared_ptr<IForceLaw>& law);
    void clearForceLaws() { forceLaws.clear(); }
    const ForceLawList& getForceLaws() const { return forceLaws; }

    void setRandomSeed(unsigned int seed);
    unsigned int getRandomSeed() const { return specificConfig.randomSeed; }

    void setSpecificConfig(const EngineConfig& config) override;

    EnergyInfo getEnergyInfo() const;
    double getTotalEnergy() const override { return getEnergyInfo().total(); }

    /** @brief Sets the body components from a state vector */
    void moveObjects(const std::vector<double>& vars);

    /**
     * @brief Adds the effect of a force on its body to a derivative
     *
     * Forces on bodies outside this sim and on fixed bodies are ignored.
     */
    void applyForce(std::vector<double>& change, const Force& force) const;

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

    // IOdeSim
    VarsList& getVarsList() override { return vars; }
    std::optional<std::string> evaluate(const std::vector<double>& values,
                                        std::vector<double>& change,
                                        double timeStep) override;
    void modifyObjects() override;

    // ICollisionSim
    void findCollisions(RigidBodyCollision::CollisionList& collisions,
                        const std::vector<double>& values,
                        double stepSize) override;
    bool handleCollisions(RigidBodyCollision::CollisionList& collisions,
                          RigidBodyCollision::CollisionTotals* totals) override;
    void updateCollision(RigidBodyCollision::CollisionRecord& c, double time) override;
    RigidBodyCollision::CollisionList takeEvaluateCollisions() override;
    void saveState() override;
    void restoreState() override;
    void saveInitialState() override;
    void reset() override;
    double getTime() const override { return vars.getTime(); }

protected:
    entt::registry& registry;
    VarsList vars;
    std::vector<entt::entity> bodies;
    ForceLawList forceLaws;
    std::mt19937 rng;
    std::vector<double> initialState;
    RigidBodyCollision::CollisionList evaluateCollisions;
};

} // namespace Systems
