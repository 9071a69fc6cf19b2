#include "rigid2d/forces/gravity.hpp"

#include "rigid2d/components/basic.hpp"
#include "rigid2d/core/constants.hpp"

namespace Systems {

GravityLaw::GravityLaw(double gravity) {
    specificConfig.gravity = gravity;
}

std::vector<Force> GravityLaw::calculateForces(const entt::registry& registry) const {
    std::vector<Force> forces;
    if (specificConfig.gravity == 0.0) {
        return forces;
    }
    auto view = registry.view<Components::Position, Components::Mass>();
    for (auto entity : view) {
        double const m = view.get<Components::Mass>(entity).value;
        if (SimulatorConstants::isInfiniteMass(m)) {
            continue;
        }
        Force f;
        f.body = entity;
        f.location = Vector(view.get<Components::Position>(entity));
        f.vector = Vector(0.0, -m * specificConfig.gravity);
        f.name = "gravity";
        forces.push_back(f);
    }
    return forces;
}

double GravityLaw::getPotentialEnergy(const entt::registry& registry) const {
    double pe = 0.0;
    auto view = registry.view<Components::Position, Components::Mass, Components::BodyInfo>();
    for (auto entity : view) {
        double const m = view.get<Components::Mass>(entity).value;
        if (SimulatorConstants::isInfiniteMass(m)) {
            continue;
        }
        const auto& info = view.get<Components::BodyInfo>(entity);
        double const zero = info.hasZeroEnergyLevel ? info.zeroEnergyLevel
                                                    : specificConfig.zeroEnergyLevel;
        double const y = view.get<Components::Position>(entity).y;
        pe += m * specificConfig.gravity * (y - zero);
    }
    return pe;
}

} // namespace Systems
