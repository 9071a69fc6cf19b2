#include "rigid2d/forces/damping.hpp"

#include "rigid2d/components/basic.hpp"
#include "rigid2d/core/constants.hpp"

namespace Systems {

DampingLaw::DampingLaw(double damping, double rotateRatio) {
    specificConfig.damping = damping;
    specificConfig.rotateRatio = rotateRatio;
}

std::vector<Force> DampingLaw::calculateForces(const entt::registry& registry) const {
    std::vector<Force> forces;
    if (specificConfig.damping == 0.0) {
        return forces;
    }
    auto view = registry.view<Components::Position, Components::Velocity,
                              Components::AngularVelocity, Components::Mass>();
    for (auto entity : view) {
        if (SimulatorConstants::isInfiniteMass(view.get<Components::Mass>(entity).value)) {
            continue;
        }
        const auto& v = view.get<Components::Velocity>(entity);
        double const w = view.get<Components::AngularVelocity>(entity).omega;
        Force f;
        f.body = entity;
        f.location = Vector(view.get<Components::Position>(entity));
        f.vector = v * -specificConfig.damping;
        f.torque = -specificConfig.damping * specificConfig.rotateRatio * w;
        f.name = "damping";
        forces.push_back(f);
    }
    return forces;
}

} // namespace Systems
