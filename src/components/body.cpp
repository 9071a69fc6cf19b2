#include "rigid2d/components/body.hpp"

#include <algorithm>
#include <stdexcept>

#include "rigid2d/core/constants.hpp"

namespace Bodies {

entt::entity createBody(entt::registry& registry,
                        const std::string& name,
                        std::shared_ptr<const Geometry::Polygon> polygon,
                        double mass,
                        double inertia,
                        const Vector& cmBody)
{
    if (!polygon || !polygon->isFinished()) {
        throw std::invalid_argument("createBody: body '" + name + "' needs a closed polygon");
    }
    if (!(mass > 0) || !(inertia > 0)) {
        throw std::invalid_argument("createBody: body '" + name + "' needs positive mass and inertia");
    }

    auto e = registry.create();
    registry.emplace<Components::Position>(e, 0.0, 0.0);
    registry.emplace<Components::Velocity>(e, 0.0, 0.0);
    registry.emplace<Components::AngularPosition>(e, 0.0);
    registry.emplace<Components::AngularVelocity>(e, 0.0);
    registry.emplace<Components::Mass>(e, mass);
    registry.emplace<Components::Inertia>(e, inertia);
    registry.emplace<Components::Shape>(e, Components::Shape{std::move(polygon), cmBody});
    registry.emplace<Components::Material>(e);
    registry.emplace<Components::CollisionTolerance>(e);

    Components::BodyInfo info;
    info.name = name;
    registry.emplace<Components::BodyInfo>(e, info);
    return e;
}

Geometry::Pose currentPose(const entt::registry& registry, entt::entity e) {
    const auto& pos = registry.get<Components::Position>(e);
    Geometry::Pose pose;
    pose.position = Vector(pos);
    pose.angle = registry.get<Components::AngularPosition>(e).angle;
    pose.cmBody = registry.get<Components::Shape>(e).cmBody;
    return pose;
}

std::optional<Geometry::Pose> oldPose(const entt::registry& registry, entt::entity e) {
    const auto* old = registry.try_get<Components::OldCoords>(e);
    if (old == nullptr) {
        return std::nullopt;
    }
    Geometry::Pose pose;
    pose.position = Vector(old->position);
    pose.angle = old->angle;
    pose.cmBody = registry.get<Components::Shape>(e).cmBody;
    return pose;
}

void saveOldCoords(entt::registry& registry, entt::entity e) {
    const auto& pos = registry.get<Components::Position>(e);
    double const angle = registry.get<Components::AngularPosition>(e).angle;
    registry.emplace_or_replace<Components::OldCoords>(e, Components::OldCoords{pos, angle});
}

void eraseOldCoords(entt::registry& registry, entt::entity e) {
    registry.remove<Components::OldCoords>(e);
}

void setPose(entt::registry& registry, entt::entity e, const Vector& position, double angle) {
    auto& pos = registry.get<Components::Position>(e);
    pos.x = position.x;
    pos.y = position.y;
    registry.get<Components::AngularPosition>(e).angle = angle;
}

void setVelocity(entt::registry& registry, entt::entity e, const Vector& velocity, double omega) {
    auto& vel = registry.get<Components::Velocity>(e);
    vel = velocity;
    registry.get<Components::AngularVelocity>(e).omega = omega;
}

bool isFixed(const entt::registry& registry, entt::entity e) {
    return SimulatorConstants::isInfiniteMass(registry.get<Components::Mass>(e).value);
}

double inverseMass(const entt::registry& registry, entt::entity e) {
    double const m = registry.get<Components::Mass>(e).value;
    return SimulatorConstants::isInfiniteMass(m) ? 0.0 : 1.0 / m;
}

double inverseInertia(const entt::registry& registry, entt::entity e) {
    double const I = registry.get<Components::Inertia>(e).I;
    return SimulatorConstants::isInfiniteMass(I) ? 0.0 : 1.0 / I;
}

Vector velocityAt(const entt::registry& registry, entt::entity e, const Vector& r) {
    const auto& v = registry.get<Components::Velocity>(e);
    double const w = registry.get<Components::AngularVelocity>(e).omega;
    return v + angularCross(w, r);
}

double kineticEnergy(const entt::registry& registry, entt::entity e) {
    if (isFixed(registry, e)) {
        return 0.0;
    }
    const auto& v = registry.get<Components::Velocity>(e);
    double const w = registry.get<Components::AngularVelocity>(e).omega;
    double const m = registry.get<Components::Mass>(e).value;
    double const I = registry.get<Components::Inertia>(e).I;
    return 0.5 * m * v.lengthSquared() + 0.5 * I * w * w;
}

void addNonCollide(entt::registry& registry, entt::entity a, entt::entity b) {
    auto add = [&registry](entt::entity from, entt::entity to) {
        auto& nc = registry.get_or_emplace<Components::NonCollide>(from);
        if (std::find(nc.others.begin(), nc.others.end(), to) == nc.others.end()) {
            nc.others.push_back(to);
        }
    };
    add(a, b);
    add(b, a);
}

bool canCollide(const entt::registry& registry, entt::entity a, entt::entity b) {
    if (a == b) {
        return false;
    }
    const auto* nc = registry.try_get<Components::NonCollide>(a);
    if (nc == nullptr) {
        return true;
    }
    return std::find(nc->others.begin(), nc->others.end(), b) == nc->others.end();
}

void setElasticity(entt::registry& registry, entt::entity e, double elasticity) {
    if (elasticity < 0.0 || elasticity > 1.0) {
        throw std::invalid_argument("elasticity must be in [0,1]");
    }
    registry.get<Components::Material>(e).elasticity = elasticity;
}

void setTolerances(entt::registry& registry, entt::entity e,
                   double distanceTol, double velocityTol, double accuracy)
{
    if (distanceTol < 0.0 || velocityTol < 0.0) {
        throw std::invalid_argument("tolerances must not be negative");
    }
    if (accuracy <= 0.0 || accuracy > 1.0) {
        throw std::invalid_argument("accuracy must be in (0,1]");
    }
    auto& tol = registry.get<Components::CollisionTolerance>(e);
    tol.distanceTol = distanceTol;
    tol.velocityTol = velocityTol;
    tol.accuracy = accuracy;
}

void setZeroEnergyLevel(entt::registry& registry, entt::entity e, double level) {
    auto& info = registry.get<Components::BodyInfo>(e);
    info.zeroEnergyLevel = level;
    info.hasZeroEnergyLevel = true;
}

const std::string& name(const entt::registry& registry, entt::entity e) {
    return registry.get<Components::BodyInfo>(e).name;
}

} // namespace Bodies
