/**
 * @file body.hpp
 * @brief Helpers reading and writing the rigid body components of an entity
 *
 * These are the only places that know how the Components structs combine into
 * a body: its pose, its inverse mass properties, the velocity of one of its
 * points and the pairs that never collide.
 */

#ifndef RIGID2D_BODY_HPP
#define RIGID2D_BODY_HPP

#include <memory>
#include <optional>
#include <string>

#include <entt/entt.hpp>

#include "rigid2d/components/basic.hpp"
#include "rigid2d/geometry/pose.hpp"

namespace Bodies {

/**
 * @brief Creates an entity carrying every rigid body component
 *
 * Position, velocity and angle start at zero. Pass infinity for @p mass and
 * @p inertia to make a fixed body.
 * @throws std::invalid_argument for a missing polygon or non-positive mass
 */
entt::entity createBody(entt::registry& registry,
                        const std::string& name,
                        std::shared_ptr<const Geometry::Polygon> polygon,
                        double mass,
                        double inertia,
                        const Vector& cmBody = Vector(0, 0));

Geometry::Pose currentPose(const entt::registry& registry, entt::entity e);

/** @brief Pose saved at the start of the step, if one was saved */
std::optional<Geometry::Pose> oldPose(const entt::registry& registry, entt::entity e);

/** @brief Copies the current pose into the OldCoords component */
void saveOldCoords(entt::registry& registry, entt::entity e);
void eraseOldCoords(entt::registry& registry, entt::entity e);

void setPose(entt::registry& registry, entt::entity e, const Vector& position, double angle);
void setVelocity(entt::registry& registry, entt::entity e, const Vector& velocity, double omega);

bool isFixed(const entt::registry& registry, entt::entity e);
double inverseMass(const entt::registry& registry, entt::entity e);
double inverseInertia(const entt::registry& registry, entt::entity e);

/**
 * @brief World velocity of the body point at world offset @p r from the center of mass
 */
Vector velocityAt(const entt::registry& registry, entt::entity e, const Vector& r);

double kineticEnergy(const entt::registry& registry, entt::entity e);

/** @brief Marks two bodies as never colliding, in both directions */
void addNonCollide(entt::registry& registry, entt::entity a, entt::entity b);

bool canCollide(const entt::registry& registry, entt::entity a, entt::entity b);

/** @throws std::invalid_argument outside [0,1] */
void setElasticity(entt::registry& registry, entt::entity e, double elasticity);

/**
 * @throws std::invalid_argument for negative tolerances or an accuracy
 *         outside (0,1]
 */
void setTolerances(entt::registry& registry, entt::entity e,
                   double distanceTol, double velocityTol, double accuracy);

void setZeroEnergyLevel(entt::registry& registry, entt::entity e, double level);

const std::string& name(const entt::registry& registry, entt::entity e);

} // namespace Bodies

#endif
