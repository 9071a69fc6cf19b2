/**
 * @file contact_forces.hpp
 * @brief Resting contact forces computed inside the derivative
 *
 * For a set of contacts the normal accelerations are a = A f + b, with the same
 * matrix A as for impulses. The b vector holds the acceleration the contacts
 * would have without contact forces: the external forces already in the
 * derivative, the centripetal terms and the rate of change of curved normals.
 * An extra term pushes the contact gap toward half the distance tolerance and
 * its velocity toward zero.
 */

#ifndef RIGID2D_CONTACT_FORCES_HPP
#define RIGID2D_CONTACT_FORCES_HPP

#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Which drift correction is added to the b vector
 *
 * With h the extra acceleration time step, VELOCITY adds v/h and
 * VELOCITY_AND_DISTANCE adds (2 v h + x)/h^2 where x is the distance to half
 * the gap. The plain variants skip joints.
 */
enum class ExtraAccel {
    NONE,
    VELOCITY,
    VELOCITY_JOINTS,
    VELOCITY_AND_DISTANCE,
    VELOCITY_AND_DISTANCE_JOINTS
};

std::string extraAccelName(ExtraAccel policy);

/** @throws std::invalid_argument for an unknown name */
ExtraAccel extraAccelFromName(const std::string& name);

/**
 * @brief Drift correction term for one contact
 * @param h Time scale, must be positive
 */
double extraAcceleration(const CollisionRecord& c, ExtraAccel policy, double h);

/**
 * @brief Contact acceleration of every record without contact forces
 *
 * @param vars State the derivative is evaluated at
 * @param change Derivative holding the external accelerations so far
 * @throws std::runtime_error when a term is not finite
 */
std::vector<double> calculateBVector(const entt::registry& registry,
                                     const CollisionList& contacts,
                                     const std::vector<double>& change,
                                     const std::vector<double>& vars,
                                     ExtraAccel policy, double extraAccelTimeStep);

} // namespace RigidBodyCollision

#endif
