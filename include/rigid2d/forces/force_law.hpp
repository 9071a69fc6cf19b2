/**
 * @file force_law.hpp
 * @brief Pluggable force laws that feed the rigid body equations of motion
 *
 * Force laws read body state from the registry. The sim copies the variables
 * being evaluated into the components before asking for forces, so a law only
 * ever sees a consistent snapshot.
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/math/vector_math.hpp"

namespace Systems {

/**
 * @brief A force applied to one body at a world location, plus a pure torque
 */
struct Force {
    entt::entity body = entt::null;
    Vector location;        ///< World coordinates
    Vector vector;          ///< World coordinates
    double torque = 0.0;    ///< Added on top of the moment of @c vector
    std::string name;
};

/**
 * @class IForceLaw
 * @brief Interface for forces that act between bodies or on single bodies
 */
class IForceLaw {
public:
    virtual ~IForceLaw() = default;

    virtual std::vector<Force> calculateForces(const entt::registry& registry) const = 0;

    virtual double getPotentialEnergy(const entt::registry& registry) const = 0;

    virtual std::string getName() const = 0;
};

using ForceLawList = std::vector<std::shared_ptr<IForceLaw>>;

} // namespace Systems
