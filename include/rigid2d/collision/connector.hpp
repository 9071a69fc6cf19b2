/**
 * @file connector.hpp
 * @brief Interface for constraints between two bodies that report records
 */

#ifndef RIGID2D_CONNECTOR_HPP
#define RIGID2D_CONNECTOR_HPP

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @class IConnector
 * @brief Joins two bodies and takes part in every detection pass
 *
 * A connector adds its own records to the collision list and recomputes them
 * when asked; the narrow phase never looks at it.
 */
class IConnector {
public:
    virtual ~IConnector() = default;

    /** @brief Adds this connector's record, detected at @p time, when it applies */
    virtual void addCollision(const entt::registry& registry, CollisionList& collisions,
                              double time) const = 0;

    /**
     * @brief Recomputes impact points, normal and distance of a record of this connector
     * @throws std::logic_error for a record made by something else
     */
    virtual void updateCollision(const entt::registry& registry, CollisionRecord& c) const = 0;

    /** @brief Moves a body so the connector starts out satisfied */
    virtual void align(entt::registry& registry) const = 0;

    virtual double getNormalDistance(const entt::registry& registry) const = 0;

    virtual entt::entity getBody1() const = 0;
    virtual entt::entity getBody2() const = 0;
};

} // namespace RigidBodyCollision

#endif
