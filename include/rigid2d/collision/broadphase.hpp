/**
 * @file broadphase.hpp
 * @brief Broad-phase collision detection using spatial partitioning
 *
 * This module builds a quadtree over the world bounding boxes of all rigid
 * bodies and reports the pairs whose boxes overlap. Each box encloses the body
 * at both its current and its saved old pose, swollen by the distance
 * tolerance, so a body that moved through another during a step still pairs
 * with it.
 */

#ifndef RIGID2D_BROADPHASE_HPP
#define RIGID2D_BROADPHASE_HPP

#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Axis-aligned bounding box of a body's current and old pose
 */
struct AABB {
    double minx, miny, maxx, maxy;
};

AABB computeAABB(const entt::registry& registry, entt::entity e);

/**
 * @brief Performs broad-phase collision detection on all rigid bodies
 *
 * @param registry Registry holding the rigid body components
 * @return Pairs whose boxes overlap, excluding pairs of fixed bodies and pairs
 *         marked as non-colliding
 *
 * @note Pairs are ordered so the first entity has the lower id, and the list
 *       is sorted, which keeps detection order reproducible
 */
std::vector<CandidatePair> broadPhase(const entt::registry& registry);

} // namespace RigidBodyCollision

#endif
