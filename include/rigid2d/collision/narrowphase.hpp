/**
 * @file narrowphase.hpp
 * @brief Exact edge and vertex tests between candidate pairs
 *
 * Tests run in the body coordinates of the body owning the edge. A vertex is
 * tested at its current position and, when both bodies carry an old pose, on
 * the path from its old position, so a vertex that crossed an edge during the
 * step is caught even when the current positions no longer overlap much.
 *
 * - vertex vs straight edge: contact within the distance tolerance above the
 *   segment, collision when the vertex crossed the segment or lies inside
 * - vertex vs circular edge: the same, with a curved normal (ballNormal)
 * - vertex vs vertex: beyond an edge's end points but within 0.6 of the
 *   distance tolerance of an end vertex
 * - circle vs straight edge (ballObject) and circle vs circle, including a
 *   convex circle inside a concave one
 */

#ifndef RIGID2D_NARROWPHASE_HPP
#define RIGID2D_NARROWPHASE_HPP

#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @brief Tests one pair of bodies and adds every record found
 *
 * New records get their detected time set to @p time before being added
 * through addCollision().
 */
void checkPair(const entt::registry& registry, entt::entity a, entt::entity b,
               double time, CollisionList& out);

void narrowPhase(const entt::registry& registry,
                 const std::vector<CandidatePair>& pairs,
                 double time, CollisionList& out);

/**
 * @brief Fills the R vectors and normal velocity from the current body state
 *
 * Expects impact points, normal and U vectors to be set.
 */
void computeVelocity(const entt::registry& registry, CollisionRecord& c);

/**
 * @brief Recomputes the geometry of an existing record for the current pose
 *
 * The same vertex and edges are used even if they no longer overlap; the
 * normal velocity is refreshed too.
 */
void updateRecordGeometry(const entt::registry& registry, CollisionRecord& c);

} // namespace RigidBodyCollision

#endif
