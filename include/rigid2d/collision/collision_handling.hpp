/**
 * @file collision_handling.hpp
 * @brief Impulse resolution of collision records
 *
 * A unit impulse j at record k pushes its primary body along the normal and
 * its normal body against it. The collision matrix A collects how much every
 * record's normal velocity changes per unit impulse at every other record, so
 * after impulses j the normal velocities are A j + v.
 */

#ifndef RIGID2D_COLLISION_HANDLING_HPP
#define RIGID2D_COLLISION_HANDLING_HPP

#include <optional>
#include <random>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"
#include "rigid2d/collision/collision_stats.hpp"
#include "rigid2d/collision/contact_solver.hpp"
#include "rigid2d/core/vars_list.hpp"

namespace RigidBodyCollision {

enum class CollisionHandling {
    SIMULTANEOUS,
    HYBRID,
    SERIAL_SEPARATE,
    SERIAL_GROUPED,
    SERIAL_SEPARATE_LASTPASS,
    SERIAL_GROUPED_LASTPASS
};

std::string handlingName(CollisionHandling handling);

/** @throws std::invalid_argument for an unknown name */
CollisionHandling handlingFromName(const std::string& name);

/**
 * @brief Change of the normal velocity at @p ci from a unit impulse at @p cj,
 *        through @p body alone
 *
 * Zero unless the body takes part in both records and has finite mass.
 */
double influence(const entt::registry& registry,
                 const CollisionRecord& ci, const CollisionRecord& cj,
                 entt::entity body);

Matrix makeCollisionMatrix(const entt::registry& registry, const CollisionList& collisions);

/**
 * @brief Indices of the records handled together with @p start
 *
 * Always includes @p start and every joint chained to it through the bodies
 * it moves. In hybrid mode the non-joint records on either body of @p start
 * whose velocity @p v is below @p minVelocity are added first.
 */
std::vector<size_t> subsetCollisions2(const entt::registry& registry,
                                      const CollisionList& collisions,
                                      size_t start, bool hybrid,
                                      const std::vector<double>& v,
                                      double minVelocity);

/**
 * @brief Splits the records into groups connected through movable bodies
 */
std::vector<std::vector<size_t>> connectedSubsets(const entt::registry& registry,
                                                  const CollisionList& collisions);

/**
 * @brief Applies impulse @p j of a record to the velocities in @p vars
 *
 * Stores the impulse on the record. Slightly negative impulses on non-joints
 * are treated as zero.
 * @throws std::logic_error for a clearly negative impulse on a non-joint
 */
void applyCollisionImpulse(const entt::registry& registry, VarsList& vars,
                           CollisionRecord& c, double j);

/**
 * @brief One solve over all records at once
 * @return Whether any impulse larger than the tiny threshold was applied
 */
bool handleCollisionsSimultaneous(const entt::registry& registry, VarsList& vars,
                                  CollisionList& collisions,
                                  CollisionTotals* totals);

struct SerialOptions {
    bool hybrid = false;
    bool grouped = true;
    bool lastPass = true;
    double smallVelocity = 1e-5;
    bool doPanic = true;
};

/**
 * @brief Resolves one randomly chosen focus collision at a time until none
 *        is closing faster than the small velocity
 *
 * Each focus is solved together with its subset (see subsetCollisions2) with
 * restitution, and the normal velocities of all records are updated from the
 * impulse. Joints must end with |v| below the small velocity. After 20 n
 * loops the small velocity is doubled. With lastPass a final solve over all
 * records without restitution removes what is left.
 *
 * @return Whether any impulse larger than the tiny threshold was applied
 */
bool handleCollisionsSerial(const entt::registry& registry, VarsList& vars,
                            CollisionList& collisions, std::mt19937& rng,
                            const SerialOptions& options,
                            CollisionTotals* totals);

/**
 * @brief Dispatches on the handling mode
 * @throws std::invalid_argument for an empty record list
 */
bool handleCollisions(const entt::registry& registry, VarsList& vars,
                      CollisionList& collisions, CollisionHandling handling,
                      std::mt19937& rng, CollisionTotals* totals);

} // namespace RigidBodyCollision

#endif
