/**
 * @file collision_stats.hpp
 * @brief Running totals and per-pass summaries of collision handling
 */

#ifndef RIGID2D_COLLISION_STATS_HPP
#define RIGID2D_COLLISION_STATS_HPP

#include <string>

#include "rigid2d/collision/collision_data.hpp"

namespace RigidBodyCollision {

/**
 * @class CollisionTotals
 * @brief Monotonically increasing counters kept across advance() calls
 */
class CollisionTotals {
public:
    void addCollisions(int n) { collisions += n; }
    void addSearches(int n) { searches += n; }
    void addImpulses(int n) { impulses += n; }
    void addSteps(int n) { steps += n; }
    void addBackups(int n) { backups += n; }

    int getCollisions() const { return collisions; }
    int getSearches() const { return searches; }
    int getImpulses() const { return impulses; }
    int getSteps() const { return steps; }
    int getBackups() const { return backups; }

    void reset();

    std::string toString() const;

private:
    int collisions = 0;
    int searches = 0;
    int impulses = 0;
    int steps = 0;
    int backups = 0;
};

/**
 * @struct CollisionStats
 * @brief Summary of one list of records
 *
 * "Imminent" records are the ones still approaching that either need handling
 * or are not resting contacts; only those feed the minimum distance and the
 * earliest estimated time. If any of them has no estimate, the earliest
 * estimate is unknown (NaN).
 */
struct CollisionStats {
    int numCollisions = 0;
    int numJoints = 0;
    int numContacts = 0;
    int numNonContact = 0;
    int numNeedsHandling = 0;
    int numImminent = 0;
    double minDistance = 0.0;
    double estTime = 0.0;
    double detectedTime = 0.0;

    CollisionStats() { clear(); }

    void clear();

    /** @brief Clears, then summarizes @p collisions */
    void update(const CollisionList& collisions);

    std::string toString() const;
};

} // namespace RigidBodyCollision

#endif
