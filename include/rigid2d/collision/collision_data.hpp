/**
 * @file collision_data.hpp
 * @brief Collision and contact records shared by detection and resolution
 *
 * A record describes one place where two bodies touch, are about to touch or
 * have penetrated. The normal always points from the normal body toward the
 * primary body, so a negative normal velocity means the bodies are closing.
 *
 * The U vectors run from each body's center of mass to the point whose
 * velocity governs the record: the impact point for a straight feature, or the
 * center of the circle for a curved one (ballObject / ballNormal).
 */

#ifndef RIGID2D_COLLISION_DATA_HPP
#define RIGID2D_COLLISION_DATA_HPP

#include <limits>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/math/vector_math.hpp"

namespace RigidBodyCollision {

class IConnector;

// CandidatePair used by broad phase and narrow phase
struct CandidatePair {
    entt::entity eA;
    entt::entity eB;
};

enum class CollisionKind {
    CornerEdge,    // vertex of the primary body against an edge of the normal body
    CornerCorner,  // vertex against the end vertex of an edge
    EdgeEdge,      // curved edge of the primary body against an edge of the normal body
    Joint,
    Rope           // a rope that is tight or nearly so
};

const char* kindName(CollisionKind kind);

/**
 * @struct CollisionRecord
 * @brief Geometry, velocity and classification of one contact point
 */
struct CollisionRecord {
    static constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

    entt::entity primaryBody = entt::null;
    entt::entity normalBody = entt::null;
    CollisionKind kind = CollisionKind::CornerEdge;
    std::string creator;

    // Features involved, indices into the bodies' polygons
    int primaryVertex = -1;
    int primaryEdge = -1;
    int normalEdge = -1;
    int normalVertex = -1;
    const IConnector* connector = nullptr;  // joint or rope that made the record

    Vector impact1;          // world contact point on the primary body
    Vector impact2;          // world contact point on the normal body
    bool hasImpact2 = false;
    Vector normal;           // unit, world, from normal body toward primary body

    double distance = NaN;   // negative when penetrating
    double normalVelocity = NaN;

    bool ballObject = false; // primary feature is curved
    bool ballNormal = false; // normal feature is curved
    bool normalFixed = false;
    Vector u1;               // primary body: center of mass to circle center
    Vector u2;               // normal body: center of mass to circle center
    Vector r1;               // primary body: center of mass to impact1
    Vector r2;               // normal body: center of mass to impact2 (or impact1)
    double radius1 = 0.0;    // signed radius of the primary feature
    double radius2 = 0.0;    // signed radius of the normal feature

    double elasticity = 1.0;
    double distanceTol = 0.01;
    double velocityTol = 0.5;
    double accuracy = 0.003; // absolute, fraction of targetGap
    double targetGap = 0.005;

    double detectedTime = NaN;
    double detectedDistance = NaN;
    double detectedVelocity = NaN;
    double estimate = NaN;
    double updateTime = NaN;
    bool mustHandle = false;

    double impulse = NaN;
    double force = NaN;

    /**
     * @brief Fills in the per-pair constants from both bodies' components
     *
     * Distance and velocity tolerances take the larger of the two bodies,
     * elasticity the smaller. Joints get zero target gap and elasticity.
     */
    void initFromBodies(const entt::registry& registry);

    bool isJoint() const { return kind == CollisionKind::Joint; }

    /** @brief Offset whose velocity governs the primary side */
    const Vector& getU1() const { return ballObject ? u1 : r1; }
    /** @brief Offset whose velocity governs the normal side */
    const Vector& getU2() const { return ballNormal ? u2 : r2; }

    bool contact() const;
    bool closeEnough(bool allowTiny) const;
    bool isColliding() const;
    bool isTouching() const;
    bool illegalState() const;

    double distanceToHalfGap() const { return distance - targetGap; }

    bool needsHandling() const { return mustHandle; }
    void setNeedsHandling(bool value) { mustHandle = value; }

    /**
     * @brief Records detection time, distance and velocity and makes a
     *        first linear estimate of the collision time
     * @throws std::logic_error if called twice
     */
    void setDetectedTime(double time);

    /**
     * @brief Refreshes the time estimate after the geometry was recomputed
     *
     * Called once the distance and normal velocity describe @p time.
     */
    void updateCollision(double time);

    /**
     * @brief Constant-acceleration estimate combining the readings at
     *        @p time and at the detected time
     */
    void updateEstimatedTime(double time, bool doUpdate);

    /**
     * @brief Same bodies and the same primary vertex, or the same edge pair
     */
    bool similarTo(const CollisionRecord& other) const;

    bool hasBody(entt::entity e) const { return primaryBody == e || normalBody == e; }

    std::string toString() const;
};

using CollisionList = std::vector<CollisionRecord>;

/**
 * @brief Adds a record, replacing a similar one if the new one is better
 *
 * A record detected later wins. At the same detected time the deeper record
 * wins. Joints are always added.
 * @throws std::invalid_argument for a non-joint record with non-finite distance
 */
void addCollision(CollisionList& collisions, const CollisionRecord& record);

} // namespace RigidBodyCollision

#endif
