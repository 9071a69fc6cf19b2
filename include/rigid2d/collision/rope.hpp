/**
 * @file rope.hpp
 * @brief Rope or rod limiting the distance between two attach points
 *
 * A flexible rope only acts when it is tight: its record appears once the
 * slack is below the distance tolerance and behaves like a one-sided contact.
 * A rod is always tight and its record is a joint, so it can push as well as
 * pull.
 *
 * The attached points move on circles around each other, so the record is
 * treated like two curved edges with a concave radius equal to the rope
 * length. The record's normal runs from the first attach point toward the
 * second, and its distance is the slack (rest length minus current length).
 */

#ifndef RIGID2D_ROPE_HPP
#define RIGID2D_ROPE_HPP

#include <memory>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/collision/collision_data.hpp"
#include "rigid2d/collision/connector.hpp"

namespace RigidBodyCollision {

enum class RopeType {
    Rope,
    Rod
};

class Rope : public IConnector {
public:
    /**
     * @throws std::invalid_argument if both ends are on the same body, the
     *         second body is fixed or the length is not positive
     */
    Rope(const entt::registry& registry,
         entt::entity body1, const Vector& attach1,
         entt::entity body2, const Vector& attach2,
         double restLength, RopeType type);

    /** @brief Adds a record when this is a rod or the rope is nearly tight */
    void addCollision(const entt::registry& registry, CollisionList& collisions,
                      double time) const override;

    void updateCollision(const entt::registry& registry, CollisionRecord& c) const override;

    /**
     * @brief Moves the second body out along the rope to its rest length
     *
     * A rope shorter than its rest length (less half the distance tolerance)
     * is left alone. Angles are unchanged.
     */
    void align(entt::registry& registry) const override;

    /** @brief Current distance between the attach points */
    double getNormalDistance(const entt::registry& registry) const override { return getLength(registry); }

    double getLength(const entt::registry& registry) const;
    /** @brief Current length minus rest length */
    double getStretch(const entt::registry& registry) const;
    bool isTight(const entt::registry& registry) const;

    Vector getPosition1(const entt::registry& registry) const;
    Vector getPosition2(const entt::registry& registry) const;

    double getRestLength() const { return restLength; }
    bool isRod() const { return type == RopeType::Rod; }

    entt::entity getBody1() const override { return body1; }
    entt::entity getBody2() const override { return body2; }

private:
    entt::entity body1;
    Vector attach1;
    entt::entity body2;
    Vector attach2;
    double restLength;
    RopeType type;
    double distanceTol;
};

using RopeList = std::vector<std::shared_ptr<Rope>>;

} // namespace RigidBodyCollision

#endif
