/**
 * @file shapes.hpp
 * @brief Builders for common rigid body outlines and the entities using them
 */

#ifndef RIGID2D_SHAPES_HPP
#define RIGID2D_SHAPES_HPP

#include <memory>
#include <string>

#include <entt/entt.hpp>

#include "rigid2d/geometry/polygon.hpp"

namespace Shapes {

/** @brief Rectangle centered on the origin */
std::shared_ptr<Geometry::Polygon> makeBlockPolygon(double width, double height);

/** @brief Full circle centered on the origin */
std::shared_ptr<Geometry::Polygon> makeBallPolygon(double radius);

/**
 * @brief Rectangle centered on the origin whose top edge is a concave arc
 *
 * The arc dips into the block and has radius @p arcRadius; it must be at
 * least half the width.
 * @throws std::invalid_argument if the arc does not fit inside the block
 */
std::shared_ptr<Geometry::Polygon> makeBowlPolygon(double width, double height, double arcRadius);

double blockInertia(double mass, double width, double height);
double ballInertia(double mass, double radius);

entt::entity createBlock(entt::registry& registry, const std::string& name,
                         double width, double height, double mass = 1.0);

/**
 * @brief Ball whose center of mass may sit away from its geometric center
 * @param cmOffset Center of mass in body coordinates
 */
entt::entity createBall(entt::registry& registry, const std::string& name,
                        double radius, double mass = 1.0,
                        const Vector& cmOffset = Vector(0, 0));

/** @brief Fixed block, used for floors and walls */
entt::entity createWall(entt::registry& registry, const std::string& name,
                        double width, double height);

/** @brief Fixed bowl */
entt::entity createBowl(entt::registry& registry, const std::string& name,
                        double width, double height, double arcRadius);

} // namespace Shapes

#endif
