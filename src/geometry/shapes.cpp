#include "rigid2d/geometry/shapes.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include "rigid2d/components/body.hpp"

namespace Shapes {

std::shared_ptr<Geometry::Polygon> makeBlockPolygon(double width, double height) {
    if (!(width > 0) || !(height > 0)) {
        throw std::invalid_argument("makeBlockPolygon: width and height must be positive");
    }
    double const hw = width / 2;
    double const hh = height / 2;
    auto p = std::make_shared<Geometry::Polygon>();
    p->startPath(Vector(-hw, -hh));
    p->addStraightEdge(Vector(hw, -hh), /*outsideIsUp=*/false);
    p->addStraightEdge(Vector(hw, hh), /*outsideIsUp=*/true);
    p->addStraightEdge(Vector(-hw, hh), /*outsideIsUp=*/true);
    p->addStraightEdge(Vector(-hw, -hh), /*outsideIsUp=*/false);
    p->closePath();
    return p;
}

std::shared_ptr<Geometry::Polygon> makeBallPolygon(double radius) {
    if (!(radius > 0)) {
        throw std::invalid_argument("makeBallPolygon: radius must be positive");
    }
    auto p = std::make_shared<Geometry::Polygon>();
    p->startPath(Vector(-radius, 0));
    p->addCircularEdge(Vector(-radius, 0), Vector(0, 0),
                       /*clockwise=*/false, /*outsideIsOut=*/true);
    p->closePath();
    return p;
}

std::shared_ptr<Geometry::Polygon> makeBowlPolygon(double width, double height, double arcRadius) {
    double const hw = width / 2;
    double const hh = height / 2;
    if (!(width > 0) || !(height > 0) || arcRadius < hw) {
        throw std::invalid_argument("makeBowlPolygon: bad dimensions");
    }
    double const rise = std::sqrt(arcRadius * arcRadius - hw * hw);
    Vector const center(0, hh + rise);
    if (center.y - arcRadius <= -hh) {
        throw std::invalid_argument("makeBowlPolygon: arc cuts through the bottom");
    }
    auto p = std::make_shared<Geometry::Polygon>();
    p->startPath(Vector(-hw, -hh));
    p->addStraightEdge(Vector(hw, -hh), /*outsideIsUp=*/false);
    p->addStraightEdge(Vector(hw, hh), /*outsideIsUp=*/true);
    p->addCircularEdge(Vector(-hw, hh), center,
                       /*clockwise=*/true, /*outsideIsOut=*/false);
    p->addStraightEdge(Vector(-hw, -hh), /*outsideIsUp=*/false);
    p->closePath();
    return p;
}

double blockInertia(double mass, double width, double height) {
    return mass * (width * width + height * height) / 12.0;
}

double ballInertia(double mass, double radius) {
    return mass * radius * radius / 2.0;
}

entt::entity createBlock(entt::registry& registry, const std::string& name,
                         double width, double height, double mass)
{
    return Bodies::createBody(registry, name, makeBlockPolygon(width, height),
                              mass, blockInertia(mass, width, height));
}

entt::entity createBall(entt::registry& registry, const std::string& name,
                        double radius, double mass, const Vector& cmOffset)
{
    return Bodies::createBody(registry, name, makeBallPolygon(radius),
                              mass, ballInertia(mass, radius), cmOffset);
}

entt::entity createWall(entt::registry& registry, const std::string& name,
                        double width, double height)
{
    double const inf = std::numeric_limits<double>::infinity();
    return Bodies::createBody(registry, name, makeBlockPolygon(width, height), inf, inf);
}

entt::entity createBowl(entt::registry& registry, const std::string& name,
                        double width, double height, double arcRadius)
{
    double const inf = std::numeric_limits<double>::infinity();
    return Bodies::createBody(registry, name, makeBowlPolygon(width, height, arcRadius), inf, inf);
}

} // namespace Shapes
