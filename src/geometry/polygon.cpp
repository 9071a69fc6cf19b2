/**
 * @file polygon.cpp
 * @brief Edge geometry and outline construction for rigid bodies
 */

#include "rigid2d/geometry/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Geometry {

namespace {

constexpr double TWO_PI = 6.283185307179586476925286766559;

// Maps an angle into [0, 2pi)
double wrapAngle(double a) {
    a = std::fmod(a, TWO_PI);
    if (a < 0) {
        a += TWO_PI;
    }
    return a;
}

double angleOf(const Vector& v) {
    return std::atan2(v.y, v.x);
}

} // namespace

double Edge::distanceToLine(const Vector& p) const {
    if (isStraight()) {
        return (p - v1).dotProduct(outwardNormal);
    }
    double const r = (p - center).length();
    return outsideIsOut ? r - radius : radius - r;
}

double Edge::distanceToPoint(const Vector& p) const {
    if (isStraight()) {
        Vector const d = v2 - v1;
        double const len2 = d.lengthSquared();
        double const t = len2 > 0 ? (p - v1).dotProduct(d) / len2 : 0.0;
        if (t < 0.0 || t > 1.0) {
            return std::numeric_limits<double>::infinity();
        }
        return distanceToLine(p);
    }
    if (!arcContains(p)) {
        return std::numeric_limits<double>::infinity();
    }
    return distanceToLine(p);
}

bool Edge::arcContains(const Vector& p) const {
    if (isStraight() || span >= TWO_PI) {
        return true;
    }
    Vector const q = p - center;
    if (q.lengthSquared() == 0.0) {
        return false;
    }
    double const a = wrapAngle(angleOf(q) - startAngle);
    return a <= span + 1e-12;
}

Vector Edge::normalAt(const Vector& p) const {
    if (isStraight()) {
        return outwardNormal;
    }
    Vector const radial = (p - center).normalized();
    return outsideIsOut ? radial : -radial;
}

double Edge::signedRadius() const {
    if (isStraight()) {
        return std::numeric_limits<double>::infinity();
    }
    return outsideIsOut ? radius : -radius;
}

void Polygon::startPath(const Vector& startPoint) {
    if (started) {
        throw std::logic_error("Polygon::startPath called twice");
    }
    start = startPoint;
    current = startPoint;
    started = true;
}

void Polygon::addStraightEdge(const Vector& end, bool outsideIsUp) {
    if (!started || finished) {
        throw std::logic_error("Polygon::addStraightEdge outside an open path");
    }
    Vector const d = end - current;
    if (d.length() < EPSILON) {
        throw std::invalid_argument("Polygon::addStraightEdge zero length edge");
    }

    Edge e;
    e.type = EdgeType::Straight;
    e.v1 = current;
    e.v2 = end;
    e.index = static_cast<int>(edges.size());
    e.outsideIsUp = outsideIsUp;

    // "Up" is larger y, or larger x for a vertical edge
    Vector up = d.perp().normalized();
    if (up.y < 0 || (std::fabs(up.y) < EPSILON && up.x < 0)) {
        up = -up;
    }
    e.outwardNormal = outsideIsUp ? up : -up;

    edges.push_back(e);
    current = end;
}

void Polygon::addCircularEdge(const Vector& end, const Vector& center,
                              bool clockwise, bool outsideIsOut) {
    if (!started || finished) {
        throw std::logic_error("Polygon::addCircularEdge outside an open path");
    }
    double const r1 = (current - center).length();
    double const r2 = (end - center).length();
    if (r1 < EPSILON || std::fabs(r1 - r2) > 1e-6 * std::max(1.0, r1)) {
        throw std::invalid_argument("Polygon::addCircularEdge end points not on one circle");
    }

    Edge e;
    e.type = EdgeType::Circular;
    e.v1 = current;
    e.v2 = end;
    e.index = static_cast<int>(edges.size());
    e.center = center;
    e.radius = r1;
    e.clockwise = clockwise;
    e.outsideIsOut = outsideIsOut;

    if ((end - current).length() < EPSILON) {
        e.startAngle = wrapAngle(angleOf(current - center));
        e.span = TWO_PI;
    } else if (!clockwise) {
        e.startAngle = wrapAngle(angleOf(current - center));
        e.span = wrapAngle(angleOf(end - center) - e.startAngle);
    } else {
        // Stored as the counter-clockwise arc from end back to the start
        e.startAngle = wrapAngle(angleOf(end - center));
        e.span = wrapAngle(angleOf(current - center) - e.startAngle);
    }

    edges.push_back(e);
    current = end;
}

void Polygon::closePath() {
    if (!started || finished || edges.empty()) {
        throw std::logic_error("Polygon::closePath without an open path");
    }
    if ((current - start).length() > 1e-6) {
        throw std::logic_error("Polygon::closePath path does not end at its start");
    }

    int const n = static_cast<int>(edges.size());
    vertices.clear();
    for (int i = 0; i < n; ++i) {
        Vertex v;
        v.loc = edges[i].v1;
        v.edge1 = (i + n - 1) % n;
        v.edge2 = i;
        v.corner = edges[v.edge1].isStraight() || edges[v.edge2].isStraight();
        vertices.push_back(v);
    }
    finished = true;
}

bool Polygon::isInside(const Vector& p) const {
    int crossings = 0;
    for (const auto& e : edges) {
        if (e.isStraight()) {
            const Vector& a = e.v1;
            const Vector& b = e.v2;
            if ((a.y > p.y) != (b.y > p.y)) {
                double const x = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
                if (x > p.x) {
                    ++crossings;
                }
            }
            continue;
        }
        double const dy = p.y - e.center.y;
        if (std::fabs(dy) >= e.radius) {
            continue;
        }
        double const dx = std::sqrt(e.radius * e.radius - dy * dy);
        for (double x : {e.center.x - dx, e.center.x + dx}) {
            if (x > p.x && e.arcContains(Vector(x, p.y))) {
                ++crossings;
            }
        }
    }
    return (crossings % 2) == 1;
}

double Polygon::boundingRadius(const Vector& centerBody) const {
    double r = 0.0;
    for (const auto& e : edges) {
        if (e.isStraight()) {
            r = std::max(r, (e.v1 - centerBody).length());
            r = std::max(r, (e.v2 - centerBody).length());
        } else {
            r = std::max(r, (e.center - centerBody).length() + e.radius);
        }
    }
    return r;
}

Vector Polygon::boundsCenter() const {
    if (edges.empty()) {
        return Vector(0, 0);
    }
    double minX = std::numeric_limits<double>::max();
    double minY = minX;
    double maxX = -minX;
    double maxY = -minX;
    auto grow = [&](double x0, double y0, double x1, double y1) {
        minX = std::min(minX, x0);
        minY = std::min(minY, y0);
        maxX = std::max(maxX, x1);
        maxY = std::max(maxY, y1);
    };
    for (const auto& e : edges) {
        if (e.isStraight()) {
            grow(e.v1.x, e.v1.y, e.v1.x, e.v1.y);
        } else {
            grow(e.center.x - e.radius, e.center.y - e.radius,
                 e.center.x + e.radius, e.center.y + e.radius);
        }
    }
    return Vector((minX + maxX) / 2, (minY + maxY) / 2);
}

} // namespace Geometry
