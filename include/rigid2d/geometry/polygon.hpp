/**
 * @file polygon.hpp
 * @brief Rigid body outlines made of straight and circular edges
 *
 * A Polygon is a closed path of edges in body coordinates. Straight edges
 * carry an "outside is up" flag and circular edges an "outside is out" flag,
 * which fix which side of the edge is solid. A circular edge whose outside
 * points toward its center is concave.
 *
 * Vertices join consecutive edges. Only corners (a vertex touching at least
 * one straight edge) take part in vertex/edge collision tests; the seam of a
 * full circle is not a corner.
 */

#ifndef RIGID2D_POLYGON_HPP
#define RIGID2D_POLYGON_HPP

#include <limits>
#include <vector>

#include "rigid2d/math/vector_math.hpp"

namespace Geometry {

enum class EdgeType {
    Straight,
    Circular
};

/**
 * @brief One edge of a Polygon, in body coordinates
 */
struct Edge {
    EdgeType type = EdgeType::Straight;
    Vector v1;                 ///< Start point
    Vector v2;                 ///< End point
    int index = -1;            ///< Position in the owning polygon

    // Straight edges
    bool outsideIsUp = true;
    Vector outwardNormal;      ///< Unit normal pointing out of the solid

    // Circular edges
    Vector center;
    double radius = 0;
    bool clockwise = false;    ///< Direction of travel from v1 to v2
    bool outsideIsOut = true;  ///< false for a concave edge
    double startAngle = 0;     ///< Angle of v1 about the center
    double span = 0;           ///< Angular extent, always positive

    bool isStraight() const { return type == EdgeType::Straight; }

    /**
     * @brief Signed distance from a point to the line through a straight edge
     *
     * Positive on the outside. Circular edges measure to the full circle.
     */
    double distanceToLine(const Vector& p) const;

    /**
     * @brief Signed distance to the edge itself
     * @return infinity if the point does not project onto the edge
     */
    double distanceToPoint(const Vector& p) const;

    /**
     * @brief Whether the direction from the center toward @p p lies inside the arc
     *
     * Always true for straight edges.
     */
    bool arcContains(const Vector& p) const;

    /**
     * @brief Unit normal pointing out of the solid at the point of the edge nearest @p p
     */
    Vector normalAt(const Vector& p) const;

    /**
     * @brief Signed radius used for the rate of change of a curved normal
     *
     * Positive for convex arcs, negative for concave arcs, infinite for
     * straight edges.
     */
    double signedRadius() const;
};

/**
 * @brief A junction between two consecutive edges
 */
struct Vertex {
    Vector loc;        ///< Body coordinates
    int edge1 = -1;    ///< Edge ending here
    int edge2 = -1;    ///< Edge starting here
    bool corner = true;
};

/**
 * @class Polygon
 * @brief Closed outline of a rigid body, built as a path of edges
 *
 * Usage:
 * @code
 * Geometry::Polygon p;
 * p.startPath(Vector(-1, -1));
 * p.addStraightEdge(Vector(1, -1), false);
 * ...
 * p.closePath();
 * @endcode
 */
class Polygon {
public:
    Polygon() = default;

    void startPath(const Vector& start);

    /**
     * @brief Adds a straight edge from the current point to @p end
     * @param outsideIsUp Whether the outside lies at larger y (at larger x for a
     *        vertical edge)
     */
    void addStraightEdge(const Vector& end, bool outsideIsUp);

    /**
     * @brief Adds a circular arc from the current point to @p end
     *
     * When @p end equals the current point the arc is a full circle.
     * @throws std::invalid_argument if the end points are not equidistant
     *         from @p center
     */
    void addCircularEdge(const Vector& end, const Vector& center,
                         bool clockwise, bool outsideIsOut);

    /**
     * @brief Closes the path and builds the vertex list
     * @throws std::logic_error if the path does not end where it started
     */
    void closePath();

    bool isFinished() const { return finished; }

    const std::vector<Edge>& getEdges() const { return edges; }
    const std::vector<Vertex>& getVertices() const { return vertices; }

    /**
     * @brief Crossing-number point containment test, in body coordinates
     */
    bool isInside(const Vector& p) const;

    /**
     * @brief Radius of a circle about @p centerBody that encloses the outline
     */
    double boundingRadius(const Vector& centerBody) const;

    /** @brief Center of the outline's bounding box, in body coordinates */
    Vector boundsCenter() const;

private:
    std::vector<Edge> edges;
    std::vector<Vertex> vertices;
    Vector current;
    Vector start;
    bool started = false;
    bool finished = false;
};

} // namespace Geometry

#endif
