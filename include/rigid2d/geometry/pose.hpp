#ifndef RIGID2D_POSE_HPP
#define RIGID2D_POSE_HPP

#include "rigid2d/math/vector_math.hpp"

namespace Geometry {

/**
 * @brief Placement of a rigid body: maps body coordinates to world coordinates
 *
 * Body coordinates are the frame the body's edges are defined in. The body's
 * center of mass sits at @c cmBody in that frame and at @c position in the
 * world, and the body is rotated by @c angle about that point.
 */
struct Pose {
    Vector position;   ///< World location of the center of mass
    double angle = 0;  ///< Radians, counter-clockwise
    Vector cmBody;     ///< Center of mass in body coordinates

    Vector bodyToWorld(const Vector& pBody) const {
        return position + (pBody - cmBody).rotateByAngle(angle);
    }

    Vector worldToBody(const Vector& pWorld) const {
        return (pWorld - position).rotateByAngle(-angle) + cmBody;
    }

    Vector rotateBodyToWorld(const Vector& v) const {
        return v.rotateByAngle(angle);
    }

    Vector rotateWorldToBody(const Vector& v) const {
        return v.rotateByAngle(-angle);
    }
};

} // namespace Geometry

#endif
