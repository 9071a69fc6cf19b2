#ifndef RIGID2D_COMPONENTS_BASIC_HPP
#define RIGID2D_COMPONENTS_BASIC_HPP

#include <memory>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "rigid2d/math/vector_math.hpp"
#include "rigid2d/geometry/polygon.hpp"

namespace Components {

    // World location of the center of mass and its velocity
    using Position = ::Position;
    using Velocity = ::Vector;

    // Infinite for fixed bodies
    struct Mass {
        double value;
    };

    struct Inertia {
        double I; // about the center of mass
    };

    struct AngularPosition {
        double angle; // radians
    };

    struct AngularVelocity {
        double omega; // radians per second
    };

    // Outline in body coordinates, shared between bodies of the same shape
    struct Shape {
        std::shared_ptr<const Geometry::Polygon> polygon;
        Vector cmBody; // center of mass in body coordinates
    };

    struct Material {
        double elasticity = 1.0;
    };

    struct CollisionTolerance {
        double distanceTol = 0.01;
        double velocityTol = 0.5;
        double accuracy = 0.6;
    };

    struct BodyInfo {
        std::string name;
        int varsIndex = -1; // base slot in the VarsList, -1 until added to a sim
        double zeroEnergyLevel = 0.0;
        bool hasZeroEnergyLevel = false;
    };

    // Pose at the start of the current step, for swept vertex tests
    struct OldCoords {
        Position position;
        double angle;
    };

    struct NonCollide {
        std::vector<entt::entity> others;
    };

} // namespace Components

#endif
