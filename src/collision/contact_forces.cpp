/**
 * @file contact_forces.cpp
 * @brief b vector and drift correction for contact forces
 */

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "rigid2d/collision/contact_forces.hpp"
#include "rigid2d/components/basic.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/vars_list.hpp"

namespace RigidBodyCollision {

namespace {

// Velocity and derivative of a body read from the state vectors
struct BodyMotion {
    bool fixed = true;
    double vx = 0, vy = 0, w = 0;
    double ax = 0, ay = 0, alpha = 0;
};

BodyMotion readMotion(const entt::registry& registry, entt::entity e,
                      const std::vector<double>& vars,
                      const std::vector<double>& change)
{
    BodyMotion m;
    if (e == entt::null || Bodies::isFixed(registry, e)) {
        return m;
    }
    int const idx = registry.get<Components::BodyInfo>(e).varsIndex;
    if (idx < 0) {
        return m;
    }
    m.fixed = false;
    m.vx = vars[idx + VarsList::VX_];
    m.vy = vars[idx + VarsList::VY_];
    m.w = vars[idx + VarsList::VW_];
    m.ax = change[idx + VarsList::VX_];
    m.ay = change[idx + VarsList::VY_];
    m.alpha = change[idx + VarsList::VW_];
    return m;
}

} // namespace

std::string extraAccelName(ExtraAccel policy) {
    switch (policy) {
        case ExtraAccel::NONE:                         return "NONE";
        case ExtraAccel::VELOCITY:                     return "VELOCITY";
        case ExtraAccel::VELOCITY_JOINTS:              return "VELOCITY_JOINTS";
        case ExtraAccel::VELOCITY_AND_DISTANCE:        return "VELOCITY_AND_DISTANCE";
        case ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS: return "VELOCITY_AND_DISTANCE_JOINTS";
    }
    return "UNKNOWN";
}

ExtraAccel extraAccelFromName(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto p : {ExtraAccel::NONE, ExtraAccel::VELOCITY, ExtraAccel::VELOCITY_JOINTS,
                   ExtraAccel::VELOCITY_AND_DISTANCE, ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS}) {
        if (extraAccelName(p) == upper) {
            return p;
        }
    }
    throw std::invalid_argument("unknown extra acceleration: " + name);
}

double extraAcceleration(const CollisionRecord& c, ExtraAccel policy, double h) {
    switch (policy) {
        case ExtraAccel::NONE:
            return 0.0;
        case ExtraAccel::VELOCITY:
            if (c.isJoint()) return 0.0;
            return c.normalVelocity / h;
        case ExtraAccel::VELOCITY_JOINTS:
            return c.normalVelocity / h;
        case ExtraAccel::VELOCITY_AND_DISTANCE:
            if (c.isJoint()) return 0.0;
            return (2 * c.normalVelocity * h + c.distanceToHalfGap()) / (h * h);
        case ExtraAccel::VELOCITY_AND_DISTANCE_JOINTS:
            return (2 * c.normalVelocity * h + c.distanceToHalfGap()) / (h * h);
    }
    return 0.0;
}

std::vector<double> calculateBVector(const entt::registry& registry,
                                     const CollisionList& contacts,
                                     const std::vector<double>& change,
                                     const std::vector<double>& vars,
                                     ExtraAccel policy, double extraAccelTimeStep)
{
    std::vector<double> b(contacts.size(), 0.0);
    for (size_t i = 0; i < contacts.size(); ++i) {
        const CollisionRecord& c = contacts[i];
        BodyMotion const m1 = readMotion(registry, c.primaryBody, vars, change);
        BodyMotion const m2 = readMotion(registry, c.normalBody, vars, change);
        const Vector& r1 = c.getU1();
        const Vector& r2 = c.getU2();
        const Vector& n = c.normal;

        b[i] += extraAcceleration(c, policy, extraAccelTimeStep);

        if (!c.normalFixed) {
            // time derivative of the normal, dotted with the relative velocity
            Vector np;
            if (c.ballNormal) {
                double const radius = c.ballObject ? c.radius1 + c.radius2 : c.radius2;
                np = Vector(m1.vx - m1.w * r1.y, m1.vy + m1.w * r1.x) / radius;
                if (!m2.fixed) {
                    np -= Vector(m2.vx - m2.w * r2.y, m2.vy + m2.w * r2.x) / radius;
                }
            } else {
                np = Vector(-m2.w * n.y, m2.w * n.x);
                if (c.ballObject && !m2.fixed) {
                    b[i] += -c.radius1 * m2.w * m2.w;
                }
            }
            Vector const v1 = m1.fixed ? Vector(0, 0) : Vector(m1.vx - m1.w * r1.y, m1.vy + m1.w * r1.x);
            Vector const v2 = m2.fixed ? Vector(0, 0) : Vector(m2.vx - m2.w * r2.y, m2.vy + m2.w * r2.x);
            double const factor = c.ballNormal ? 1.0 : 2.0;
            b[i] += factor * np.dotProduct(v1 - v2);
        }

        // external acceleration of each contact point, with centripetal term
        if (!m1.fixed) {
            b[i] += n.x * (m1.ax - m1.alpha * r1.y - m1.w * m1.w * r1.x);
            b[i] += n.y * (m1.ay + m1.alpha * r1.x - m1.w * m1.w * r1.y);
        }
        if (!m2.fixed) {
            b[i] -= n.x * (m2.ax - m2.alpha * r2.y - m2.w * m2.w * r2.x);
            b[i] -= n.y * (m2.ay + m2.alpha * r2.x - m2.w * m2.w * r2.y);
        }
        if (!std::isfinite(b[i])) {
            throw std::runtime_error("contact b vector is not finite: " + c.toString());
        }
    }
    return b;
}

} // namespace RigidBodyCollision
