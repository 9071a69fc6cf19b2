/**
 * @file collision_handling.cpp
 * @brief Simultaneous and serial impulse resolution
 */

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <numeric>
#include <stdexcept>

#include "rigid2d/collision/collision_handling.hpp"
#include "rigid2d/components/basic.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/constants.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"

namespace RigidBodyCollision {

#if !defined(ENABLE_IMPULSE_DEBUG)
    #define ENABLE_IMPULSE_DEBUG 0
#endif

#define DEBUG_LOG(x) \
    do { if (ENABLE_IMPULSE_DEBUG) { std::cout << x << std::endl; } } while(0)

namespace {

bool movable(const entt::registry& registry, entt::entity e) {
    return e != entt::null && !Bodies::isFixed(registry, e);
}

bool contains(const std::vector<entt::entity>& list, entt::entity e) {
    return std::find(list.begin(), list.end(), e) != list.end();
}

/**
 * @brief Solves a subset and reports a failure beyond the tolerance
 */
void solveImpulses(const Matrix& A, const std::vector<double>& b,
                   const std::vector<bool>& joint, std::vector<double>& j)
{
    LcpResult const r = solveLCP_PGS(A, b, joint, j,
                                     SimulatorConstants::SolverMaxIterations,
                                     SimulatorConstants::SolverTolerance);
    if (!r.converged && r.maxResidual > 1e-4) {
        RIGID2D_DEBUG_MSG(RIGID2D_DEBUG_LEVEL_BASIC,
            "impulse solve not converged, n=" << b.size()
            << " residual=" << r.maxResidual << "\n");
    }
}

} // namespace

std::string handlingName(CollisionHandling handling) {
    switch (handling) {
        case CollisionHandling::SIMULTANEOUS:             return "SIMULTANEOUS";
        case CollisionHandling::HYBRID:                   return "HYBRID";
        case CollisionHandling::SERIAL_SEPARATE:          return "SERIAL_SEPARATE";
        case CollisionHandling::SERIAL_GROUPED:           return "SERIAL_GROUPED";
        case CollisionHandling::SERIAL_SEPARATE_LASTPASS: return "SERIAL_SEPARATE_LASTPASS";
        case CollisionHandling::SERIAL_GROUPED_LASTPASS:  return "SERIAL_GROUPED_LASTPASS";
    }
    return "UNKNOWN";
}

CollisionHandling handlingFromName(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (auto h : {CollisionHandling::SIMULTANEOUS, CollisionHandling::HYBRID,
                   CollisionHandling::SERIAL_SEPARATE, CollisionHandling::SERIAL_GROUPED,
                   CollisionHandling::SERIAL_SEPARATE_LASTPASS,
                   CollisionHandling::SERIAL_GROUPED_LASTPASS}) {
        if (handlingName(h) == upper) {
            return h;
        }
    }
    throw std::invalid_argument("unknown collision handling: " + name);
}

double influence(const entt::registry& registry,
                 const CollisionRecord& ci, const CollisionRecord& cj,
                 entt::entity body)
{
    if (!movable(registry, body)) {
        return 0.0;
    }
    Vector ri;
    if (ci.primaryBody == body) {
        ri = ci.r1;
    } else if (ci.normalBody == body) {
        ri = ci.r2;
    } else {
        return 0.0;
    }
    Vector rj;
    double factor;
    if (cj.primaryBody == body) {
        rj = cj.r1;
        factor = 1.0;
    } else if (cj.normalBody == body) {
        rj = cj.r2;
        factor = -1.0;
    } else {
        return 0.0;
    }
    double const invM = Bodies::inverseMass(registry, body);
    double const invI = Bodies::inverseInertia(registry, body);
    // change in the body's velocity at ri per unit impulse along nj at rj
    Vector const dv = cj.normal * invM + angularCross(rj.cross(cj.normal) * invI, ri);
    return factor * ci.normal.dotProduct(dv);
}

Matrix makeCollisionMatrix(const entt::registry& registry, const CollisionList& collisions) {
    size_t const n = collisions.size();
    Matrix A(n, std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        const auto& ci = collisions[i];
        for (size_t k = 0; k < n; ++k) {
            const auto& cj = collisions[k];
            A[i][k] += influence(registry, ci, cj, ci.primaryBody);
            A[i][k] -= influence(registry, ci, cj, ci.normalBody);
        }
    }
    return A;
}

std::vector<size_t> subsetCollisions2(const entt::registry& registry,
                                      const CollisionList& collisions,
                                      size_t start, bool hybrid,
                                      const std::vector<double>& v,
                                      double minVelocity)
{
    std::vector<size_t> subset{start};
    std::vector<bool> inSubset(collisions.size(), false);
    inSubset[start] = true;

    const auto& startC = collisions[start];
    std::vector<entt::entity> bodies;
    if (movable(registry, startC.primaryBody)) bodies.push_back(startC.primaryBody);
    if (movable(registry, startC.normalBody)) bodies.push_back(startC.normalBody);

    if (hybrid) {
        for (size_t i = 0; i < collisions.size(); ++i) {
            const auto& c = collisions[i];
            if (inSubset[i] || c.isJoint() || !(v[i] < minVelocity)) continue;
            if (c.hasBody(startC.primaryBody) || c.hasBody(startC.normalBody)) {
                subset.push_back(i);
                inSubset[i] = true;
                if (!contains(bodies, c.primaryBody)) bodies.push_back(c.primaryBody);
                if (!contains(bodies, c.normalBody)) bodies.push_back(c.normalBody);
            }
        }
    }

    // follow joint chains until nothing more is added
    size_t n;
    do {
        n = subset.size();
        for (size_t i = 0; i < collisions.size(); ++i) {
            const auto& c = collisions[i];
            if (inSubset[i] || !c.isJoint()) continue;
            if (contains(bodies, c.primaryBody)) {
                subset.push_back(i);
                inSubset[i] = true;
                if (movable(registry, c.normalBody) && !contains(bodies, c.normalBody)) {
                    bodies.push_back(c.normalBody);
                }
            } else if (contains(bodies, c.normalBody)) {
                subset.push_back(i);
                inSubset[i] = true;
                if (movable(registry, c.primaryBody) && !contains(bodies, c.primaryBody)) {
                    bodies.push_back(c.primaryBody);
                }
            }
        }
    } while (n < subset.size());
    return subset;
}

std::vector<std::vector<size_t>> connectedSubsets(const entt::registry& registry,
                                                  const CollisionList& collisions)
{
    std::vector<std::vector<size_t>> subsets;
    std::vector<bool> used(collisions.size(), false);
    for (size_t first = 0; first < collisions.size(); ++first) {
        if (used[first]) continue;
        std::vector<size_t> subset{first};
        used[first] = true;
        std::vector<entt::entity> bodies;
        if (movable(registry, collisions[first].primaryBody)) bodies.push_back(collisions[first].primaryBody);
        if (movable(registry, collisions[first].normalBody)) bodies.push_back(collisions[first].normalBody);

        size_t n;
        do {
            n = subset.size();
            for (size_t i = 0; i < collisions.size(); ++i) {
                if (used[i]) continue;
                const auto& c = collisions[i];
                bool const touchesPrimary = contains(bodies, c.primaryBody);
                bool const touchesNormal = contains(bodies, c.normalBody);
                if (!touchesPrimary && !touchesNormal) continue;
                subset.push_back(i);
                used[i] = true;
                if (movable(registry, c.primaryBody) && !touchesPrimary) bodies.push_back(c.primaryBody);
                if (movable(registry, c.normalBody) && !touchesNormal) bodies.push_back(c.normalBody);
            }
        } while (n < subset.size());
        subsets.push_back(std::move(subset));
    }
    return subsets;
}

void applyCollisionImpulse(const entt::registry& registry, VarsList& vars,
                           CollisionRecord& c, double j)
{
    if (!c.isJoint() && j < 0) {
        if (j < -SimulatorConstants::TinyImpulse) {
            throw std::logic_error("negative impulse is impossible: " + c.toString());
        }
        j = 0;
    }
    c.impulse = j;
    if (j == 0) {
        return;
    }
    DebugStats::updateImpulse(j);

    auto push = [&](entt::entity e, double mag, const Vector& r) {
        if (!movable(registry, e)) return;
        int const idx = registry.get<Components::BodyInfo>(e).varsIndex;
        if (idx < 0) return;
        double const invM = Bodies::inverseMass(registry, e);
        double const invI = Bodies::inverseInertia(registry, e);
        vars.setValue(idx + VarsList::VX_, vars.getValue(idx + VarsList::VX_) + c.normal.x * mag * invM);
        vars.setValue(idx + VarsList::VY_, vars.getValue(idx + VarsList::VY_) + c.normal.y * mag * invM);
        vars.setValue(idx + VarsList::VW_, vars.getValue(idx + VarsList::VW_) + r.cross(c.normal) * mag * invI);
    };
    push(c.primaryBody, j, c.r1);
    push(c.normalBody, -j, c.r2);
    DEBUG_LOG("[Impulse] j=" << j << " " << c.toString());
}

bool handleCollisionsSimultaneous(const entt::registry& registry, VarsList& vars,
                                  CollisionList& collisions,
                                  CollisionTotals* totals)
{
    size_t const n = collisions.size();
    std::vector<double> b(n);
    std::vector<bool> joint(n);
    for (size_t k = 0; k < n; ++k) {
        const auto& c = collisions[k];
        b[k] = c.normalVelocity * (c.contact() ? 1.0 : 1.0 + c.elasticity);
        joint[k] = c.isJoint();
    }
    Matrix const A = makeCollisionMatrix(registry, collisions);
    std::vector<double> j(n, 0.0);
    solveImpulses(A, b, joint, j);

    bool impulse = false;
    for (size_t i = 0; i < n; ++i) {
        if (j[i] > SimulatorConstants::TinyImpulse) {
            impulse = true;
        }
        applyCollisionImpulse(registry, vars, collisions[i], j[i]);
    }
    if (totals) {
        totals->addImpulses(1);
    }
    return impulse;
}

bool handleCollisionsSerial(const entt::registry& registry, VarsList& vars,
                            CollisionList& collisions, std::mt19937& rng,
                            const SerialOptions& options,
                            CollisionTotals* totals)
{
    size_t const n = collisions.size();
    double smallVelocity = options.smallVelocity;
    int loopCtr = 0;
    int const panicLimit = 20 * static_cast<int>(n);
    int loopPanic = panicLimit;

    std::vector<double> e(n), b(n), j2(n, 0.0);
    std::vector<bool> joint(n);
    for (size_t i = 0; i < n; ++i) {
        const auto& c = collisions[i];
        joint[i] = c.isJoint();
        e[i] = (options.grouped && joint[i]) ? 0.0 : c.elasticity;
        b[i] = c.normalVelocity;
    }
    Matrix const A = makeCollisionMatrix(registry, collisions);

    std::vector<size_t> order(n);
    std::iota(order.begin(), order.end(), 0);

    long focus;
    do {
        loopCtr++;
        if (options.doPanic && loopCtr > loopPanic) {
            smallVelocity *= 2;
            loopPanic += panicLimit;
            DEBUG_LOG("[Serial] panic loopCtr=" << loopCtr << " smallVelocity=" << smallVelocity);
        }

        // random order so every record gets an even chance to be the focus
        std::shuffle(order.begin(), order.end(), rng);
        focus = -1;
        for (size_t k : order) {
            if ((!joint[k] && b[k] < -smallVelocity) ||
                (joint[k] && std::fabs(b[k]) > smallVelocity)) {
                focus = static_cast<long>(k);
                break;
            }
        }
        if (focus == -1 && !options.lastPass) {
            break;
        }

        std::vector<bool> set(n, false);
        if (focus == -1) {
            std::fill(set.begin(), set.end(), true);
        } else if (options.hybrid || options.grouped) {
            for (size_t idx : subsetCollisions2(registry, collisions, static_cast<size_t>(focus),
                                                options.hybrid, b, -smallVelocity)) {
                set[idx] = true;
            }
        } else {
            set[static_cast<size_t>(focus)] = true;
        }

        std::vector<size_t> members;
        for (size_t k = 0; k < n; ++k) {
            if (set[k]) members.push_back(k);
        }
        size_t const n1 = members.size();
        Matrix A1(n1, std::vector<double>(n1, 0.0));
        std::vector<double> b1(n1), j1(n1, 0.0);
        std::vector<bool> joint1(n1);
        for (size_t r = 0; r < n1; ++r) {
            size_t const i = members[r];
            b1[r] = b[i];
            if (focus != -1) {
                b1[r] *= 1.0 + e[i];
            }
            joint1[r] = joint[i];
            for (size_t s = 0; s < n1; ++s) {
                A1[r][s] = A[i][members[s]];
            }
        }
        solveImpulses(A1, b1, joint1, j1);

        for (size_t r = 0; r < n1; ++r) {
            j2[members[r]] += j1[r];
        }
        for (size_t i = 0; i < n; ++i) {
            for (size_t r = 0; r < n1; ++r) {
                b[i] += A[i][members[r]] * j1[r];
            }
        }
        if (totals) {
            totals->addImpulses(1);
        }
    } while (focus > -1);

    bool impulse = false;
    for (size_t i = 0; i < n; ++i) {
        if (j2[i] > SimulatorConstants::TinyImpulse) {
            impulse = true;
        }
        applyCollisionImpulse(registry, vars, collisions[i], j2[i]);
    }
    if (loopCtr > 100 + 2 * static_cast<int>(n * std::log(n + 1.0))) {
        DEBUG_LOG("[Serial] many loops: n=" << n << " loopCtr=" << loopCtr
                  << " smallVelocity=" << smallVelocity);
    }
    return impulse;
}

bool handleCollisions(const entt::registry& registry, VarsList& vars,
                      CollisionList& collisions, CollisionHandling handling,
                      std::mt19937& rng, CollisionTotals* totals)
{
    PROFILE_SCOPE("HandleCollisions");
    if (collisions.empty()) {
        throw std::invalid_argument("empty record list passed to handleCollisions");
    }
    SerialOptions options;
    options.smallVelocity = SimulatorConstants::SmallVelocity;
    switch (handling) {
        case CollisionHandling::SIMULTANEOUS:
            return handleCollisionsSimultaneous(registry, vars, collisions, totals);
        case CollisionHandling::HYBRID:
            options.hybrid = true;
            break;
        case CollisionHandling::SERIAL_SEPARATE:
            options.grouped = false;
            options.lastPass = false;
            break;
        case CollisionHandling::SERIAL_GROUPED:
            options.lastPass = false;
            break;
        case CollisionHandling::SERIAL_SEPARATE_LASTPASS:
            options.grouped = false;
            break;
        case CollisionHandling::SERIAL_GROUPED_LASTPASS:
            break;
    }
    return handleCollisionsSerial(registry, vars, collisions, rng, options, totals);
}

} // namespace RigidBodyCollision
