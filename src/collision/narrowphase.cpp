/**
 * @file narrowphase.cpp
 * @brief Vertex, edge and circle tests producing collision records
 */

#include "rigid2d/collision/narrowphase.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>

#include "rigid2d/collision/connector.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/debug.hpp"
#include "rigid2d/core/profile.hpp"

#ifndef ENABLE_NARROWPHASE_DEBUG
#define ENABLE_NARROWPHASE_DEBUG 0
#endif

#define DEBUG_LOG(x) do { \
    if (ENABLE_NARROWPHASE_DEBUG) { RIGID2D_DEBUG_MSG(RIGID2D_DEBUG_LEVEL_VERBOSE, x); } \
} while(0)

namespace RigidBodyCollision {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

// Vertex-vertex contacts are accepted within this fraction of the distance tolerance
constexpr double CORNER_CORNER_FRACTION = 0.6;
constexpr double CORNER_CORNER_MIN = 1e-6;

struct BodyView {
    entt::entity e;
    const Geometry::Polygon* poly;
    Geometry::Pose now;
    std::optional<Geometry::Pose> old;
    double distTol;
};

BodyView viewOf(const entt::registry& registry, entt::entity e) {
    BodyView v;
    v.e = e;
    v.poly = registry.get<Components::Shape>(e).polygon.get();
    v.now = Bodies::currentPose(registry, e);
    v.old = Bodies::oldPose(registry, e);
    v.distTol = registry.get<Components::CollisionTolerance>(e).distanceTol;
    return v;
}

// Parameter of the projection of p onto a straight edge, 0 at v1 and 1 at v2
double segmentParam(const Geometry::Edge& e, const Vector& p) {
    Vector const d = e.v2 - e.v1;
    double const len2 = d.lengthSquared();
    return len2 > 0 ? (p - e.v1).dotProduct(d) / len2 : 0.0;
}

bool projectsOnto(const Geometry::Edge& e, const Vector& p) {
    if (e.isStraight()) {
        double const t = segmentParam(e, p);
        return t >= 0.0 && t <= 1.0;
    }
    return e.arcContains(p);
}

CollisionRecord newRecord(const entt::registry& registry, entt::entity primary,
                          entt::entity normalBody, CollisionKind kind, const char* creator) {
    CollisionRecord c;
    c.primaryBody = primary;
    c.normalBody = normalBody;
    c.kind = kind;
    c.creator = creator;
    c.radius1 = INF;
    c.radius2 = INF;
    c.initFromBodies(registry);
    return c;
}

// Geometry of a vertex of the primary body against an edge of the normal body.
// pN is the vertex in the normal body's coordinates.
void vertexEdgeGeometry(const Geometry::Pose& poseP, const Geometry::Pose& poseN,
                        const Geometry::Edge& edge, const Vector& vertexBody,
                        CollisionRecord& c) {
    Vector const world = poseP.bodyToWorld(vertexBody);
    Vector const pN = poseN.worldToBody(world);
    c.impact1 = world;
    c.distance = edge.distanceToLine(pN);
    Vector const nBody = edge.normalAt(pN);
    c.normal = poseN.rotateBodyToWorld(nBody);
    if (edge.isStraight()) {
        c.ballNormal = false;
        c.hasImpact2 = false;
        c.radius2 = INF;
    } else {
        c.ballNormal = true;
        c.u2 = poseN.bodyToWorld(edge.center) - poseN.position;
        c.radius2 = edge.signedRadius();
        c.impact2 = poseN.bodyToWorld(pN - nBody * c.distance);
        c.hasImpact2 = true;
    }
}

void vertexVertexGeometry(const Geometry::Pose& poseP, const Geometry::Pose& poseN,
                          const Vector& vertexP, const Vector& vertexN,
                          CollisionRecord& c) {
    Vector const world = poseP.bodyToWorld(vertexP);
    Vector const pN = poseN.worldToBody(world);
    Vector const d = pN - vertexN;
    c.distance = d.length();
    c.normal = poseN.rotateBodyToWorld(d.normalized());
    c.impact1 = world;
    c.impact2 = poseN.bodyToWorld(vertexN);
    c.hasImpact2 = true;
}

// Geometry of a convex circular edge of the primary body against an edge of the
// normal body. Returns false when the shapes are degenerate (concentric circles).
bool edgeEdgeGeometry(const Geometry::Pose& poseP, const Geometry::Pose& poseN,
                      const Geometry::Edge& edgeP, const Geometry::Edge& edgeN,
                      CollisionRecord& c, Vector& contactPBody, Vector& contactNBody) {
    double const R = edgeP.radius;
    Vector const centerW = poseP.bodyToWorld(edgeP.center);
    Vector const cN = poseN.worldToBody(centerW);

    c.ballObject = true;
    c.u1 = centerW - poseP.position;
    c.radius1 = R;

    if (edgeN.isStraight()) {
        double const dl = edgeN.distanceToLine(cN);
        Vector const n = edgeN.outwardNormal;
        c.distance = dl - R;
        c.normal = poseN.rotateBodyToWorld(n);
        contactNBody = cN - n * dl;
        Vector const onCircle = cN - n * R;
        c.impact1 = poseN.bodyToWorld(onCircle);
        c.impact2 = poseN.bodyToWorld(contactNBody);
        c.hasImpact2 = true;
        c.ballNormal = false;
        c.radius2 = INF;
        contactPBody = poseP.worldToBody(c.impact1);
        return true;
    }

    Vector const offset = cN - edgeN.center;
    double const L = offset.length();
    if (L < 1e-12) {
        return false;
    }
    Vector const dir = offset / L;
    c.ballNormal = true;
    c.u2 = poseN.bodyToWorld(edgeN.center) - poseN.position;
    c.radius2 = edgeN.signedRadius();
    if (edgeN.outsideIsOut) {
        c.distance = L - R - edgeN.radius;
        c.normal = poseN.rotateBodyToWorld(dir);
        Vector const onP = cN - dir * R;
        c.impact1 = poseN.bodyToWorld(onP);
        contactNBody = edgeN.center + dir * edgeN.radius;
    } else {
        c.distance = edgeN.radius - L - R;
        c.normal = poseN.rotateBodyToWorld(-dir);
        Vector const onP = cN + dir * R;
        c.impact1 = poseN.bodyToWorld(onP);
        contactNBody = edgeN.center + dir * edgeN.radius;
    }
    c.impact2 = poseN.bodyToWorld(contactNBody);
    c.hasImpact2 = true;
    contactPBody = poseP.worldToBody(c.impact1);
    return true;
}

/**
 * @brief Tests every corner of P against the edges of N
 */
void checkVertices(const entt::registry& registry, const BodyView& P, const BodyView& N,
                   double time, CollisionList& out) {
    const auto& edgesN = N.poly->getEdges();
    const auto& vertsN = N.poly->getVertices();
    double const distTol = std::max(P.distTol, N.distTol);
    double const reach = N.poly->boundingRadius(N.now.cmBody) + distTol;
    bool const swept = P.old.has_value() && N.old.has_value();

    const auto& vertsP = P.poly->getVertices();
    for (size_t k = 0; k < vertsP.size(); ++k) {
        const auto& vertex = vertsP[k];
        if (!vertex.corner) {
            continue;
        }
        Vector const pN = N.now.worldToBody(P.now.bodyToWorld(vertex.loc));
        Vector const pOld = swept ? N.old->worldToBody(P.old->bodyToWorld(vertex.loc)) : pN;
        if ((pN - N.now.cmBody).length() > reach && (pOld - N.now.cmBody).length() > reach) {
            continue;
        }

        const Geometry::Edge* best = nullptr;
        const Geometry::Vertex* bestVertex = nullptr;
        int bestVertexIndex = -1;
        const char* creator = "";

        bool const inside = N.poly->isInside(pN);
        if (inside) {
            // Prefer the first edge the vertex crossed on its way in
            double bestFrac = INF;
            if (swept) {
                for (const auto& e : edgesN) {
                    double const dOld = e.distanceToLine(pOld);
                    double const dNow = e.distanceToLine(pN);
                    if (!(dOld >= 0 && dNow < 0)) {
                        continue;
                    }
                    double const frac = dOld / (dOld - dNow);
                    Vector const crossing = pOld + (pN - pOld) * frac;
                    if (!projectsOnto(e, crossing) && !projectsOnto(e, pN)) {
                        continue;
                    }
                    if (frac < bestFrac) {
                        bestFrac = frac;
                        best = &e;
                        creator = "vertex crossed edge";
                    }
                }
            }
            if (best == nullptr) {
                // Started inside or no old pose: take the shallowest edge
                double bestDist = -INF;
                for (const auto& e : edgesN) {
                    double const d = e.distanceToPoint(pN);
                    if (d < 0 && d > bestDist) {
                        bestDist = d;
                        best = &e;
                        creator = "vertex inside";
                    }
                }
            }
        } else {
            double bestDist = INF;
            for (const auto& e : edgesN) {
                double const d = e.distanceToPoint(pN);
                if (d >= 0 && d <= distTol && d < bestDist) {
                    bestDist = d;
                    best = &e;
                    creator = "vertex contact";
                }
            }
            if (best == nullptr) {
                double const limit = CORNER_CORNER_FRACTION * distTol;
                double bestDistV = INF;
                for (size_t j = 0; j < vertsN.size(); ++j) {
                    if (!vertsN[j].corner) {
                        continue;
                    }
                    double const d = (pN - vertsN[j].loc).length();
                    if (d >= CORNER_CORNER_MIN && d <= limit && d < bestDistV) {
                        bestDistV = d;
                        bestVertex = &vertsN[j];
                        bestVertexIndex = static_cast<int>(j);
                    }
                }
            }
        }

        if (best != nullptr) {
            CollisionRecord c = newRecord(registry, P.e, N.e, CollisionKind::CornerEdge, creator);
            c.primaryVertex = static_cast<int>(k);
            c.primaryEdge = vertex.edge2;
            c.normalEdge = best->index;
            vertexEdgeGeometry(P.now, N.now, *best, vertex.loc, c);
            computeVelocity(registry, c);
            c.setDetectedTime(time);
            DEBUG_LOG("vertex/edge " << c.toString() << "\n");
            addCollision(out, c);
        } else if (bestVertex != nullptr) {
            CollisionRecord c = newRecord(registry, P.e, N.e, CollisionKind::CornerCorner, "vertex vertex");
            c.primaryVertex = static_cast<int>(k);
            c.normalVertex = bestVertexIndex;
            c.normalEdge = bestVertex->edge2;
            vertexVertexGeometry(P.now, N.now, vertex.loc, bestVertex->loc, c);
            computeVelocity(registry, c);
            c.setDetectedTime(time);
            DEBUG_LOG("vertex/vertex " << c.toString() << "\n");
            addCollision(out, c);
        }
    }
}

/**
 * @brief Tests the convex circular edges of P against every edge of N
 *
 * @param convexPairsToo Whether to test P's circles against N's convex circles;
 *        false on the second pass over a pair so those are found once
 */
void checkCurvedEdges(const entt::registry& registry, const BodyView& P, const BodyView& N,
                      bool convexPairsToo, double time, CollisionList& out) {
    double const distTol = std::max(P.distTol, N.distTol);
    for (const auto& eP : P.poly->getEdges()) {
        if (eP.isStraight() || !eP.outsideIsOut) {
            continue;
        }
        for (const auto& eN : N.poly->getEdges()) {
            if (!eN.isStraight() && eN.outsideIsOut && !convexPairsToo) {
                continue;
            }
            if (!eN.isStraight() && !eN.outsideIsOut && eN.radius <= eP.radius) {
                continue;
            }
            CollisionRecord c = newRecord(registry, P.e, N.e, CollisionKind::EdgeEdge,
                                          eN.isStraight() ? "circle straight" : "circle circle");
            c.primaryEdge = eP.index;
            c.normalEdge = eN.index;
            Vector contactP, contactN;
            if (!edgeEdgeGeometry(P.now, N.now, eP, eN, c, contactP, contactN)) {
                continue;
            }
            if (!(c.distance < distTol) || c.distance < -eP.radius) {
                continue;
            }
            if (eN.isStraight()) {
                // circle center must sit over the segment, on the outside
                Vector const cN = N.now.worldToBody(P.now.bodyToWorld(eP.center));
                double const t = segmentParam(eN, cN);
                if (t < 0.0 || t > 1.0 || eN.distanceToLine(cN) <= 0) {
                    continue;
                }
            } else if (!eN.arcContains(contactN)) {
                continue;
            }
            if (!eP.arcContains(contactP)) {
                continue;
            }
            computeVelocity(registry, c);
            c.setDetectedTime(time);
            DEBUG_LOG("edge/edge " << c.toString() << "\n");
            addCollision(out, c);
        }
    }
}

} // namespace

void computeVelocity(const entt::registry& registry, CollisionRecord& c) {
    Vector const posP(registry.get<Components::Position>(c.primaryBody));
    Vector const posN(registry.get<Components::Position>(c.normalBody));
    c.r1 = c.impact1 - posP;
    c.r2 = (c.hasImpact2 ? c.impact2 : c.impact1) - posN;
    Vector const v1 = Bodies::velocityAt(registry, c.primaryBody, c.getU1());
    Vector const v2 = Bodies::velocityAt(registry, c.normalBody, c.getU2());
    c.normalVelocity = c.normal.dotProduct(v1 - v2);
}

void checkPair(const entt::registry& registry, entt::entity a, entt::entity b,
               double time, CollisionList& out) {
    BodyView const A = viewOf(registry, a);
    BodyView const B = viewOf(registry, b);
    checkVertices(registry, A, B, time, out);
    checkVertices(registry, B, A, time, out);
    checkCurvedEdges(registry, A, B, /*convexPairsToo=*/true, time, out);
    checkCurvedEdges(registry, B, A, /*convexPairsToo=*/false, time, out);
}

void narrowPhase(const entt::registry& registry,
                 const std::vector<CandidatePair>& pairs,
                 double time, CollisionList& out) {
    PROFILE_SCOPE("Narrowphase");
    for (const auto& pair : pairs) {
        checkPair(registry, pair.eA, pair.eB, time, out);
    }
}

void updateRecordGeometry(const entt::registry& registry, CollisionRecord& c) {
    if (c.connector != nullptr) {
        c.connector->updateCollision(registry, c);
        computeVelocity(registry, c);
        return;
    }
    Geometry::Pose const poseP = Bodies::currentPose(registry, c.primaryBody);
    Geometry::Pose const poseN = Bodies::currentPose(registry, c.normalBody);
    const auto& polyP = *registry.get<Components::Shape>(c.primaryBody).polygon;
    const auto& polyN = *registry.get<Components::Shape>(c.normalBody).polygon;

    switch (c.kind) {
        case CollisionKind::CornerEdge:
            vertexEdgeGeometry(poseP, poseN, polyN.getEdges().at(c.normalEdge),
                               polyP.getVertices().at(c.primaryVertex).loc, c);
            break;
        case CollisionKind::CornerCorner:
            vertexVertexGeometry(poseP, poseN, polyP.getVertices().at(c.primaryVertex).loc,
                                 polyN.getVertices().at(c.normalVertex).loc, c);
            break;
        case CollisionKind::EdgeEdge: {
            Vector contactP, contactN;
            if (!edgeEdgeGeometry(poseP, poseN, polyP.getEdges().at(c.primaryEdge),
                                  polyN.getEdges().at(c.normalEdge), c, contactP, contactN)) {
                throw std::runtime_error("updateRecordGeometry: concentric circles " + c.toString());
            }
            break;
        }
        case CollisionKind::Joint:
        case CollisionKind::Rope:
            throw std::logic_error("updateRecordGeometry: connector record without connector");
    }
    computeVelocity(registry, c);
}

} // namespace RigidBodyCollision
