/**
 * @file broadphase.cpp
 * @brief Implementation of quadtree-based broad-phase collision detection
 */

#include <algorithm>
#include <cmath>
#include <memory>
#include <vector>

#include "rigid2d/collision/broadphase.hpp"
#include "rigid2d/components/basic.hpp"
#include "rigid2d/components/body.hpp"
#include "rigid2d/core/profile.hpp"

namespace RigidBodyCollision
{

namespace {

struct AABBEntity {
    entt::entity entity;
    AABB box;
};

bool boxesOverlap(const AABB &a, const AABB &b) {
    if (a.maxx < b.minx || a.minx > b.maxx) return false;
    if (a.maxy < b.miny || a.miny > b.maxy) return false;
    return true;
}

/**
 * @brief A node in the quadtree
 *
 * A leaf holds up to 'capacity' boxes. A full leaf splits into four children
 * and pushes down every box that fits entirely inside one child; boxes that
 * straddle a split line stay with the parent.
 */
struct BoxNode {
    double x, y, size;
    int capacity;
    bool is_leaf;
    std::vector<AABBEntity> objects;
    std::unique_ptr<BoxNode> nw, ne, sw, se;

    BoxNode(double _x, double _y, double _size, int _capacity)
        : x(_x), y(_y), size(_size), capacity(_capacity), is_leaf(true) {}

    bool nodeContains(const AABB &bb) const {
        return (bb.minx >= x && bb.maxx < (x + size) &&
                bb.miny >= y && bb.maxy < (y + size));
    }

    bool nodeOverlaps(const AABB &bb) const {
        if (bb.maxx < x || bb.minx > x+size) return false;
        if (bb.maxy < y || bb.miny > y+size) return false;
        return true;
    }

    void subdivide() {
        double half = size / 2.0;
        nw = std::make_unique<BoxNode>(x,       y,       half, capacity);
        ne = std::make_unique<BoxNode>(x+half,  y,       half, capacity);
        sw = std::make_unique<BoxNode>(x,       y+half,  half, capacity);
        se = std::make_unique<BoxNode>(x+half,  y+half,  half, capacity);
        is_leaf = false;
    }

    bool pushDown(const AABBEntity &o) {
        if (!nodeContains(o.box)) return false;
        if      (nw->nodeContains(o.box)) nw->insert(o);
        else if (ne->nodeContains(o.box)) ne->insert(o);
        else if (sw->nodeContains(o.box)) sw->insert(o);
        else if (se->nodeContains(o.box)) se->insert(o);
        else return false;
        return true;
    }

    void insert(const AABBEntity &o) {
        if (!nodeOverlaps(o.box)) return;

        if (is_leaf && (int)objects.size() < capacity) {
            objects.push_back(o);
            return;
        }

        if (is_leaf) {
            subdivide();
            auto oldObjs = std::move(objects);
            objects.clear();
            for (auto &old : oldObjs) {
                if (!pushDown(old)) objects.push_back(old);
            }
        }

        if (!pushDown(o)) objects.push_back(o);
    }

    void query(const AABB &q, std::vector<AABBEntity> &found) const {
        if (q.maxx < x || q.minx > x+size) return;
        if (q.maxy < y || q.miny > y+size) return;

        for (auto &o : objects) {
            if (boxesOverlap(o.box, q)) found.push_back(o);
        }
        if (!is_leaf) {
            nw->query(q, found);
            ne->query(q, found);
            sw->query(q, found);
            se->query(q, found);
        }
    }
};

void growBox(AABB &box, const Vector &center, double r) {
    box.minx = std::min(box.minx, center.x - r);
    box.miny = std::min(box.miny, center.y - r);
    box.maxx = std::max(box.maxx, center.x + r);
    box.maxy = std::max(box.maxy, center.y + r);
}

} // namespace

AABB computeAABB(const entt::registry& registry, entt::entity e) {
    const auto &shape = registry.get<Components::Shape>(e);
    double const tol = registry.get<Components::CollisionTolerance>(e).distanceTol;
    double const r = shape.polygon->boundingRadius(shape.cmBody) + tol;

    Vector const pos(registry.get<Components::Position>(e));
    AABB box{pos.x, pos.y, pos.x, pos.y};
    growBox(box, pos, r);
    if (auto old = Bodies::oldPose(registry, e)) {
        growBox(box, old->position, r);
    }
    return box;
}

std::vector<CandidatePair> broadPhase(const entt::registry& registry)
{
    PROFILE_SCOPE("Broadphase");

    std::vector<AABBEntity> boxes;
    auto view = registry.view<Components::Position, Components::Shape, Components::Mass>();
    for (auto e : view) {
        boxes.push_back({e, computeAABB(registry, e)});
    }
    if (boxes.size() < 2) {
        return {};
    }

    // Root square enclosing every box
    AABB world = boxes.front().box;
    for (const auto &b : boxes) {
        world.minx = std::min(world.minx, b.box.minx);
        world.miny = std::min(world.miny, b.box.miny);
        world.maxx = std::max(world.maxx, b.box.maxx);
        world.maxy = std::max(world.maxy, b.box.maxy);
    }
    double const size = std::max(world.maxx - world.minx, world.maxy - world.miny) + 2.0;
    BoxNode root(world.minx - 1.0, world.miny - 1.0, size, 8);
    for (const auto &b : boxes) {
        root.insert(b);
    }

    std::vector<CandidatePair> pairs;
    std::vector<AABBEntity> found;
    for (const auto &query : boxes) {
        entt::entity const e = query.entity;
        found.clear();
        root.query(query.box, found);

        for (auto &f : found) {
            // each pair once, from its lower entity
            if (!(f.entity > e)) continue;
            if (Bodies::isFixed(registry, e) && Bodies::isFixed(registry, f.entity)) continue;
            if (!Bodies::canCollide(registry, e, f.entity)) continue;
            pairs.push_back({e, f.entity});
        }
    }

    std::sort(pairs.begin(), pairs.end(), [](const CandidatePair &a, const CandidatePair &b) {
        if (a.eA != b.eA) return a.eA < b.eA;
        return a.eB < b.eB;
    });
    return pairs;
}

} // namespace RigidBodyCollision
