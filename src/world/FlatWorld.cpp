/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/FlatWorld.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace SwarmForge {

namespace {

// Slab test; returns entry distance along the ray or -1 on miss
float intersectBox(const Vector3D& origin, const Vector3D& dir, const BoxObstacle& box) {
    float tMin = 0.0f;
    float tMax = std::numeric_limits<float>::max();

    const float o[3] = {origin.getX(), origin.getY(), origin.getZ()};
    const float d[3] = {dir.getX(), dir.getY(), dir.getZ()};
    const float lo[3] = {box.min.getX(), box.min.getY(), box.min.getZ()};
    const float hi[3] = {box.max.getX(), box.max.getY(), box.max.getZ()};

    for (int axis = 0; axis < 3; ++axis) {
        if (std::fabs(d[axis]) < 1e-8f) {
            if (o[axis] < lo[axis] || o[axis] > hi[axis]) {
                return -1.0f;
            }
            continue;
        }
        const float inv = 1.0f / d[axis];
        float t1 = (lo[axis] - o[axis]) * inv;
        float t2 = (hi[axis] - o[axis]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return -1.0f;
        }
    }
    return tMin;
}

} // namespace

std::optional<RaycastHit> FlatWorld::raycast(const Vector3D& origin, const Vector3D& direction,
                                             float length, const RaycastFilter& filter) const {
    const Vector3D dir = direction.normalized();
    if (dir.lengthSquared() == 0.0f || length <= 0.0f) {
        return std::nullopt;
    }

    std::optional<RaycastHit> best;
    float bestDist = length;

    // Ground plane is one-sided: only rays from above heading down hit it
    if (dir.getY() < 0.0f && origin.getY() >= m_groundHeight && !filter.ignores("ground")) {
        const float t = (origin.getY() - m_groundHeight) / -dir.getY();
        if (t <= bestDist) {
            bestDist = t;
            best = RaycastHit{origin + dir * t, t, 0, true, "ground"};
        }
    }

    for (const auto& box : m_boxes) {
        if (filter.ignores(box.tag) || box.contains(origin)) {
            continue;
        }
        const float t = intersectBox(origin, dir, box);
        if (t >= 0.0f && t <= bestDist) {
            bestDist = t;
            best = RaycastHit{origin + dir * t, t, box.id, box.solid, box.tag};
        }
    }

    return best;
}

uint32_t FlatWorld::addBox(const Vector3D& min, const Vector3D& max, bool solid,
                           const std::string& tag) {
    BoxObstacle box;
    box.id = m_nextId++;
    box.min = Vector3D(std::min(min.getX(), max.getX()), std::min(min.getY(), max.getY()),
                       std::min(min.getZ(), max.getZ()));
    box.max = Vector3D(std::max(min.getX(), max.getX()), std::max(min.getY(), max.getY()),
                       std::max(min.getZ(), max.getZ()));
    box.solid = solid;
    box.tag = tag;
    m_boxes.push_back(box);
    WORLD_DEBUG(std::format("Added {} box {} from {} to {}", solid ? "solid" : "decorative",
                            box.id, box.min, box.max));
    return box.id;
}

bool FlatWorld::removeBox(uint32_t id) {
    return std::erase_if(m_boxes, [id](const BoxObstacle& b) { return b.id == id; }) > 0;
}

bool FlatWorld::moveBox(uint32_t id, const Vector3D& min, const Vector3D& max) {
    auto it = std::find_if(m_boxes.begin(), m_boxes.end(),
                           [id](const BoxObstacle& b) { return b.id == id; });
    if (it == m_boxes.end()) {
        return false;
    }
    it->min = min;
    it->max = max;
    return true;
}

const BoxObstacle* FlatWorld::getBox(uint32_t id) const {
    auto it = std::find_if(m_boxes.begin(), m_boxes.end(),
                           [id](const BoxObstacle& b) { return b.id == id; });
    return it != m_boxes.end() ? &*it : nullptr;
}

} // namespace SwarmForge
