/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/SpatialQueryAdapter.hpp"
#include "core/Logger.hpp"
#include <format>

namespace SwarmForge {

namespace {
// Re-cast starts this far past a skipped non-solid hit
constexpr float SKIP_NUDGE = 0.1f;
const Vector3D DOWN(0.0f, -1.0f, 0.0f);
} // namespace

std::optional<RaycastHit> SpatialQueryAdapter::castSolid(const Vector3D& origin,
                                                         const Vector3D& direction,
                                                         float length,
                                                         const RaycastFilter& filter) const {
    const Vector3D dir = direction.normalized();
    if (dir.lengthSquared() == 0.0f || length <= 0.0f) {
        return std::nullopt;
    }

    Vector3D from = origin;
    float remaining = length;
    float travelled = 0.0f;

    for (uint32_t skips = 0; skips <= m_settings.maxGroundSkips; ++skips) {
        auto hit = m_world.raycast(from, dir, remaining, filter);
        if (!hit) {
            return std::nullopt;
        }
        if (hit->solid) {
            hit->distance += travelled;
            return hit;
        }

        const float advance = hit->distance + SKIP_NUDGE;
        travelled += advance;
        remaining -= advance;
        if (remaining <= 0.0f) {
            return std::nullopt;
        }
        from = hit->point + dir * SKIP_NUDGE;
    }

    WORLD_DEBUG(std::format("Ray from {} exceeded {} non-solid skips", origin,
                            m_settings.maxGroundSkips));
    return std::nullopt;
}

std::optional<Vector3D> SpatialQueryAdapter::findGround(const Vector3D& origin, float length,
                                                        const RaycastFilter& filter) const {
    auto hit = castSolid(origin, DOWN, length, filter);
    if (!hit) {
        return std::nullopt;
    }
    return hit->point;
}

std::optional<Vector3D> SpatialQueryAdapter::groundPosition(const Vector3D& pos) const {
    return findGround(pos + Vector3D(0.0f, 1.0f, 0.0f), m_settings.groundRayLength);
}

std::optional<Vector3D> SpatialQueryAdapter::snapToGround(const Vector3D& pos,
                                                          float heightOffset) const {
    auto ground = groundPosition(pos);
    if (!ground) {
        return std::nullopt;
    }
    return pos.withY(ground->getY() + heightOffset);
}

bool SpatialQueryAdapter::isOnGround(const Vector3D& pos, float heightOffset) const {
    return findGround(pos, heightOffset + m_settings.groundCheckDistance).has_value();
}

bool SpatialQueryAdapter::hasLineOfSight(const Vector3D& from, const Vector3D& to,
                                         const RaycastFilter& filter) const {
    const Vector3D delta = to - from;
    const float dist = delta.length();
    if (dist < 0.01f) {
        return true;
    }
    return !castSolid(from, delta, dist, filter).has_value();
}

bool SpatialQueryAdapter::isBlocked(const Vector3D& feet, const Vector3D& direction, float distance,
                                    float probeHeight, const RaycastFilter& filter) const {
    const Vector3D flat = direction.flattened();
    if (flat.lengthSquared() < 0.0001f || distance <= 0.0f) {
        return false;
    }
    const Vector3D probe = feet + Vector3D(0.0f, probeHeight, 0.0f);
    return castSolid(probe, flat, distance, filter).has_value();
}

} // namespace SwarmForge
