/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_QUERY_ADAPTER_HPP
#define SPATIAL_QUERY_ADAPTER_HPP

#include "core/SimulationSettings.hpp"
#include "world/SpatialQuery.hpp"
#include <optional>

namespace SwarmForge {

/**
 * @brief Ground and visibility queries built on ISpatialQuery.
 *
 * All ground lookups skip non-solid hits in a bounded loop
 * (JumpSettings::maxGroundSkips) so decorative geometry never acts as floor.
 */
class SpatialQueryAdapter {
public:
    SpatialQueryAdapter(const ISpatialQuery& world, const JumpSettings& settings)
        : m_world(world), m_settings(settings) {}

    /**
     * @brief First solid surface straight below origin within length.
     */
    std::optional<Vector3D> findGround(const Vector3D& origin, float length,
                                       const RaycastFilter& filter = {}) const;

    // Ground under pos, cast from one unit above it
    std::optional<Vector3D> groundPosition(const Vector3D& pos) const;

    // Logical position resting on the ground under pos
    std::optional<Vector3D> snapToGround(const Vector3D& pos, float heightOffset) const;

    bool isOnGround(const Vector3D& pos, float heightOffset) const;

    bool hasLineOfSight(const Vector3D& from, const Vector3D& to,
                        const RaycastFilter& filter = {}) const;

    /**
     * @brief Horizontal probe for walls in front of the feet.
     * @param feet Feet position (logical position minus height offset)
     * @param probeHeight Obstacles lower than this are stepped over
     */
    bool isBlocked(const Vector3D& feet, const Vector3D& direction, float distance,
                   float probeHeight, const RaycastFilter& filter = {}) const;

    const ISpatialQuery& world() const { return m_world; }

private:
    std::optional<RaycastHit> castSolid(const Vector3D& origin, const Vector3D& direction,
                                        float length, const RaycastFilter& filter) const;

    const ISpatialQuery& m_world;
    const JumpSettings& m_settings;
};

} // namespace SwarmForge

#endif // SPATIAL_QUERY_ADAPTER_HPP
