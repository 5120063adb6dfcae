/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SPATIAL_QUERY_HPP
#define SPATIAL_QUERY_HPP

#include "utils/Vector3D.hpp"
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace SwarmForge {

struct RaycastHit {
    Vector3D point;
    float distance{0.0f};
    uint32_t obstacleId{0};      // 0 is the ground plane
    bool solid{true};            // Decorative geometry is non-solid
    std::string tag;
};

struct RaycastFilter {
    // Geometry carrying one of these tags is transparent to the ray
    boost::container::small_vector<std::string, 2> ignoreTags;

    bool ignores(const std::string& tag) const {
        return !tag.empty() &&
               std::find(ignoreTags.begin(), ignoreTags.end(), tag) != ignoreTags.end();
    }
};

/**
 * @brief World geometry queries provided by the host engine.
 *
 * Only the first hit along the ray is reported; callers that need to look
 * past non-solid geometry re-cast from just beyond the hit.
 */
class ISpatialQuery {
public:
    virtual ~ISpatialQuery() = default;

    virtual std::optional<RaycastHit> raycast(const Vector3D& origin, const Vector3D& direction,
                                              float length, const RaycastFilter& filter) const = 0;
};

} // namespace SwarmForge

#endif // SPATIAL_QUERY_HPP
