/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATH_SMOOTHER_HPP
#define PATH_SMOOTHER_HPP

#include <vector>
#include <cmath>
#include "ai/pathfinding/PathfindingRequest.hpp"

namespace SwarmForge {

struct PathSmoother {
    // Removes collinear points on the ground plane; jump waypoints and the
    // waypoint leading into a jump always survive
    static void simplify(std::vector<Waypoint>& path) {
        if (path.size() < 3) return;
        std::vector<Waypoint> out;
        out.reserve(path.size());
        out.push_back(path.front());
        for (size_t i = 1; i + 1 < path.size(); ++i) {
            const Waypoint& b = path[i];
            if (b.action == WaypointAction::Jump ||
                path[i + 1].action == WaypointAction::Jump) {
                out.push_back(b);
                continue;
            }
            Vector3D ab = (b.position - out.back().position).flattened();
            Vector3D bc = (path[i + 1].position - b.position).flattened();
            // Check near collinearity via cross product ~ 0
            float cross = ab.getX() * bc.getZ() - ab.getZ() * bc.getX();
            if (std::fabs(cross) > 1e-3f || std::fabs(b.position.getY() - out.back().position.getY()) > 1e-3f) {
                out.push_back(b);
            }
        }
        out.push_back(path.back());
        path.swap(out);
    }
};

} // namespace SwarmForge

#endif // PATH_SMOOTHER_HPP
