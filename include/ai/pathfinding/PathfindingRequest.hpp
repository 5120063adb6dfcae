/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDING_REQUEST_HPP
#define PATHFINDING_REQUEST_HPP

#include "entities/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <cstdint>
#include <functional>
#include <ostream>
#include <vector>

namespace SwarmForge {

enum class PathfindingResult { SUCCESS, NO_PATH_FOUND, INVALID_START, INVALID_GOAL, TIMEOUT };

// Stream operator for PathfindingResult to support test output
inline std::ostream& operator<<(std::ostream& os, const PathfindingResult& result) {
    switch (result) {
        case PathfindingResult::SUCCESS: return os << "SUCCESS";
        case PathfindingResult::NO_PATH_FOUND: return os << "NO_PATH_FOUND";
        case PathfindingResult::INVALID_START: return os << "INVALID_START";
        case PathfindingResult::INVALID_GOAL: return os << "INVALID_GOAL";
        case PathfindingResult::TIMEOUT: return os << "TIMEOUT";
        default: return os << "UNKNOWN";
    }
}

enum class WaypointAction : uint8_t { Walk, Jump };

struct Waypoint {
    Vector3D position;   // Ground level
    WaypointAction action{WaypointAction::Walk};
};

/**
 * @brief Compute-only pathfinder supplied by the host world.
 *
 * Implementations never move anything; they fill outPath from start to goal.
 */
class IWaypointPathfinder {
public:
    virtual ~IWaypointPathfinder() = default;

    virtual PathfindingResult computePath(const Vector3D& start, const Vector3D& goal,
                                          std::vector<Waypoint>& outPath) = 0;
};

using RouteCallback = std::function<void(const AgentId& agentId, uint64_t version,
                                         PathfindingResult result,
                                         const std::vector<Waypoint>& waypoints)>;

struct PathfindingRequest {
    uint64_t requestId{0};
    AgentId agentId;
    uint64_t version{0};      // Route version at the time of the request
    Vector3D start;
    Vector3D goal;
    RouteCallback onComplete;
};

} // namespace SwarmForge

#endif // PATHFINDING_REQUEST_HPP
