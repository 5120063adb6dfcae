/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ROUTE_FOLLOWER_HPP
#define ROUTE_FOLLOWER_HPP

#include "ai/pathfinding/PathfindingRequest.hpp"
#include "core/SimulationSettings.hpp"
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace SwarmForge {

class PathfinderManager;

enum class RouteKind : uint8_t { Travel, Combat, Flee };

enum class RouteStatus : uint8_t {
    Idle,        // No route, nothing requested
    Pending,     // Waiting for the pathfinder
    Following,
    Arrived,
    Abandoned    // Too many failures; the caller should drop the destination
};

/**
 * @brief Agent-side cursor over routes from PathfinderManager.
 *
 * Every request bumps a version; results carrying an older version are
 * discarded. A fresh route is re-anchored lazily on the next steer() call
 * so waypoints the agent walked past while the route was computing are
 * skipped. Within one route the cursor only moves forward.
 */
class RouteFollower {
public:
    struct Steering {
        std::optional<Vector3D> target;   // Next waypoint to walk toward
        bool finalLeg{false};
        bool arrived{false};
        bool jump{false};                 // Cursor just reached a jump waypoint
    };

    RouteFollower(AgentId agentId, PathfinderManager* manager, const PathfindingSettings& settings);
    ~RouteFollower();

    RouteFollower(const RouteFollower&) = delete;
    RouteFollower& operator=(const RouteFollower&) = delete;

    /**
     * @brief True when a pathfinder can serve this follower
     */
    bool isAvailable() const;

    /**
     * @brief Whether a new request toward goal is due, honouring the per-kind
     *        rate limit and recompute distance
     */
    bool wantsRecompute(const Vector3D& goal, RouteKind kind, Uint64 nowMs) const;

    /**
     * @brief Issue a request; any in-flight request becomes stale
     * @return false if no pathfinder accepted the request
     */
    bool requestRoute(const Vector3D& from, const Vector3D& goal, RouteKind kind, Uint64 nowMs);

    /**
     * @brief Advance past reached waypoints and return the current target
     */
    Steering steer(const Vector3D& position);

    void reportStuck();

    // Route idle; queued work left alone
    void stop();

    // Route idle, version bumped and queued work dropped
    void cancel();

    // cancel() plus error counters and abandonment cleared, for a new destination
    void reset();

    RouteStatus getStatus() const { return m_status; }
    bool isAbandoned() const { return m_status == RouteStatus::Abandoned; }
    bool isPending() const { return m_status == RouteStatus::Pending; }
    bool hasRoute() const { return m_status == RouteStatus::Following; }
    uint64_t getVersion() const { return m_version; }
    size_t getCursor() const { return m_cursor; }
    const std::vector<Waypoint>& getWaypoints() const { return m_waypoints; }
    const std::optional<Vector3D>& getGoal() const { return m_goal; }

    uint32_t getComputationErrors() const { return m_computationErrors; }
    uint32_t getUnreachableErrors() const { return m_unreachableErrors; }
    uint32_t getStuckErrors() const { return m_stuckErrors; }
    uint64_t getStaleResults() const { return m_staleResults; }

private:
    void onRouteComputed(uint64_t version, PathfindingResult result,
                         const std::vector<Waypoint>& waypoints);
    void reanchor(const Vector3D& position);
    void abandon(const char* reason);
    float requestInterval(RouteKind kind) const;
    float recomputeDistance(RouteKind kind) const;

    AgentId m_agentId;
    PathfinderManager* m_manager;
    const PathfindingSettings& m_settings;

    std::vector<Waypoint> m_waypoints;
    size_t m_cursor{0};
    bool m_needsReanchor{false};
    RouteStatus m_status{RouteStatus::Idle};
    uint64_t m_version{0};

    std::optional<Vector3D> m_goal;
    RouteKind m_kind{RouteKind::Travel};
    Uint64 m_lastRequestMs{0};
    bool m_hasRequested{false};
    bool m_forceRecompute{false};

    uint32_t m_computationErrors{0};
    uint32_t m_unreachableErrors{0};
    uint32_t m_stuckErrors{0};
    uint64_t m_staleResults{0};
};

} // namespace SwarmForge

#endif // ROUTE_FOLLOWER_HPP
