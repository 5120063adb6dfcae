/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PATHFINDER_MANAGER_HPP
#define PATHFINDER_MANAGER_HPP

/**
 * @file PathfinderManager.hpp
 * @brief Compute-only route service in front of an IWaypointPathfinder
 *
 * Requests are queued and processed in update() with a per-update budget
 * (PathfindingSettings::maxRoutesPerUpdate), so a burst of requests never
 * stalls a tick. Only the latest request per agent is kept: a new request
 * replaces a queued one for the same agent.
 *
 * Results are delivered through the request callback together with the
 * route version supplied by the caller. The manager never moves agents and
 * never judges staleness; RouteFollower does both.
 *
 * Goals are moved onto the ground under them before computation when a
 * SpatialQueryAdapter is attached.
 */

#include "ai/pathfinding/PathfindingRequest.hpp"
#include "core/SimulationSettings.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

class SpatialQueryAdapter;

class PathfinderManager {
public:
    explicit PathfinderManager(const PathfindingSettings& settings) : m_settings(settings) {}
    ~PathfinderManager() = default;

    PathfinderManager(const PathfinderManager&) = delete;
    PathfinderManager& operator=(const PathfinderManager&) = delete;

    bool init();
    void clean();
    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    void setPathfinder(IWaypointPathfinder* pathfinder) { m_pathfinder = pathfinder; }
    bool hasPathfinder() const { return m_pathfinder != nullptr; }
    void setGroundQueries(const SpatialQueryAdapter* queries) { m_groundQueries = queries; }

    /**
     * @brief Queue a route computation
     * @return Request ID (0 if the manager cannot accept requests)
     */
    uint64_t requestRoute(const AgentId& agentId, uint64_t version, const Vector3D& start,
                          const Vector3D& goal, RouteCallback callback);

    /**
     * @brief Drop the queued request for an agent, if any
     */
    bool cancel(const AgentId& agentId);

    /**
     * @brief Process up to maxRoutesPerUpdate queued requests
     */
    void update();

    size_t getQueueSize() const { return m_pendingByAgent.size(); }
    bool hasPendingWork() const { return !m_pendingByAgent.empty(); }

    struct PathfinderStats {
        uint64_t totalRequests{0};
        uint64_t completedRequests{0};
        uint64_t failedRequests{0};
        uint64_t coalescedRequests{0};
        uint64_t cancelledRequests{0};
        double lastUpdateMs{0.0};
        double averageProcessingTimeMs{0.0};
        uint64_t totalUpdates{0};

        static constexpr double ALPHA = 0.05;  // EMA smoothing

        void updateAverage(double newMs) {
            if (totalUpdates == 0) {
                averageProcessingTimeMs = newMs;
            } else {
                averageProcessingTimeMs = ALPHA * newMs + (1.0 - ALPHA) * averageProcessingTimeMs;
            }
            totalUpdates++;
        }
    };

    const PathfinderStats& getStats() const { return m_stats; }
    void resetStats() { m_stats = PathfinderStats{}; }

private:
    const PathfindingSettings& m_settings;
    IWaypointPathfinder* m_pathfinder{nullptr};
    const SpatialQueryAdapter* m_groundQueries{nullptr};

    std::deque<PathfindingRequest> m_queue;
    std::unordered_map<AgentId, uint64_t> m_pendingByAgent;   // Latest live request per agent
    std::vector<Waypoint> m_pathBuffer;
    uint64_t m_nextRequestId{1};

    PathfinderStats m_stats;
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // PATHFINDER_MANAGER_HPP
