/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/PathfinderManager.hpp"
#include "core/Logger.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <algorithm>
#include <chrono>
#include <format>

namespace SwarmForge {

bool PathfinderManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        PATHFIND_WARN("PathfinderManager already initialized");
        return true;
    }

    m_queue.clear();
    m_pendingByAgent.clear();
    m_pathBuffer.reserve(64);
    m_stats = PathfinderStats{};

    m_initialized.store(true, std::memory_order_release);
    PATHFIND_INFO(std::format("PathfinderManager initialized (budget {} routes/update, pathfinder {})",
                              m_settings.maxRoutesPerUpdate,
                              m_pathfinder ? "attached" : "none"));
    return true;
}

void PathfinderManager::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }

    PATHFIND_INFO(std::format("Cleaning PathfinderManager ({} requests, {} completed, {} failed)",
                              m_stats.totalRequests, m_stats.completedRequests,
                              m_stats.failedRequests));
    m_queue.clear();
    m_pendingByAgent.clear();
    m_pathBuffer.clear();
    m_initialized.store(false, std::memory_order_release);
}

uint64_t PathfinderManager::requestRoute(const AgentId& agentId, uint64_t version,
                                         const Vector3D& start, const Vector3D& goal,
                                         RouteCallback callback) {
    if (!m_initialized.load(std::memory_order_acquire) || !m_pathfinder) {
        return 0;
    }

    const uint64_t requestId = m_nextRequestId++;
    auto [it, inserted] = m_pendingByAgent.insert_or_assign(agentId, requestId);
    if (!inserted) {
        // The older queued entry is skipped when it reaches the front
        m_stats.coalescedRequests++;
    }

    PathfindingRequest request;
    request.requestId = requestId;
    request.agentId = agentId;
    request.version = version;
    request.start = start;
    request.goal = goal;
    request.onComplete = std::move(callback);
    m_queue.push_back(std::move(request));

    m_stats.totalRequests++;
    return requestId;
}

bool PathfinderManager::cancel(const AgentId& agentId) {
    if (m_pendingByAgent.erase(agentId) > 0) {
        m_stats.cancelledRequests++;
        return true;
    }
    return false;
}

void PathfinderManager::update() {
    if (!m_initialized.load(std::memory_order_acquire) || m_queue.empty()) {
        return;
    }

    auto t0 = std::chrono::steady_clock::now();
    uint32_t processed = 0;

    while (!m_queue.empty() && processed < m_settings.maxRoutesPerUpdate) {
        PathfindingRequest request = std::move(m_queue.front());
        m_queue.pop_front();

        auto pending = m_pendingByAgent.find(request.agentId);
        if (pending == m_pendingByAgent.end() || pending->second != request.requestId) {
            continue;   // Superseded or cancelled
        }
        m_pendingByAgent.erase(pending);

        Vector3D goal = request.goal;
        if (m_groundQueries) {
            if (auto ground = m_groundQueries->groundPosition(goal)) {
                goal = *ground;
            }
        }

        m_pathBuffer.clear();
        const PathfindingResult result = m_pathfinder->computePath(request.start, goal, m_pathBuffer);
        ++processed;

        if (result == PathfindingResult::SUCCESS) {
            m_stats.completedRequests++;
        } else {
            m_stats.failedRequests++;
            PATHFIND_DEBUG(std::format("Route for {} failed: {}", request.agentId,
                                       static_cast<int>(result)));
        }

        // Callback may queue a follow-up request for the same agent
        if (request.onComplete) {
            const std::vector<Waypoint> waypoints = m_pathBuffer;
            request.onComplete(request.agentId, request.version, result, waypoints);
        }
    }

    // Drop superseded entries left at the front
    while (!m_queue.empty()) {
        const auto& front = m_queue.front();
        auto pending = m_pendingByAgent.find(front.agentId);
        if (pending != m_pendingByAgent.end() && pending->second == front.requestId) {
            break;
        }
        m_queue.pop_front();
    }

    auto t1 = std::chrono::steady_clock::now();
    double elapsedMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
    m_stats.lastUpdateMs = elapsedMs;
    m_stats.updateAverage(elapsedMs);

    if (m_stats.totalUpdates % 300 == 0) {
        PATHFIND_DEBUG(std::format("Routes processed: {}, queued: {}, avg: {:.3f}ms", processed,
                                   m_pendingByAgent.size(), m_stats.averageProcessingTimeMs));
    }
}

} // namespace SwarmForge
