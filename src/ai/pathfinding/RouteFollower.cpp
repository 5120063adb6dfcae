/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/pathfinding/RouteFollower.hpp"
#include "core/Logger.hpp"
#include "managers/PathfinderManager.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace SwarmForge {

RouteFollower::RouteFollower(AgentId agentId, PathfinderManager* manager,
                             const PathfindingSettings& settings)
    : m_agentId(std::move(agentId)), m_manager(manager), m_settings(settings) {}

RouteFollower::~RouteFollower() {
    if (m_manager) {
        m_manager->cancel(m_agentId);
    }
}

bool RouteFollower::isAvailable() const {
    return m_manager && m_manager->isInitialized() && m_manager->hasPathfinder();
}

float RouteFollower::requestInterval(RouteKind kind) const {
    switch (kind) {
        case RouteKind::Combat: return m_settings.combatRequestInterval;
        case RouteKind::Flee: return m_settings.fleeRequestInterval;
        case RouteKind::Travel:
        default: return m_settings.travelRequestInterval;
    }
}

float RouteFollower::recomputeDistance(RouteKind kind) const {
    switch (kind) {
        case RouteKind::Combat: return m_settings.combatRecomputeDistance;
        case RouteKind::Flee: return m_settings.fleeRecomputeDistance;
        case RouteKind::Travel:
        default: return m_settings.travelRecomputeDistance;
    }
}

bool RouteFollower::wantsRecompute(const Vector3D& goal, RouteKind kind, Uint64 nowMs) const {
    if (m_status == RouteStatus::Abandoned) {
        return false;
    }

    if (m_hasRequested) {
        const Uint64 intervalMs = static_cast<Uint64>(requestInterval(kind) * 1000.0f);
        if (nowMs < m_lastRequestMs + intervalMs) {
            return false;
        }
    }

    if (m_forceRecompute || m_status == RouteStatus::Idle || !m_goal || kind != m_kind) {
        return true;
    }
    if (m_status == RouteStatus::Pending) {
        return false;
    }
    return Vector3D::horizontalDistance(*m_goal, goal) > recomputeDistance(kind);
}

bool RouteFollower::requestRoute(const Vector3D& from, const Vector3D& goal, RouteKind kind,
                                 Uint64 nowMs) {
    if (!isAvailable() || m_status == RouteStatus::Abandoned) {
        return false;
    }

    const uint64_t version = ++m_version;
    const uint64_t requestId = m_manager->requestRoute(
        m_agentId, version, from, goal,
        [this](const AgentId&, uint64_t v, PathfindingResult result,
               const std::vector<Waypoint>& waypoints) { onRouteComputed(v, result, waypoints); });
    if (requestId == 0) {
        return false;
    }

    // Keep following the old route until the new one arrives
    if (m_status != RouteStatus::Following) {
        m_status = RouteStatus::Pending;
    }
    m_goal = goal;
    m_kind = kind;
    m_lastRequestMs = nowMs;
    m_hasRequested = true;
    m_forceRecompute = false;
    return true;
}

void RouteFollower::onRouteComputed(uint64_t version, PathfindingResult result,
                                    const std::vector<Waypoint>& waypoints) {
    if (version != m_version || m_status == RouteStatus::Abandoned) {
        m_staleResults++;
        return;
    }

    switch (result) {
        case PathfindingResult::SUCCESS:
            m_waypoints = waypoints;
            m_cursor = 0;
            m_needsReanchor = true;
            m_computationErrors = 0;
            m_unreachableErrors = 0;
            m_stuckErrors = 0;
            m_status = m_waypoints.empty() ? RouteStatus::Idle : RouteStatus::Following;
            return;

        case PathfindingResult::NO_PATH_FOUND:
            m_unreachableErrors++;
            if (m_unreachableErrors >= m_settings.maxUnreachableErrors) {
                abandon("unreachable");
                return;
            }
            break;

        case PathfindingResult::TIMEOUT:
        case PathfindingResult::INVALID_START:
        case PathfindingResult::INVALID_GOAL:
        default:
            m_computationErrors++;
            if (m_computationErrors >= m_settings.maxComputationErrors) {
                abandon("computation errors");
                return;
            }
            break;
    }

    // Retry on the next eligible recompute
    m_waypoints.clear();
    m_cursor = 0;
    m_status = RouteStatus::Idle;
}

void RouteFollower::reanchor(const Vector3D& position) {
    m_needsReanchor = false;
    m_cursor = 0;
    if (m_waypoints.size() < 2) {
        return;
    }

    // Head for the end of the segment whose nearest point is closest to the agent.
    // Ties go to the later segment so an agent sitting on a waypoint moves on.
    float bestDistSq = std::numeric_limits<float>::max();
    for (size_t i = 0; i + 1 < m_waypoints.size(); ++i) {
        const Vector3D& from = m_waypoints[i].position;
        const Vector3D& to = m_waypoints[i + 1].position;
        const float segX = to.getX() - from.getX();
        const float segZ = to.getZ() - from.getZ();
        const float relX = position.getX() - from.getX();
        const float relZ = position.getZ() - from.getZ();
        const float lengthSq = segX * segX + segZ * segZ;

        float t = 0.0f;
        if (lengthSq > 0.0f) {
            t = std::clamp((relX * segX + relZ * segZ) / lengthSq, 0.0f, 1.0f);
        }
        const float dx = relX - segX * t;
        const float dz = relZ - segZ * t;
        const float distSq = dx * dx + dz * dz;
        if (distSq <= bestDistSq) {
            bestDistSq = distSq;
            // Behind the start of the route, go to the start first
            m_cursor = (i == 0 && t <= 0.0f) ? 0 : i + 1;
        }
    }
}

RouteFollower::Steering RouteFollower::steer(const Vector3D& position) {
    Steering steering;
    if (m_status != RouteStatus::Following || m_waypoints.empty()) {
        steering.arrived = (m_status == RouteStatus::Arrived);
        return steering;
    }

    if (m_needsReanchor) {
        const size_t before = m_cursor;
        reanchor(position);
        if (m_cursor != before && m_waypoints[m_cursor].action == WaypointAction::Jump) {
            steering.jump = true;
        }
    }

    while (m_cursor < m_waypoints.size()) {
        const bool last = (m_cursor + 1 == m_waypoints.size());
        const float reach = last ? m_settings.finalReachDistance : m_settings.waypointReachDistance;
        if (Vector3D::horizontalDistance(position, m_waypoints[m_cursor].position) >= reach) {
            break;
        }
        if (last) {
            m_status = RouteStatus::Arrived;
            m_waypoints.clear();
            m_cursor = 0;
            steering.arrived = true;
            return steering;
        }
        ++m_cursor;
        if (m_waypoints[m_cursor].action == WaypointAction::Jump) {
            steering.jump = true;
        }
    }

    steering.target = m_waypoints[m_cursor].position;
    steering.finalLeg = (m_cursor + 1 == m_waypoints.size());
    return steering;
}

void RouteFollower::reportStuck() {
    m_stuckErrors++;
    if (m_stuckErrors >= m_settings.maxStuckErrors) {
        abandon("stuck");
        return;
    }
    m_forceRecompute = true;
}

void RouteFollower::abandon(const char* reason) {
    PATHFIND_DEBUG(std::format("Agent {} abandoned its destination ({})", m_agentId, reason));
    if (m_manager) {
        m_manager->cancel(m_agentId);
    }
    ++m_version;
    m_waypoints.clear();
    m_cursor = 0;
    m_status = RouteStatus::Abandoned;
}

void RouteFollower::stop() {
    m_waypoints.clear();
    m_cursor = 0;
    m_needsReanchor = false;
    if (m_status != RouteStatus::Abandoned) {
        m_status = RouteStatus::Idle;
    }
}

void RouteFollower::cancel() {
    stop();
    ++m_version;
    if (m_manager) {
        m_manager->cancel(m_agentId);
    }
    m_goal.reset();
    m_hasRequested = false;
}

void RouteFollower::reset() {
    cancel();
    m_computationErrors = 0;
    m_unreachableErrors = 0;
    m_stuckErrors = 0;
    m_forceRecompute = false;
    m_status = RouteStatus::Idle;
}

} // namespace SwarmForge
