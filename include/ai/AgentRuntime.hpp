/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_RUNTIME_HPP
#define AGENT_RUNTIME_HPP

#include "ai/pathfinding/RouteFollower.hpp"
#include "entities/AgentConfig.hpp"
#include "managers/AgentStateStore.hpp"
#include "managers/SightManager.hpp"
#include "physics/JumpSimulator.hpp"
#include "utils/Orientation.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <memory>
#include <optional>

namespace SwarmForge {

/**
 * @brief Node-local simulation state of one owned agent.
 *
 * Exists only while the node owns the agent. The shared AgentRecord is the
 * published view; this struct holds everything the behavior needs between
 * ticks.
 */
struct AgentRuntime {
    AgentId id;
    AgentConfig config;
    Vector3D position;
    Orientation orientation;
    Vector3D spawnPosition;

    MovementState state{MovementState::Idle};
    std::optional<Vector3D> destination;
    bool externalDestination{false};      // Came from the shared record, not from behavior
    bool clearSharedDestination{false};   // External destination consumed; owner clears the record

    // Targeting
    std::optional<TargetRef> target;
    Vector3D targetPosition;
    std::optional<Vector3D> lastKnownTargetPosition;
    Uint64 lastSeenMs{0};

    // Flee
    std::optional<Vector3D> threatPosition;   // Frozen once the target is lost
    std::optional<Vector3D> fleeFromPosition; // Threat position the flee route was planned from
    Uint64 noticeStartMs{0};
    bool noticing{false};

    // Combat
    float meleeRange{0.0f};

    JumpState jump;
    std::unique_ptr<RouteFollower> route;

    Uint64 nextWanderCheckMs{0};
    Vector3D stuckAnchor;
    Uint64 stuckWindowStartMs{0};
    Uint64 nextGroundCheckMs{0};

    SubscriptionArena subscriptions;

    MovementState effectiveState() const {
        return jump.active ? MovementState::Jumping : state;
    }

    bool isAirborne() const { return jump.active; }
};

} // namespace SwarmForge

#endif // AGENT_RUNTIME_HPP
