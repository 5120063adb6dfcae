/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MOVEMENT_BEHAVIOR_HPP
#define MOVEMENT_BEHAVIOR_HPP

/**
 * @file MovementBehavior.hpp
 * @brief Per-tick movement state machine for owned agents
 *
 * One tick runs, in order:
 *   1. behavior evaluation (combat, flee, travel, wander)
 *   2. horizontal movement (route waypoints or direct)
 *   3. vertical integration (jumps, falls, ground following)
 *   4. stuck detection and periodic ground correction
 * The caller then publishes position and orientation once.
 *
 * The engine holds no per-agent state; everything lives in AgentRuntime.
 */

#include "ai/AgentRuntime.hpp"
#include "core/SimulationSettings.hpp"
#include <functional>
#include <optional>
#include <random>

namespace SwarmForge {

class SpatialQueryAdapter;

// Current position of a target, nullopt once it is gone or dead
using TargetLocator = std::function<std::optional<Vector3D>(const TargetRef&)>;

struct TickResult {
    bool arrived{false};
    bool jumped{false};
    bool abandoned{false};            // Route failures dropped the destination
};

class MovementBehavior {
public:
    MovementBehavior(const SimulationSettings& settings, const SpatialQueryAdapter& queries,
                     const JumpSimulator& jumps, uint32_t seed = std::random_device{}());

    /**
     * @brief Prepare a freshly claimed agent
     */
    void initAgent(AgentRuntime& agent, Uint64 nowMs);

    /**
     * @brief Apply a sight detection result
     */
    void applySight(AgentRuntime& agent, const SightResult& result, Uint64 nowMs);

    TickResult tick(AgentRuntime& agent, float deltaTime, Uint64 nowMs,
                    const TargetLocator& locateTarget);

    /**
     * @brief External destination command (commanded or investigate)
     */
    void setDestination(AgentRuntime& agent, const std::optional<Vector3D>& destination,
                        bool external);

    // jumpPower <= 0 uses the agent's configured power
    bool triggerJump(AgentRuntime& agent, Uint64 nowMs, float jumpPower = 0.0f);

    // Full stop: route cancelled, destination and target dropped
    void halt(AgentRuntime& agent);

    float desiredCombatRange(const AgentRuntime& agent) const;

private:
    struct MoveIntent {
        std::optional<Vector3D> goal;
        RouteKind kind{RouteKind::Travel};
        float speed{0.0f};
    };

    MoveIntent evaluateBehavior(AgentRuntime& agent, Uint64 nowMs);
    MoveIntent evaluateFlee(AgentRuntime& agent, const Vector3D& threat, Uint64 nowMs);
    void evaluateWander(AgentRuntime& agent, Uint64 nowMs);

    // Returns whether the agent tried to cover ground this tick
    bool moveHorizontal(AgentRuntime& agent, const MoveIntent& intent, float deltaTime,
                        Uint64 nowMs, TickResult& result);
    bool stepToward(AgentRuntime& agent, const Vector3D& target, float speed, float deltaTime,
                    bool exactArrival);
    void moveVertical(AgentRuntime& agent, float deltaTime, Uint64 nowMs);
    void checkStuck(AgentRuntime& agent, bool wantedToMove, Uint64 nowMs, TickResult& result);
    void periodicGroundCheck(AgentRuntime& agent, Uint64 nowMs);

    void loseTarget(AgentRuntime& agent, Uint64 nowMs);
    void clearDestination(AgentRuntime& agent);
    void faceToward(AgentRuntime& agent, const Vector3D& point);
    bool usesPathfinding(const AgentRuntime& agent) const;

    float fleeSpeedMultiplier(const AgentConfig& config) const;
    float fleeDistanceFactor(const AgentConfig& config) const;
    float fleeSafeDistanceFactor(const AgentConfig& config) const;

    const SimulationSettings& m_settings;
    const SpatialQueryAdapter& m_queries;
    const JumpSimulator& m_jumps;
    std::mt19937 m_rng;
};

} // namespace SwarmForge

#endif // MOVEMENT_BEHAVIOR_HPP
