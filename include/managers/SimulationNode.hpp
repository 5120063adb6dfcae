/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_NODE_HPP
#define SIMULATION_NODE_HPP

/**
 * @file SimulationNode.hpp
 * @brief One client node: claims nearby agents and simulates them
 *
 * A node's viewpoint is the position of the player attached to it in the
 * PlayerRegistry. Agents within simulationRadius of the viewpoint are
 * claimed from the authority; agents beyond simulationRadius *
 * handoffHysteresis are released.
 *
 * simulationStep() order:
 *   1. pathfinder queue
 *   2. due orphan claims (race-checked against the record)
 *   3. distance check every positionSyncInterval (handoff + pickup)
 *   4. sight scheduler
 *   5. agent ticks, each followed by the store write
 *   6. outbound position sync
 *
 * The step is driven by SimClock from either the render frame or the
 * fallback timer, never both.
 */

#include "ai/MovementBehavior.hpp"
#include "ai/pathfinding/PathfindingRequest.hpp"
#include "core/SimClock.hpp"
#include "core/SimulationSettings.hpp"
#include "managers/PathfinderManager.hpp"
#include "managers/SightManager.hpp"
#include "net/MessageBus.hpp"
#include "net/PositionSyncSender.hpp"
#include "net/RemoteAgentView.hpp"
#include "physics/JumpSimulator.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <SDL3/SDL_stdinc.h>
#include <boost/container/flat_map.hpp>
#include <atomic>
#include <memory>
#include <optional>
#include <random>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

class AgentStateStore;
class PlayerRegistry;

class SimulationNode {
public:
    /**
     * @param pathfinder Route source shared with other nodes; nullptr makes
     *        every agent use direct movement
     */
    SimulationNode(NodeId id, const SimulationSettings& settings, AgentStateStore& store,
                   const PlayerRegistry& players, const ISpatialQuery& world, MessageBus& bus,
                   IWaypointPathfinder* pathfinder = nullptr, uint32_t seed = std::random_device{}());
    ~SimulationNode();

    SimulationNode(const SimulationNode&) = delete;
    SimulationNode& operator=(const SimulationNode&) = delete;

    enum class RandomStream : uint32_t { Sight = 1, Behavior = 2 };

    // Seed for one random stream, derived from the node seed through std::seed_seq
    static uint32_t streamSeed(uint32_t seed, RandomStream stream);

    /**
     * @brief Connect to the bus and bring up sight and pathfinding
     */
    bool init();

    /**
     * @brief Release every agent, then disconnect
     */
    void clean();

    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    NodeId getId() const { return m_id; }
    std::optional<Vector3D> getViewpoint() const;

    // ===== Clock entry points =====

    bool onPrimaryFrame(Uint64 nowMs, float deltaTime) { return m_clock.onPrimaryFrame(nowMs, deltaTime); }
    bool onSecondaryTick(Uint64 nowMs, float deltaTime) { return m_clock.onSecondaryTick(nowMs, deltaTime); }
    const SimClock& getClock() const { return m_clock; }

    void simulationStep(Uint64 nowMs, float deltaTime);

    // ===== Ownership =====

    /**
     * @brief Ask the authority for an agent and start simulating on success
     */
    bool requestClaim(const AgentId& id, std::optional<uint64_t> expectedVersion, Uint64 nowMs);

    /**
     * @brief Stop simulating and tell the authority
     */
    bool releaseAgent(const AgentId& id);

    bool isSimulating(const AgentId& id) const { return m_agents.contains(id); }
    size_t getSimulatedCount() const { return m_agents.size(); }
    std::vector<AgentId> getSimulatedAgents() const;
    const AgentRuntime* getRuntime(const AgentId& id) const;
    bool hasPendingClaim(const AgentId& id) const { return m_pendingClaims.contains(id); }
    size_t getPendingClaimCount() const { return m_pendingClaims.size(); }

    const RemoteAgentView& getRemoteView() const { return m_remote; }
    const SightManager& getSight() const { return m_sight; }
    const PathfinderManager& getPathfinder() const { return m_pathfinder; }
    const PositionSyncSender& getSyncSender() const { return m_sync; }

    struct NodeStats {
        uint64_t steps{0};
        uint64_t claimRequests{0};
        uint64_t claimsAccepted{0};
        uint64_t claimsRejected{0};
        uint64_t claimsAborted{0};          // Orphan changed hands before the delayed claim
        uint64_t releases{0};
        uint64_t ownershipLost{0};          // Authority reassigned an agent this node was simulating
        uint64_t selfOwnedUpdatesIgnored{0};
        uint64_t remoteUpdatesApplied{0};
        uint64_t jumpsCommanded{0};
        uint64_t arrivals{0};
    };
    const NodeStats& getStats() const { return m_stats; }

private:
    struct PendingClaim {
        Uint64 dueMs{0};
        Vector3D broadcastPosition;
        uint64_t claimVersion{0};
    };

    void onMessage(const Message& message);
    void handleOrphans(const AgentsOrphaned& orphans);
    void handlePositionUpdates(const std::vector<PositionUpdate>& updates);
    void handleJump(const AgentJumpTriggered& jump);

    bool startSimulation(const AgentId& id, Uint64 nowMs);
    bool stopSimulation(const AgentId& id, bool sendRelease);
    void loseOwnership(const AgentId& id);

    void processPendingClaims(Uint64 nowMs);
    void distanceCheck(Uint64 nowMs);
    void tickAgents(float deltaTime, Uint64 nowMs);

    AgentRuntime* findRuntime(const AgentId& id);
    std::optional<Vector3D> locateTarget(const TargetRef& target) const;
    bool atCapacity() const;

    NodeId m_id;
    const SimulationSettings& m_settings;
    AgentStateStore& m_store;
    const PlayerRegistry& m_players;
    MessageBus& m_bus;
    IWaypointPathfinder* m_routeSource;

    SpatialQueryAdapter m_queries;
    JumpSimulator m_jumps;
    PathfinderManager m_pathfinder;
    SightManager m_sight;
    MovementBehavior m_behavior;
    PositionSyncSender m_sync;
    RemoteAgentView m_remote;
    SimClock m_clock;

    std::unordered_map<AgentId, std::unique_ptr<AgentRuntime>> m_agents;
    boost::container::flat_map<AgentId, PendingClaim> m_pendingClaims;
    MessageBus::HandlerToken m_busToken;

    Uint64 m_nowMs{0};
    Uint64 m_nextDistanceCheckMs{0};
    NodeStats m_stats;
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // SIMULATION_NODE_HPP
