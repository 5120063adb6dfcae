/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OWNERSHIP_MANAGER_HPP
#define OWNERSHIP_MANAGER_HPP

/**
 * @file OwnershipManager.hpp
 * @brief Authority-side claim bookkeeping: who simulates which agent
 *
 * Every agent is in exactly one of Claimed, Orphaned or FallbackSimulated.
 * Transitions happen only through claimAgent(), releaseAgent(),
 * sweepTimeouts() and handleNodeDisconnected(). Each transition bumps the
 * record's claimVersion so a node can tell that an orphan it is about to
 * claim has changed hands in the meantime.
 *
 * The manager writes ownership metadata to the AgentStateStore; it never
 * touches kinematics.
 */

#include "core/SimulationSettings.hpp"
#include "entities/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <boost/container/flat_map.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

class AgentStateStore;

enum class ClaimResult : uint8_t {
    Accepted,
    OwnedByOther,
    CapacityExceeded,
    StaleVersion,       // Expected claim version no longer matches
    UnknownAgent,
    AgentDead
};

std::ostream& operator<<(std::ostream& os, ClaimResult result);

// What an orphan broadcast carries per agent
struct OrphanInfo {
    AgentId id;
    Vector3D lastPosition;
    uint64_t claimVersion{0};
};

enum class OwnershipChange : uint8_t {
    Claimed,
    Released,
    TimedOut,
    Disconnected,
    Forgotten       // Agent removed from the world
};

class OwnershipManager {
public:
    using ChangeListener = std::function<void(const AgentId&, NodeId, OwnershipChange)>;

    OwnershipManager(const SimulationSettings& settings, AgentStateStore& store);

    OwnershipManager(const OwnershipManager&) = delete;
    OwnershipManager& operator=(const OwnershipManager&) = delete;

    bool init();
    void clean();
    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    /**
     * @brief Fired after every ownership transition; used to make the
     *        fallback simulator yield or pick agents up
     */
    void setChangeListener(ChangeListener listener) { m_listener = std::move(listener); }

    /**
     * @brief Request ownership of an agent for a node.
     *
     * Re-claiming an agent the node already owns is accepted without a
     * version bump.
     *
     * @param expectedVersion When set, the claim only succeeds if the record's
     *        claimVersion still equals it
     */
    ClaimResult claimAgent(NodeId node, const AgentId& id, std::optional<uint64_t> expectedVersion,
                           Uint64 nowMs);

    /**
     * @brief Give up ownership. Only the owner may release.
     * @return the orphan entry to broadcast, nullopt if the node did not own it
     */
    std::optional<OrphanInfo> releaseAgent(NodeId node, const AgentId& id);

    /**
     * @brief Orphan everything the node owned
     */
    std::vector<OrphanInfo> handleNodeDisconnected(NodeId node);

    /**
     * @brief Orphan owned agents with no update for ownershipTimeout
     */
    std::vector<OrphanInfo> sweepTimeouts(Uint64 nowMs);

    // Refresh the timeout clock; ignored for agents nobody owns
    bool touch(const AgentId& id, Uint64 nowMs);

    // Agent left the world; drops ownership without writing the store
    void forgetAgent(const AgentId& id);

    // Orphaned <-> FallbackSimulated; refused while the agent is owned
    bool setFallbackStatus(const AgentId& id, bool simulated);

    NodeId getOwner(const AgentId& id) const;
    bool isOwnedBy(const AgentId& id, NodeId node) const { return getOwner(id) == node; }
    std::vector<AgentId> getOwnedAgents(NodeId node) const;
    size_t getOwnedCount(NodeId node) const;
    size_t getTotalOwned() const { return m_owners.size(); }
    uint32_t getCapacity() const { return m_settings.clientSimulation.maxAgentsPerNode; }

    struct OwnershipStats {
        uint64_t claimsAccepted{0};
        uint64_t claimsRejected{0};
        uint64_t releases{0};
        uint64_t timeouts{0};
        uint64_t disconnectOrphans{0};
    };
    const OwnershipStats& getStats() const { return m_stats; }

private:
    std::optional<OrphanInfo> orphan(const AgentId& id, OwnershipChange reason);
    void decrementCount(NodeId node);

    const SimulationSettings& m_settings;
    AgentStateStore& m_store;

    std::unordered_map<AgentId, NodeId> m_owners;
    boost::container::flat_map<NodeId, size_t> m_ownedCounts;

    ChangeListener m_listener;
    OwnershipStats m_stats;
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // OWNERSHIP_MANAGER_HPP
