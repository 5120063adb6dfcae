/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AUTHORITY_SERVICE_HPP
#define AUTHORITY_SERVICE_HPP

/**
 * @file AuthorityService.hpp
 * @brief The coordinating authority: ownership, fallback simulation and
 *        position relay behind one MessageBus endpoint
 *
 * Drives the periodic loops from update():
 * - fallback simulator (promotion check + fixed-rate movement)
 * - ownership timeout sweep every timeoutCheckInterval
 *
 * Store events wire the rest: Created makes an agent claimable, Removed
 * drops it everywhere, AliveChanged stops or resumes fallback simulation.
 * A node disconnect orphans everything the node owned.
 */

#include "core/SimulationSettings.hpp"
#include "managers/AgentStateStore.hpp"
#include "managers/FallbackSimulator.hpp"
#include "managers/OwnershipManager.hpp"
#include "net/MessageBus.hpp"
#include "net/PositionSyncRelay.hpp"
#include <SDL3/SDL_stdinc.h>
#include <atomic>
#include <optional>
#include <random>
#include <vector>

namespace SwarmForge {

class PlayerRegistry;

class AuthorityService {
public:
    AuthorityService(const SimulationSettings& settings, AgentStateStore& store,
                     const PlayerRegistry& players, MessageBus& bus,
                     uint32_t seed = std::random_device{}());
    ~AuthorityService();

    AuthorityService(const AuthorityService&) = delete;
    AuthorityService& operator=(const AuthorityService&) = delete;

    bool init();
    void clean();
    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    /**
     * @brief Advance the authority's periodic work
     */
    void update(float deltaTime, Uint64 nowMs);

    // Time used for events that arrive between updates
    void setTime(Uint64 nowMs) { m_nowMs = nowMs; }

    // ===== World events =====

    // New agent: claimable by nodes, fallback clock started
    void onAgentSpawned(const AgentId& id);

    // Agent left the world: ownership and fallback dropped
    void onAgentRemoved(const AgentId& id);

    /**
     * @brief Command a jump; the owning node applies it
     */
    bool triggerJump(const AgentId& id, float jumpPower = 0.0f);

    void broadcastOrphans(const std::vector<OrphanInfo>& orphans, NodeId exclude = INVALID_NODE);

    OwnershipManager& getOwnership() { return m_ownership; }
    const OwnershipManager& getOwnership() const { return m_ownership; }
    FallbackSimulator& getFallback() { return m_fallback; }
    const FallbackSimulator& getFallback() const { return m_fallback; }
    PositionSyncRelay& getRelay() { return m_relay; }

    struct AuthorityStats {
        uint64_t claimRequests{0};
        uint64_t releases{0};
        uint64_t orphanBroadcasts{0};
        uint64_t orphansAnnounced{0};
        uint64_t jumpsTriggered{0};
    };
    const AuthorityStats& getStats() const { return m_stats; }

private:
    std::optional<Message> handleRequest(const Message& request);
    void handleMessage(const Message& message);
    void onNodeConnection(NodeId node, bool connected);
    void onOwnershipChange(const AgentId& id, NodeId node, OwnershipChange change);

    const SimulationSettings& m_settings;
    AgentStateStore& m_store;
    MessageBus& m_bus;

    OwnershipManager m_ownership;
    FallbackSimulator m_fallback;
    PositionSyncRelay m_relay;

    SubscriptionArena m_storeSubscriptions;
    Uint64 m_nowMs{0};
    Uint64 m_nextSweepMs{0};
    AuthorityStats m_stats;
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // AUTHORITY_SERVICE_HPP
