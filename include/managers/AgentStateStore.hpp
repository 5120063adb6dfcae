/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_STATE_STORE_HPP
#define AGENT_STATE_STORE_HPP

/**
 * @file AgentStateStore.hpp
 * @brief Shared per-agent state read by every node and the authority.
 *
 * The store is deliberately unlocked: correctness comes from the
 * single-writer rule enforced by the claim protocol, not from mutual
 * exclusion. Every mutation goes through a named writer so the writer role
 * is visible at the call site.
 *
 * Listeners register through subscribe() and get a SubscriptionHandle back.
 * Per-agent listeners collect their handles in a SubscriptionArena and
 * release them together when the agent's simulation is torn down.
 */

#include "entities/AgentConfig.hpp"
#include "entities/AgentRecord.hpp"
#include <boost/container/small_vector.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

enum class AgentEvent : uint8_t {
    Created,
    DestinationChanged,
    AliveChanged,
    PositionCorrected,   // The authority clamped or snapped the position
    Removed
};

using AgentEventHandler = std::function<void(const AgentRecord&, AgentEvent)>;

struct SubscriptionHandle {
    uint64_t id{0};
    AgentId agentId;     // Empty for store-wide subscriptions
    AgentEvent event{AgentEvent::Created};

    bool valid() const { return id != 0; }
};

class AgentStateStore;

/**
 * @brief Handles owned by one agent's simulation, released as a unit.
 */
class SubscriptionArena {
public:
    void add(SubscriptionHandle handle) {
        if (handle.valid()) m_handles.push_back(std::move(handle));
    }

    // Returns how many handles were still live in the store
    size_t releaseAll(AgentStateStore& store);

    size_t size() const { return m_handles.size(); }
    bool empty() const { return m_handles.empty(); }

private:
    boost::container::small_vector<SubscriptionHandle, 4> m_handles;
};

class AgentStateStore {
public:
    AgentStateStore() = default;
    ~AgentStateStore() = default;

    AgentStateStore(const AgentStateStore&) = delete;
    AgentStateStore& operator=(const AgentStateStore&) = delete;

    bool init();
    void clean();
    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    // ===== Lifecycle (external spawner / authority) =====

    /**
     * @brief Publish a new agent. The config JSON is parsed once here.
     * @return false if the id exists or the config is malformed
     */
    bool createAgent(AgentRecord record);
    bool removeAgent(const AgentId& id);

    // ===== Readers =====

    const AgentRecord* getAgent(const AgentId& id) const;
    const AgentConfig* getConfig(const AgentId& id) const;
    bool hasAgent(const AgentId& id) const { return m_agents.contains(id); }
    size_t getAgentCount() const { return m_agents.size(); }
    void forEachAgent(const std::function<void(const AgentRecord&)>& fn) const;

    // ===== Writers =====

    // Current simulator (owning node or fallback simulator)
    bool writeKinematics(const AgentId& id, const Vector3D& position, const Orientation& orientation);

    // Authority soft correction; raises PositionCorrected
    bool correctPosition(const AgentId& id, const Vector3D& position);

    // External commands; raises DestinationChanged when the value changes
    bool setDestination(const AgentId& id, const std::optional<Vector3D>& destination);

    // External health authority; raises AliveChanged when the flag flips
    bool setHealth(const AgentId& id, float health);

    // OwnershipManager only
    bool setOwnership(const AgentId& id, NodeId owner, OwnershipStatus status, uint64_t claimVersion);
    bool setStatus(const AgentId& id, OwnershipStatus status);
    bool touch(const AgentId& id, Uint64 nowMs);

    // ===== Subscriptions =====

    SubscriptionHandle subscribe(const AgentId& id, AgentEvent event, AgentEventHandler handler);
    SubscriptionHandle subscribeAll(AgentEvent event, AgentEventHandler handler);
    bool unsubscribe(const SubscriptionHandle& handle);
    size_t getSubscriptionCount() const;

private:
    struct Entry {
        AgentRecord record;
        AgentConfig config;
    };

    struct Subscriber {
        uint64_t id;
        AgentEvent event;
        AgentEventHandler handler;
    };

    void notify(const AgentRecord& record, AgentEvent event);
    Entry* find(const AgentId& id);

    std::unordered_map<AgentId, Entry> m_agents;
    std::unordered_map<AgentId, std::vector<Subscriber>> m_agentSubscribers;
    std::vector<Subscriber> m_globalSubscribers;
    uint64_t m_nextSubscriptionId{1};
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // AGENT_STATE_STORE_HPP
