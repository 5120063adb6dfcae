/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POSITION_SYNC_SENDER_HPP
#define POSITION_SYNC_SENDER_HPP

#include "core/SimulationSettings.hpp"
#include "entities/AgentTypes.hpp"
#include "utils/Orientation.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <unordered_map>

namespace SwarmForge {

class AgentStateStore;
class MessageBus;

/**
 * @brief Node-side outbound position updates for owned agents.
 *
 * Every positionSyncInterval the current store values of all tracked agents
 * are sent to the authority, either as one batch or one message per agent.
 * With delta compression an agent that has not moved since its last send is
 * skipped until keepaliveInterval has passed, so the authority keeps seeing
 * the owner of an idle agent.
 */
class PositionSyncSender {
public:
    PositionSyncSender(const ClientSimulationSettings& settings, const AgentStateStore& store,
                       MessageBus& bus, NodeId node);

    void track(const AgentId& id);
    void untrack(const AgentId& id);
    bool isTracked(const AgentId& id) const { return m_tracked.contains(id); }
    size_t getTrackedCount() const { return m_tracked.size(); }
    void clear() { m_tracked.clear(); }

    /**
     * @return number of agent updates sent (0 when not yet due)
     */
    size_t update(Uint64 nowMs);

    struct SyncStats {
        uint64_t updatesSent{0};
        uint64_t messagesSent{0};
        uint64_t skippedUnchanged{0};
    };
    const SyncStats& getStats() const { return m_stats; }

private:
    struct Tracked {
        bool sent{false};
        Uint64 lastSentMs{0};
        Vector3D position;
        Vector3D look;
    };

    const ClientSimulationSettings& m_settings;
    const AgentStateStore& m_store;
    MessageBus& m_bus;
    NodeId m_node;

    std::unordered_map<AgentId, Tracked> m_tracked;
    Uint64 m_nextSendMs{0};
    SyncStats m_stats;
};

} // namespace SwarmForge

#endif // POSITION_SYNC_SENDER_HPP
