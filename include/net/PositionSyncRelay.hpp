/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef POSITION_SYNC_RELAY_HPP
#define POSITION_SYNC_RELAY_HPP

/**
 * @file PositionSyncRelay.hpp
 * @brief Authority-side handling of node position updates
 *
 * Per update, in order:
 *   1. owner check (an unowned agent is assigned to the sender)
 *   2. validation hook (accepts everything unless replaced)
 *   3. soft-bounds clamp around the spawn point
 *   4. store write and ownership timeout refresh
 * Accepted updates are then re-broadcast, one batch per recipient, to the
 * nodes whose viewpoint is within broadcastRadius of the agent. The sender
 * never gets its own updates back.
 */

#include "core/SimulationSettings.hpp"
#include "net/Messages.hpp"
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <functional>
#include <vector>

namespace SwarmForge {

class AgentStateStore;
class MessageBus;
class OwnershipManager;
class PlayerRegistry;
struct AgentRecord;

class PositionSyncRelay {
public:
    // Return false to drop the update
    using PositionValidator =
        std::function<bool(NodeId sender, const AgentRecord& current, const PositionUpdate& update)>;

    PositionSyncRelay(const SimulationSettings& settings, AgentStateStore& store,
                      OwnershipManager& ownership, const PlayerRegistry& players, MessageBus& bus);

    void setValidator(PositionValidator validator) { m_validator = std::move(validator); }

    /**
     * @brief Handle an UpdateAgentPosition or UpdateAgentPositionBatch message
     * @return number of updates accepted
     */
    size_t handleMessage(const Message& message, Uint64 nowMs);

    /**
     * @brief Apply a single update without relaying it
     * @param applied Receives the stored position when accepted
     */
    bool apply(NodeId sender, const PositionUpdate& update, Uint64 nowMs, PositionUpdate& applied);

    // Send accepted updates to nearby nodes other than the sender
    size_t broadcast(const std::vector<PositionUpdate>& updates, NodeId sender);

    struct RelayStats {
        uint64_t accepted{0};
        uint64_t rejectedNotOwner{0};
        uint64_t rejectedByValidator{0};
        uint64_t unknownAgent{0};
        uint64_t autoAssigned{0};
        uint64_t clamped{0};
        uint64_t relayedMessages{0};
        uint64_t malformed{0};
    };
    const RelayStats& getStats() const { return m_stats; }

private:
    bool clampToBounds(const AgentRecord& record, Vector3D& position) const;

    const SimulationSettings& m_settings;
    AgentStateStore& m_store;
    OwnershipManager& m_ownership;
    const PlayerRegistry& m_players;
    MessageBus& m_bus;

    PositionValidator m_validator;
    RelayStats m_stats;
};

} // namespace SwarmForge

#endif // POSITION_SYNC_RELAY_HPP
