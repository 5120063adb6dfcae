/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/PositionSyncRelay.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerRegistry.hpp"
#include "managers/AgentStateStore.hpp"
#include "managers/OwnershipManager.hpp"
#include "net/MessageBus.hpp"
#include <format>

namespace SwarmForge {

PositionSyncRelay::PositionSyncRelay(const SimulationSettings& settings, AgentStateStore& store,
                                     OwnershipManager& ownership, const PlayerRegistry& players,
                                     MessageBus& bus)
    : m_settings(settings), m_store(store), m_ownership(ownership), m_players(players), m_bus(bus) {}

size_t PositionSyncRelay::handleMessage(const Message& message, Uint64 nowMs) {
    std::vector<PositionUpdate> incoming;
    if (message.type == MessageType::UpdateAgentPositionBatch) {
        PositionBatch batch;
        if (!readPayload(message, batch)) {
            m_stats.malformed++;
            SYNC_WARN(std::format("Malformed position batch from node {}", message.sender));
            return 0;
        }
        incoming = std::move(batch.updates);
    } else if (message.type == MessageType::UpdateAgentPosition) {
        PositionUpdate update;
        if (!readPayload(message, update)) {
            m_stats.malformed++;
            SYNC_WARN(std::format("Malformed position update from node {}", message.sender));
            return 0;
        }
        incoming.push_back(std::move(update));
    } else {
        return 0;
    }

    std::vector<PositionUpdate> accepted;
    accepted.reserve(incoming.size());
    for (const PositionUpdate& update : incoming) {
        PositionUpdate applied;
        if (apply(message.sender, update, nowMs, applied)) {
            accepted.push_back(std::move(applied));
        }
    }

    if (!accepted.empty()) {
        broadcast(accepted, message.sender);
    }
    return accepted.size();
}

bool PositionSyncRelay::apply(NodeId sender, const PositionUpdate& update, Uint64 nowMs,
                              PositionUpdate& applied) {
    const AgentRecord* record = m_store.getAgent(update.agentId);
    if (!record) {
        m_stats.unknownAgent++;
        return false;
    }

    const NodeId owner = m_ownership.getOwner(update.agentId);
    if (owner == INVALID_NODE) {
        // First update from a node for an unowned agent makes it the owner
        if (m_ownership.claimAgent(sender, update.agentId, std::nullopt, nowMs) != ClaimResult::Accepted) {
            m_stats.rejectedNotOwner++;
            return false;
        }
        m_stats.autoAssigned++;
        SYNC_DEBUG(std::format("Assigned {} to node {} on first update", update.agentId, sender));
        record = m_store.getAgent(update.agentId);
    } else if (owner != sender) {
        m_stats.rejectedNotOwner++;
        SYNC_DEBUG(std::format("Dropped update for {} from node {} (owner {})", update.agentId,
                               sender, owner));
        return false;
    }

    if (m_validator && !m_validator(sender, *record, update)) {
        m_stats.rejectedByValidator++;
        return false;
    }

    Vector3D position = update.position;
    const bool clamped = clampToBounds(*record, position);

    m_store.writeKinematics(update.agentId, position, update.orientation);
    if (clamped) {
        m_stats.clamped++;
        // Raises PositionCorrected so the owner pulls the agent back
        m_store.correctPosition(update.agentId, position);
    }
    m_ownership.touch(update.agentId, nowMs);
    m_stats.accepted++;

    applied = update;
    applied.position = position;
    return true;
}

bool PositionSyncRelay::clampToBounds(const AgentRecord& record, Vector3D& position) const {
    const MitigationSettings& mitigation = m_settings.mitigation;
    if (!mitigation.softBoundsEnabled) {
        return false;
    }
    const AgentConfig* config = m_store.getConfig(record.id);
    const float radius = config && config->maxWanderRadius ? *config->maxWanderRadius
                                                           : mitigation.defaultMaxWanderRadius;

    const Vector3D offset = (position - record.spawnPosition).flattened();
    const float dist = offset.length();
    if (dist <= radius) {
        return false;
    }
    const Vector3D edge = record.spawnPosition + offset * (radius / dist);
    position = Vector3D(edge.getX(), position.getY(), edge.getZ());
    return true;
}

size_t PositionSyncRelay::broadcast(const std::vector<PositionUpdate>& updates, NodeId sender) {
    const ClientSimulationSettings& client = m_settings.clientSimulation;
    const float radiusSq = client.broadcastRadius * client.broadcastRadius;
    size_t messages = 0;

    for (NodeId node : m_bus.getConnectedNodes()) {
        if (node == sender) {
            continue;
        }
        const std::optional<Vector3D> viewpoint = m_players.getViewpoint(node);
        if (!viewpoint) {
            continue;
        }

        PositionBatch batch;
        for (const PositionUpdate& update : updates) {
            if (Vector3D::distanceSquared(*viewpoint, update.position) <= radiusSq) {
                batch.updates.push_back(update);
            }
        }
        if (batch.updates.empty()) {
            continue;
        }

        if (client.useBatchedUpdates) {
            if (auto message = makeMessage(MessageType::UpdateAgentPositionBatch, AUTHORITY_NODE, batch)) {
                m_bus.post(node, std::move(*message));
                messages++;
            }
        } else {
            for (const PositionUpdate& update : batch.updates) {
                if (auto message = makeMessage(MessageType::UpdateAgentPosition, AUTHORITY_NODE, update)) {
                    m_bus.post(node, std::move(*message));
                    messages++;
                }
            }
        }
    }

    m_stats.relayedMessages += messages;
    return messages;
}

} // namespace SwarmForge
