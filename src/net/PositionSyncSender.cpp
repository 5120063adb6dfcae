/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "net/PositionSyncSender.hpp"
#include "core/Logger.hpp"
#include "managers/AgentStateStore.hpp"
#include "net/MessageBus.hpp"
#include <format>

namespace SwarmForge {

namespace {
// Movement below this is not worth a packet
constexpr float POSITION_EPSILON_SQ = 0.0001f * 0.0001f;
constexpr float LOOK_EPSILON_SQ = 0.0001f;
} // namespace

PositionSyncSender::PositionSyncSender(const ClientSimulationSettings& settings,
                                       const AgentStateStore& store, MessageBus& bus, NodeId node)
    : m_settings(settings), m_store(store), m_bus(bus), m_node(node) {}

void PositionSyncSender::track(const AgentId& id) {
    m_tracked.try_emplace(id);
}

void PositionSyncSender::untrack(const AgentId& id) {
    m_tracked.erase(id);
}

size_t PositionSyncSender::update(Uint64 nowMs) {
    if (nowMs < m_nextSendMs || m_tracked.empty()) {
        return 0;
    }
    m_nextSendMs = nowMs + static_cast<Uint64>(m_settings.positionSyncInterval * 1000.0f);
    const Uint64 keepaliveMs = static_cast<Uint64>(m_settings.keepaliveInterval * 1000.0f);

    PositionBatch batch;
    batch.updates.reserve(m_tracked.size());

    for (auto& [id, tracked] : m_tracked) {
        const AgentRecord* record = m_store.getAgent(id);
        if (!record) {
            continue;
        }
        const Vector3D& look = record->orientation.getLookVector();
        if (m_settings.useDeltaCompression && tracked.sent && nowMs - tracked.lastSentMs < keepaliveMs &&
            Vector3D::distanceSquared(tracked.position, record->position) < POSITION_EPSILON_SQ &&
            Vector3D::distanceSquared(tracked.look, look) < LOOK_EPSILON_SQ) {
            m_stats.skippedUnchanged++;
            continue;
        }
        tracked.sent = true;
        tracked.lastSentMs = nowMs;
        tracked.position = record->position;
        tracked.look = look;
        batch.updates.push_back(PositionUpdate{id, record->position, record->orientation, nowMs});
    }

    if (batch.updates.empty()) {
        return 0;
    }

    if (m_settings.useBatchedUpdates) {
        if (auto message = makeMessage(MessageType::UpdateAgentPositionBatch, m_node, batch)) {
            m_bus.postToAuthority(std::move(*message));
            m_stats.messagesSent++;
        }
    } else {
        for (const PositionUpdate& update : batch.updates) {
            if (auto message = makeMessage(MessageType::UpdateAgentPosition, m_node, update)) {
                m_bus.postToAuthority(std::move(*message));
                m_stats.messagesSent++;
            }
        }
    }

    m_stats.updatesSent += batch.updates.size();
    SYNC_DEBUG(std::format("Node {} sent {} position updates", m_node, batch.updates.size()));
    return batch.updates.size();
}

} // namespace SwarmForge
