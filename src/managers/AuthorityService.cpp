/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AuthorityService.hpp"
#include "core/Logger.hpp"
#include <format>

namespace SwarmForge {

AuthorityService::AuthorityService(const SimulationSettings& settings, AgentStateStore& store,
                                   const PlayerRegistry& players, MessageBus& bus, uint32_t seed)
    : m_settings(settings),
      m_store(store),
      m_bus(bus),
      m_ownership(settings, store),
      m_fallback(settings.fallback, store, seed),
      m_relay(settings, store, m_ownership, players, bus) {}

AuthorityService::~AuthorityService() {
    clean();
}

bool AuthorityService::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        AUTHORITY_WARN("AuthorityService already initialized");
        return true;
    }
    if (!m_store.isInitialized()) {
        AUTHORITY_ERROR("AgentStateStore must be initialized before AuthorityService");
        return false;
    }
    if (!m_ownership.init() || !m_fallback.init()) {
        AUTHORITY_ERROR("Failed to initialize authority subsystems");
        return false;
    }

    m_ownership.setChangeListener([this](const AgentId& id, NodeId node, OwnershipChange change) {
        onOwnershipChange(id, node, change);
    });
    m_fallback.setStatusListener([this](const AgentId& id, bool simulated) {
        m_ownership.setFallbackStatus(id, simulated);
    });

    m_bus.setRequestHandler([this](const Message& request) { return handleRequest(request); });
    m_bus.setAuthorityHandler([this](const Message& message) { handleMessage(message); });
    m_bus.setConnectionListener([this](NodeId node, bool connected) { onNodeConnection(node, connected); });

    m_storeSubscriptions.add(m_store.subscribeAll(AgentEvent::Created,
        [this](const AgentRecord& record, AgentEvent) { onAgentSpawned(record.id); }));
    m_storeSubscriptions.add(m_store.subscribeAll(AgentEvent::Removed,
        [this](const AgentRecord& record, AgentEvent) { onAgentRemoved(record.id); }));
    m_storeSubscriptions.add(m_store.subscribeAll(AgentEvent::AliveChanged,
        [this](const AgentRecord& record, AgentEvent) {
            if (!record.isAlive) {
                m_fallback.removeAgent(record.id);
            } else if (m_ownership.getOwner(record.id) == INVALID_NODE) {
                m_fallback.markUnclaimed(record.id, m_nowMs);
            }
        }));

    // Agents that existed before the authority came up start unclaimed
    m_store.forEachAgent([this](const AgentRecord& record) {
        if (record.isAlive && record.ownerNode == INVALID_NODE) {
            m_fallback.markUnclaimed(record.id, m_nowMs);
        }
    });

    m_nextSweepMs = 0;
    m_stats = AuthorityStats{};
    m_initialized.store(true, std::memory_order_release);
    AUTHORITY_INFO("AuthorityService initialized");
    return true;
}

void AuthorityService::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    AUTHORITY_INFO("Cleaning up AuthorityService...");
    m_storeSubscriptions.releaseAll(m_store);
    m_bus.setRequestHandler(nullptr);
    m_bus.setAuthorityHandler(nullptr);
    m_bus.setConnectionListener(nullptr);
    m_fallback.clean();
    m_ownership.clean();
    m_initialized.store(false, std::memory_order_release);
}

void AuthorityService::update(float deltaTime, Uint64 nowMs) {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    m_nowMs = nowMs;

    m_fallback.update(deltaTime, nowMs);

    if (nowMs >= m_nextSweepMs) {
        m_nextSweepMs = nowMs + static_cast<Uint64>(m_settings.ownership.timeoutCheckInterval * 1000.0f);
        std::vector<OrphanInfo> orphans = m_ownership.sweepTimeouts(nowMs);
        if (!orphans.empty()) {
            broadcastOrphans(orphans);
        }
    }
}

void AuthorityService::onAgentSpawned(const AgentId& id) {
    const AgentRecord* record = m_store.getAgent(id);
    if (!record || !record->isAlive) {
        return;
    }
    m_fallback.markUnclaimed(id, m_nowMs);
    broadcastOrphans({OrphanInfo{id, record->position, record->claimVersion}});
}

void AuthorityService::onAgentRemoved(const AgentId& id) {
    m_ownership.forgetAgent(id);
    m_fallback.removeAgent(id);
}

bool AuthorityService::triggerJump(const AgentId& id, float jumpPower) {
    const NodeId owner = m_ownership.getOwner(id);
    if (owner == INVALID_NODE) {
        AUTHORITY_DEBUG(std::format("Jump for {} ignored, nobody simulates it", id));
        return false;
    }
    auto message = makeMessage(MessageType::AgentJumpTriggered, AUTHORITY_NODE,
                               AgentJumpTriggered{id, jumpPower});
    if (!message) {
        return false;
    }
    for (NodeId node : m_bus.getConnectedNodes()) {
        m_bus.post(node, *message);
    }
    m_stats.jumpsTriggered++;
    return true;
}

void AuthorityService::broadcastOrphans(const std::vector<OrphanInfo>& orphans, NodeId exclude) {
    if (orphans.empty()) {
        return;
    }
    AgentsOrphaned payload;
    payload.agents.reserve(orphans.size());
    for (const OrphanInfo& info : orphans) {
        payload.agents.push_back(OrphanEntry{info.id, info.lastPosition, info.claimVersion});
    }
    auto message = makeMessage(MessageType::AgentsOrphaned, AUTHORITY_NODE, payload);
    if (!message) {
        return;
    }
    for (NodeId node : m_bus.getConnectedNodes()) {
        if (node != exclude) {
            m_bus.post(node, *message);
        }
    }
    m_stats.orphanBroadcasts++;
    m_stats.orphansAnnounced += orphans.size();
}

std::optional<Message> AuthorityService::handleRequest(const Message& request) {
    if (request.type != MessageType::ClaimAgent) {
        AUTHORITY_WARN(std::format("Unexpected request type {} from node {}",
                                   static_cast<int>(request.type), request.sender));
        return std::nullopt;
    }
    ClaimAgentRequest claim;
    if (!readPayload(request, claim)) {
        AUTHORITY_WARN(std::format("Malformed claim request from node {}", request.sender));
        return std::nullopt;
    }
    m_stats.claimRequests++;

    ClaimAgentResponse response;
    response.agentId = claim.agentId;
    response.result = m_ownership.claimAgent(request.sender, claim.agentId, claim.expectedVersion, m_nowMs);
    if (const AgentRecord* record = m_store.getAgent(claim.agentId)) {
        response.claimVersion = record->claimVersion;
    }
    return makeMessage(MessageType::ClaimResponse, AUTHORITY_NODE, response);
}

void AuthorityService::handleMessage(const Message& message) {
    switch (message.type) {
        case MessageType::ReleaseAgent: {
            ReleaseAgentRequest release;
            if (!readPayload(message, release)) {
                AUTHORITY_WARN(std::format("Malformed release from node {}", message.sender));
                return;
            }
            if (auto orphan = m_ownership.releaseAgent(message.sender, release.agentId)) {
                m_stats.releases++;
                broadcastOrphans({*orphan}, message.sender);
            }
            break;
        }
        case MessageType::UpdateAgentPosition:
        case MessageType::UpdateAgentPositionBatch:
            m_relay.handleMessage(message, m_nowMs);
            break;
        default:
            AUTHORITY_DEBUG(std::format("Ignoring message type {} from node {}",
                                        static_cast<int>(message.type), message.sender));
            break;
    }
}

void AuthorityService::onNodeConnection(NodeId node, bool connected) {
    if (connected) {
        AUTHORITY_INFO(std::format("Node {} connected", node));
        return;
    }
    std::vector<OrphanInfo> orphans = m_ownership.handleNodeDisconnected(node);
    broadcastOrphans(orphans, node);
}

void AuthorityService::onOwnershipChange(const AgentId& id, NodeId node, OwnershipChange change) {
    (void)node;
    switch (change) {
        case OwnershipChange::Claimed:
            m_fallback.markClaimed(id);
            break;
        case OwnershipChange::Released:
        case OwnershipChange::TimedOut:
        case OwnershipChange::Disconnected:
            if (const AgentRecord* record = m_store.getAgent(id); record && record->isAlive) {
                m_fallback.markUnclaimed(id, m_nowMs);
            }
            break;
        case OwnershipChange::Forgotten:
            break;
    }
}

} // namespace SwarmForge
