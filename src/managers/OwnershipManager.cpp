/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/OwnershipManager.hpp"
#include "core/Logger.hpp"
#include "managers/AgentStateStore.hpp"
#include <format>

namespace SwarmForge {

std::ostream& operator<<(std::ostream& os, ClaimResult result) {
    switch (result) {
        case ClaimResult::Accepted: return os << "Accepted";
        case ClaimResult::OwnedByOther: return os << "OwnedByOther";
        case ClaimResult::CapacityExceeded: return os << "CapacityExceeded";
        case ClaimResult::StaleVersion: return os << "StaleVersion";
        case ClaimResult::UnknownAgent: return os << "UnknownAgent";
        case ClaimResult::AgentDead: return os << "AgentDead";
    }
    return os << "Unknown";
}

OwnershipManager::OwnershipManager(const SimulationSettings& settings, AgentStateStore& store)
    : m_settings(settings), m_store(store) {}

bool OwnershipManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        OWNERSHIP_WARN("OwnershipManager already initialized");
        return true;
    }
    m_owners.clear();
    m_ownedCounts.clear();
    m_stats = OwnershipStats{};
    m_initialized.store(true, std::memory_order_release);
    OWNERSHIP_INFO(std::format("OwnershipManager initialized (capacity {} per node)",
                               m_settings.clientSimulation.maxAgentsPerNode));
    return true;
}

void OwnershipManager::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    OWNERSHIP_INFO(std::format("Cleaning OwnershipManager ({} owned, {} claims accepted)",
                               m_owners.size(), m_stats.claimsAccepted));
    m_owners.clear();
    m_ownedCounts.clear();
    m_initialized.store(false, std::memory_order_release);
}

ClaimResult OwnershipManager::claimAgent(NodeId node, const AgentId& id,
                                         std::optional<uint64_t> expectedVersion, Uint64 nowMs) {
    const AgentRecord* record = m_store.getAgent(id);
    if (!record) {
        OWNERSHIP_DEBUG(std::format("Node {} claimed unknown agent {}", node, id));
        return ClaimResult::UnknownAgent;
    }
    if (!record->isAlive) {
        m_stats.claimsRejected++;
        return ClaimResult::AgentDead;
    }

    const NodeId owner = getOwner(id);
    if (owner == node) {
        m_store.touch(id, nowMs);
        return ClaimResult::Accepted;
    }
    if (owner != INVALID_NODE) {
        m_stats.claimsRejected++;
        return ClaimResult::OwnedByOther;
    }
    if (expectedVersion && *expectedVersion != record->claimVersion) {
        m_stats.claimsRejected++;
        OWNERSHIP_DEBUG(std::format("Node {} claim on {} carries version {}, record is at {}", node,
                                    id, *expectedVersion, record->claimVersion));
        return ClaimResult::StaleVersion;
    }
    if (getOwnedCount(node) >= m_settings.clientSimulation.maxAgentsPerNode) {
        m_stats.claimsRejected++;
        return ClaimResult::CapacityExceeded;
    }

    const uint64_t version = record->claimVersion + 1;
    m_store.setOwnership(id, node, OwnershipStatus::Claimed, version);
    m_store.touch(id, nowMs);
    m_owners[id] = node;
    m_ownedCounts[node]++;
    m_stats.claimsAccepted++;

    OWNERSHIP_DEBUG(std::format("Node {} owns {} (version {})", node, id, version));
    if (m_listener) {
        m_listener(id, node, OwnershipChange::Claimed);
    }
    return ClaimResult::Accepted;
}

std::optional<OrphanInfo> OwnershipManager::releaseAgent(NodeId node, const AgentId& id) {
    if (node == INVALID_NODE || getOwner(id) != node) {
        return std::nullopt;
    }
    m_stats.releases++;
    return orphan(id, OwnershipChange::Released);
}

std::vector<OrphanInfo> OwnershipManager::handleNodeDisconnected(NodeId node) {
    std::vector<OrphanInfo> orphans;
    const std::vector<AgentId> owned = getOwnedAgents(node);
    orphans.reserve(owned.size());
    for (const AgentId& id : owned) {
        if (auto info = orphan(id, OwnershipChange::Disconnected)) {
            orphans.push_back(std::move(*info));
        }
    }
    m_ownedCounts.erase(node);
    m_stats.disconnectOrphans += orphans.size();

    if (!orphans.empty()) {
        OWNERSHIP_INFO(std::format("Node {} disconnected, orphaned {} agents", node, orphans.size()));
    }
    return orphans;
}

std::vector<OrphanInfo> OwnershipManager::sweepTimeouts(Uint64 nowMs) {
    const Uint64 timeoutMs = static_cast<Uint64>(m_settings.ownership.ownershipTimeout * 1000.0f);

    std::vector<AgentId> expired;
    for (const auto& [id, owner] : m_owners) {
        const AgentRecord* record = m_store.getAgent(id);
        if (!record) {
            continue;
        }
        if (nowMs > record->lastUpdateMs && nowMs - record->lastUpdateMs > timeoutMs) {
            expired.push_back(id);
        }
    }

    std::vector<OrphanInfo> orphans;
    orphans.reserve(expired.size());
    for (const AgentId& id : expired) {
        OWNERSHIP_INFO(std::format("Ownership of {} by node {} timed out", id, getOwner(id)));
        if (auto info = orphan(id, OwnershipChange::TimedOut)) {
            orphans.push_back(std::move(*info));
        }
    }
    m_stats.timeouts += orphans.size();
    return orphans;
}

bool OwnershipManager::touch(const AgentId& id, Uint64 nowMs) {
    if (!m_owners.contains(id)) {
        return false;
    }
    return m_store.touch(id, nowMs);
}

void OwnershipManager::forgetAgent(const AgentId& id) {
    auto it = m_owners.find(id);
    if (it == m_owners.end()) {
        return;
    }
    const NodeId node = it->second;
    m_owners.erase(it);
    decrementCount(node);
    if (m_listener) {
        m_listener(id, node, OwnershipChange::Forgotten);
    }
}

bool OwnershipManager::setFallbackStatus(const AgentId& id, bool simulated) {
    if (m_owners.contains(id)) {
        return false;
    }
    return m_store.setStatus(id, simulated ? OwnershipStatus::FallbackSimulated
                                           : OwnershipStatus::Orphaned);
}

NodeId OwnershipManager::getOwner(const AgentId& id) const {
    auto it = m_owners.find(id);
    return it == m_owners.end() ? INVALID_NODE : it->second;
}

std::vector<AgentId> OwnershipManager::getOwnedAgents(NodeId node) const {
    std::vector<AgentId> owned;
    for (const auto& [id, owner] : m_owners) {
        if (owner == node) {
            owned.push_back(id);
        }
    }
    return owned;
}

size_t OwnershipManager::getOwnedCount(NodeId node) const {
    auto it = m_ownedCounts.find(node);
    return it == m_ownedCounts.end() ? 0 : it->second;
}

std::optional<OrphanInfo> OwnershipManager::orphan(const AgentId& id, OwnershipChange reason) {
    auto it = m_owners.find(id);
    if (it == m_owners.end()) {
        return std::nullopt;
    }
    const NodeId node = it->second;
    m_owners.erase(it);
    decrementCount(node);

    const AgentRecord* record = m_store.getAgent(id);
    if (!record) {
        return std::nullopt;
    }
    const uint64_t version = record->claimVersion + 1;
    m_store.setOwnership(id, INVALID_NODE, OwnershipStatus::Orphaned, version);

    if (m_listener) {
        m_listener(id, node, reason);
    }
    return OrphanInfo{id, record->position, version};
}

void OwnershipManager::decrementCount(NodeId node) {
    auto it = m_ownedCounts.find(node);
    if (it == m_ownedCounts.end()) {
        return;
    }
    if (it->second <= 1) {
        m_ownedCounts.erase(it);
    } else {
        it->second--;
    }
}

} // namespace SwarmForge
