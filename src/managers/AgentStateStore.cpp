/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/AgentStateStore.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <format>

namespace SwarmForge {

size_t SubscriptionArena::releaseAll(AgentStateStore& store) {
    size_t released = 0;
    for (const auto& handle : m_handles) {
        if (store.unsubscribe(handle)) {
            ++released;
        }
    }
    m_handles.clear();
    return released;
}

bool AgentStateStore::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        STORE_WARN("AgentStateStore already initialized");
        return true;
    }

    m_agents.clear();
    m_agentSubscribers.clear();
    m_globalSubscribers.clear();
    m_nextSubscriptionId = 1;

    m_initialized.store(true, std::memory_order_release);
    STORE_INFO("AgentStateStore initialized");
    return true;
}

void AgentStateStore::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }

    STORE_INFO(std::format("Cleaning AgentStateStore ({} agents, {} subscriptions)",
                           m_agents.size(), getSubscriptionCount()));
    m_agents.clear();
    m_agentSubscribers.clear();
    m_globalSubscribers.clear();
    m_initialized.store(false, std::memory_order_release);
}

bool AgentStateStore::createAgent(AgentRecord record) {
    if (record.id.empty()) {
        STORE_ERROR("Rejected agent with empty id");
        return false;
    }
    if (m_agents.contains(record.id)) {
        STORE_WARN(std::format("Agent {} already exists", record.id));
        return false;
    }

    auto config = AgentConfig::fromJson(record.configJson);
    if (!config) {
        STORE_ERROR(std::format("Agent {} has a malformed config", record.id));
        return false;
    }

    // Spawn anchor defaults to the initial position
    if (config->spawnPosition) {
        record.spawnPosition = *config->spawnPosition;
    } else if (record.spawnPosition == Vector3D()) {
        record.spawnPosition = record.position;
    }
    record.maxHealth = config->maxHealth;
    record.health = std::min(record.health, record.maxHealth);
    record.isAlive = record.health > 0.0f;

    const AgentId id = record.id;
    auto [it, inserted] = m_agents.emplace(id, Entry{std::move(record), std::move(*config)});
    STORE_DEBUG(std::format("Created agent {} at {}", id, it->second.record.position));
    notify(it->second.record, AgentEvent::Created);
    return inserted;
}

bool AgentStateStore::removeAgent(const AgentId& id) {
    auto it = m_agents.find(id);
    if (it == m_agents.end()) {
        return false;
    }

    // Listeners still see the record while Removed is dispatched
    const AgentId key = id;
    notify(it->second.record, AgentEvent::Removed);

    m_agents.erase(key);
    m_agentSubscribers.erase(key);
    STORE_DEBUG(std::format("Removed agent {}", key));
    return true;
}

const AgentRecord* AgentStateStore::getAgent(const AgentId& id) const {
    auto it = m_agents.find(id);
    return it != m_agents.end() ? &it->second.record : nullptr;
}

const AgentConfig* AgentStateStore::getConfig(const AgentId& id) const {
    auto it = m_agents.find(id);
    return it != m_agents.end() ? &it->second.config : nullptr;
}

void AgentStateStore::forEachAgent(const std::function<void(const AgentRecord&)>& fn) const {
    for (const auto& [id, entry] : m_agents) {
        fn(entry.record);
    }
}

AgentStateStore::Entry* AgentStateStore::find(const AgentId& id) {
    auto it = m_agents.find(id);
    return it != m_agents.end() ? &it->second : nullptr;
}

bool AgentStateStore::writeKinematics(const AgentId& id, const Vector3D& position,
                                      const Orientation& orientation) {
    Entry* entry = find(id);
    if (!entry) return false;
    entry->record.position = position;
    entry->record.orientation = orientation;
    return true;
}

bool AgentStateStore::correctPosition(const AgentId& id, const Vector3D& position) {
    Entry* entry = find(id);
    if (!entry) return false;
    entry->record.position = position;
    notify(entry->record, AgentEvent::PositionCorrected);
    return true;
}

bool AgentStateStore::setDestination(const AgentId& id, const std::optional<Vector3D>& destination) {
    Entry* entry = find(id);
    if (!entry) return false;
    if (entry->record.destination == destination) {
        return true;
    }
    entry->record.destination = destination;
    notify(entry->record, AgentEvent::DestinationChanged);
    return true;
}

bool AgentStateStore::setHealth(const AgentId& id, float health) {
    Entry* entry = find(id);
    if (!entry) return false;

    AgentRecord& record = entry->record;
    record.health = std::clamp(health, 0.0f, record.maxHealth);
    const bool alive = record.health > 0.0f;
    if (alive != record.isAlive) {
        record.isAlive = alive;
        STORE_DEBUG(std::format("Agent {} is now {}", id, alive ? "alive" : "dead"));
        notify(record, AgentEvent::AliveChanged);
    }
    return true;
}

bool AgentStateStore::setOwnership(const AgentId& id, NodeId owner, OwnershipStatus status,
                                   uint64_t claimVersion) {
    Entry* entry = find(id);
    if (!entry) return false;
    entry->record.ownerNode = owner;
    entry->record.status = status;
    entry->record.claimVersion = claimVersion;
    return true;
}

bool AgentStateStore::setStatus(const AgentId& id, OwnershipStatus status) {
    Entry* entry = find(id);
    if (!entry) return false;
    entry->record.status = status;
    return true;
}

bool AgentStateStore::touch(const AgentId& id, Uint64 nowMs) {
    Entry* entry = find(id);
    if (!entry) return false;
    entry->record.lastUpdateMs = nowMs;
    return true;
}

SubscriptionHandle AgentStateStore::subscribe(const AgentId& id, AgentEvent event,
                                              AgentEventHandler handler) {
    if (!handler || !m_agents.contains(id)) {
        return {};
    }
    const uint64_t subId = m_nextSubscriptionId++;
    m_agentSubscribers[id].push_back(Subscriber{subId, event, std::move(handler)});
    return SubscriptionHandle{subId, id, event};
}

SubscriptionHandle AgentStateStore::subscribeAll(AgentEvent event, AgentEventHandler handler) {
    if (!handler) {
        return {};
    }
    const uint64_t subId = m_nextSubscriptionId++;
    m_globalSubscribers.push_back(Subscriber{subId, event, std::move(handler)});
    return SubscriptionHandle{subId, {}, event};
}

bool AgentStateStore::unsubscribe(const SubscriptionHandle& handle) {
    if (!handle.valid()) {
        return false;
    }

    auto matches = [&handle](const Subscriber& s) { return s.id == handle.id; };

    if (handle.agentId.empty()) {
        auto it = std::find_if(m_globalSubscribers.begin(), m_globalSubscribers.end(), matches);
        if (it == m_globalSubscribers.end()) return false;
        m_globalSubscribers.erase(it);
        return true;
    }

    auto listIt = m_agentSubscribers.find(handle.agentId);
    if (listIt == m_agentSubscribers.end()) {
        return false;
    }
    auto& list = listIt->second;
    auto it = std::find_if(list.begin(), list.end(), matches);
    if (it == list.end()) return false;
    list.erase(it);
    if (list.empty()) {
        m_agentSubscribers.erase(listIt);
    }
    return true;
}

size_t AgentStateStore::getSubscriptionCount() const {
    size_t count = m_globalSubscribers.size();
    for (const auto& [id, list] : m_agentSubscribers) {
        count += list.size();
    }
    return count;
}

void AgentStateStore::notify(const AgentRecord& record, AgentEvent event) {
    // Handlers may subscribe or unsubscribe, so dispatch from a copy
    std::vector<AgentEventHandler> handlers;

    if (auto it = m_agentSubscribers.find(record.id); it != m_agentSubscribers.end()) {
        for (const auto& sub : it->second) {
            if (sub.event == event) handlers.push_back(sub.handler);
        }
    }
    for (const auto& sub : m_globalSubscribers) {
        if (sub.event == event) handlers.push_back(sub.handler);
    }

    // Copy the record too: a handler may remove the agent
    const AgentRecord snapshot = record;
    for (const auto& handler : handlers) {
        handler(snapshot, event);
    }
}

} // namespace SwarmForge
