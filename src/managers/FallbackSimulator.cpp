/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/FallbackSimulator.hpp"
#include "core/Logger.hpp"
#include "managers/AgentStateStore.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <numbers>
#include <vector>

namespace SwarmForge {

FallbackSimulator::FallbackSimulator(const FallbackSettings& settings, AgentStateStore& store,
                                     uint32_t seed)
    : m_settings(settings), m_store(store), m_rng(seed) {}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool FallbackSimulator::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        FALLBACK_WARN("FallbackSimulator already initialized");
        return true;
    }
    m_unclaimed.clear();
    m_simulated.clear();
    m_simulated.reserve(m_settings.maxSimulated);
    m_accumulator = 0.0f;
    m_nextCheckMs = 0;
    m_perf = PerfStats{};

    m_initialized.store(true, std::memory_order_release);
    FALLBACK_INFO(std::format("FallbackSimulator initialized ({} Hz, max {} agents{})",
                              m_settings.simulationFps, m_settings.maxSimulated,
                              m_settings.enabled ? "" : ", disabled"));
    return true;
}

void FallbackSimulator::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    FALLBACK_INFO(std::format("Cleaning up FallbackSimulator ({} simulated, {} waiting)",
                              m_simulated.size(), m_unclaimed.size()));
    m_unclaimed.clear();
    m_simulated.clear();
    m_initialized.store(false, std::memory_order_release);
}

// ============================================================================
// TRACKING
// ============================================================================

void FallbackSimulator::markUnclaimed(const AgentId& id, Uint64 nowMs) {
    if (m_simulated.contains(id)) {
        return;
    }
    // Keep the earliest timestamp so repeated orphan events do not reset the clock
    m_unclaimed.emplace(id, nowMs);
}

void FallbackSimulator::markClaimed(const AgentId& id) {
    m_unclaimed.erase(id);
    if (m_simulated.contains(id)) {
        FALLBACK_DEBUG(std::format("Yielding {} to its new owner", id));
        stopSimulating(id);
    }
}

void FallbackSimulator::removeAgent(const AgentId& id) {
    m_unclaimed.erase(id);
    if (m_simulated.contains(id)) {
        stopSimulating(id);
    }
}

void FallbackSimulator::stopSimulating(const AgentId& id) {
    m_simulated.erase(id);
    if (m_listener) {
        m_listener(id, false);
    }
}

// ============================================================================
// MAIN UPDATE (promotion check + fixed-rate accumulator)
// ============================================================================

void FallbackSimulator::update(float deltaTime, Uint64 nowMs) {
    if (!m_initialized.load(std::memory_order_acquire) || !m_settings.enabled) {
        return;
    }

    if (nowMs >= m_nextCheckMs) {
        m_nextCheckMs = nowMs + static_cast<Uint64>(m_settings.checkInterval * 1000.0f);
        promoteDue(nowMs);
    }

    if (m_settings.simulationFps <= 0.0f) {
        return;
    }
    const float stepInterval = 1.0f / m_settings.simulationFps;
    m_accumulator += deltaTime;
    if (m_accumulator < stepInterval) {
        return;
    }
    // One step per update; a long stall is not replayed
    m_accumulator = std::min(m_accumulator - stepInterval, stepInterval);

    auto t0 = std::chrono::steady_clock::now();
    simulateStep(stepInterval);
    auto t1 = std::chrono::steady_clock::now();

    m_perf.lastUpdateMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
    m_perf.updateAverage(m_perf.lastUpdateMs);
}

void FallbackSimulator::promoteDue(Uint64 nowMs) {
    const Uint64 timeoutMs = static_cast<Uint64>(m_settings.unclaimedTimeout * 1000.0f);

    std::vector<AgentId> promote;
    std::vector<AgentId> drop;
    for (const auto& [id, sinceMs] : m_unclaimed) {
        const AgentRecord* record = m_store.getAgent(id);
        if (!record || !record->isAlive || record->ownerNode != INVALID_NODE) {
            drop.push_back(id);
            continue;
        }
        if (nowMs < sinceMs || nowMs - sinceMs < timeoutMs) {
            continue;
        }
        if (m_simulated.size() + promote.size() >= m_settings.maxSimulated) {
            break;
        }
        promote.push_back(id);
    }

    for (const AgentId& id : drop) {
        m_unclaimed.erase(id);
    }

    for (const AgentId& id : promote) {
        m_unclaimed.erase(id);
        const AgentRecord* record = m_store.getAgent(id);
        SimulatedAgent agent;
        agent.spawn = record->spawnPosition;
        m_simulated.emplace(id, agent);
        m_perf.totalPromotions++;
        if (m_listener) {
            m_listener(id, true);
        }
    }

    if (!promote.empty()) {
        FALLBACK_DEBUG(std::format("Promoted {} unclaimed agents ({} simulated)", promote.size(),
                                   m_simulated.size()));
    }
}

void FallbackSimulator::simulateStep(float fixedDeltaTime) {
    std::vector<AgentId> gone;
    size_t processed = 0;

    for (auto& [id, agent] : m_simulated) {
        const AgentRecord* record = m_store.getAgent(id);
        const AgentConfig* config = m_store.getConfig(id);
        if (!record || !config || !record->isAlive) {
            gone.push_back(id);
            continue;
        }
        if (!config->enableIdleWander || !config->canWalk) {
            continue;
        }

        const float radius = config->maxWanderRadius.value_or(m_settings.defaultWanderRadius);
        const Vector3D position = record->position;
        if (!agent.hasTarget ||
            Vector3D::horizontalDistance(position, agent.wanderTarget) <= m_settings.arrivalDistance) {
            agent.wanderTarget = pickWanderPoint(agent.spawn, radius);
            agent.hasTarget = true;
        }

        const Vector3D delta = (agent.wanderTarget - position).flattened();
        const float dist = delta.length();
        if (dist <= 0.0f) {
            continue;
        }
        const Vector3D direction = delta / dist;
        const float step = std::min(dist, config->walkSpeed * m_settings.speedMultiplier * fixedDeltaTime);

        m_store.writeKinematics(id, position + direction * step, Orientation(direction));
        processed++;
    }

    for (const AgentId& id : gone) {
        FALLBACK_DEBUG(std::format("Dropping {} from fallback simulation", id));
        stopSimulating(id);
    }
    m_perf.lastEntitiesProcessed = processed;
}

Vector3D FallbackSimulator::pickWanderPoint(const Vector3D& spawn, float radius) {
    std::uniform_real_distribution<float> angleDist(0.0f, 2.0f * std::numbers::pi_v<float>);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    const float angle = angleDist(m_rng);
    // sqrt keeps the points uniform over the disc
    const float r = radius * std::sqrt(unit(m_rng));
    return Vector3D(spawn.getX() + std::cos(angle) * r, spawn.getY(),
                    spawn.getZ() + std::sin(angle) * r);
}

} // namespace SwarmForge
