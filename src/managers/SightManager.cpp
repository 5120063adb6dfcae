/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SightManager.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerRegistry.hpp"
#include "managers/AgentStateStore.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <boost/container/small_vector.hpp>
#include <algorithm>
#include <cmath>
#include <format>
#include <numbers>

namespace SwarmForge {

namespace {

struct Candidate {
    TargetRef ref;
    Vector3D position;
    float distance;
    const AgentConfig* config;   // nullptr for players
};

// Heap is rebuilt once stale entries outnumber live ones by this factor
constexpr size_t COMPACT_FACTOR = 2;
constexpr size_t COMPACT_SLACK = 64;

} // namespace

SightManager::SightManager(const SightSettings& settings, const AgentStateStore& store,
                           const PlayerRegistry& players, const SpatialQueryAdapter& queries,
                           uint32_t seed)
    : m_settings(settings), m_store(store), m_players(players), m_queries(queries), m_rng(seed) {}

bool SightManager::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        SIGHT_WARN("SightManager already initialized");
        return true;
    }
    m_schedule = {};
    m_registrations.clear();
    m_nextPumpMs = 0;
    m_stats = SightStats{};
    m_initialized.store(true, std::memory_order_release);
    SIGHT_INFO("SightManager initialized");
    return true;
}

void SightManager::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    SIGHT_INFO(std::format("Cleaning SightManager ({} registered, {} detections run)",
                           m_registrations.size(), m_stats.detectionsRun));
    m_schedule = {};
    m_registrations.clear();
    m_initialized.store(false, std::memory_order_release);
}

Uint64 SightManager::nextDelayMs(bool hasTarget) {
    if (hasTarget) {
        return static_cast<Uint64>(m_settings.detectionIntervalWithTarget * 1000.0f);
    }
    std::uniform_real_distribution<float> dist(m_settings.detectionIntervalMin,
                                               std::max(m_settings.detectionIntervalMin,
                                                        m_settings.detectionIntervalMax));
    return static_cast<Uint64>(dist(m_rng) * 1000.0f);
}

bool SightManager::registerAgent(const AgentId& id, Uint64 nowMs) {
    if (!m_initialized.load(std::memory_order_acquire)) {
        SIGHT_WARN(std::format("Cannot register {}: SightManager not initialized", id));
        return false;
    }
    if (m_registrations.contains(id)) {
        return false;
    }

    const uint64_t generation = m_nextGeneration++;
    m_registrations.emplace(id, generation);

    // Spread first detections so a mass spawn does not detect in lockstep
    std::uniform_real_distribution<float> initial(0.0f, m_settings.detectionIntervalMin);
    const Uint64 delay = static_cast<Uint64>(initial(m_rng) * 1000.0f);
    m_schedule.push(ScheduleEntry{nowMs + delay, generation, id});
    return true;
}

bool SightManager::unregisterAgent(const AgentId& id) {
    if (m_registrations.erase(id) == 0) {
        return false;
    }
    if (m_registrations.empty()) {
        m_schedule = {};
    } else if (m_schedule.size() > m_registrations.size() * COMPACT_FACTOR + COMPACT_SLACK) {
        compact();
    }
    return true;
}

void SightManager::compact() {
    std::vector<ScheduleEntry> live;
    live.reserve(m_registrations.size());
    while (!m_schedule.empty()) {
        ScheduleEntry entry = m_schedule.top();
        m_schedule.pop();
        auto it = m_registrations.find(entry.agentId);
        if (it != m_registrations.end() && it->second == entry.generation) {
            live.push_back(std::move(entry));
        } else {
            m_stats.staleEntriesDropped++;
        }
    }
    m_schedule = decltype(m_schedule)(LaterFirst{}, std::move(live));
}

void SightManager::update(Uint64 nowMs) {
    if (!m_initialized.load(std::memory_order_acquire) || m_schedule.empty()) {
        return;
    }
    if (nowMs < m_nextPumpMs) {
        return;
    }
    m_nextPumpMs = nowMs + static_cast<Uint64>(m_settings.schedulerInterval * 1000.0f);

    while (!m_schedule.empty() && m_schedule.top().dueMs <= nowMs) {
        ScheduleEntry entry = m_schedule.top();
        m_schedule.pop();

        auto reg = m_registrations.find(entry.agentId);
        if (reg == m_registrations.end() || reg->second != entry.generation) {
            m_stats.staleEntriesDropped++;
            continue;
        }

        std::optional<SightQuery> query = m_resolver ? m_resolver(entry.agentId) : std::nullopt;
        if (!query || !query->config) {
            m_registrations.erase(reg);
            m_stats.autoUnregistered++;
            SIGHT_DEBUG(std::format("Dropped {} from sight scheduling", entry.agentId));
            continue;
        }

        SightResult result = detect(entry.agentId, *query, nowMs);
        const bool hasTarget = result.target.has_value();

        // Reschedule before the handler runs so it may unregister safely
        m_schedule.push(ScheduleEntry{nowMs + nextDelayMs(hasTarget), entry.generation, entry.agentId});

        if (m_handler) {
            m_handler(result);
        }
    }

    if (m_registrations.empty()) {
        m_schedule = {};
    }
}

SightResult SightManager::detect(const AgentId& id, const SightQuery& query, Uint64 nowMs) const {
    m_stats.detectionsRun++;

    SightResult result;
    result.agentId = id;
    result.timestampMs = nowMs;

    const AgentConfig& config = *query.config;
    const float range = config.sightRange;
    if (range <= 0.0f) {
        return result;
    }
    const float rangeSq = range * range;

    boost::container::small_vector<Candidate, 16> candidates;

    m_players.forEachPlayer([&](const PlayerInfo& player) {
        if (!player.isAlive) return;
        const float d2 = Vector3D::distanceSquared(query.position, player.position);
        if (d2 <= rangeSq) {
            candidates.push_back(Candidate{{TargetKind::Player, player.id}, player.position,
                                           std::sqrt(d2), nullptr});
        }
    });

    m_store.forEachAgent([&](const AgentRecord& other) {
        if (other.id == id || !other.isAlive) return;
        const float d2 = Vector3D::distanceSquared(query.position, other.position);
        if (d2 <= rangeSq) {
            candidates.push_back(Candidate{{TargetKind::Agent, other.id}, other.position,
                                           std::sqrt(d2), m_store.getConfig(other.id)});
        }
    });

    if (candidates.empty()) {
        return result;
    }

    // View cone on the horizontal plane; a candidate straight above or below is always seen
    if (config.sightMode == SightMode::Directional) {
        const float halfAngle = (m_settings.coneAngleDegrees * 0.5f) * std::numbers::pi_v<float> / 180.0f;
        const float minDot = std::cos(halfAngle);
        const Vector3D& look = query.orientation.getLookVector();
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const Candidate& c) {
            const Vector3D toCandidate = (c.position - query.position).flattened();
            if (toCandidate.lengthSquared() < 0.0001f) return false;
            return toCandidate.normalized().dot(look) < minDot;
        }),
                     candidates.end());
    }

    candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const Candidate& c) {
        RaycastFilter filter;
        filter.ignoreTags.push_back(id);
        filter.ignoreTags.push_back(c.ref.id);
        return !m_queries.hasLineOfSight(query.position, c.position, filter);
    }),
                     candidates.end());

    if (!config.canAttackAllies) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const Candidate& c) {
            return c.config && areAllies(config.faction, c.config->faction);
        }),
                     candidates.end());
    }

    if (candidates.empty()) {
        return result;
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const Candidate& a, const Candidate& b) { return a.distance < b.distance; });

    const Candidate& nearest = candidates.front();
    result.target = nearest.ref;
    result.targetPosition = nearest.position;
    result.distance = nearest.distance;
    m_stats.targetsFound++;
    return result;
}

} // namespace SwarmForge
