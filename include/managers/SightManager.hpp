/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIGHT_MANAGER_HPP
#define SIGHT_MANAGER_HPP

/**
 * @file SightManager.hpp
 * @brief Target detection for every simulated agent on one shared scheduler
 *
 * Registered agents sit in a min-heap keyed by their next detection time.
 * update() is pumped every tick but only does work every
 * SightSettings::schedulerInterval, and then only for agents that are due.
 *
 * Unregistering is O(1): heap entries carry the registration generation and
 * stale ones are dropped when they surface. The heap is compacted when stale
 * entries dominate it.
 *
 * Detection pipeline per agent:
 *   candidates in range -> view cone -> line of sight -> ally filter -> nearest
 */

#include "core/SimulationSettings.hpp"
#include "entities/AgentConfig.hpp"
#include "utils/Orientation.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <queue>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace SwarmForge {

class AgentStateStore;
class PlayerRegistry;
class SpatialQueryAdapter;

enum class TargetKind : uint8_t { Player, Agent };

struct TargetRef {
    TargetKind kind{TargetKind::Player};
    std::string id;

    bool operator==(const TargetRef& other) const { return kind == other.kind && id == other.id; }
    bool operator!=(const TargetRef& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const TargetRef& ref) {
    return os << (ref.kind == TargetKind::Player ? "player:" : "agent:") << ref.id;
}

// Viewer state supplied by whoever simulates the agent
struct SightQuery {
    Vector3D position;
    Orientation orientation;
    const AgentConfig* config{nullptr};
};

struct SightResult {
    AgentId agentId;
    std::optional<TargetRef> target;
    Vector3D targetPosition;
    float distance{0.0f};
    Uint64 timestampMs{0};
};

class SightManager {
public:
    // nullopt means the agent can no longer see (dead or torn down) and is dropped
    using QueryResolver = std::function<std::optional<SightQuery>(const AgentId&)>;
    using ResultHandler = std::function<void(const SightResult&)>;

    SightManager(const SightSettings& settings, const AgentStateStore& store,
                 const PlayerRegistry& players, const SpatialQueryAdapter& queries,
                 uint32_t seed = std::random_device{}());

    SightManager(const SightManager&) = delete;
    SightManager& operator=(const SightManager&) = delete;

    bool init();
    void clean();
    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    void setQueryResolver(QueryResolver resolver) { m_resolver = std::move(resolver); }
    void setResultHandler(ResultHandler handler) { m_handler = std::move(handler); }

    /**
     * @return false if already registered
     */
    bool registerAgent(const AgentId& id, Uint64 nowMs);

    /**
     * @return false if not registered; safe to call repeatedly
     */
    bool unregisterAgent(const AgentId& id);

    bool isRegistered(const AgentId& id) const { return m_registrations.contains(id); }

    /**
     * @brief Pump the scheduler; detections run for due agents only
     */
    void update(Uint64 nowMs);

    /**
     * @brief Run the detection pipeline immediately, without rescheduling
     */
    SightResult detect(const AgentId& id, const SightQuery& query, Uint64 nowMs) const;

    size_t registeredCount() const { return m_registrations.size(); }
    size_t scheduledCount() const { return m_schedule.size(); }

    struct SightStats {
        uint64_t detectionsRun{0};
        uint64_t targetsFound{0};
        uint64_t staleEntriesDropped{0};
        uint64_t autoUnregistered{0};
    };
    const SightStats& getStats() const { return m_stats; }

private:
    struct ScheduleEntry {
        Uint64 dueMs;
        uint64_t generation;
        AgentId agentId;
    };
    struct LaterFirst {
        bool operator()(const ScheduleEntry& a, const ScheduleEntry& b) const {
            return a.dueMs > b.dueMs;
        }
    };

    Uint64 nextDelayMs(bool hasTarget);
    void compact();

    const SightSettings& m_settings;
    const AgentStateStore& m_store;
    const PlayerRegistry& m_players;
    const SpatialQueryAdapter& m_queries;

    std::priority_queue<ScheduleEntry, std::vector<ScheduleEntry>, LaterFirst> m_schedule;
    std::unordered_map<AgentId, uint64_t> m_registrations;   // id -> live generation
    uint64_t m_nextGeneration{1};
    Uint64 m_nextPumpMs{0};

    QueryResolver m_resolver;
    ResultHandler m_handler;
    std::mt19937 m_rng;
    mutable SightStats m_stats;   // detect() is const but counted
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // SIGHT_MANAGER_HPP
