/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef FALLBACK_SIMULATOR_HPP
#define FALLBACK_SIMULATOR_HPP

/**
 * @file FallbackSimulator.hpp
 * @brief Low-rate authority-side simulation for agents no node will claim
 *
 * An agent that stays unclaimed for FallbackSettings::unclaimedTimeout is
 * picked up here and walked straight toward random points around its spawn,
 * at a fixed rate (FallbackSettings::simulationFps) and reduced speed. No
 * pathfinding, no sight, no ground queries.
 *
 * Processing model:
 * - Promotion check every checkInterval (cheap, map scan)
 * - Movement on a fixed-step accumulator, one step per update at most
 * - Yields immediately when a node claims the agent (markClaimed)
 *
 * While an agent is fallback-simulated this class is its single writer.
 */

#include "core/SimulationSettings.hpp"
#include "entities/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <boost/container/flat_map.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <random>
#include <unordered_map>

namespace SwarmForge {

class AgentStateStore;

class FallbackSimulator {
public:
    // Promotion/demotion notifications (true when simulation starts)
    using StatusListener = std::function<void(const AgentId&, bool simulated)>;

    FallbackSimulator(const FallbackSettings& settings, AgentStateStore& store,
                      uint32_t seed = std::random_device{}());

    FallbackSimulator(const FallbackSimulator&) = delete;
    FallbackSimulator& operator=(const FallbackSimulator&) = delete;

    bool init();
    void clean();

    [[nodiscard]] bool isInitialized() const noexcept {
        return m_initialized.load(std::memory_order_acquire);
    }

    void setStatusListener(StatusListener listener) { m_listener = std::move(listener); }

    /**
     * @brief Start (or keep) the unclaimed clock for an agent
     */
    void markUnclaimed(const AgentId& id, Uint64 nowMs);

    /**
     * @brief A node took the agent; stop simulating it now
     */
    void markClaimed(const AgentId& id);

    void removeAgent(const AgentId& id);

    /**
     * @param deltaTime Seconds since the last call
     * @param nowMs Current time for the promotion check
     */
    void update(float deltaTime, Uint64 nowMs);

    [[nodiscard]] bool isSimulating(const AgentId& id) const { return m_simulated.contains(id); }
    [[nodiscard]] bool isWaiting(const AgentId& id) const { return m_unclaimed.contains(id); }
    [[nodiscard]] size_t getSimulatedCount() const { return m_simulated.size(); }
    [[nodiscard]] size_t getWaitingCount() const { return m_unclaimed.size(); }

    // Performance metrics (follows PathfinderManager)
    struct PerfStats {
        double lastUpdateMs{0.0};
        double avgUpdateMs{0.0};
        size_t lastEntitiesProcessed{0};
        uint64_t totalPromotions{0};
        uint64_t totalUpdates{0};

        static constexpr double ALPHA = 0.05;  // EMA smoothing

        void updateAverage(double newMs) {
            if (totalUpdates == 0) {
                avgUpdateMs = newMs;
            } else {
                avgUpdateMs = ALPHA * newMs + (1.0 - ALPHA) * avgUpdateMs;
            }
            totalUpdates++;
        }
    };

    [[nodiscard]] const PerfStats& getPerfStats() const { return m_perf; }
    void resetPerfStats() { m_perf = PerfStats{}; }

private:
    struct SimulatedAgent {
        Vector3D spawn;
        Vector3D wanderTarget;
        bool hasTarget{false};
    };

    void promoteDue(Uint64 nowMs);
    void simulateStep(float fixedDeltaTime);
    Vector3D pickWanderPoint(const Vector3D& spawn, float radius);
    void stopSimulating(const AgentId& id);

    const FallbackSettings& m_settings;
    AgentStateStore& m_store;

    boost::container::flat_map<AgentId, Uint64> m_unclaimed;   // id -> unclaimed since
    std::unordered_map<AgentId, SimulatedAgent> m_simulated;

    float m_accumulator{0.0f};
    Uint64 m_nextCheckMs{0};

    StatusListener m_listener;
    std::mt19937 m_rng;
    PerfStats m_perf;
    std::atomic<bool> m_initialized{false};
};

} // namespace SwarmForge

#endif // FALLBACK_SIMULATOR_HPP
