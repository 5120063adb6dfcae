/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_SETTINGS_HPP
#define SIMULATION_SETTINGS_HPP

/**
 * @file SimulationSettings.hpp
 * @brief Tunables for the distributed agent simulation.
 *
 * Every value has a default, so a default-constructed SimulationSettings is
 * a complete, working configuration. A JSON file can override any subset:
 *
 * {
 *   "client_simulation": { "simulation_radius": 150, "max_agents_per_node": 30 },
 *   "server_fallback":   { "enabled": false }
 * }
 *
 * Durations are seconds, distances are world units.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace SwarmForge {

class JsonValue;

struct ClientSimulationSettings {
    float simulationRadius{200.0f};      // Node may claim agents within this of its viewpoint
    uint32_t maxAgentsPerNode{50};
    float positionSyncInterval{0.5f};    // Outbound sync and distance-check period
    float broadcastRadius{250.0f};       // Authority relays updates to nodes within this
    float handoffHysteresis{1.5f};       // Release beyond simulationRadius * this
    float claimDelayBase{0.1f};
    float claimDelayPerUnit{0.001f};
    float claimPositionEpsilon{1.0f};    // Orphan moved more than this => someone else owns it
    bool useDeltaCompression{true};
    float keepaliveInterval{1.0f};       // Unchanged agents are still resent this often
    bool useBatchedUpdates{true};
    float secondaryClockTakeover{0.1f};  // Secondary clock steps only after this much primary silence
};

struct OwnershipSettings {
    float ownershipTimeout{3.0f};
    float timeoutCheckInterval{5.0f};
};

struct FallbackSettings {
    bool enabled{true};
    float unclaimedTimeout{5.0f};
    float simulationFps{1.0f};
    float speedMultiplier{0.5f};
    uint32_t maxSimulated{100};
    float checkInterval{1.0f};
    float defaultWanderRadius{50.0f};
    float arrivalDistance{1.0f};
};

struct JumpSettings {
    float defaultJumpPower{50.0f};
    float gravity{196.2f};
    float jumpTimeout{3.0f};
    float groundCheckDistance{1.0f};
    float groundRayLength{100.0f};
    float landingRayHeight{3.0f};        // Landing ray starts this far above the predicted position
    float landingRayLength{20.0f};
    uint32_t maxGroundSkips{5};          // Non-solid hits skipped before giving up
};

struct PathfindingSettings {
    float waypointReachDistance{2.0f};
    float finalReachDistance{0.5f};
    float directArrivalDistance{0.01f};
    float travelRequestInterval{1.0f};
    float combatRequestInterval{0.1f};
    float fleeRequestInterval{0.5f};
    float travelRecomputeDistance{1.0f};
    float combatRecomputeDistance{10.0f};
    float fleeRecomputeDistance{5.0f};
    uint32_t maxComputationErrors{3};    // Failures tolerated before the destination is abandoned
    uint32_t maxUnreachableErrors{5};
    uint32_t maxStuckErrors{3};
    uint32_t maxRoutesPerUpdate{8};
};

struct SightSettings {
    float coneAngleDegrees{120.0f};      // Total cone, half on each side of the look vector
    float detectionIntervalMin{1.0f};
    float detectionIntervalMax{3.0f};
    float detectionIntervalWithTarget{1.5f};
    float schedulerInterval{0.1f};
};

struct BehaviorSettings {
    float wanderRadiusMin{10.0f};
    float wanderRadiusMax{30.0f};
    float wanderCooldown{3.0f};
    float wanderChance{0.3f};
    float meleeOffsetMin{3.0f};
    float meleeOffsetMax{8.0f};
    float rangedRangeFactor{0.7f};
    float fleeSpeedMultiplier{1.3f};
    float fleeDistanceFactor{1.5f};
    float fleeSafeDistanceFactor{1.2f};
    float fleeNoticeDuration{0.4f};
    float stuckThreshold{0.5f};
    float stuckWindow{2.0f};
    float obstacleProbeHeight{0.5f};     // Above the feet; lower obstacles are stepped over
};

struct MitigationSettings {
    bool softBoundsEnabled{true};
    float defaultMaxWanderRadius{500.0f};
    float groundCheckInterval{2.0f};
    float groundSnapTolerance{10.0f};
};

struct SimulationSettings {
    ClientSimulationSettings clientSimulation;
    OwnershipSettings ownership;
    FallbackSettings fallback;
    JumpSettings jump;
    PathfindingSettings pathfinding;
    SightSettings sight;
    BehaviorSettings behavior;
    MitigationSettings mitigation;
};

/**
 * @brief Reads and writes SimulationSettings as categorized JSON.
 *
 * Unknown categories or keys and wrongly typed values are skipped with a
 * warning; the affected field keeps its previous value.
 */
class SettingsLoader {
public:
    static bool loadFromFile(const std::string& filepath, SimulationSettings& settings);
    static bool loadFromString(const std::string& json, SimulationSettings& settings);
    static bool saveToFile(const std::string& filepath, const SimulationSettings& settings);
    static std::string toJson(const SimulationSettings& settings);

private:
    static bool apply(const JsonValue& root, SimulationSettings& settings);
};

} // namespace SwarmForge

#endif // SIMULATION_SETTINGS_HPP
