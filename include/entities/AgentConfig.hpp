/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_CONFIG_HPP
#define AGENT_CONFIG_HPP

#include "entities/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <optional>
#include <string>

namespace SwarmForge {

class JsonValue;

/**
 * @brief Immutable per-agent configuration.
 *
 * Travels inside the shared record as a JSON object with PascalCase keys
 * ("SightRange", "MovementMode", ...). Every field is optional in the
 * document; absent fields keep the defaults below.
 */
struct AgentConfig {
    float maxHealth{100.0f};
    float walkSpeed{16.0f};
    float jumpPower{50.0f};
    float sightRange{200.0f};
    SightMode sightMode{SightMode::Directional};
    MovementMode movementMode{MovementMode::Ranged};
    std::string faction;                  // Empty means factionless
    bool canAttackAllies{false};
    bool enableCombatMovement{true};
    bool enableIdleWander{true};
    bool canWalk{true};                   // False for turrets and other stationary agents
    bool usePathfinding{true};
    std::optional<Vector3D> spawnPosition;
    std::optional<float> maxWanderRadius;
    std::optional<float> meleeOffsetRange;
    std::optional<float> fleeSpeedMultiplier;
    std::optional<float> fleeDistanceFactor;
    std::optional<float> fleeSafeDistanceFactor;
    float hipHeight{2.0f};
    float rootHalfHeight{1.0f};

    // Distance from the feet to the logical position
    float heightOffset() const { return hipHeight + rootHalfHeight; }

    bool isFactionless() const { return faction.empty(); }

    /**
     * @brief Parse from JSON text.
     * @return nullopt if the text is not a JSON object
     */
    static std::optional<AgentConfig> fromJson(const std::string& json);
    static AgentConfig fromJsonValue(const JsonValue& value);

    std::string toJson() const;
};

/**
 * @brief Faction rule shared by sight filtering: same faction, or both
 *        factionless, are allies.
 */
inline bool areAllies(const std::string& factionA, const std::string& factionB) {
    return factionA == factionB;
}

} // namespace SwarmForge

#endif // AGENT_CONFIG_HPP
