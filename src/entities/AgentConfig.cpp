/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/AgentConfig.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"

namespace SwarmForge {

namespace {

void readFloat(const JsonValue& obj, const char* key, float& out) {
    if (auto v = obj[key].tryAsFloat()) out = *v;
}

void readBool(const JsonValue& obj, const char* key, bool& out) {
    if (auto v = obj[key].tryAsBool()) out = *v;
}

void readOptionalFloat(const JsonValue& obj, const char* key, std::optional<float>& out) {
    if (auto v = obj[key].tryAsFloat()) out = *v;
}

std::optional<Vector3D> readVector(const JsonValue& value) {
    if (!value.isObject()) return std::nullopt;
    auto x = value["X"].tryAsFloat();
    auto y = value["Y"].tryAsFloat();
    auto z = value["Z"].tryAsFloat();
    if (!x || !y || !z) return std::nullopt;
    return Vector3D(*x, *y, *z);
}

JsonValue writeVector(const Vector3D& v) {
    JsonValue out{JsonObject{}};
    out["X"] = JsonValue(v.getX());
    out["Y"] = JsonValue(v.getY());
    out["Z"] = JsonValue(v.getZ());
    return out;
}

} // namespace

AgentConfig AgentConfig::fromJsonValue(const JsonValue& obj) {
    AgentConfig config;
    if (!obj.isObject()) {
        return config;
    }

    readFloat(obj, "MaxHealth", config.maxHealth);
    readFloat(obj, "WalkSpeed", config.walkSpeed);
    readFloat(obj, "JumpPower", config.jumpPower);
    readFloat(obj, "SightRange", config.sightRange);
    readFloat(obj, "HipHeight", config.hipHeight);
    readFloat(obj, "RootHalfHeight", config.rootHalfHeight);

    if (auto mode = obj["SightMode"].tryAsString()) {
        if (*mode == "Omnidirectional") {
            config.sightMode = SightMode::Omnidirectional;
        } else if (*mode == "Directional") {
            config.sightMode = SightMode::Directional;
        } else {
            SWARM_WARN("AgentConfig", "Unknown SightMode '" + *mode + "', using Directional");
        }
    }

    if (auto mode = obj["MovementMode"].tryAsString()) {
        if (*mode == "Melee") {
            config.movementMode = MovementMode::Melee;
        } else if (*mode == "Flee") {
            config.movementMode = MovementMode::Flee;
        } else if (*mode == "Ranged") {
            config.movementMode = MovementMode::Ranged;
        } else {
            SWARM_WARN("AgentConfig", "Unknown MovementMode '" + *mode + "', using Ranged");
        }
    }

    if (auto faction = obj["Faction"].tryAsString()) config.faction = *faction;

    readBool(obj, "CanAttackAllies", config.canAttackAllies);
    readBool(obj, "EnableCombatMovement", config.enableCombatMovement);
    readBool(obj, "EnableIdleWander", config.enableIdleWander);
    readBool(obj, "CanWalk", config.canWalk);
    readBool(obj, "UsePathfinding", config.usePathfinding);

    config.spawnPosition = readVector(obj["SpawnPosition"]);
    readOptionalFloat(obj, "MaxWanderRadius", config.maxWanderRadius);
    readOptionalFloat(obj, "MeleeOffsetRange", config.meleeOffsetRange);
    readOptionalFloat(obj, "FleeSpeedMultiplier", config.fleeSpeedMultiplier);
    readOptionalFloat(obj, "FleeDistanceFactor", config.fleeDistanceFactor);
    readOptionalFloat(obj, "FleeSafeDistanceFactor", config.fleeSafeDistanceFactor);

    return config;
}

std::optional<AgentConfig> AgentConfig::fromJson(const std::string& json) {
    if (json.empty()) {
        return AgentConfig{};
    }
    JsonReader reader;
    if (!reader.parse(json) || !reader.getRoot().isObject()) {
        SWARM_WARN("AgentConfig", "Invalid agent config: " + reader.getLastError());
        return std::nullopt;
    }
    return fromJsonValue(reader.getRoot());
}

std::string AgentConfig::toJson() const {
    JsonValue obj{JsonObject{}};
    obj["MaxHealth"] = JsonValue(maxHealth);
    obj["WalkSpeed"] = JsonValue(walkSpeed);
    obj["JumpPower"] = JsonValue(jumpPower);
    obj["SightRange"] = JsonValue(sightRange);
    obj["SightMode"] = JsonValue(std::string(toString(sightMode)));
    obj["MovementMode"] = JsonValue(std::string(toString(movementMode)));
    if (!faction.empty()) obj["Faction"] = JsonValue(faction);
    obj["CanAttackAllies"] = JsonValue(canAttackAllies);
    obj["EnableCombatMovement"] = JsonValue(enableCombatMovement);
    obj["EnableIdleWander"] = JsonValue(enableIdleWander);
    obj["CanWalk"] = JsonValue(canWalk);
    obj["UsePathfinding"] = JsonValue(usePathfinding);
    obj["HipHeight"] = JsonValue(hipHeight);
    obj["RootHalfHeight"] = JsonValue(rootHalfHeight);
    if (spawnPosition) obj["SpawnPosition"] = writeVector(*spawnPosition);
    if (maxWanderRadius) obj["MaxWanderRadius"] = JsonValue(*maxWanderRadius);
    if (meleeOffsetRange) obj["MeleeOffsetRange"] = JsonValue(*meleeOffsetRange);
    if (fleeSpeedMultiplier) obj["FleeSpeedMultiplier"] = JsonValue(*fleeSpeedMultiplier);
    if (fleeDistanceFactor) obj["FleeDistanceFactor"] = JsonValue(*fleeDistanceFactor);
    if (fleeSafeDistanceFactor) obj["FleeSafeDistanceFactor"] = JsonValue(*fleeSafeDistanceFactor);
    return obj.toString();
}

} // namespace SwarmForge
