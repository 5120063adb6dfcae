/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimulationSettings.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <format>
#include <fstream>
#include <variant>
#include <vector>

namespace SwarmForge {

namespace {

using FieldRef = std::variant<float*, uint32_t*, bool*>;

struct Binding {
    const char* key;
    FieldRef field;
};

struct Category {
    const char* name;
    std::vector<Binding> bindings;
};

// The single place that maps JSON names to fields
std::vector<Category> bindAll(SimulationSettings& s) {
    auto& cs = s.clientSimulation;
    auto& own = s.ownership;
    auto& fb = s.fallback;
    auto& jp = s.jump;
    auto& pf = s.pathfinding;
    auto& st = s.sight;
    auto& bh = s.behavior;
    auto& mt = s.mitigation;

    return {
        {"client_simulation",
         {{"simulation_radius", &cs.simulationRadius},
          {"max_agents_per_node", &cs.maxAgentsPerNode},
          {"position_sync_interval", &cs.positionSyncInterval},
          {"broadcast_radius", &cs.broadcastRadius},
          {"handoff_hysteresis", &cs.handoffHysteresis},
          {"claim_delay_base", &cs.claimDelayBase},
          {"claim_delay_per_unit", &cs.claimDelayPerUnit},
          {"claim_position_epsilon", &cs.claimPositionEpsilon},
          {"use_delta_compression", &cs.useDeltaCompression},
          {"keepalive_interval", &cs.keepaliveInterval},
          {"use_batched_updates", &cs.useBatchedUpdates},
          {"secondary_clock_takeover", &cs.secondaryClockTakeover}}},
        {"ownership",
         {{"ownership_timeout", &own.ownershipTimeout},
          {"timeout_check_interval", &own.timeoutCheckInterval}}},
        {"server_fallback",
         {{"enabled", &fb.enabled},
          {"unclaimed_timeout", &fb.unclaimedTimeout},
          {"simulation_fps", &fb.simulationFps},
          {"speed_multiplier", &fb.speedMultiplier},
          {"max_simulated", &fb.maxSimulated},
          {"check_interval", &fb.checkInterval},
          {"default_wander_radius", &fb.defaultWanderRadius},
          {"arrival_distance", &fb.arrivalDistance}}},
        {"jump",
         {{"default_jump_power", &jp.defaultJumpPower},
          {"gravity", &jp.gravity},
          {"jump_timeout", &jp.jumpTimeout},
          {"ground_check_distance", &jp.groundCheckDistance},
          {"ground_ray_length", &jp.groundRayLength},
          {"landing_ray_height", &jp.landingRayHeight},
          {"landing_ray_length", &jp.landingRayLength},
          {"max_ground_skips", &jp.maxGroundSkips}}},
        {"pathfinding",
         {{"waypoint_reach_distance", &pf.waypointReachDistance},
          {"final_reach_distance", &pf.finalReachDistance},
          {"direct_arrival_distance", &pf.directArrivalDistance},
          {"travel_request_interval", &pf.travelRequestInterval},
          {"combat_request_interval", &pf.combatRequestInterval},
          {"flee_request_interval", &pf.fleeRequestInterval},
          {"travel_recompute_distance", &pf.travelRecomputeDistance},
          {"combat_recompute_distance", &pf.combatRecomputeDistance},
          {"flee_recompute_distance", &pf.fleeRecomputeDistance},
          {"max_computation_errors", &pf.maxComputationErrors},
          {"max_unreachable_errors", &pf.maxUnreachableErrors},
          {"max_stuck_errors", &pf.maxStuckErrors},
          {"max_routes_per_update", &pf.maxRoutesPerUpdate}}},
        {"sight",
         {{"cone_angle", &st.coneAngleDegrees},
          {"detection_interval_min", &st.detectionIntervalMin},
          {"detection_interval_max", &st.detectionIntervalMax},
          {"detection_interval_target", &st.detectionIntervalWithTarget},
          {"scheduler_interval", &st.schedulerInterval}}},
        {"behavior",
         {{"wander_radius_min", &bh.wanderRadiusMin},
          {"wander_radius_max", &bh.wanderRadiusMax},
          {"wander_cooldown", &bh.wanderCooldown},
          {"wander_chance", &bh.wanderChance},
          {"melee_offset_min", &bh.meleeOffsetMin},
          {"melee_offset_max", &bh.meleeOffsetMax},
          {"ranged_range_factor", &bh.rangedRangeFactor},
          {"flee_speed_multiplier", &bh.fleeSpeedMultiplier},
          {"flee_distance_factor", &bh.fleeDistanceFactor},
          {"flee_safe_distance_factor", &bh.fleeSafeDistanceFactor},
          {"flee_notice_duration", &bh.fleeNoticeDuration},
          {"stuck_threshold", &bh.stuckThreshold},
          {"stuck_window", &bh.stuckWindow},
          {"obstacle_probe_height", &bh.obstacleProbeHeight}}},
        {"mitigation",
         {{"soft_bounds_enabled", &mt.softBoundsEnabled},
          {"default_max_wander_radius", &mt.defaultMaxWanderRadius},
          {"ground_check_interval", &mt.groundCheckInterval},
          {"ground_snap_tolerance", &mt.groundSnapTolerance}}},
    };
}

bool assign(const FieldRef& field, const JsonValue& value) {
    if (auto* f = std::get_if<float*>(&field)) {
        auto number = value.tryAsFloat();
        if (!number) return false;
        **f = *number;
        return true;
    }
    if (auto* u = std::get_if<uint32_t*>(&field)) {
        auto number = value.tryAsNumber();
        if (!number || *number < 0.0) return false;
        **u = static_cast<uint32_t>(*number);
        return true;
    }
    auto flag = value.tryAsBool();
    if (!flag) return false;
    *std::get<bool*>(field) = *flag;
    return true;
}

std::string formatField(const FieldRef& field) {
    if (auto* f = std::get_if<float*>(&field)) return std::format("{}", **f);
    if (auto* u = std::get_if<uint32_t*>(&field)) return std::to_string(**u);
    return *std::get<bool*>(field) ? "true" : "false";
}

} // namespace

bool SettingsLoader::loadFromFile(const std::string& filepath, SimulationSettings& settings) {
    JsonReader reader;
    if (!reader.loadFromFile(filepath)) {
        SETTINGS_ERROR("Failed to load settings from file: " + filepath + " - " + reader.getLastError());
        return false;
    }

    if (!apply(reader.getRoot(), settings)) {
        SETTINGS_ERROR("Settings file root is not a JSON object: " + filepath);
        return false;
    }

    SETTINGS_INFO("Loaded settings from file: " + filepath);
    return true;
}

bool SettingsLoader::loadFromString(const std::string& json, SimulationSettings& settings) {
    JsonReader reader;
    if (!reader.parse(json)) {
        SETTINGS_ERROR("Failed to parse settings: " + reader.getLastError());
        return false;
    }
    if (!apply(reader.getRoot(), settings)) {
        SETTINGS_ERROR("Settings root is not a JSON object");
        return false;
    }
    return true;
}

bool SettingsLoader::apply(const JsonValue& root, SimulationSettings& settings) {
    const JsonObject* rootObj = root.tryAsObject();
    if (!rootObj) {
        return false;
    }

    // Parse into a copy so a bad document never leaves settings half-applied
    SimulationSettings parsed = settings;
    auto categories = bindAll(parsed);

    for (const auto& [categoryName, categoryValue] : *rootObj) {
        auto category = std::find_if(categories.begin(), categories.end(),
                                     [&](const Category& c) { return categoryName == c.name; });
        if (category == categories.end()) {
            SETTINGS_WARNING("Unknown settings category '" + categoryName + "', skipping");
            continue;
        }

        const JsonObject* categoryObj = categoryValue.tryAsObject();
        if (!categoryObj) {
            SETTINGS_WARNING("Category '" + categoryName + "' is not an object, skipping");
            continue;
        }

        for (const auto& [key, value] : *categoryObj) {
            auto binding = std::find_if(category->bindings.begin(), category->bindings.end(),
                                        [&](const Binding& b) { return key == b.key; });
            if (binding == category->bindings.end()) {
                SETTINGS_WARNING("Unknown setting '" + categoryName + "." + key + "', skipping");
                continue;
            }
            if (!assign(binding->field, value)) {
                SETTINGS_WARNING("Wrong value type for setting '" + categoryName + "." + key +
                                 "', keeping default");
            }
        }
    }

    settings = parsed;
    return true;
}

std::string SettingsLoader::toJson(const SimulationSettings& settings) {
    SimulationSettings copy = settings;
    const auto categories = bindAll(copy);

    std::string out = "{\n";
    for (size_t c = 0; c < categories.size(); ++c) {
        out += std::format("  \"{}\": {{\n", categories[c].name);
        const auto& bindings = categories[c].bindings;
        for (size_t k = 0; k < bindings.size(); ++k) {
            out += std::format("    \"{}\": {}{}\n", bindings[k].key, formatField(bindings[k].field),
                               k + 1 < bindings.size() ? "," : "");
        }
        out += std::format("  }}{}\n", c + 1 < categories.size() ? "," : "");
    }
    out += "}\n";
    return out;
}

bool SettingsLoader::saveToFile(const std::string& filepath, const SimulationSettings& settings) {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        SETTINGS_ERROR("Failed to open settings file for writing: " + filepath);
        return false;
    }

    file << toJson(settings);
    if (!file.good()) {
        SETTINGS_ERROR("Failed writing settings file: " + filepath);
        return false;
    }

    SETTINGS_INFO("Saved settings to file: " + filepath);
    return true;
}

} // namespace SwarmForge
