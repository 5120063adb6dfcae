/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_TYPES_HPP
#define AGENT_TYPES_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace SwarmForge {

using AgentId = std::string;
using NodeId = uint32_t;

constexpr NodeId INVALID_NODE = 0;
constexpr NodeId AUTHORITY_NODE = 0xFFFFFFFFu;

enum class MovementState : uint8_t {
    Idle,
    Wandering,
    Moving,              // Walking to a commanded or investigation destination
    CombatApproaching,
    CombatMelee,
    CombatRanged,
    Fleeing,
    Jumping
};

enum class OwnershipStatus : uint8_t { Orphaned, Claimed, FallbackSimulated };

enum class SightMode : uint8_t { Directional, Omnidirectional };

enum class MovementMode : uint8_t { Ranged, Melee, Flee };

inline std::string_view toString(MovementState state) {
    switch (state) {
        case MovementState::Idle: return "Idle";
        case MovementState::Wandering: return "Wandering";
        case MovementState::Moving: return "Moving";
        case MovementState::CombatApproaching: return "CombatApproaching";
        case MovementState::CombatMelee: return "CombatMelee";
        case MovementState::CombatRanged: return "CombatRanged";
        case MovementState::Fleeing: return "Fleeing";
        case MovementState::Jumping: return "Jumping";
    }
    return "Unknown";
}

inline std::string_view toString(OwnershipStatus status) {
    switch (status) {
        case OwnershipStatus::Orphaned: return "Orphaned";
        case OwnershipStatus::Claimed: return "Claimed";
        case OwnershipStatus::FallbackSimulated: return "FallbackSimulated";
    }
    return "Unknown";
}

inline std::string_view toString(SightMode mode) {
    return mode == SightMode::Directional ? "Directional" : "Omnidirectional";
}

inline std::string_view toString(MovementMode mode) {
    switch (mode) {
        case MovementMode::Ranged: return "Ranged";
        case MovementMode::Melee: return "Melee";
        case MovementMode::Flee: return "Flee";
    }
    return "Unknown";
}

// Stream operators for test output
inline std::ostream& operator<<(std::ostream& os, MovementState state) { return os << toString(state); }
inline std::ostream& operator<<(std::ostream& os, OwnershipStatus status) { return os << toString(status); }
inline std::ostream& operator<<(std::ostream& os, SightMode mode) { return os << toString(mode); }
inline std::ostream& operator<<(std::ostream& os, MovementMode mode) { return os << toString(mode); }

} // namespace SwarmForge

#endif // AGENT_TYPES_HPP
