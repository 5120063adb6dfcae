/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AGENT_RECORD_HPP
#define AGENT_RECORD_HPP

#include "entities/AgentTypes.hpp"
#include "utils/BinarySerializer.hpp"
#include "utils/Orientation.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <optional>
#include <string>

namespace SwarmForge {

/**
 * @brief Fixed-schema shared state of one agent.
 *
 * Position and orientation are written by the current simulator only.
 * Health and alive state belong to the external authority. Ownership fields
 * are written by the OwnershipManager.
 */
struct AgentRecord {
    AgentId id;
    Vector3D position;
    Orientation orientation;
    Vector3D spawnPosition;
    float health{100.0f};
    float maxHealth{100.0f};
    bool isAlive{true};
    std::string configJson;
    std::optional<Vector3D> destination;

    NodeId ownerNode{INVALID_NODE};
    OwnershipStatus status{OwnershipStatus::Orphaned};
    uint64_t claimVersion{0};           // Bumped on every ownership transition
    Uint64 lastUpdateMs{0};

    DECLARE_SERIALIZABLE()
};

} // namespace SwarmForge

#endif // AGENT_RECORD_HPP
