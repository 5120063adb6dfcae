/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef PLAYER_REGISTRY_HPP
#define PLAYER_REGISTRY_HPP

#include "entities/AgentTypes.hpp"
#include "utils/Vector3D.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

namespace SwarmForge {

using PlayerId = std::string;

struct PlayerInfo {
    PlayerId id;
    NodeId node{INVALID_NODE};   // Client node the player is attached to
    Vector3D position;
    bool isAlive{true};
};

/**
 * @brief Positions of connected players.
 *
 * Players are sight candidates for agents and double as node viewpoints:
 * a node's viewpoint is the position of the player attached to it.
 */
class PlayerRegistry {
public:
    bool addPlayer(const PlayerId& id, NodeId node, const Vector3D& position);
    bool removePlayer(const PlayerId& id);
    void removePlayersOfNode(NodeId node);

    bool setPosition(const PlayerId& id, const Vector3D& position);
    bool setAlive(const PlayerId& id, bool alive);

    const PlayerInfo* getPlayer(const PlayerId& id) const;
    std::optional<Vector3D> getViewpoint(NodeId node) const;

    void forEachPlayer(const std::function<void(const PlayerInfo&)>& fn) const;
    size_t getPlayerCount() const { return m_players.size(); }

private:
    std::unordered_map<PlayerId, PlayerInfo> m_players;
};

} // namespace SwarmForge

#endif // PLAYER_REGISTRY_HPP
