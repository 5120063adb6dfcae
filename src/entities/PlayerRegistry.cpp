/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/PlayerRegistry.hpp"
#include <iterator>

namespace SwarmForge {

bool PlayerRegistry::addPlayer(const PlayerId& id, NodeId node, const Vector3D& position) {
    if (id.empty()) return false;
    return m_players.try_emplace(id, PlayerInfo{id, node, position, true}).second;
}

bool PlayerRegistry::removePlayer(const PlayerId& id) {
    return m_players.erase(id) > 0;
}

void PlayerRegistry::removePlayersOfNode(NodeId node) {
    std::erase_if(m_players, [node](const auto& entry) { return entry.second.node == node; });
}

bool PlayerRegistry::setPosition(const PlayerId& id, const Vector3D& position) {
    auto it = m_players.find(id);
    if (it == m_players.end()) return false;
    it->second.position = position;
    return true;
}

bool PlayerRegistry::setAlive(const PlayerId& id, bool alive) {
    auto it = m_players.find(id);
    if (it == m_players.end()) return false;
    it->second.isAlive = alive;
    return true;
}

const PlayerInfo* PlayerRegistry::getPlayer(const PlayerId& id) const {
    auto it = m_players.find(id);
    return it != m_players.end() ? &it->second : nullptr;
}

std::optional<Vector3D> PlayerRegistry::getViewpoint(NodeId node) const {
    for (const auto& [id, info] : m_players) {
        if (info.node == node) {
            return info.position;
        }
    }
    return std::nullopt;
}

void PlayerRegistry::forEachPlayer(const std::function<void(const PlayerInfo&)>& fn) const {
    for (const auto& [id, info] : m_players) {
        fn(info);
    }
}

} // namespace SwarmForge
