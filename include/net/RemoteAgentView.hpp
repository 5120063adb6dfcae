/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef REMOTE_AGENT_VIEW_HPP
#define REMOTE_AGENT_VIEW_HPP

#include "net/Messages.hpp"
#include <unordered_map>

namespace SwarmForge {

/**
 * @brief A node's picture of agents simulated elsewhere, fed by relayed
 *        position updates. Presentation reads from here.
 */
class RemoteAgentView {
public:
    struct RemoteAgent {
        Vector3D position;
        Orientation orientation;
        Uint64 timestampMs{0};
    };

    // Older updates than the one held are ignored
    bool apply(const PositionUpdate& update) {
        auto [it, inserted] = m_agents.try_emplace(update.agentId);
        if (!inserted && update.timestampMs < it->second.timestampMs) {
            return false;
        }
        it->second.position = update.position;
        it->second.orientation = update.orientation;
        it->second.timestampMs = update.timestampMs;
        return true;
    }

    const RemoteAgent* get(const AgentId& id) const {
        auto it = m_agents.find(id);
        return it == m_agents.end() ? nullptr : &it->second;
    }

    bool remove(const AgentId& id) { return m_agents.erase(id) > 0; }
    void clear() { m_agents.clear(); }
    size_t size() const { return m_agents.size(); }

private:
    std::unordered_map<AgentId, RemoteAgent> m_agents;
};

} // namespace SwarmForge

#endif // REMOTE_AGENT_VIEW_HPP
