/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/SimulationNode.hpp"
#include "core/Logger.hpp"
#include "entities/PlayerRegistry.hpp"
#include "managers/AgentStateStore.hpp"
#include <algorithm>
#include <format>
#include <random>

namespace SwarmForge {

namespace {
inline Uint64 toMs(float seconds) {
    return static_cast<Uint64>(seconds * 1000.0f);
}
} // namespace

SimulationNode::SimulationNode(NodeId id, const SimulationSettings& settings, AgentStateStore& store,
                               const PlayerRegistry& players, const ISpatialQuery& world,
                               MessageBus& bus, IWaypointPathfinder* pathfinder, uint32_t seed)
    : m_id(id),
      m_settings(settings),
      m_store(store),
      m_players(players),
      m_bus(bus),
      m_routeSource(pathfinder),
      m_queries(world, settings.jump),
      m_jumps(settings.jump, m_queries),
      m_pathfinder(settings.pathfinding),
      m_sight(settings.sight, store, players, m_queries, streamSeed(seed, RandomStream::Sight)),
      m_behavior(settings, m_queries, m_jumps, streamSeed(seed, RandomStream::Behavior)),
      m_sync(settings.clientSimulation, store, bus, id),
      m_clock(settings.clientSimulation,
              [this](Uint64 nowMs, float deltaTime) { simulationStep(nowMs, deltaTime); }) {}

uint32_t SimulationNode::streamSeed(uint32_t seed, RandomStream stream) {
    std::seed_seq sequence{seed, static_cast<uint32_t>(stream)};
    uint32_t derived = 0;
    sequence.generate(&derived, &derived + 1);
    return derived;
}

SimulationNode::~SimulationNode() {
    clean();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

bool SimulationNode::init() {
    if (m_initialized.load(std::memory_order_acquire)) {
        NODE_WARN(std::format("Node {} already initialized", m_id));
        return true;
    }
    if (!m_store.isInitialized()) {
        NODE_ERROR("AgentStateStore must be initialized before SimulationNode");
        return false;
    }

    if (!m_pathfinder.init() || !m_sight.init()) {
        NODE_ERROR(std::format("Node {} failed to initialize its subsystems", m_id));
        return false;
    }
    m_pathfinder.setPathfinder(m_routeSource);
    m_pathfinder.setGroundQueries(&m_queries);

    m_sight.setQueryResolver([this](const AgentId& id) -> std::optional<SightQuery> {
        AgentRuntime* runtime = findRuntime(id);
        const AgentRecord* record = m_store.getAgent(id);
        if (!runtime || !record || !record->isAlive) {
            return std::nullopt;
        }
        return SightQuery{runtime->position, runtime->orientation, &runtime->config};
    });
    m_sight.setResultHandler([this](const SightResult& result) {
        if (AgentRuntime* runtime = findRuntime(result.agentId)) {
            m_behavior.applySight(*runtime, result, m_nowMs);
        }
    });

    m_busToken = m_bus.connect(m_id, [this](const Message& message) { onMessage(message); });
    if (!m_busToken.valid()) {
        NODE_ERROR(std::format("Node {} could not connect to the bus", m_id));
        m_sight.clean();
        m_pathfinder.clean();
        return false;
    }

    m_nextDistanceCheckMs = 0;
    m_stats = NodeStats{};
    m_initialized.store(true, std::memory_order_release);
    NODE_INFO(std::format("Node {} initialized", m_id));
    return true;
}

void SimulationNode::clean() {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    NODE_INFO(std::format("Cleaning up node {} ({} agents simulated)", m_id, m_agents.size()));

    for (const AgentId& id : getSimulatedAgents()) {
        stopSimulation(id, true);
    }
    m_pendingClaims.clear();
    m_remote.clear();
    m_sync.clear();

    m_bus.removeHandler(m_busToken);
    m_busToken = {};

    m_sight.clean();
    m_pathfinder.clean();
    m_initialized.store(false, std::memory_order_release);
}

std::optional<Vector3D> SimulationNode::getViewpoint() const {
    return m_players.getViewpoint(m_id);
}

// ============================================================================
// SIMULATION STEP
// ============================================================================

void SimulationNode::simulationStep(Uint64 nowMs, float deltaTime) {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return;
    }
    m_nowMs = nowMs;

    m_pathfinder.update();
    processPendingClaims(nowMs);

    if (nowMs >= m_nextDistanceCheckMs) {
        m_nextDistanceCheckMs = nowMs + toMs(m_settings.clientSimulation.positionSyncInterval);
        distanceCheck(nowMs);
    }

    m_sight.update(nowMs);
    tickAgents(deltaTime, nowMs);
    m_sync.update(nowMs);
    m_stats.steps++;
}

void SimulationNode::tickAgents(float deltaTime, Uint64 nowMs) {
    const TargetLocator locator = [this](const TargetRef& target) { return locateTarget(target); };

    // The record names the single writer; stop anything the authority took away
    std::vector<AgentId> lost;
    for (const auto& [id, runtime] : m_agents) {
        const AgentRecord* record = m_store.getAgent(id);
        if (record && record->ownerNode != m_id) {
            lost.push_back(id);
        }
    }
    for (const AgentId& id : lost) {
        loseOwnership(id);
    }

    for (auto& [id, runtime] : m_agents) {
        const AgentRecord* record = m_store.getAgent(id);
        if (!record || !record->isAlive) {
            continue;
        }

        const TickResult result = m_behavior.tick(*runtime, deltaTime, nowMs, locator);
        m_store.writeKinematics(id, runtime->position, runtime->orientation);

        if (runtime->clearSharedDestination) {
            runtime->clearSharedDestination = false;
            m_store.setDestination(id, std::nullopt);
        }
        if (result.arrived) {
            m_stats.arrivals++;
        }
    }
}

std::optional<Vector3D> SimulationNode::locateTarget(const TargetRef& target) const {
    if (target.kind == TargetKind::Player) {
        const PlayerInfo* player = m_players.getPlayer(target.id);
        if (!player || !player->isAlive) {
            return std::nullopt;
        }
        return player->position;
    }
    const AgentRecord* record = m_store.getAgent(target.id);
    if (!record || !record->isAlive) {
        return std::nullopt;
    }
    return record->position;
}

// ============================================================================
// OWNERSHIP
// ============================================================================

bool SimulationNode::atCapacity() const {
    return m_agents.size() >= m_settings.clientSimulation.maxAgentsPerNode;
}

bool SimulationNode::requestClaim(const AgentId& id, std::optional<uint64_t> expectedVersion,
                                  Uint64 nowMs) {
    if (!m_initialized.load(std::memory_order_acquire)) {
        return false;
    }
    if (m_agents.contains(id)) {
        return true;
    }

    auto request = makeMessage(MessageType::ClaimAgent, m_id, ClaimAgentRequest{id, expectedVersion});
    if (!request) {
        return false;
    }
    m_stats.claimRequests++;

    std::optional<Message> reply = m_bus.call(*request);
    ClaimAgentResponse response;
    if (!reply || !readPayload(*reply, response)) {
        NODE_WARN(std::format("Node {} got no usable claim reply for {}", m_id, id));
        return false;
    }

    if (response.result != ClaimResult::Accepted) {
        m_stats.claimsRejected++;
        return false;
    }
    m_stats.claimsAccepted++;
    return startSimulation(id, nowMs);
}

bool SimulationNode::releaseAgent(const AgentId& id) {
    return stopSimulation(id, true);
}

bool SimulationNode::startSimulation(const AgentId& id, Uint64 nowMs) {
    const AgentRecord* record = m_store.getAgent(id);
    const AgentConfig* config = m_store.getConfig(id);
    if (!record || !config) {
        NODE_WARN(std::format("Node {} cannot simulate {}: no record", m_id, id));
        return false;
    }

    auto runtime = std::make_unique<AgentRuntime>();
    runtime->id = id;
    runtime->config = *config;
    runtime->position = record->position;
    runtime->orientation = record->orientation;
    runtime->spawnPosition = record->spawnPosition;
    runtime->destination = record->destination;
    runtime->externalDestination = record->destination.has_value();
    if (runtime->destination) {
        runtime->state = MovementState::Moving;
    }
    runtime->route = std::make_unique<RouteFollower>(id, &m_pathfinder, m_settings.pathfinding);
    m_behavior.initAgent(*runtime, nowMs);

    runtime->subscriptions.add(m_store.subscribe(id, AgentEvent::DestinationChanged,
        [this, id](const AgentRecord& changed, AgentEvent) {
            if (AgentRuntime* agent = findRuntime(id)) {
                m_behavior.setDestination(*agent, changed.destination, true);
            }
        }));
    runtime->subscriptions.add(m_store.subscribe(id, AgentEvent::PositionCorrected,
        [this, id](const AgentRecord& corrected, AgentEvent) {
            if (AgentRuntime* agent = findRuntime(id)) {
                agent->position = corrected.position;
                if (agent->route) {
                    agent->route->cancel();
                }
            }
        }));
    runtime->subscriptions.add(m_store.subscribe(id, AgentEvent::AliveChanged,
        [this, id](const AgentRecord& changed, AgentEvent) {
            if (!changed.isAlive) {
                NODE_DEBUG(std::format("{} died, node {} stops simulating it", id, m_id));
                stopSimulation(id, true);
            }
        }));
    runtime->subscriptions.add(m_store.subscribe(id, AgentEvent::Removed,
        [this, id](const AgentRecord&, AgentEvent) { stopSimulation(id, false); }));

    m_agents[id] = std::move(runtime);
    m_sight.registerAgent(id, nowMs);
    m_sync.track(id);
    m_pendingClaims.erase(id);
    m_remote.remove(id);

    NODE_DEBUG(std::format("Node {} simulating {} ({} total)", m_id, id, m_agents.size()));
    return true;
}

bool SimulationNode::stopSimulation(const AgentId& id, bool sendRelease) {
    auto it = m_agents.find(id);
    if (it == m_agents.end()) {
        return false;
    }
    std::unique_ptr<AgentRuntime> runtime = std::move(it->second);
    m_agents.erase(it);

    runtime->subscriptions.releaseAll(m_store);
    if (runtime->route) {
        runtime->route->cancel();
    }
    m_sight.unregisterAgent(id);
    m_sync.untrack(id);

    if (sendRelease) {
        if (auto message = makeMessage(MessageType::ReleaseAgent, m_id, ReleaseAgentRequest{id})) {
            m_bus.postToAuthority(std::move(*message));
        }
        m_stats.releases++;
    }
    NODE_DEBUG(std::format("Node {} stopped simulating {}", m_id, id));
    return true;
}

void SimulationNode::loseOwnership(const AgentId& id) {
    if (stopSimulation(id, false)) {
        m_stats.ownershipLost++;
        NODE_INFO(std::format("Node {} lost ownership of {}", m_id, id));
    }
}

void SimulationNode::processPendingClaims(Uint64 nowMs) {
    if (m_pendingClaims.empty()) {
        return;
    }

    std::vector<std::pair<AgentId, PendingClaim>> due;
    for (const auto& [id, pending] : m_pendingClaims) {
        if (pending.dueMs <= nowMs) {
            due.emplace_back(id, pending);
        }
    }

    const float epsilon = m_settings.clientSimulation.claimPositionEpsilon;
    for (const auto& [id, pending] : due) {
        m_pendingClaims.erase(id);

        const AgentRecord* record = m_store.getAgent(id);
        if (!record || !record->isAlive) {
            continue;
        }
        // Someone else got there first if the record moved on since the broadcast
        if (record->claimVersion != pending.claimVersion || record->ownerNode != INVALID_NODE ||
            Vector3D::distance(record->position, pending.broadcastPosition) > epsilon) {
            m_stats.claimsAborted++;
            NODE_DEBUG(std::format("Node {} aborts delayed claim on {}", m_id, id));
            continue;
        }
        if (atCapacity()) {
            continue;
        }
        requestClaim(id, pending.claimVersion, nowMs);
    }
}

void SimulationNode::distanceCheck(Uint64 nowMs) {
    const std::optional<Vector3D> viewpoint = getViewpoint();
    if (!viewpoint) {
        return;
    }
    const ClientSimulationSettings& client = m_settings.clientSimulation;

    // Handoff
    const float releaseRadius = client.simulationRadius * client.handoffHysteresis;
    std::vector<AgentId> outOfRange;
    for (const auto& [id, runtime] : m_agents) {
        if (Vector3D::distance(*viewpoint, runtime->position) > releaseRadius) {
            outOfRange.push_back(id);
        }
    }
    for (const AgentId& id : outOfRange) {
        NODE_DEBUG(std::format("Node {} hands off {}", m_id, id));
        stopSimulation(id, true);
    }

    if (atCapacity()) {
        return;
    }

    // Pickup, nearest first
    std::vector<std::pair<float, AgentId>> candidates;
    m_store.forEachAgent([&](const AgentRecord& record) {
        if (!record.isAlive || record.ownerNode != INVALID_NODE || m_pendingClaims.contains(record.id)) {
            return;
        }
        const float dist = Vector3D::distance(*viewpoint, record.position);
        if (dist <= client.simulationRadius) {
            candidates.emplace_back(dist, record.id);
        }
    });
    std::sort(candidates.begin(), candidates.end());

    for (const auto& [dist, id] : candidates) {
        if (atCapacity()) {
            break;
        }
        const AgentRecord* record = m_store.getAgent(id);
        if (record) {
            requestClaim(id, record->claimVersion, nowMs);
        }
    }
}

// ============================================================================
// INBOUND MESSAGES
// ============================================================================

void SimulationNode::onMessage(const Message& message) {
    switch (message.type) {
        case MessageType::AgentsOrphaned: {
            AgentsOrphaned orphans;
            if (readPayload(message, orphans)) {
                handleOrphans(orphans);
            } else {
                NODE_WARN(std::format("Node {} dropped malformed orphan broadcast", m_id));
            }
            break;
        }
        case MessageType::UpdateAgentPositionBatch: {
            PositionBatch batch;
            if (readPayload(message, batch)) {
                handlePositionUpdates(batch.updates);
            }
            break;
        }
        case MessageType::UpdateAgentPosition: {
            PositionUpdate update;
            if (readPayload(message, update)) {
                handlePositionUpdates({update});
            }
            break;
        }
        case MessageType::AgentJumpTriggered: {
            AgentJumpTriggered jump;
            if (readPayload(message, jump)) {
                handleJump(jump);
            }
            break;
        }
        default:
            NODE_DEBUG(std::format("Node {} ignores message type {}", m_id, static_cast<int>(message.type)));
            break;
    }
}

void SimulationNode::handleOrphans(const AgentsOrphaned& orphans) {
    // An orphan we still simulate was timed out by the authority
    for (const OrphanEntry& entry : orphans.agents) {
        const AgentRecord* record = m_store.getAgent(entry.agentId);
        if (m_agents.contains(entry.agentId) &&
            (!record || record->ownerNode != m_id || record->claimVersion <= entry.claimVersion)) {
            loseOwnership(entry.agentId);
        }
    }

    const std::optional<Vector3D> viewpoint = getViewpoint();
    if (!viewpoint) {
        return;
    }
    const ClientSimulationSettings& client = m_settings.clientSimulation;

    for (const OrphanEntry& entry : orphans.agents) {
        if (m_agents.contains(entry.agentId)) {
            continue;
        }
        const AgentRecord* record = m_store.getAgent(entry.agentId);
        if (!record || !record->isAlive) {
            continue;
        }
        const float dist = Vector3D::distance(*viewpoint, entry.lastPosition);
        if (dist > client.simulationRadius) {
            continue;
        }
        // Closer nodes fire first and win the race
        const float delay = client.claimDelayBase + dist * client.claimDelayPerUnit;
        m_pendingClaims[entry.agentId] =
            PendingClaim{m_nowMs + toMs(delay), entry.lastPosition, entry.claimVersion};
    }
}

void SimulationNode::handlePositionUpdates(const std::vector<PositionUpdate>& updates) {
    for (const PositionUpdate& update : updates) {
        // The owner is the only writer; echoes of our own agents are stale
        if (m_agents.contains(update.agentId)) {
            m_stats.selfOwnedUpdatesIgnored++;
            continue;
        }
        if (m_remote.apply(update)) {
            m_stats.remoteUpdatesApplied++;
        }
    }
}

void SimulationNode::handleJump(const AgentJumpTriggered& jump) {
    AgentRuntime* runtime = findRuntime(jump.agentId);
    if (!runtime) {
        return;
    }
    if (m_behavior.triggerJump(*runtime, m_nowMs, jump.jumpPower)) {
        m_stats.jumpsCommanded++;
    }
}

// ============================================================================
// ACCESSORS
// ============================================================================

AgentRuntime* SimulationNode::findRuntime(const AgentId& id) {
    auto it = m_agents.find(id);
    return it == m_agents.end() ? nullptr : it->second.get();
}

const AgentRuntime* SimulationNode::getRuntime(const AgentId& id) const {
    auto it = m_agents.find(id);
    return it == m_agents.end() ? nullptr : it->second.get();
}

std::vector<AgentId> SimulationNode::getSimulatedAgents() const {
    std::vector<AgentId> ids;
    ids.reserve(m_agents.size());
    for (const auto& [id, runtime] : m_agents) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace SwarmForge
