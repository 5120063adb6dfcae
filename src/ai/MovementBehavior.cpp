/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/MovementBehavior.hpp"
#include "core/Logger.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <cmath>
#include <format>
#include <numbers>

namespace SwarmForge {

namespace {

// Clearance kept between the body and a wall when probing ahead
constexpr float BODY_PROBE_MARGIN = 0.5f;

// Vertical slack before the agent is considered off the ground
constexpr float STEP_TOLERANCE = 0.5f;

inline Uint64 toMs(float seconds) {
    return static_cast<Uint64>(seconds * 1000.0f);
}

inline bool isMovingState(MovementState state) {
    return state == MovementState::Wandering || state == MovementState::Moving ||
           state == MovementState::CombatApproaching || state == MovementState::Fleeing;
}

} // namespace

MovementBehavior::MovementBehavior(const SimulationSettings& settings,
                                   const SpatialQueryAdapter& queries, const JumpSimulator& jumps,
                                   uint32_t seed)
    : m_settings(settings), m_queries(queries), m_jumps(jumps), m_rng(seed) {}

void MovementBehavior::initAgent(AgentRuntime& agent, Uint64 nowMs) {
    const BehaviorSettings& behavior = m_settings.behavior;
    if (agent.config.meleeOffsetRange) {
        agent.meleeRange = *agent.config.meleeOffsetRange;
    } else {
        std::uniform_real_distribution<float> dist(behavior.meleeOffsetMin, behavior.meleeOffsetMax);
        agent.meleeRange = dist(m_rng);
    }

    agent.nextWanderCheckMs = nowMs + toMs(behavior.wanderCooldown);
    agent.nextGroundCheckMs = nowMs + toMs(m_settings.mitigation.groundCheckInterval);

    if (!agent.jump.active) {
        if (auto snapped = m_queries.snapToGround(agent.position, agent.config.heightOffset())) {
            agent.position = *snapped;
        } else {
            MOVEMENT_WARN(std::format("No ground under {} at {}", agent.id, agent.position));
        }
    }
    agent.stuckAnchor = agent.position;
    agent.stuckWindowStartMs = nowMs;
}

void MovementBehavior::applySight(AgentRuntime& agent, const SightResult& result, Uint64 nowMs) {
    if (!result.target) {
        if (agent.target) {
            loseTarget(agent, nowMs);
        }
        return;
    }

    const bool changed = !agent.target || *agent.target != *result.target;
    agent.target = result.target;
    agent.targetPosition = result.targetPosition;
    agent.lastKnownTargetPosition = result.targetPosition;
    agent.lastSeenMs = nowMs;

    if (!changed) {
        return;
    }

    MOVEMENT_DEBUG(std::format("{} acquired target {} at distance {:.1f}", agent.id,
                               result.target->id, result.distance));

    if (agent.config.movementMode == MovementMode::Flee) {
        agent.threatPosition = result.targetPosition;
        if (agent.state != MovementState::Fleeing && !agent.noticing) {
            agent.noticing = true;
            agent.noticeStartMs = nowMs;
            clearDestination(agent);
        }
        return;
    }

    if (agent.config.enableCombatMovement && agent.config.canWalk) {
        // Combat takes precedence over wander, investigate and commanded travel
        clearDestination(agent);
        agent.state = MovementState::CombatApproaching;
    }
}

void MovementBehavior::loseTarget(AgentRuntime& agent, Uint64 nowMs) {
    const Vector3D lastKnown = agent.lastKnownTargetPosition.value_or(agent.targetPosition);
    MOVEMENT_DEBUG(std::format("{} lost target {}", agent.id, agent.target ? agent.target->id : ""));
    agent.target.reset();

    if (agent.config.movementMode == MovementMode::Flee) {
        // Keep running from where the threat was last seen
        if (agent.state == MovementState::Fleeing || agent.noticing) {
            agent.threatPosition = lastKnown;
        }
        return;
    }

    if (agent.config.enableCombatMovement && agent.config.canWalk) {
        clearDestination(agent);
        agent.destination = lastKnown;
        agent.externalDestination = false;
        agent.state = MovementState::Moving;
        return;
    }

    agent.state = MovementState::Idle;
    agent.nextWanderCheckMs = nowMs + toMs(m_settings.behavior.wanderCooldown);
}

TickResult MovementBehavior::tick(AgentRuntime& agent, float deltaTime, Uint64 nowMs,
                                  const TargetLocator& locateTarget) {
    TickResult result;

    if (agent.target) {
        std::optional<Vector3D> current = locateTarget ? locateTarget(*agent.target) : std::nullopt;
        if (current) {
            agent.targetPosition = *current;
            agent.lastKnownTargetPosition = *current;
            if (agent.config.movementMode == MovementMode::Flee) {
                agent.threatPosition = *current;
            }
        } else {
            loseTarget(agent, nowMs);
        }
    }

    // Stationary agents only track their target and stay on the ground
    if (!agent.config.canWalk) {
        if (agent.target) {
            faceToward(agent, agent.targetPosition);
            agent.state = agent.config.movementMode == MovementMode::Melee
                              ? MovementState::CombatMelee
                              : MovementState::CombatRanged;
        } else {
            agent.state = MovementState::Idle;
        }
        agent.destination.reset();
        moveVertical(agent, deltaTime, nowMs);
        periodicGroundCheck(agent, nowMs);
        return result;
    }

    const MoveIntent intent = evaluateBehavior(agent, nowMs);
    const bool attempted = moveHorizontal(agent, intent, deltaTime, nowMs, result);
    moveVertical(agent, deltaTime, nowMs);
    checkStuck(agent, attempted, nowMs, result);
    periodicGroundCheck(agent, nowMs);
    return result;
}

MovementBehavior::MoveIntent MovementBehavior::evaluateBehavior(AgentRuntime& agent, Uint64 nowMs) {
    const AgentConfig& config = agent.config;
    MoveIntent intent;
    intent.speed = config.walkSpeed;

    if (config.movementMode == MovementMode::Flee) {
        std::optional<Vector3D> threat;
        if (agent.target) {
            threat = agent.targetPosition;
        } else if (agent.state == MovementState::Fleeing || agent.noticing) {
            threat = agent.threatPosition;
        }
        if (threat) {
            return evaluateFlee(agent, *threat, nowMs);
        }
    } else if (agent.target) {
        if (config.enableCombatMovement) {
            const float desired = desiredCombatRange(agent);
            const float dist = Vector3D::horizontalDistance(agent.position, agent.targetPosition);
            if (dist <= desired) {
                agent.state = config.movementMode == MovementMode::Melee ? MovementState::CombatMelee
                                                                         : MovementState::CombatRanged;
                if (agent.route) {
                    agent.route->stop();
                }
                faceToward(agent, agent.targetPosition);
                return intent;
            }
            agent.state = MovementState::CombatApproaching;
            intent.goal = agent.targetPosition;
            intent.kind = RouteKind::Combat;
            return intent;
        }
        if (!agent.destination) {
            faceToward(agent, agent.targetPosition);
            agent.state = MovementState::Idle;
            return intent;
        }
    }

    if (agent.destination) {
        if (agent.state != MovementState::Wandering) {
            agent.state = MovementState::Moving;
        }
        intent.goal = agent.destination;
        intent.kind = RouteKind::Travel;
        return intent;
    }

    agent.state = MovementState::Idle;
    evaluateWander(agent, nowMs);
    if (agent.destination) {
        intent.goal = agent.destination;
        intent.kind = RouteKind::Travel;
    }
    return intent;
}

MovementBehavior::MoveIntent MovementBehavior::evaluateFlee(AgentRuntime& agent,
                                                            const Vector3D& threat, Uint64 nowMs) {
    const AgentConfig& config = agent.config;
    MoveIntent intent;
    intent.speed = config.walkSpeed * fleeSpeedMultiplier(config);
    intent.kind = RouteKind::Flee;

    const float range = config.sightRange;
    const float dist = Vector3D::horizontalDistance(agent.position, threat);

    if (dist >= range * fleeSafeDistanceFactor(config)) {
        MOVEMENT_DEBUG(std::format("{} reached safety at {:.1f} from threat", agent.id, dist));
        agent.target.reset();
        agent.threatPosition.reset();
        agent.noticing = false;
        clearDestination(agent);
        agent.state = MovementState::Idle;
        agent.nextWanderCheckMs = nowMs + toMs(m_settings.behavior.wanderCooldown);
        return MoveIntent{};
    }

    if (agent.state != MovementState::Fleeing) {
        if (!agent.noticing) {
            agent.noticing = true;
            agent.noticeStartMs = nowMs;
        }
        if (nowMs < agent.noticeStartMs + toMs(m_settings.behavior.fleeNoticeDuration)) {
            agent.state = MovementState::Idle;
            faceToward(agent, threat);
            return MoveIntent{};
        }
        agent.noticing = false;
        agent.state = MovementState::Fleeing;
        agent.fleeFromPosition.reset();
    }

    const bool replan =
        !agent.destination || !agent.fleeFromPosition ||
        Vector3D::horizontalDistance(*agent.fleeFromPosition, threat) >
            m_settings.pathfinding.fleeRecomputeDistance;

    if (replan) {
        Vector3D away = (agent.position - threat).flattened();
        if (away.lengthSquared() < 0.0001f) {
            std::uniform_real_distribution<float> angle(0.0f, 2.0f * std::numbers::pi_v<float>);
            const float a = angle(m_rng);
            away = Vector3D(std::cos(a), 0.0f, std::sin(a));
        } else {
            away = away.normalized();
        }
        agent.destination = agent.position + away * (range * fleeDistanceFactor(config));
        agent.externalDestination = false;
        agent.fleeFromPosition = threat;
    }

    intent.goal = agent.destination;
    return intent;
}

void MovementBehavior::evaluateWander(AgentRuntime& agent, Uint64 nowMs) {
    if (!agent.config.enableIdleWander || agent.destination || nowMs < agent.nextWanderCheckMs) {
        return;
    }
    const BehaviorSettings& behavior = m_settings.behavior;
    agent.nextWanderCheckMs = nowMs + toMs(behavior.wanderCooldown);

    std::uniform_real_distribution<float> roll(0.0f, 1.0f);
    if (roll(m_rng) >= behavior.wanderChance) {
        return;
    }

    std::uniform_real_distribution<float> angleDist(0.0f, 2.0f * std::numbers::pi_v<float>);
    std::uniform_real_distribution<float> radiusDist(behavior.wanderRadiusMin, behavior.wanderRadiusMax);
    const float angle = angleDist(m_rng);
    const float radius = radiusDist(m_rng);

    Vector3D point = agent.spawnPosition +
                     Vector3D(std::cos(angle) * radius, 0.0f, std::sin(angle) * radius);
    if (auto snapped = m_queries.snapToGround(point, agent.config.heightOffset())) {
        point = *snapped;
    }

    agent.destination = point;
    agent.externalDestination = false;
    agent.state = MovementState::Wandering;
    if (agent.route) {
        agent.route->reset();
    }
}

bool MovementBehavior::moveHorizontal(AgentRuntime& agent, const MoveIntent& intent,
                                      float deltaTime, Uint64 nowMs, TickResult& result) {
    if (!intent.goal) {
        return false;
    }

    auto finishTravel = [&]() {
        if (intent.kind == RouteKind::Combat) {
            if (agent.route) {
                agent.route->stop();
            }
            return;
        }
        result.arrived = true;
        clearDestination(agent);
        // A flee leg that ends early is replanned next tick
        if (intent.kind != RouteKind::Flee) {
            agent.state = MovementState::Idle;
            agent.nextWanderCheckMs = nowMs + toMs(m_settings.behavior.wanderCooldown);
        }
    };

    if (usesPathfinding(agent)) {
        RouteFollower& route = *agent.route;

        if (route.isAbandoned()) {
            MOVEMENT_DEBUG(std::format("{} abandoned {} goal {}", agent.id,
                                       intent.kind == RouteKind::Combat ? "combat" : "travel",
                                       *intent.goal));
            result.abandoned = true;
            clearDestination(agent);
            if (intent.kind == RouteKind::Combat) {
                agent.target.reset();
            }
            agent.state = MovementState::Idle;
            agent.nextWanderCheckMs = nowMs + toMs(m_settings.behavior.wanderCooldown);
            return false;
        }

        if (route.wantsRecompute(*intent.goal, intent.kind, nowMs)) {
            route.requestRoute(agent.position, *intent.goal, intent.kind, nowMs);
        }

        const RouteFollower::Steering steering = route.steer(agent.position);
        if (steering.arrived) {
            finishTravel();
            return false;
        }
        if (steering.jump && triggerJump(agent, nowMs)) {
            result.jumped = true;
        }
        if (!steering.target) {
            // Waiting on the pathfinder
            return false;
        }
        stepToward(agent, *steering.target, intent.speed, deltaTime, false);
        return true;
    }

    if (stepToward(agent, *intent.goal, intent.speed, deltaTime, true)) {
        finishTravel();
    }
    return true;
}

bool MovementBehavior::stepToward(AgentRuntime& agent, const Vector3D& target, float speed,
                                  float deltaTime, bool exactArrival) {
    const Vector3D delta = (target - agent.position).flattened();
    const float dist = delta.length();
    if (dist <= m_settings.pathfinding.directArrivalDistance) {
        return exactArrival;
    }

    const Vector3D direction = delta / dist;
    const float step = speed * deltaTime;
    const bool reaches = step >= dist;
    const float travel = reaches ? dist : step;

    agent.orientation.setLook(direction);

    const float offset = agent.config.heightOffset();
    const Vector3D feet = agent.position - Vector3D(0.0f, offset, 0.0f);
    RaycastFilter filter;
    filter.ignoreTags.push_back(agent.id);
    if (m_queries.isBlocked(feet, direction, travel + BODY_PROBE_MARGIN,
                            m_settings.behavior.obstacleProbeHeight, filter)) {
        return false;
    }

    // Clamp to the target so a large step never overshoots
    if (reaches) {
        agent.position.setX(target.getX());
        agent.position.setZ(target.getZ());
    } else {
        agent.position += direction * travel;
    }
    return reaches && exactArrival;
}

void MovementBehavior::moveVertical(AgentRuntime& agent, float deltaTime, Uint64 nowMs) {
    const float offset = agent.config.heightOffset();

    if (agent.jump.active) {
        const auto stepResult = m_jumps.step(agent.jump, agent.position, offset, deltaTime, nowMs);
        if (stepResult == JumpSimulator::StepResult::TimedOut) {
            MOVEMENT_WARN(std::format("{} jump timed out, snapped to {}", agent.id, agent.position));
        }
        return;
    }

    auto ground = m_queries.groundPosition(agent.position);
    if (!ground) {
        return;
    }
    const float restY = ground->getY() + offset;
    const float above = agent.position.getY() - restY;
    if (above > STEP_TOLERANCE) {
        m_jumps.startFall(agent.jump, nowMs);
    } else {
        // Small drops and step-ups are absorbed directly
        agent.position.setY(restY);
    }
}

void MovementBehavior::checkStuck(AgentRuntime& agent, bool wantedToMove, Uint64 nowMs,
                                  TickResult& result) {
    if (!wantedToMove || agent.isAirborne() || !isMovingState(agent.state)) {
        agent.stuckAnchor = agent.position;
        agent.stuckWindowStartMs = nowMs;
        return;
    }

    const BehaviorSettings& behavior = m_settings.behavior;
    if (nowMs < agent.stuckWindowStartMs + toMs(behavior.stuckWindow)) {
        return;
    }

    const float moved = Vector3D::horizontalDistance(agent.position, agent.stuckAnchor);
    agent.stuckAnchor = agent.position;
    agent.stuckWindowStartMs = nowMs;

    if (moved < behavior.stuckThreshold) {
        MOVEMENT_DEBUG(std::format("{} stuck at {} (moved {:.2f})", agent.id, agent.position, moved));
        if (triggerJump(agent, nowMs)) {
            result.jumped = true;
        }
        if (agent.route) {
            agent.route->reportStuck();
        }
    }
}

void MovementBehavior::periodicGroundCheck(AgentRuntime& agent, Uint64 nowMs) {
    if (nowMs < agent.nextGroundCheckMs) {
        return;
    }
    const MitigationSettings& mitigation = m_settings.mitigation;
    agent.nextGroundCheckMs = nowMs + toMs(mitigation.groundCheckInterval);
    if (agent.jump.active) {
        return;
    }

    auto snapped = m_queries.snapToGround(agent.position, agent.config.heightOffset());
    if (!snapped) {
        MOVEMENT_WARN(std::format("Ground check found nothing under {} at {}", agent.id,
                                  agent.position));
        return;
    }
    if (std::fabs(snapped->getY() - agent.position.getY()) > mitigation.groundSnapTolerance) {
        MOVEMENT_INFO(std::format("{} corrected from {} to {}", agent.id, agent.position, *snapped));
        agent.position = *snapped;
    }
}

void MovementBehavior::setDestination(AgentRuntime& agent,
                                      const std::optional<Vector3D>& destination, bool external) {
    if (agent.destination == destination) {
        return;
    }
    agent.destination = destination;
    agent.externalDestination = destination.has_value() && external;
    agent.fleeFromPosition.reset();
    if (agent.route) {
        agent.route->reset();
    }

    if (destination) {
        if (!agent.target && agent.state != MovementState::Fleeing) {
            agent.state = MovementState::Moving;
        }
    } else if (agent.state == MovementState::Moving || agent.state == MovementState::Wandering) {
        agent.state = MovementState::Idle;
    }
}

bool MovementBehavior::triggerJump(AgentRuntime& agent, Uint64 nowMs, float jumpPower) {
    if (!agent.config.canWalk) {
        return false;
    }
    return m_jumps.startJump(agent.jump, jumpPower > 0.0f ? jumpPower : agent.config.jumpPower, nowMs);
}

void MovementBehavior::halt(AgentRuntime& agent) {
    if (agent.route) {
        agent.route->cancel();
    }
    agent.destination.reset();
    agent.externalDestination = false;
    agent.target.reset();
    agent.threatPosition.reset();
    agent.fleeFromPosition.reset();
    agent.noticing = false;
    agent.state = MovementState::Idle;
}

float MovementBehavior::desiredCombatRange(const AgentRuntime& agent) const {
    if (agent.config.movementMode == MovementMode::Melee) {
        return agent.meleeRange;
    }
    return agent.config.sightRange * m_settings.behavior.rangedRangeFactor;
}

void MovementBehavior::clearDestination(AgentRuntime& agent) {
    if (agent.destination && agent.externalDestination) {
        agent.clearSharedDestination = true;
    }
    agent.destination.reset();
    agent.externalDestination = false;
    agent.fleeFromPosition.reset();
    if (agent.route) {
        agent.route->reset();
    }
}

void MovementBehavior::faceToward(AgentRuntime& agent, const Vector3D& point) {
    const Vector3D look = (point - agent.position).flattened();
    if (look.lengthSquared() > 0.0001f) {
        agent.orientation.setLook(look);
    }
}

bool MovementBehavior::usesPathfinding(const AgentRuntime& agent) const {
    return agent.config.usePathfinding && agent.route && agent.route->isAvailable();
}

float MovementBehavior::fleeSpeedMultiplier(const AgentConfig& config) const {
    return config.fleeSpeedMultiplier.value_or(m_settings.behavior.fleeSpeedMultiplier);
}

float MovementBehavior::fleeDistanceFactor(const AgentConfig& config) const {
    return config.fleeDistanceFactor.value_or(m_settings.behavior.fleeDistanceFactor);
}

float MovementBehavior::fleeSafeDistanceFactor(const AgentConfig& config) const {
    return config.fleeSafeDistanceFactor.value_or(m_settings.behavior.fleeSafeDistanceFactor);
}

} // namespace SwarmForge
