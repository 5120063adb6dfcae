/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "physics/JumpSimulator.hpp"
#include "core/Logger.hpp"
#include "world/SpatialQueryAdapter.hpp"
#include <cmath>
#include <format>

namespace SwarmForge {

bool JumpSimulator::startJump(JumpState& state, float jumpPower, Uint64 nowMs) const {
    if (state.active) {
        return false;
    }
    state.active = true;
    state.verticalVelocity = effectivePower(jumpPower);
    state.startMs = nowMs;
    return true;
}

bool JumpSimulator::startFall(JumpState& state, Uint64 nowMs) const {
    if (state.active) {
        return false;
    }
    state.active = true;
    state.verticalVelocity = 0.0f;
    state.startMs = nowMs;
    return true;
}

JumpSimulator::StepResult JumpSimulator::step(JumpState& state, Vector3D& position,
                                              float heightOffset, float deltaTime,
                                              Uint64 nowMs) const {
    if (!state.active) {
        return StepResult::NotJumping;
    }

    const Uint64 timeoutMs = static_cast<Uint64>(m_settings.jumpTimeout * 1000.0f);
    if (nowMs >= state.startMs + timeoutMs) {
        JUMP_DEBUG(std::format("Jump timed out at {}", position));
        forceEndJump(state, position, heightOffset);
        return StepResult::TimedOut;
    }

    state.verticalVelocity -= m_settings.gravity * deltaTime;
    Vector3D predicted = position;
    predicted.setY(position.getY() + state.verticalVelocity * deltaTime);

    // Landing is only possible on the way down
    if (state.verticalVelocity <= 0.0f) {
        const Vector3D rayOrigin = predicted + Vector3D(0.0f, m_settings.landingRayHeight, 0.0f);
        auto ground = m_queries.findGround(rayOrigin, m_settings.landingRayLength);
        if (ground) {
            const float restY = ground->getY() + heightOffset;
            if (predicted.getY() <= restY) {
                position = predicted.withY(restY);
                state = JumpState{};
                return StepResult::Landed;
            }
        }
    }

    position = predicted;
    return StepResult::Airborne;
}

void JumpSimulator::forceEndJump(JumpState& state, Vector3D& position, float heightOffset) const {
    state = JumpState{};
    if (auto snapped = m_queries.snapToGround(position, heightOffset)) {
        position = *snapped;
    }
}

float JumpSimulator::apexHeight(float jumpPower) const {
    const float v = effectivePower(jumpPower);
    return (v * v) / (2.0f * m_settings.gravity);
}

bool JumpSimulator::canClearObstacle(float obstacleHeight, float jumpPower) const {
    return apexHeight(jumpPower) > obstacleHeight;
}

std::optional<JumpTrajectory> JumpSimulator::calculateTrajectory(const Vector3D& start,
                                                                 const Vector3D& target,
                                                                 float jumpPower) const {
    const float v = effectivePower(jumpPower);
    const float g = m_settings.gravity;
    const float dy = target.getY() - start.getY();

    JumpTrajectory trajectory;
    trajectory.timeToApex = v / g;
    trajectory.apexHeight = apexHeight(v);
    if (dy > trajectory.apexHeight) {
        return std::nullopt;
    }

    // dy = v t - g t^2 / 2, later root is the descending landing
    const float discriminant = v * v - 2.0f * g * dy;
    if (discriminant < 0.0f) {
        return std::nullopt;
    }
    trajectory.landingTime = (v + std::sqrt(discriminant)) / g;
    if (trajectory.landingTime <= 0.0f) {
        return std::nullopt;
    }

    trajectory.horizontalSpeed = Vector3D::horizontalDistance(start, target) / trajectory.landingTime;
    return trajectory;
}

} // namespace SwarmForge
