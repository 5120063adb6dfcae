/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef JUMP_SIMULATOR_HPP
#define JUMP_SIMULATOR_HPP

#include "core/SimulationSettings.hpp"
#include "utils/Vector3D.hpp"
#include <SDL3/SDL_stdinc.h>
#include <optional>

namespace SwarmForge {

class SpatialQueryAdapter;

struct JumpState {
    bool active{false};
    float verticalVelocity{0.0f};
    Uint64 startMs{0};
};

struct JumpTrajectory {
    float timeToApex{0.0f};
    float apexHeight{0.0f};           // Above the start
    float landingTime{0.0f};
    float horizontalSpeed{0.0f};      // Needed to cover the horizontal gap in landingTime
};

/**
 * @brief Vertical arc integration with ground-snapped landings.
 *
 * Only the vertical axis is simulated. Horizontal displacement is applied
 * by the caller in the same tick, so an airborne agent keeps moving.
 */
class JumpSimulator {
public:
    enum class StepResult { NotJumping, Airborne, Landed, TimedOut };

    JumpSimulator(const JumpSettings& settings, const SpatialQueryAdapter& queries)
        : m_settings(settings), m_queries(queries) {}

    /**
     * @brief Launch with jumpPower (or the default when <= 0)
     * @return false if already airborne
     */
    bool startJump(JumpState& state, float jumpPower, Uint64 nowMs) const;

    // Walked off a ledge: airborne with no upward velocity
    bool startFall(JumpState& state, Uint64 nowMs) const;

    /**
     * @brief Integrate one tick of gravity on position
     * @param heightOffset Distance from the feet to the logical position
     */
    StepResult step(JumpState& state, Vector3D& position, float heightOffset, float deltaTime,
                    Uint64 nowMs) const;

    /**
     * @brief End the jump now and snap to the ground under position
     */
    void forceEndJump(JumpState& state, Vector3D& position, float heightOffset) const;

    /**
     * @return nullopt when the target is higher than the apex
     */
    std::optional<JumpTrajectory> calculateTrajectory(const Vector3D& start, const Vector3D& target,
                                                      float jumpPower) const;

    bool canClearObstacle(float obstacleHeight, float jumpPower) const;

    float apexHeight(float jumpPower) const;

private:
    float effectivePower(float jumpPower) const {
        return jumpPower > 0.0f ? jumpPower : m_settings.defaultJumpPower;
    }

    const JumpSettings& m_settings;
    const SpatialQueryAdapter& m_queries;
};

} // namespace SwarmForge

#endif // JUMP_SIMULATOR_HPP
