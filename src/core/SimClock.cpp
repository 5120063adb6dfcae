/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SimClock.hpp"

namespace SwarmForge {

SimClock::SimClock(const ClientSimulationSettings& settings, StepFunction step)
    : m_settings(settings), m_step(std::move(step)) {}

bool SimClock::onPrimaryFrame(Uint64 nowMs, float deltaTime) {
    m_lastPrimaryMs = nowMs;
    m_primarySeen = true;
    m_primarySteps++;
    if (m_step) {
        m_step(nowMs, deltaTime);
    }
    return true;
}

bool SimClock::onSecondaryTick(Uint64 nowMs, float deltaTime) {
    if (isPrimaryActive(nowMs)) {
        m_skippedSecondary++;
        return false;
    }
    m_secondarySteps++;
    if (m_step) {
        m_step(nowMs, deltaTime);
    }
    return true;
}

bool SimClock::isPrimaryActive(Uint64 nowMs) const {
    if (!m_primarySeen) {
        return false;
    }
    const Uint64 takeoverMs = static_cast<Uint64>(m_settings.secondaryClockTakeover * 1000.0f);
    return nowMs <= m_lastPrimaryMs + takeoverMs;
}

} // namespace SwarmForge
