/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIM_CLOCK_HPP
#define SIM_CLOCK_HPP

#include "core/SimulationSettings.hpp"
#include <SDL3/SDL_stdinc.h>
#include <cstdint>
#include <functional>

namespace SwarmForge {

/**
 * @brief Chooses which of two tick sources drives a node's simulation step.
 *
 * The primary source is the render frame; it always steps. The secondary
 * source is a fixed-rate timer that only steps once the primary has been
 * silent for longer than secondaryClockTakeover, e.g. while the window is
 * minimized. A frame is never stepped by both.
 */
class SimClock {
public:
    using StepFunction = std::function<void(Uint64 nowMs, float deltaTime)>;

    SimClock(const ClientSimulationSettings& settings, StepFunction step);

    /**
     * @return true (the primary always steps)
     */
    bool onPrimaryFrame(Uint64 nowMs, float deltaTime);

    /**
     * @return true if this tick stepped the simulation
     */
    bool onSecondaryTick(Uint64 nowMs, float deltaTime);

    bool isPrimaryActive(Uint64 nowMs) const;

    uint64_t getPrimarySteps() const { return m_primarySteps; }
    uint64_t getSecondarySteps() const { return m_secondarySteps; }
    uint64_t getSkippedSecondary() const { return m_skippedSecondary; }

private:
    const ClientSimulationSettings& m_settings;
    StepFunction m_step;

    Uint64 m_lastPrimaryMs{0};
    bool m_primarySeen{false};

    uint64_t m_primarySteps{0};
    uint64_t m_secondarySteps{0};
    uint64_t m_skippedSecondary{0};
};

} // namespace SwarmForge

#endif // SIM_CLOCK_HPP
