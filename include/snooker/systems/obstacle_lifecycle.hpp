/**
 * @file obstacle_lifecycle.hpp
 * @brief Phase state machine of a timed obstacle
 *
 * Warning -> Active -> Fading -> removed, driven only by age:
 * - age <= warning                      : Warning
 * - age <= warning + active             : Active
 * - age <= warning + active + fade      : Fading
 * - beyond that                         : expired
 */

#pragma once

#include "snooker/components/basic.hpp"

namespace Systems {

/**
 * @struct LifecycleThresholds
 * @brief Phase durations in ticks
 */
struct LifecycleThresholds {
    int warningDuration = 120;
    int activeDuration = 300;
    int fadeDuration = 60;

    int activeEnd() const { return warningDuration + activeDuration; }
    int totalLifetime() const { return warningDuration + activeDuration + fadeDuration; }
};

/**
 * @struct PhaseTransition
 * @brief Outcome of one lifecycle evaluation, with edge flags for the caller
 */
struct PhaseTransition {
    Components::ObstaclePhase phase;
    bool createForceField = false;   // Warning -> Active edge
    bool destroyForceField = false;  // Active -> Fading (or Active -> expired) edge
    bool expired = false;            // Obstacle must be removed
};

/**
 * @brief Evaluates the phase for an age, never moving backwards from current.
 *
 * @param current Phase before this evaluation
 * @param age Ticks since spawn
 * @param thresholds Phase durations
 */
PhaseTransition advancePhase(Components::ObstaclePhase current, int age,
                             const LifecycleThresholds& thresholds);

/**
 * @brief Ticks left in the Warning phase, rounded up to whole seconds.
 */
int warningCountdownSeconds(int age, const LifecycleThresholds& thresholds, unsigned int ticksPerSecond);

/**
 * @brief Progress through the Fading phase in [0, 1].
 */
double fadeProgress(int age, const LifecycleThresholds& thresholds);

const char* phaseName(Components::ObstaclePhase phase);

} // namespace Systems
