#include "snooker/systems/obstacle_lifecycle.hpp"

#include <algorithm>
#include <cmath>

namespace Systems {

PhaseTransition advancePhase(Components::ObstaclePhase current, int age,
                             const LifecycleThresholds& thresholds) {
    using Components::ObstaclePhase;

    ObstaclePhase target = ObstaclePhase::Warning;
    if (age > thresholds.activeEnd()) {
        target = ObstaclePhase::Fading;
    } else if (age > thresholds.warningDuration) {
        target = ObstaclePhase::Active;
    }

    // Phases are ordered; never step back
    if (static_cast<int>(target) < static_cast<int>(current)) {
        target = current;
    }

    PhaseTransition result;
    result.phase = target;
    result.expired = age > thresholds.totalLifetime();
    result.createForceField = current == ObstaclePhase::Warning && target == ObstaclePhase::Active;
    result.destroyForceField = current == ObstaclePhase::Active &&
                               (target == ObstaclePhase::Fading || result.expired);
    return result;
}

int warningCountdownSeconds(int age, const LifecycleThresholds& thresholds, unsigned int ticksPerSecond) {
    if (ticksPerSecond == 0) {
        return 0;
    }
    int const remaining = std::max(thresholds.warningDuration - age, 0);
    return static_cast<int>(std::ceil(static_cast<double>(remaining) / ticksPerSecond));
}

double fadeProgress(int age, const LifecycleThresholds& thresholds) {
    if (thresholds.fadeDuration <= 0) {
        return age > thresholds.activeEnd() ? 1.0 : 0.0;
    }
    double const progress = static_cast<double>(age - thresholds.activeEnd()) / thresholds.fadeDuration;
    return std::clamp(progress, 0.0, 1.0);
}

const char* phaseName(Components::ObstaclePhase phase) {
    switch (phase) {
        case Components::ObstaclePhase::Warning: return "warning";
        case Components::ObstaclePhase::Active:  return "active";
        case Components::ObstaclePhase::Fading:  return "fading";
        default: return "unknown";
    }
}

} // namespace Systems
