#pragma once

#include <vector>
#include "snooker/systems/systems.hpp"

/**
 * @struct SystemConfig
 * @brief Parameters shared by every system in the simulation.
 */
struct SystemConfig {
    double TimeScale = 1.0;        // Multiplier on per-tick motion
    double MotionThreshold = 0.5;  // Speed above which a ball counts as moving

    std::vector<Systems::SystemType> activeSystems = {
        Systems::SystemType::TRAJECTORY,
        Systems::SystemType::OBSTACLES,
        Systems::SystemType::MOVEMENT,
        Systems::SystemType::DAMPENING,
        Systems::SystemType::CUSHION,
    };
};
