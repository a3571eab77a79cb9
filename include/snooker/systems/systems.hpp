#pragma once

/**
 * @brief Defines available ECS systems for the table simulation.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief The ECS systems that can be activated in a simulator, in tick order.
 */
enum class SystemType {
    TRAJECTORY,
    OBSTACLES,
    MOVEMENT,
    DAMPENING,
    CUSHION,
};

} // namespace Systems
