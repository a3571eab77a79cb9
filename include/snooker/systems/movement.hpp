/**
 * @file movement.hpp
 * @brief System for updating ball positions based on velocity
 *
 * This system handles:
 * - Position updates using velocity, scaled by the shared time scale
 * - Skips balls that have been pocketed
 *
 * Required components:
 * - Ball (tag data)
 * - Position (to modify)
 * - Velocity (to read)
 *
 * Also provides the "is anything moving" query the prediction and
 * obstacle systems gate on.
 */

#ifndef SNOOKER_MOVEMENT_SYSTEM_HPP
#define SNOOKER_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "snooker/systems/i_system.hpp"

namespace Systems {

/**
 * @brief True when any ball still on the table has speed above threshold.
 * @param registry EnTT registry containing the balls
 * @param threshold Speed (units per tick) separating moving from resting
 */
bool anyBallsMoving(const entt::registry& registry, double threshold);

/**
 * @class MovementSystem
 * @brief Advances ball positions by one tick of velocity
 */
class MovementSystem : public ISystem {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    /**
     * @brief Updates positions for all balls still on the table
     * @param registry EnTT registry containing entities and components
     * @param table Table geometry (unused)
     */
    void update(entt::registry &registry, const Table& table) override;
};

} // namespace Systems

#endif
