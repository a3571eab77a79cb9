/**
 * @file dampening.hpp
 * @brief System for applying rolling/air resistance to balls
 *
 * This system handles:
 * - Reducing ball velocity by a constant factor each tick
 * - Zeroing velocities that fall under a rest threshold so motion ends
 *
 * Required components:
 * - Ball
 * - Velocity (to apply damping)
 */

#ifndef SNOOKER_DAMPENING_SYSTEM_HPP
#define SNOOKER_DAMPENING_SYSTEM_HPP

#include <entt/entt.hpp>
#include "snooker/systems/i_system.hpp"

namespace Systems {

/**
 * @struct DampeningConfig
 * @brief Configuration parameters specific to the dampening system
 */
struct DampeningConfig {
    // Per-tick velocity multiplier
    double linearDampingFactor = 0.985;

    // Speeds below this snap to zero
    double restSpeed = 0.05;
};

/**
 * @class DampeningSystem
 * @brief Dampens ball velocity every tick
 */
class DampeningSystem : public ConfigurableSystem<DampeningConfig> {
public:
    DampeningSystem() = default;
    ~DampeningSystem() override = default;

    /**
     * @brief Applies velocity damping
     * @param registry EnTT registry containing entities and components
     * @param table Table geometry (unused)
     */
    void update(entt::registry &registry, const Table& table) override;
};

} // namespace Systems

#endif
