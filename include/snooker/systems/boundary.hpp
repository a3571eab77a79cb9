/**
 * @file boundary.hpp
 * @brief System for rebounding balls off the cushions
 *
 * This system handles:
 * - Checking if a ball centre has passed the cushion line (rail inset by
 *   cushion thickness and ball radius)
 * - Clamping the ball back onto that line
 * - Reversing the normal velocity component with a restitution factor
 *
 * Required components:
 * - Ball
 * - Position (to read/modify)
 * - Velocity (to read/modify)
 *
 * Pockets are not modelled here; a ball near a pocket mouth still rebounds.
 */

#ifndef SNOOKER_BOUNDARY_SYSTEM_HPP
#define SNOOKER_BOUNDARY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "snooker/systems/i_system.hpp"

namespace Systems {

/**
 * @struct CushionConfig
 * @brief Configuration parameters specific to the cushion system
 */
struct CushionConfig {
    // Fraction of normal speed kept after a rebound (0-1)
    double restitution = 0.75;
};

/**
 * @class CushionSystem
 * @brief Handles ball/cushion contact for the headless simulator
 */
class CushionSystem : public ConfigurableSystem<CushionConfig> {
public:
    CushionSystem() = default;
    ~CushionSystem() override = default;

    /**
     * @brief Checks and processes cushion contacts
     * @param registry EnTT registry containing entities and components
     * @param table Table geometry supplying the rails
     */
    void update(entt::registry &registry, const Table& table) override;
};

} // namespace Systems

#endif
