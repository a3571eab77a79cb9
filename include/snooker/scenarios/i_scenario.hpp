#ifndef SNOOKER_I_SCENARIO_HPP
#define SNOOKER_I_SCENARIO_HPP

#include <entt/entt.hpp>
#include "snooker/core/system_config.hpp"
#include "snooker/core/table.hpp"

/**
 * @brief Abstract base class for any table setup
 *
 * Each scenario must provide:
 *  - getConfig() returning the shared SystemConfig
 *  - getTableConfig() returning the table geometry
 *  - createEntities() that places the balls
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    virtual SystemConfig getConfig() const = 0;

    virtual TableConfig getTableConfig() const = 0;

    /**
     * @brief Creates scenario-specific entities in the registry
     */
    virtual void createEntities(entt::registry &registry, const Table &table) const = 0;
};

#endif // SNOOKER_I_SCENARIO_HPP
